#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include "renderer/device/GpuTypes.hpp"

namespace ember {

// Main color target of a view
struct ViewTarget {
    static constexpr TextureFormat kHdrFormat = TextureFormat::RGBA16Float;
    static constexpr TextureFormat kSdrFormat = TextureFormat::RGBA8UnormSrgb;

    uint32_t width = 0;
    uint32_t height = 0;
    bool hdr = true;

    TextureFormat format() const { return hdr ? kHdrFormat : kSdrFormat; }
};

enum class BloomCompositeMode : uint8_t {
    EnergyConserving,
    Additive
};

struct BloomPrefilter {
    float threshold = 0.0f;          // 0 disables the prefilter
    float thresholdSoftness = 0.0f;  // 0..1
};

// Per-view bloom settings, read-only to the graph
struct BloomSettings {
    float intensity = 0.15f;
    float lowFrequencyBoost = 0.7f;
    float lowFrequencyBoostCurvature = 0.95f;
    float highPassFrequency = 1.0f;
    BloomPrefilter prefilter;
    BloomCompositeMode compositeMode = BloomCompositeMode::EnergyConserving;
    uint32_t maxMipDimension = 512;
    glm::vec2 scale{1.0f, 1.0f};

    bool usesPrefilter() const { return prefilter.threshold > 0.0f; }
    bool hasUniformScale() const { return scale == glm::vec2(1.0f, 1.0f); }
};

} // namespace ember
