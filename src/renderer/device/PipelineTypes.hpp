#pragma once

#include <EASTL/hash_map.h>
#include <EASTL/optional.h>
#include <EASTL/shared_ptr.h>
#include <EASTL/string.h>
#include <EASTL/vector.h>
#include <cstdint>

#include "GpuTypes.hpp"

namespace ember {

// Compiled shader code. Loading it from disk is the asset layer's job.
struct ShaderModule {
    eastl::string label;
    eastl::vector<uint32_t> spirv;
    // Shader def name -> boolean specialization constant id
    eastl::hash_map<eastl::string, uint32_t> specializationConstants;
};

struct ShaderStageDesc {
    eastl::shared_ptr<const ShaderModule> module;
    eastl::string entryPoint;
    eastl::vector<eastl::string> shaderDefs;

    bool hasDef(const eastl::string& def) const {
        for (const auto& d : shaderDefs) {
            if (d == def) return true;
        }
        return false;
    }
};

enum class BlendFactor : uint8_t {
    Zero,
    One,
    SrcAlpha,
    OneMinusSrcAlpha,
    Constant,
    OneMinusConstant
};

enum class BlendOperation : uint8_t { Add, Subtract, Min, Max };

struct BlendComponent {
    BlendFactor srcFactor = BlendFactor::One;
    BlendFactor dstFactor = BlendFactor::Zero;
    BlendOperation operation = BlendOperation::Add;

    bool operator==(const BlendComponent& other) const {
        return srcFactor == other.srcFactor && dstFactor == other.dstFactor && operation == other.operation;
    }
    bool operator!=(const BlendComponent& other) const { return !(*this == other); }
};

struct BlendState {
    BlendComponent color;
    BlendComponent alpha;
};

enum class ColorWrites : uint8_t {
    Red   = 1u << 0,
    Green = 1u << 1,
    Blue  = 1u << 2,
    Alpha = 1u << 3,
    All   = 0x0F
};

struct ColorTargetState {
    TextureFormat format = TextureFormat::Undefined;
    eastl::optional<BlendState> blend;
    ColorWrites writeMask = ColorWrites::All;
};

struct FragmentState : ShaderStageDesc {
    eastl::vector<ColorTargetState> targets;

    void setTarget(size_t index, const ColorTargetState& target) {
        if (targets.size() <= index) {
            targets.resize(index + 1);
        }
        targets[index] = target;
    }
};

enum class PrimitiveTopology : uint8_t { TriangleList, TriangleStrip, LineList, PointList };

struct RenderPipelineDesc {
    eastl::string label;
    eastl::vector<RawHandle> layout;  // Bind group layouts, by set index
    ShaderStageDesc vertex;
    eastl::optional<FragmentState> fragment;
    PrimitiveTopology topology = PrimitiveTopology::TriangleList;
};

struct RenderPipeline {
    RawHandle pipeline = kNullRawHandle;
    RawHandle layout = kNullRawHandle;
};

enum class PipelineErrorCode : uint8_t {
    None,
    MissingFragmentState,
    MissingEntryPoint,
    UnsupportedTargetFormat,
    UnknownShaderDef,
    InvalidShaderModule,
    LayoutCreationFailed,
    PipelineCreationFailed,
    UnknownPipeline
};

constexpr const char* toString(PipelineErrorCode code) {
    switch (code) {
        case PipelineErrorCode::None:                    return "None";
        case PipelineErrorCode::MissingFragmentState:    return "MissingFragmentState";
        case PipelineErrorCode::MissingEntryPoint:       return "MissingEntryPoint";
        case PipelineErrorCode::UnsupportedTargetFormat: return "UnsupportedTargetFormat";
        case PipelineErrorCode::UnknownShaderDef:        return "UnknownShaderDef";
        case PipelineErrorCode::InvalidShaderModule:     return "InvalidShaderModule";
        case PipelineErrorCode::LayoutCreationFailed:    return "LayoutCreationFailed";
        case PipelineErrorCode::PipelineCreationFailed:  return "PipelineCreationFailed";
        case PipelineErrorCode::UnknownPipeline:         return "UnknownPipeline";
    }
    return "Unknown";
}

struct PipelineError {
    PipelineErrorCode code = PipelineErrorCode::None;
    eastl::string message;
};

struct PipelineCompileResult {
    bool success = false;
    RenderPipeline pipeline;
    PipelineError error;

    static PipelineCompileResult ok(const RenderPipeline& pipeline) {
        return PipelineCompileResult{true, pipeline, {}};
    }
    static PipelineCompileResult failure(PipelineErrorCode code, const eastl::string& message) {
        return PipelineCompileResult{false, {}, PipelineError{code, message}};
    }
};

} // namespace ember
