#pragma once

#include <EASTL/string.h>
#include <EASTL/vector.h>
#include <cstdint>

namespace ember {

// Backend object handle (a 64-bit Vulkan handle, or a mock token in tests)
using RawHandle = uint64_t;
constexpr RawHandle kNullRawHandle = 0;

enum class TextureFormat : uint8_t {
    Undefined,
    R8Unorm,
    RGBA8Unorm,
    RGBA8UnormSrgb,
    BGRA8Unorm,
    RG11B10Float,
    RGBA16Float,
    RGBA32Float,
    R32Float,
    Depth32Float,
    Depth24PlusStencil8
};

constexpr const char* toString(TextureFormat format) {
    switch (format) {
        case TextureFormat::Undefined:           return "Undefined";
        case TextureFormat::R8Unorm:             return "R8Unorm";
        case TextureFormat::RGBA8Unorm:          return "RGBA8Unorm";
        case TextureFormat::RGBA8UnormSrgb:      return "RGBA8UnormSrgb";
        case TextureFormat::BGRA8Unorm:          return "BGRA8Unorm";
        case TextureFormat::RG11B10Float:        return "RG11B10Float";
        case TextureFormat::RGBA16Float:         return "RGBA16Float";
        case TextureFormat::RGBA32Float:         return "RGBA32Float";
        case TextureFormat::R32Float:            return "R32Float";
        case TextureFormat::Depth32Float:        return "Depth32Float";
        case TextureFormat::Depth24PlusStencil8: return "Depth24PlusStencil8";
    }
    return "Unknown";
}

constexpr bool isDepthFormat(TextureFormat format) {
    return format == TextureFormat::Depth32Float || format == TextureFormat::Depth24PlusStencil8;
}

enum class TextureUsage : uint32_t {
    None                   = 0,
    Sampled                = 1u << 0,
    Storage                = 1u << 1,
    ColorAttachment        = 1u << 2,
    DepthStencilAttachment = 1u << 3,
    TransferSrc            = 1u << 4,
    TransferDst            = 1u << 5
};

inline TextureUsage operator|(TextureUsage a, TextureUsage b) {
    return static_cast<TextureUsage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}
inline TextureUsage operator&(TextureUsage a, TextureUsage b) {
    return static_cast<TextureUsage>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}
inline bool hasFlag(TextureUsage flags, TextureUsage bit) {
    return (flags & bit) != TextureUsage::None;
}

enum class BufferUsage : uint32_t {
    None        = 0,
    Uniform     = 1u << 0,
    Storage     = 1u << 1,
    Vertex      = 1u << 2,
    Index       = 1u << 3,
    Indirect    = 1u << 4,
    TransferSrc = 1u << 5,
    TransferDst = 1u << 6
};

inline BufferUsage operator|(BufferUsage a, BufferUsage b) {
    return static_cast<BufferUsage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}
inline BufferUsage operator&(BufferUsage a, BufferUsage b) {
    return static_cast<BufferUsage>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}
inline bool hasFlag(BufferUsage flags, BufferUsage bit) {
    return (flags & bit) != BufferUsage::None;
}

struct TextureDesc {
    eastl::string label;
    uint32_t width = 1;
    uint32_t height = 1;
    uint32_t arrayLayers = 1;
    uint32_t mipLevels = 1;
    uint32_t sampleCount = 1;
    TextureFormat format = TextureFormat::RGBA8Unorm;
    TextureUsage usage = TextureUsage::Sampled;

    bool operator==(const TextureDesc& other) const {
        return label == other.label && width == other.width && height == other.height &&
               arrayLayers == other.arrayLayers && mipLevels == other.mipLevels &&
               sampleCount == other.sampleCount && format == other.format && usage == other.usage;
    }
    bool operator!=(const TextureDesc& other) const { return !(*this == other); }
};

struct BufferDesc {
    eastl::string label;
    uint64_t size = 0;
    BufferUsage usage = BufferUsage::Uniform;
    bool hostVisible = false;

    bool operator==(const BufferDesc& other) const {
        return label == other.label && size == other.size && usage == other.usage && hostVisible == other.hostVisible;
    }
    bool operator!=(const BufferDesc& other) const { return !(*this == other); }
};

enum class FilterMode : uint8_t { Nearest, Linear };
enum class AddressMode : uint8_t { Repeat, MirrorRepeat, ClampToEdge };

struct SamplerDesc {
    eastl::string label;
    FilterMode magFilter = FilterMode::Linear;
    FilterMode minFilter = FilterMode::Linear;
    FilterMode mipmapFilter = FilterMode::Nearest;
    AddressMode addressModeU = AddressMode::ClampToEdge;
    AddressMode addressModeV = AddressMode::ClampToEdge;
    AddressMode addressModeW = AddressMode::ClampToEdge;

    bool operator==(const SamplerDesc& other) const {
        return label == other.label && magFilter == other.magFilter && minFilter == other.minFilter &&
               mipmapFilter == other.mipmapFilter && addressModeU == other.addressModeU &&
               addressModeV == other.addressModeV && addressModeW == other.addressModeW;
    }
};

enum class ShaderStage : uint32_t {
    None     = 0,
    Vertex   = 1u << 0,
    Fragment = 1u << 1,
    Compute  = 1u << 2
};

inline ShaderStage operator|(ShaderStage a, ShaderStage b) {
    return static_cast<ShaderStage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

enum class BindingType : uint8_t {
    SampledTexture,
    StorageTexture,
    UniformBuffer,
    StorageBuffer,
    Sampler
};

struct BindGroupLayoutEntry {
    uint32_t binding = 0;
    BindingType type = BindingType::SampledTexture;
    ShaderStage visibility = ShaderStage::Fragment;
    bool hasDynamicOffset = false;
};

struct BindGroupLayoutDesc {
    eastl::string label;
    eastl::vector<BindGroupLayoutEntry> entries;

    // Sequential bindings 0..n-1 with a shared visibility
    static BindGroupLayoutDesc sequential(const eastl::string& label, ShaderStage visibility,
                                          const eastl::vector<BindingType>& types) {
        BindGroupLayoutDesc desc;
        desc.label = label;
        for (uint32_t i = 0; i < types.size(); ++i) {
            desc.entries.push_back(BindGroupLayoutEntry{i, types[i], visibility, false});
        }
        return desc;
    }
};

// Bind group entry with graph handles already resolved to device objects
struct BindGroupBinding {
    uint32_t binding = 0;
    BindingType type = BindingType::SampledTexture;
    RawHandle resource = kNullRawHandle;  // VkImageView, VkBuffer or VkSampler
    uint64_t offset = 0;
    uint64_t size = 0;                    // 0: whole buffer
};

// Realized device objects. These are what a node resolves a handle to.
struct Texture {
    RawHandle image = kNullRawHandle;
    RawHandle view = kNullRawHandle;
    uint32_t width = 0;
    uint32_t height = 0;
    TextureFormat format = TextureFormat::Undefined;
};

struct Buffer {
    RawHandle buffer = kNullRawHandle;
    uint64_t size = 0;
    void* mapped = nullptr;
};

struct Sampler {
    RawHandle sampler = kNullRawHandle;
};

struct BindGroup {
    RawHandle set = kNullRawHandle;
    RawHandle layout = kNullRawHandle;
};

struct DeviceLimits {
    uint32_t maxTextureDimension2D = 8192;
    uint32_t maxTextureArrayLayers = 256;
    uint32_t maxBindGroups = 4;
    uint32_t maxColorAttachments = 8;
    uint64_t maxUniformBufferBindingSize = 65536;
    uint64_t maxStorageBufferBindingSize = 134217728;
};

enum class DeviceFeatures : uint32_t {
    None                    = 0,
    Float32Filterable       = 1u << 0,
    TimestampQuery          = 1u << 1,
    SamplerAnisotropy       = 1u << 2,
    TextureCompressionBC    = 1u << 3,
    IndirectFirstInstance   = 1u << 4
};

inline DeviceFeatures operator|(DeviceFeatures a, DeviceFeatures b) {
    return static_cast<DeviceFeatures>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}
inline DeviceFeatures operator&(DeviceFeatures a, DeviceFeatures b) {
    return static_cast<DeviceFeatures>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}
inline bool hasFlag(DeviceFeatures flags, DeviceFeatures bit) {
    return (flags & bit) != DeviceFeatures::None;
}

} // namespace ember
