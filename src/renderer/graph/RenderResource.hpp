#pragma once

#include <EASTL/functional.h>
#include <EASTL/optional.h>
#include <EASTL/string.h>
#include <EASTL/variant.h>
#include <EASTL/vector.h>
#include <cstdint>

#include "ResourceHandle.hpp"
#include "renderer/device/RenderDevice.hpp"

namespace ember {

class World;

enum class ResourceKind : uint8_t {
    Texture,
    Buffer,
    Sampler,
    BindGroup
};

constexpr const char* toString(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Texture:   return "Texture";
        case ResourceKind::Buffer:    return "Buffer";
        case ResourceKind::Sampler:   return "Sampler";
        case ResourceKind::BindGroup: return "BindGroup";
    }
    return "Unknown";
}

// One bind group entry. The handle is resolved to a device object when the
// bind group is realized, after every texture, buffer and sampler.
struct BindGroupEntry {
    uint32_t binding = 0;
    BindingType type = BindingType::SampledTexture;
    ResourceKind kind = ResourceKind::Texture;
    ResourceId id;
    uint64_t offset = 0;
    uint64_t size = 0;

    static BindGroupEntry texture(uint32_t binding, ResourceHandle<Texture> handle,
                                  BindingType type = BindingType::SampledTexture) {
        return BindGroupEntry{binding, type, ResourceKind::Texture, handle.id(), 0, 0};
    }

    static BindGroupEntry buffer(uint32_t binding, ResourceHandle<Buffer> handle,
                                 BindingType type = BindingType::UniformBuffer,
                                 uint64_t offset = 0, uint64_t size = 0) {
        return BindGroupEntry{binding, type, ResourceKind::Buffer, handle.id(), offset, size};
    }

    static BindGroupEntry sampler(uint32_t binding, ResourceHandle<Sampler> handle) {
        return BindGroupEntry{binding, BindingType::Sampler, ResourceKind::Sampler, handle.id(), 0, 0};
    }
};

struct BindGroupDesc {
    eastl::string label;
    RawHandle layout = kNullRawHandle;
    eastl::vector<BindGroupEntry> entries;
};

/**
 * @brief Compile-time capability trait for a resource kind
 *
 * Selects the descriptor type, the kind tag, whether nodes may declare
 * writes against it, whether it may be retained across frames, and how the
 * device creates and releases it.
 */
template<typename R>
struct RenderResourceTraits;

template<>
struct RenderResourceTraits<Texture> {
    using Descriptor = TextureDesc;
    static constexpr ResourceKind kKind = ResourceKind::Texture;
    static constexpr bool kWritable = true;
    static constexpr bool kRetainable = true;

    static Texture create(RenderDevice& device, const TextureDesc& desc) { return device.createTexture(desc); }
    static void release(RenderDevice& device, const Texture& texture) { device.destroyTexture(texture); }
};

template<>
struct RenderResourceTraits<Buffer> {
    using Descriptor = BufferDesc;
    static constexpr ResourceKind kKind = ResourceKind::Buffer;
    static constexpr bool kWritable = true;
    static constexpr bool kRetainable = true;

    static Buffer create(RenderDevice& device, const BufferDesc& desc) { return device.createBuffer(desc); }
    static void release(RenderDevice& device, const Buffer& buffer) { device.destroyBuffer(buffer); }
};

template<>
struct RenderResourceTraits<Sampler> {
    using Descriptor = SamplerDesc;
    static constexpr ResourceKind kKind = ResourceKind::Sampler;
    static constexpr bool kWritable = false;
    static constexpr bool kRetainable = false;

    static Sampler create(RenderDevice& device, const SamplerDesc& desc) { return device.createSampler(desc); }
    static void release(RenderDevice& device, const Sampler& sampler) { device.destroySampler(sampler); }
};

// Created by RenderGraphBuilder::newBindGroup only
template<>
struct RenderResourceTraits<BindGroup> {
    using Descriptor = BindGroupDesc;
    static constexpr ResourceKind kKind = ResourceKind::BindGroup;
    static constexpr bool kWritable = false;
    static constexpr bool kRetainable = false;

    static void release(RenderDevice& device, const BindGroup& bindGroup) { device.destroyBindGroup(bindGroup); }
};

template<typename R>
struct ResourceMeta {
    using Descriptor = typename RenderResourceTraits<R>::Descriptor;

    eastl::optional<Descriptor> descriptor;
    R resource;
    bool owned = true;  // Imported resources are never released by the graph
};

template<typename R>
using DeferredResourceInit = eastl::function<ResourceMeta<R>(World&, RenderDevice&)>;

template<typename R>
struct QueuedResource {
    eastl::optional<typename RenderResourceTraits<R>::Descriptor> descriptor;  // Known before realization, if any
    DeferredResourceInit<R> init;
};

// Eager (available now) or Deferred (constructed once the device is available)
template<typename R>
class ResourceInit {
public:
    using Descriptor = typename RenderResourceTraits<R>::Descriptor;

    static ResourceInit eager(ResourceMeta<R> meta) {
        return ResourceInit(eastl::move(meta));
    }

    static ResourceInit deferred(DeferredResourceInit<R> init, eastl::optional<Descriptor> descriptor = {}) {
        return ResourceInit(QueuedResource<R>{eastl::move(descriptor), eastl::move(init)});
    }

    bool isEager() const { return eastl::holds_alternative<ResourceMeta<R>>(data); }
    bool isDeferred() const { return !isEager(); }

    ResourceMeta<R>& eagerMeta() { return eastl::get<ResourceMeta<R>>(data); }
    QueuedResource<R>& deferredInit() { return eastl::get<QueuedResource<R>>(data); }

private:
    explicit ResourceInit(ResourceMeta<R> meta) : data(eastl::move(meta)) {}
    explicit ResourceInit(QueuedResource<R> queued) : data(eastl::move(queued)) {}

    eastl::variant<ResourceMeta<R>, QueuedResource<R>> data;
};

} // namespace ember
