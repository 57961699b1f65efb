#include "VulkanRenderDevice.hpp"
#include "renderer/device/Spirv.hpp"
#include "core/Exception.hpp"
#include "core/Log.hpp"

namespace ember {

namespace {

template<typename VkHandle>
RawHandle toRaw(VkHandle handle) {
    return reinterpret_cast<RawHandle>(handle);
}

template<typename VkHandle>
VkHandle fromRaw(RawHandle raw) {
    return reinterpret_cast<VkHandle>(raw);
}

vk::Format toVkFormat(TextureFormat format) {
    switch (format) {
        case TextureFormat::Undefined:           return vk::Format::eUndefined;
        case TextureFormat::R8Unorm:             return vk::Format::eR8Unorm;
        case TextureFormat::RGBA8Unorm:          return vk::Format::eR8G8B8A8Unorm;
        case TextureFormat::RGBA8UnormSrgb:      return vk::Format::eR8G8B8A8Srgb;
        case TextureFormat::BGRA8Unorm:          return vk::Format::eB8G8R8A8Unorm;
        case TextureFormat::RG11B10Float:        return vk::Format::eB10G11R11UfloatPack32;
        case TextureFormat::RGBA16Float:         return vk::Format::eR16G16B16A16Sfloat;
        case TextureFormat::RGBA32Float:         return vk::Format::eR32G32B32A32Sfloat;
        case TextureFormat::R32Float:            return vk::Format::eR32Sfloat;
        case TextureFormat::Depth32Float:        return vk::Format::eD32Sfloat;
        case TextureFormat::Depth24PlusStencil8: return vk::Format::eD24UnormS8Uint;
    }
    return vk::Format::eUndefined;
}

vk::ImageUsageFlags toVkUsage(TextureUsage usage) {
    vk::ImageUsageFlags flags;
    if (hasFlag(usage, TextureUsage::Sampled))                flags |= vk::ImageUsageFlagBits::eSampled;
    if (hasFlag(usage, TextureUsage::Storage))                flags |= vk::ImageUsageFlagBits::eStorage;
    if (hasFlag(usage, TextureUsage::ColorAttachment))        flags |= vk::ImageUsageFlagBits::eColorAttachment;
    if (hasFlag(usage, TextureUsage::DepthStencilAttachment)) flags |= vk::ImageUsageFlagBits::eDepthStencilAttachment;
    if (hasFlag(usage, TextureUsage::TransferSrc))            flags |= vk::ImageUsageFlagBits::eTransferSrc;
    if (hasFlag(usage, TextureUsage::TransferDst))            flags |= vk::ImageUsageFlagBits::eTransferDst;
    return flags;
}

vk::BufferUsageFlags toVkUsage(BufferUsage usage) {
    vk::BufferUsageFlags flags;
    if (hasFlag(usage, BufferUsage::Uniform))     flags |= vk::BufferUsageFlagBits::eUniformBuffer;
    if (hasFlag(usage, BufferUsage::Storage))     flags |= vk::BufferUsageFlagBits::eStorageBuffer;
    if (hasFlag(usage, BufferUsage::Vertex))      flags |= vk::BufferUsageFlagBits::eVertexBuffer;
    if (hasFlag(usage, BufferUsage::Index))       flags |= vk::BufferUsageFlagBits::eIndexBuffer;
    if (hasFlag(usage, BufferUsage::Indirect))    flags |= vk::BufferUsageFlagBits::eIndirectBuffer;
    if (hasFlag(usage, BufferUsage::TransferSrc)) flags |= vk::BufferUsageFlagBits::eTransferSrc;
    if (hasFlag(usage, BufferUsage::TransferDst)) flags |= vk::BufferUsageFlagBits::eTransferDst;
    return flags;
}

vk::Filter toVkFilter(FilterMode mode) {
    return mode == FilterMode::Linear ? vk::Filter::eLinear : vk::Filter::eNearest;
}

vk::SamplerAddressMode toVkAddressMode(AddressMode mode) {
    switch (mode) {
        case AddressMode::Repeat:       return vk::SamplerAddressMode::eRepeat;
        case AddressMode::MirrorRepeat: return vk::SamplerAddressMode::eMirroredRepeat;
        case AddressMode::ClampToEdge:  return vk::SamplerAddressMode::eClampToEdge;
    }
    return vk::SamplerAddressMode::eClampToEdge;
}

vk::DescriptorType toVkDescriptorType(BindingType type, bool dynamicOffset) {
    switch (type) {
        case BindingType::SampledTexture: return vk::DescriptorType::eSampledImage;
        case BindingType::StorageTexture: return vk::DescriptorType::eStorageImage;
        case BindingType::UniformBuffer:
            return dynamicOffset ? vk::DescriptorType::eUniformBufferDynamic : vk::DescriptorType::eUniformBuffer;
        case BindingType::StorageBuffer:
            return dynamicOffset ? vk::DescriptorType::eStorageBufferDynamic : vk::DescriptorType::eStorageBuffer;
        case BindingType::Sampler:        return vk::DescriptorType::eSampler;
    }
    return vk::DescriptorType::eSampledImage;
}

vk::ShaderStageFlags toVkStages(ShaderStage stages) {
    const uint32_t bits = static_cast<uint32_t>(stages);
    vk::ShaderStageFlags flags;
    if (bits & static_cast<uint32_t>(ShaderStage::Vertex))   flags |= vk::ShaderStageFlagBits::eVertex;
    if (bits & static_cast<uint32_t>(ShaderStage::Fragment)) flags |= vk::ShaderStageFlagBits::eFragment;
    if (bits & static_cast<uint32_t>(ShaderStage::Compute))  flags |= vk::ShaderStageFlagBits::eCompute;
    return flags;
}

vk::BlendFactor toVkBlendFactor(BlendFactor factor) {
    switch (factor) {
        case BlendFactor::Zero:             return vk::BlendFactor::eZero;
        case BlendFactor::One:              return vk::BlendFactor::eOne;
        case BlendFactor::SrcAlpha:         return vk::BlendFactor::eSrcAlpha;
        case BlendFactor::OneMinusSrcAlpha: return vk::BlendFactor::eOneMinusSrcAlpha;
        case BlendFactor::Constant:         return vk::BlendFactor::eConstantColor;
        case BlendFactor::OneMinusConstant: return vk::BlendFactor::eOneMinusConstantColor;
    }
    return vk::BlendFactor::eOne;
}

vk::BlendOp toVkBlendOp(BlendOperation op) {
    switch (op) {
        case BlendOperation::Add:      return vk::BlendOp::eAdd;
        case BlendOperation::Subtract: return vk::BlendOp::eSubtract;
        case BlendOperation::Min:      return vk::BlendOp::eMin;
        case BlendOperation::Max:      return vk::BlendOp::eMax;
    }
    return vk::BlendOp::eAdd;
}

vk::PrimitiveTopology toVkTopology(PrimitiveTopology topology) {
    switch (topology) {
        case PrimitiveTopology::TriangleList:  return vk::PrimitiveTopology::eTriangleList;
        case PrimitiveTopology::TriangleStrip: return vk::PrimitiveTopology::eTriangleStrip;
        case PrimitiveTopology::LineList:      return vk::PrimitiveTopology::eLineList;
        case PrimitiveTopology::PointList:     return vk::PrimitiveTopology::ePointList;
    }
    return vk::PrimitiveTopology::eTriangleList;
}

vk::ColorComponentFlags toVkColorWrites(ColorWrites writes) {
    const uint32_t bits = static_cast<uint32_t>(writes);
    vk::ColorComponentFlags flags;
    if (bits & static_cast<uint32_t>(ColorWrites::Red))   flags |= vk::ColorComponentFlagBits::eR;
    if (bits & static_cast<uint32_t>(ColorWrites::Green)) flags |= vk::ColorComponentFlagBits::eG;
    if (bits & static_cast<uint32_t>(ColorWrites::Blue))  flags |= vk::ColorComponentFlagBits::eB;
    if (bits & static_cast<uint32_t>(ColorWrites::Alpha)) flags |= vk::ColorComponentFlagBits::eA;
    return flags;
}

const eastl::string& entryPointOf(const ShaderStageDesc& stage) {
    static const eastl::string kDefaultEntryPoint = "main";
    return stage.entryPoint.empty() ? kDefaultEntryPoint : stage.entryPoint;
}

// Shader defs enabled as boolean specialization constants. Must outlive pipeline creation.
struct StageSpecialization {
    eastl::vector<vk::SpecializationMapEntry> entries;
    eastl::vector<VkBool32> values;
    vk::SpecializationInfo info;

    void build(const ShaderStageDesc& stage) {
        for (const auto& def : stage.shaderDefs) {
            auto it = stage.module->specializationConstants.find(def);
            uint32_t offset = static_cast<uint32_t>(values.size() * sizeof(VkBool32));
            entries.push_back(vk::SpecializationMapEntry{it->second, offset, sizeof(VkBool32)});
            values.push_back(VK_TRUE);
        }
        info.mapEntryCount = static_cast<uint32_t>(entries.size());
        info.pMapEntries = entries.data();
        info.dataSize = values.size() * sizeof(VkBool32);
        info.pData = values.data();
    }
};

constexpr const char* kValidationLayer = "VK_LAYER_KHRONOS_validation";

} // anonymous namespace

VulkanRenderDevice::~VulkanRenderDevice() {
    cleanup();
}

void VulkanRenderDevice::init(bool enableValidation) {
    createInstance(enableValidation);
    pickPhysicalDevice();
    createLogicalDevice();
    createAllocator();
    createDescriptorPool();
    queryCapabilities();
}

void VulkanRenderDevice::cleanup() {
    if (*device) {
        device.waitIdle();
    }

    if (allocator != VK_NULL_HANDLE) {
        if (!allocations.empty()) {
            Log::error("Vulkan", "{} allocations still alive at shutdown", allocations.size());
        }
        vmaDestroyAllocator(allocator);
        allocator = VK_NULL_HANDLE;
    }
    allocations.clear();
    layoutEntries.clear();

    // Reverse order of creation
    descriptorPool = nullptr;
    graphicsQueue = nullptr;
    device = nullptr;
    physicalDevice = nullptr;
    instance = nullptr;
}

void VulkanRenderDevice::createInstance(bool enableValidation) {
    vk::ApplicationInfo appInfo;
    appInfo.pApplicationName = "Ember";
    appInfo.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
    appInfo.pEngineName = "Ember";
    appInfo.engineVersion = VK_MAKE_VERSION(1, 0, 0);
    appInfo.apiVersion = VK_API_VERSION_1_3;

    eastl::vector<const char*> layers;
    if (enableValidation) {
        for (const auto& layer : context.enumerateInstanceLayerProperties()) {
            if (eastl::string(layer.layerName.data()) == kValidationLayer) {
                layers.push_back(kValidationLayer);
                break;
            }
        }
        if (layers.empty()) {
            Log::warn("Vulkan", "Validation requested but {} is not installed", kValidationLayer);
        }
    }

    vk::InstanceCreateInfo createInfo;
    createInfo.pApplicationInfo = &appInfo;
    createInfo.enabledLayerCount = static_cast<uint32_t>(layers.size());
    createInfo.ppEnabledLayerNames = layers.empty() ? nullptr : layers.data();

    instance = vk::raii::Instance(context, createInfo);
    Log::info("Vulkan", "Instance created");
}

bool VulkanRenderDevice::isDeviceSuitable(const vk::raii::PhysicalDevice& candidate) const {
    if (candidate.getProperties().apiVersion < VK_API_VERSION_1_3) {
        return false;
    }
    for (const auto& family : candidate.getQueueFamilyProperties()) {
        if (family.queueFlags & vk::QueueFlagBits::eGraphics) {
            return true;
        }
    }
    return false;
}

void VulkanRenderDevice::pickPhysicalDevice() {
    vk::raii::PhysicalDevices devices(instance);

    // Discrete GPUs first, otherwise the first suitable device
    for (auto& candidate : devices) {
        if (isDeviceSuitable(candidate) &&
            candidate.getProperties().deviceType == vk::PhysicalDeviceType::eDiscreteGpu) {
            physicalDevice = std::move(candidate);
            break;
        }
    }
    if (!*physicalDevice) {
        for (auto& candidate : devices) {
            if (isDeviceSuitable(candidate)) {
                physicalDevice = std::move(candidate);
                break;
            }
        }
    }

    if (!*physicalDevice) {
        throw RuntimeError("Failed to find a Vulkan 1.3 device with a graphics queue");
    }

    deviceName = physicalDevice.getProperties().deviceName.data();
    Log::info("Vulkan", "Selected GPU: {}", deviceName.c_str());
}

void VulkanRenderDevice::createLogicalDevice() {
    auto families = physicalDevice.getQueueFamilyProperties();
    for (uint32_t i = 0; i < families.size(); ++i) {
        if (families[i].queueFlags & vk::QueueFlagBits::eGraphics) {
            graphicsFamily = i;
            break;
        }
    }

    float queuePriority = 1.0f;
    vk::DeviceQueueCreateInfo queueCreateInfo;
    queueCreateInfo.queueFamilyIndex = graphicsFamily;
    queueCreateInfo.queueCount = 1;
    queueCreateInfo.pQueuePriorities = &queuePriority;

    // Enable the optional features the device reports
    vk::PhysicalDeviceFeatures available = physicalDevice.getFeatures();
    vk::PhysicalDeviceFeatures enabled;
    enabled.samplerAnisotropy = available.samplerAnisotropy;
    enabled.textureCompressionBC = available.textureCompressionBC;
    enabled.drawIndirectFirstInstance = available.drawIndirectFirstInstance;

    vk::PhysicalDeviceVulkan13Features features13;
    features13.dynamicRendering = VK_TRUE;

    vk::DeviceCreateInfo createInfo;
    createInfo.pNext = &features13;
    createInfo.queueCreateInfoCount = 1;
    createInfo.pQueueCreateInfos = &queueCreateInfo;
    createInfo.pEnabledFeatures = &enabled;

    device = vk::raii::Device(physicalDevice, createInfo);
    graphicsQueue = vk::raii::Queue(device, graphicsFamily, 0);
}

void VulkanRenderDevice::createAllocator() {
    VmaAllocatorCreateInfo allocatorInfo = {};
    allocatorInfo.physicalDevice = *physicalDevice;
    allocatorInfo.device = *device;
    allocatorInfo.instance = *instance;
    allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_3;

    VkResult result = vmaCreateAllocator(&allocatorInfo, &allocator);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create VMA allocator", static_cast<int32_t>(result));
    }

    Log::info("Vulkan", "VMA allocator created");
}

void VulkanRenderDevice::createDescriptorPool() {
    constexpr uint32_t kDescriptorsPerType = 1024;
    constexpr uint32_t kMaxSets = 1024;

    eastl::vector<vk::DescriptorPoolSize> poolSizes = {
        {vk::DescriptorType::eSampledImage, kDescriptorsPerType},
        {vk::DescriptorType::eStorageImage, kDescriptorsPerType},
        {vk::DescriptorType::eSampler, kDescriptorsPerType},
        {vk::DescriptorType::eUniformBuffer, kDescriptorsPerType},
        {vk::DescriptorType::eUniformBufferDynamic, kDescriptorsPerType},
        {vk::DescriptorType::eStorageBuffer, kDescriptorsPerType},
        {vk::DescriptorType::eStorageBufferDynamic, kDescriptorsPerType}
    };

    vk::DescriptorPoolCreateInfo poolInfo;
    poolInfo.flags = vk::DescriptorPoolCreateFlagBits::eFreeDescriptorSet;
    poolInfo.maxSets = kMaxSets;
    poolInfo.poolSizeCount = static_cast<uint32_t>(poolSizes.size());
    poolInfo.pPoolSizes = poolSizes.data();

    descriptorPool = vk::raii::DescriptorPool(device, poolInfo);
}

void VulkanRenderDevice::queryCapabilities() {
    const auto properties = physicalDevice.getProperties();
    const auto& vkLimits = properties.limits;

    deviceLimits.maxTextureDimension2D = vkLimits.maxImageDimension2D;
    deviceLimits.maxTextureArrayLayers = vkLimits.maxImageArrayLayers;
    deviceLimits.maxBindGroups = vkLimits.maxBoundDescriptorSets;
    deviceLimits.maxColorAttachments = vkLimits.maxColorAttachments;
    deviceLimits.maxUniformBufferBindingSize = vkLimits.maxUniformBufferRange;
    deviceLimits.maxStorageBufferBindingSize = vkLimits.maxStorageBufferRange;

    const auto available = physicalDevice.getFeatures();
    deviceFeatures = DeviceFeatures::None;
    if (available.samplerAnisotropy) {
        deviceFeatures = deviceFeatures | DeviceFeatures::SamplerAnisotropy;
    }
    if (available.textureCompressionBC) {
        deviceFeatures = deviceFeatures | DeviceFeatures::TextureCompressionBC;
    }
    if (available.drawIndirectFirstInstance) {
        deviceFeatures = deviceFeatures | DeviceFeatures::IndirectFirstInstance;
    }
    if (vkLimits.timestampComputeAndGraphics) {
        deviceFeatures = deviceFeatures | DeviceFeatures::TimestampQuery;
    }
    auto r32Properties = physicalDevice.getFormatProperties(vk::Format::eR32Sfloat);
    if (r32Properties.optimalTilingFeatures & vk::FormatFeatureFlagBits::eSampledImageFilterLinear) {
        deviceFeatures = deviceFeatures | DeviceFeatures::Float32Filterable;
    }
}

bool VulkanRenderDevice::supportsColorTarget(TextureFormat format) const {
    if (format == TextureFormat::Undefined || isDepthFormat(format)) {
        return false;
    }
    auto properties = physicalDevice.getFormatProperties(toVkFormat(format));
    return static_cast<bool>(properties.optimalTilingFeatures & vk::FormatFeatureFlagBits::eColorAttachment);
}

Texture VulkanRenderDevice::createTexture(const TextureDesc& desc) {
    vk::ImageCreateInfo imageCreateInfo;
    imageCreateInfo.imageType = vk::ImageType::e2D;
    imageCreateInfo.extent = vk::Extent3D{desc.width, desc.height, 1};
    imageCreateInfo.mipLevels = desc.mipLevels;
    imageCreateInfo.arrayLayers = desc.arrayLayers;
    imageCreateInfo.format = toVkFormat(desc.format);
    imageCreateInfo.tiling = vk::ImageTiling::eOptimal;
    imageCreateInfo.initialLayout = vk::ImageLayout::eUndefined;
    imageCreateInfo.usage = toVkUsage(desc.usage);
    imageCreateInfo.samples = static_cast<vk::SampleCountFlagBits>(desc.sampleCount);
    imageCreateInfo.sharingMode = vk::SharingMode::eExclusive;

    VmaAllocationCreateInfo allocInfo = {};
    allocInfo.usage = VMA_MEMORY_USAGE_AUTO;

    VkImage vkImage;
    VmaAllocation allocation;
    VkImageCreateInfo vkImageCreateInfo = imageCreateInfo;
    VkResult vmaResult = vmaCreateImage(allocator, &vkImageCreateInfo, &allocInfo, &vkImage, &allocation, nullptr);
    if (vmaResult != VK_SUCCESS) {
        Log::error("Vulkan", "Failed to create image '{}': error code {}", desc.label.c_str(), static_cast<int>(vmaResult));
        throw DeviceError("Failed to create image '" + desc.label + "'", static_cast<int32_t>(vmaResult));
    }
    if (!desc.label.empty()) {
        vmaSetAllocationName(allocator, allocation, desc.label.c_str());
    }

    vk::ImageViewCreateInfo viewInfo;
    viewInfo.image = vkImage;
    viewInfo.viewType = desc.arrayLayers > 1 ? vk::ImageViewType::e2DArray : vk::ImageViewType::e2D;
    viewInfo.format = imageCreateInfo.format;
    viewInfo.subresourceRange.aspectMask = isDepthFormat(desc.format) ? vk::ImageAspectFlagBits::eDepth
                                                                        : vk::ImageAspectFlagBits::eColor;
    viewInfo.subresourceRange.baseMipLevel = 0;
    viewInfo.subresourceRange.levelCount = desc.mipLevels;
    viewInfo.subresourceRange.baseArrayLayer = 0;
    viewInfo.subresourceRange.layerCount = desc.arrayLayers;

    vk::ImageView view;
    try {
        view = vk::raii::ImageView(device, viewInfo).release();
    } catch (const vk::SystemError& e) {
        vmaDestroyImage(allocator, vkImage, allocation);
        Log::error("Vulkan", "Failed to create view for '{}': {}", desc.label.c_str(), e.what());
        throw DeviceError("Failed to create image view '" + desc.label + "'", e.code().value());
    }

    Texture texture;
    texture.image = toRaw(vkImage);
    texture.view = toRaw(static_cast<VkImageView>(view));
    texture.width = desc.width;
    texture.height = desc.height;
    texture.format = desc.format;
    allocations[texture.image] = allocation;
    return texture;
}

Buffer VulkanRenderDevice::createBuffer(const BufferDesc& desc) {
    vk::BufferCreateInfo bufferCreateInfo;
    bufferCreateInfo.size = desc.size;
    bufferCreateInfo.usage = toVkUsage(desc.usage);
    bufferCreateInfo.sharingMode = vk::SharingMode::eExclusive;

    VmaAllocationCreateInfo allocInfo = {};
    allocInfo.usage = VMA_MEMORY_USAGE_AUTO;
    if (desc.hostVisible) {
        allocInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
    }

    VkBuffer vkBuffer;
    VmaAllocation allocation;
    VmaAllocationInfo vmaAllocInfo;
    VkBufferCreateInfo vkBufferCreateInfo = bufferCreateInfo;
    VkResult vmaResult = vmaCreateBuffer(allocator, &vkBufferCreateInfo, &allocInfo, &vkBuffer, &allocation, &vmaAllocInfo);
    if (vmaResult != VK_SUCCESS) {
        Log::error("Vulkan", "Failed to create buffer '{}': error code {}", desc.label.c_str(), static_cast<int>(vmaResult));
        throw DeviceError("Failed to create buffer '" + desc.label + "'", static_cast<int32_t>(vmaResult));
    }
    if (!desc.label.empty()) {
        vmaSetAllocationName(allocator, allocation, desc.label.c_str());
    }

    Buffer buffer;
    buffer.buffer = toRaw(vkBuffer);
    buffer.size = desc.size;
    buffer.mapped = desc.hostVisible ? vmaAllocInfo.pMappedData : nullptr;
    allocations[buffer.buffer] = allocation;
    return buffer;
}

Sampler VulkanRenderDevice::createSampler(const SamplerDesc& desc) {
    vk::SamplerCreateInfo samplerInfo;
    samplerInfo.magFilter = toVkFilter(desc.magFilter);
    samplerInfo.minFilter = toVkFilter(desc.minFilter);
    samplerInfo.mipmapMode = desc.mipmapFilter == FilterMode::Linear ? vk::SamplerMipmapMode::eLinear
                                                                     : vk::SamplerMipmapMode::eNearest;
    samplerInfo.addressModeU = toVkAddressMode(desc.addressModeU);
    samplerInfo.addressModeV = toVkAddressMode(desc.addressModeV);
    samplerInfo.addressModeW = toVkAddressMode(desc.addressModeW);
    samplerInfo.maxLod = VK_LOD_CLAMP_NONE;

    try {
        vk::Sampler sampler = vk::raii::Sampler(device, samplerInfo).release();
        return Sampler{toRaw(static_cast<VkSampler>(sampler))};
    } catch (const vk::SystemError& e) {
        Log::error("Vulkan", "Failed to create sampler '{}': {}", desc.label.c_str(), e.what());
        throw DeviceError("Failed to create sampler '" + desc.label + "'", e.code().value());
    }
}

RawHandle VulkanRenderDevice::createBindGroupLayout(const BindGroupLayoutDesc& desc) {
    eastl::vector<vk::DescriptorSetLayoutBinding> bindings;
    for (const auto& entry : desc.entries) {
        vk::DescriptorSetLayoutBinding binding;
        binding.binding = entry.binding;
        binding.descriptorType = toVkDescriptorType(entry.type, entry.hasDynamicOffset);
        binding.descriptorCount = 1;
        binding.stageFlags = toVkStages(entry.visibility);
        bindings.push_back(binding);
    }

    vk::DescriptorSetLayoutCreateInfo layoutInfo;
    layoutInfo.bindingCount = static_cast<uint32_t>(bindings.size());
    layoutInfo.pBindings = bindings.data();

    try {
        vk::DescriptorSetLayout layout = vk::raii::DescriptorSetLayout(device, layoutInfo).release();
        RawHandle raw = toRaw(static_cast<VkDescriptorSetLayout>(layout));
        layoutEntries[raw] = desc.entries;
        return raw;
    } catch (const vk::SystemError& e) {
        Log::error("Vulkan", "Failed to create bind group layout '{}': {}", desc.label.c_str(), e.what());
        throw DeviceError("Failed to create bind group layout '" + desc.label + "'", e.code().value());
    }
}

BindGroup VulkanRenderDevice::createBindGroup(const eastl::string& label, RawHandle layout,
                                              const eastl::vector<BindGroupBinding>& bindings) {
    auto layoutIt = layoutEntries.find(layout);
    if (layoutIt == layoutEntries.end()) {
        Log::error("Vulkan", "Bind group '{}' uses an unknown layout", label.c_str());
        throw DeviceError("Bind group '" + label + "' uses an unknown layout", static_cast<int32_t>(VK_ERROR_UNKNOWN));
    }

    vk::DescriptorSetLayout setLayout(fromRaw<VkDescriptorSetLayout>(layout));
    vk::DescriptorSetAllocateInfo allocInfo;
    allocInfo.descriptorPool = *descriptorPool;
    allocInfo.descriptorSetCount = 1;
    allocInfo.pSetLayouts = &setLayout;

    vk::DescriptorSet set;
    vk::Result result = getDevice().allocateDescriptorSets(&allocInfo, &set, *device.getDispatcher());
    if (result != vk::Result::eSuccess) {
        Log::error("Vulkan", "Failed to allocate bind group '{}': {}", label.c_str(), vk::to_string(result));
        throw DeviceError("Failed to allocate bind group '" + label + "'", static_cast<int32_t>(result));
    }

    // Reserved up front so the pointers stored in writes stay valid
    eastl::vector<vk::DescriptorImageInfo> imageInfos;
    eastl::vector<vk::DescriptorBufferInfo> bufferInfos;
    eastl::vector<vk::WriteDescriptorSet> writes;
    imageInfos.reserve(bindings.size());
    bufferInfos.reserve(bindings.size());

    for (const auto& binding : bindings) {
        bool dynamicOffset = false;
        for (const auto& entry : layoutIt->second) {
            if (entry.binding == binding.binding) {
                dynamicOffset = entry.hasDynamicOffset;
                break;
            }
        }

        vk::WriteDescriptorSet write;
        write.dstSet = set;
        write.dstBinding = binding.binding;
        write.descriptorCount = 1;
        write.descriptorType = toVkDescriptorType(binding.type, dynamicOffset);

        switch (binding.type) {
            case BindingType::SampledTexture:
            case BindingType::StorageTexture:
                imageInfos.push_back(vk::DescriptorImageInfo{
                    nullptr, vk::ImageView(fromRaw<VkImageView>(binding.resource)),
                    binding.type == BindingType::StorageTexture ? vk::ImageLayout::eGeneral
                                                                : vk::ImageLayout::eShaderReadOnlyOptimal});
                write.pImageInfo = &imageInfos.back();
                break;
            case BindingType::Sampler:
                imageInfos.push_back(vk::DescriptorImageInfo{vk::Sampler(fromRaw<VkSampler>(binding.resource)),
                                                             nullptr, vk::ImageLayout::eUndefined});
                write.pImageInfo = &imageInfos.back();
                break;
            case BindingType::UniformBuffer:
            case BindingType::StorageBuffer:
                bufferInfos.push_back(vk::DescriptorBufferInfo{vk::Buffer(fromRaw<VkBuffer>(binding.resource)),
                                                               binding.offset,
                                                               binding.size == 0 ? VK_WHOLE_SIZE : binding.size});
                write.pBufferInfo = &bufferInfos.back();
                break;
        }
        writes.push_back(write);
    }

    getDevice().updateDescriptorSets(static_cast<uint32_t>(writes.size()), writes.data(), 0, nullptr,
                                     *device.getDispatcher());

    return BindGroup{toRaw(static_cast<VkDescriptorSet>(set)), layout};
}

PipelineError VulkanRenderDevice::validateStage(const ShaderStageDesc& stage, const char* stageName) const {
    if (!stage.module || !isSpirv(stage.module->spirv)) {
        return PipelineError{PipelineErrorCode::InvalidShaderModule,
                             eastl::string(stageName) + " stage has no valid SPIR-V module"};
    }

    const eastl::string& entryPoint = entryPointOf(stage);
    if (!hasSpirvEntryPoint(stage.module->spirv, entryPoint)) {
        return PipelineError{PipelineErrorCode::MissingEntryPoint,
                             "Entry point '" + entryPoint + "' not found in '" + stage.module->label + "'"};
    }

    for (const auto& def : stage.shaderDefs) {
        if (stage.module->specializationConstants.find(def) == stage.module->specializationConstants.end()) {
            return PipelineError{PipelineErrorCode::UnknownShaderDef,
                                 "Shader def '" + def + "' is not declared by '" + stage.module->label + "'"};
        }
    }
    return PipelineError{};
}

PipelineCompileResult VulkanRenderDevice::createRenderPipeline(const RenderPipelineDesc& desc) {
    PipelineError error = validateStage(desc.vertex, "vertex");
    if (error.code == PipelineErrorCode::None && desc.fragment) {
        error = validateStage(*desc.fragment, "fragment");
    }
    if (error.code != PipelineErrorCode::None) {
        return PipelineCompileResult::failure(error.code, error.message);
    }

    eastl::vector<vk::Format> colorFormats;
    eastl::vector<vk::PipelineColorBlendAttachmentState> blendAttachments;
    if (desc.fragment) {
        for (const auto& target : desc.fragment->targets) {
            if (!supportsColorTarget(target.format)) {
                return PipelineCompileResult::failure(PipelineErrorCode::UnsupportedTargetFormat,
                    eastl::string("Format ") + toString(target.format) + " is not color-renderable");
            }
            colorFormats.push_back(toVkFormat(target.format));

            vk::PipelineColorBlendAttachmentState attachment;
            attachment.colorWriteMask = toVkColorWrites(target.writeMask);
            attachment.blendEnable = target.blend ? VK_TRUE : VK_FALSE;
            if (target.blend) {
                attachment.srcColorBlendFactor = toVkBlendFactor(target.blend->color.srcFactor);
                attachment.dstColorBlendFactor = toVkBlendFactor(target.blend->color.dstFactor);
                attachment.colorBlendOp = toVkBlendOp(target.blend->color.operation);
                attachment.srcAlphaBlendFactor = toVkBlendFactor(target.blend->alpha.srcFactor);
                attachment.dstAlphaBlendFactor = toVkBlendFactor(target.blend->alpha.dstFactor);
                attachment.alphaBlendOp = toVkBlendOp(target.blend->alpha.operation);
            }
            blendAttachments.push_back(attachment);
        }
    }

    try {
        auto createModule = [this](const ShaderModule& module) {
            vk::ShaderModuleCreateInfo createInfo;
            createInfo.codeSize = module.spirv.size() * sizeof(uint32_t);
            createInfo.pCode = module.spirv.data();
            return vk::raii::ShaderModule(device, createInfo);
        };

        vk::raii::ShaderModule vertexModule = createModule(*desc.vertex.module);
        vk::raii::ShaderModule fragmentModule{nullptr};

        StageSpecialization vertexSpecialization;
        vertexSpecialization.build(desc.vertex);
        StageSpecialization fragmentSpecialization;

        eastl::vector<vk::PipelineShaderStageCreateInfo> shaderStages;
        vk::PipelineShaderStageCreateInfo vertexStage;
        vertexStage.stage = vk::ShaderStageFlagBits::eVertex;
        vertexStage.module = *vertexModule;
        vertexStage.pName = entryPointOf(desc.vertex).c_str();
        vertexStage.pSpecializationInfo = &vertexSpecialization.info;
        shaderStages.push_back(vertexStage);

        if (desc.fragment) {
            fragmentModule = createModule(*desc.fragment->module);
            fragmentSpecialization.build(*desc.fragment);

            vk::PipelineShaderStageCreateInfo fragmentStage;
            fragmentStage.stage = vk::ShaderStageFlagBits::eFragment;
            fragmentStage.module = *fragmentModule;
            fragmentStage.pName = entryPointOf(*desc.fragment).c_str();
            fragmentStage.pSpecializationInfo = &fragmentSpecialization.info;
            shaderStages.push_back(fragmentStage);
        }

        // Fullscreen and procedural passes only; no vertex buffers
        vk::PipelineVertexInputStateCreateInfo vertexInputInfo;

        vk::PipelineInputAssemblyStateCreateInfo inputAssembly;
        inputAssembly.topology = toVkTopology(desc.topology);

        vk::PipelineViewportStateCreateInfo viewportState;
        viewportState.viewportCount = 1;
        viewportState.scissorCount = 1;

        vk::PipelineRasterizationStateCreateInfo rasterizer;
        rasterizer.polygonMode = vk::PolygonMode::eFill;
        rasterizer.lineWidth = 1.0f;
        rasterizer.cullMode = vk::CullModeFlagBits::eNone;
        rasterizer.frontFace = vk::FrontFace::eCounterClockwise;

        vk::PipelineMultisampleStateCreateInfo multisampling;
        multisampling.rasterizationSamples = vk::SampleCountFlagBits::e1;

        vk::PipelineColorBlendStateCreateInfo colorBlending;
        colorBlending.logicOpEnable = VK_FALSE;
        colorBlending.attachmentCount = static_cast<uint32_t>(blendAttachments.size());
        colorBlending.pAttachments = blendAttachments.empty() ? nullptr : blendAttachments.data();

        // Blend constants carry per-pass factors (bloom composite)
        eastl::vector<vk::DynamicState> dynamicStates = {
            vk::DynamicState::eViewport,
            vk::DynamicState::eScissor,
            vk::DynamicState::eBlendConstants
        };
        vk::PipelineDynamicStateCreateInfo dynamicState;
        dynamicState.dynamicStateCount = static_cast<uint32_t>(dynamicStates.size());
        dynamicState.pDynamicStates = dynamicStates.data();

        vk::PipelineDepthStencilStateCreateInfo depthStencil;

        eastl::vector<vk::DescriptorSetLayout> setLayouts;
        for (RawHandle layout : desc.layout) {
            setLayouts.push_back(vk::DescriptorSetLayout(fromRaw<VkDescriptorSetLayout>(layout)));
        }

        vk::PipelineLayoutCreateInfo pipelineLayoutInfo;
        pipelineLayoutInfo.setLayoutCount = static_cast<uint32_t>(setLayouts.size());
        pipelineLayoutInfo.pSetLayouts = setLayouts.empty() ? nullptr : setLayouts.data();

        vk::raii::PipelineLayout pipelineLayout(device, pipelineLayoutInfo);

        // Dynamic rendering format info (no VkRenderPass)
        vk::PipelineRenderingCreateInfo renderingInfo;
        renderingInfo.colorAttachmentCount = static_cast<uint32_t>(colorFormats.size());
        renderingInfo.pColorAttachmentFormats = colorFormats.empty() ? nullptr : colorFormats.data();

        vk::GraphicsPipelineCreateInfo pipelineInfo;
        pipelineInfo.pNext = &renderingInfo;
        pipelineInfo.stageCount = static_cast<uint32_t>(shaderStages.size());
        pipelineInfo.pStages = shaderStages.data();
        pipelineInfo.pVertexInputState = &vertexInputInfo;
        pipelineInfo.pInputAssemblyState = &inputAssembly;
        pipelineInfo.pViewportState = &viewportState;
        pipelineInfo.pRasterizationState = &rasterizer;
        pipelineInfo.pMultisampleState = &multisampling;
        pipelineInfo.pDepthStencilState = &depthStencil;
        pipelineInfo.pColorBlendState = &colorBlending;
        pipelineInfo.pDynamicState = &dynamicState;
        pipelineInfo.layout = *pipelineLayout;

        vk::raii::Pipeline pipeline(device, nullptr, pipelineInfo);

        RenderPipeline result;
        result.pipeline = toRaw(static_cast<VkPipeline>(pipeline.release()));
        result.layout = toRaw(static_cast<VkPipelineLayout>(pipelineLayout.release()));
        Log::debug("Vulkan", "Created pipeline '{}'", desc.label.c_str());
        return PipelineCompileResult::ok(result);
    } catch (const vk::SystemError& e) {
        Log::error("Vulkan", "Failed to create pipeline '{}': {}", desc.label.c_str(), e.what());
        return PipelineCompileResult::failure(PipelineErrorCode::PipelineCreationFailed, e.what());
    }
}

void VulkanRenderDevice::destroyTexture(const Texture& texture) {
    if (texture.view != kNullRawHandle) {
        getDevice().destroyImageView(vk::ImageView(fromRaw<VkImageView>(texture.view)), nullptr, *device.getDispatcher());
    }

    auto it = allocations.find(texture.image);
    if (it != allocations.end()) {
        vmaDestroyImage(allocator, fromRaw<VkImage>(texture.image), it->second);
        allocations.erase(it);
    }
}

void VulkanRenderDevice::destroyBuffer(const Buffer& buffer) {
    // Mapped allocations are unmapped by vmaDestroyBuffer
    auto it = allocations.find(buffer.buffer);
    if (it != allocations.end()) {
        vmaDestroyBuffer(allocator, fromRaw<VkBuffer>(buffer.buffer), it->second);
        allocations.erase(it);
    }
}

void VulkanRenderDevice::destroySampler(const Sampler& sampler) {
    if (sampler.sampler != kNullRawHandle) {
        getDevice().destroySampler(vk::Sampler(fromRaw<VkSampler>(sampler.sampler)), nullptr, *device.getDispatcher());
    }
}

void VulkanRenderDevice::destroyBindGroupLayout(RawHandle layout) {
    if (layout == kNullRawHandle) {
        return;
    }
    getDevice().destroyDescriptorSetLayout(vk::DescriptorSetLayout(fromRaw<VkDescriptorSetLayout>(layout)), nullptr,
                                           *device.getDispatcher());
    layoutEntries.erase(layout);
}

void VulkanRenderDevice::destroyBindGroup(const BindGroup& bindGroup) {
    if (bindGroup.set == kNullRawHandle) {
        return;
    }
    vk::DescriptorSet set(fromRaw<VkDescriptorSet>(bindGroup.set));
    vk::Result result = getDevice().freeDescriptorSets(*descriptorPool, 1, &set, *device.getDispatcher());
    if (result != vk::Result::eSuccess) {
        Log::error("Vulkan", "Failed to free descriptor set: {}", vk::to_string(result));
    }
}

void VulkanRenderDevice::destroyRenderPipeline(const RenderPipeline& pipeline) {
    if (pipeline.pipeline != kNullRawHandle) {
        getDevice().destroyPipeline(vk::Pipeline(fromRaw<VkPipeline>(pipeline.pipeline)), nullptr, *device.getDispatcher());
    }
    if (pipeline.layout != kNullRawHandle) {
        getDevice().destroyPipelineLayout(vk::PipelineLayout(fromRaw<VkPipelineLayout>(pipeline.layout)), nullptr,
                                          *device.getDispatcher());
    }
}

} // namespace ember
