#include "ResourceSlotTable.hpp"

#include <EASTL/algorithm.h>

#include "core/Exception.hpp"
#include "core/Log.hpp"

namespace ember {

namespace {
    // Distance from the first generation, modulo the 16-bit generation space
    uint16_t generationOffset(uint16_t generation, uint16_t first) {
        return static_cast<uint16_t>(generation - first);
    }
}

ResourceSlotTable::ResourceSlotTable(uint32_t capacity)
    : maxSlots(eastl::min(capacity, GraphConfig::kMaxResourceIds)) {}

void ResourceSlotTable::configure(const GraphConfig& config) {
    maxSlots = eastl::clamp(config.maxResourcesPerFrame, 1u, GraphConfig::kMaxResourceIds);
    validateGenerations = config.validateHandleGenerations;
}

ResourceId ResourceSlotTable::allocate(ResourceKind kind) {
    if (nextIndex >= maxSlots) {
        Log::critical("RenderGraph", "Resource id space exhausted ({} ids this frame)", maxSlots);
        throw GraphError(GraphErrorKind::IdSpaceExhausted, "Resource id space exhausted for this frame");
    }

    uint16_t index = static_cast<uint16_t>(nextIndex++);
    if (index >= slots.size()) {
        slots.push_back(Slot{});
    }

    Slot& slot = slots[index];
    slot.kind = kind;
    slot.latestGeneration = slot.firstGeneration;
    slot.live = true;

    return ResourceId{index, slot.firstGeneration};
}

void ResourceSlotTable::recordWrite(ResourceId id) {
    if (!isLive(id.index)) {
        return;
    }

    Slot& slot = slots[id.index];
    uint16_t offset = generationOffset(id.generation, slot.firstGeneration);
    if (offset > generationOffset(slot.latestGeneration, slot.firstGeneration)) {
        slot.latestGeneration = id.generation;
    }
}

bool ResourceSlotTable::validate(ResourceId id, ResourceKind kind) const {
    return isLive(id.index) && slots[id.index].kind == kind && validate(id);
}

bool ResourceSlotTable::validate(ResourceId id) const {
    if (!isLive(id.index)) {
        return false;
    }

    const Slot& slot = slots[id.index];
    if (!validateGenerations) {
        return true;
    }
    return generationOffset(id.generation, slot.firstGeneration) <=
           generationOffset(slot.latestGeneration, slot.firstGeneration);
}

bool ResourceSlotTable::isLive(uint16_t index) const {
    return index < nextIndex && index < slots.size() && slots[index].live;
}

void ResourceSlotTable::beginFrame() {
    for (uint32_t i = 0; i < nextIndex && i < slots.size(); ++i) {
        Slot& slot = slots[i];
        slot.firstGeneration = static_cast<uint16_t>(slot.latestGeneration + 1);
        slot.latestGeneration = slot.firstGeneration;
        slot.live = false;
    }
    nextIndex = 0;
}

void ResourceSlotTable::clear() {
    slots.clear();
    nextIndex = 0;
}

} // namespace ember
