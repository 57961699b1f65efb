#pragma once

#include <EASTL/vector.h>
#include <cstdint>

#include "RenderResource.hpp"
#include "core/Config.hpp"

namespace ember {

/**
 * @brief Graph-wide id allocator with per-slot generation ranges
 *
 * Indices are handed out sequentially within a frame and reused from the
 * start of the next one. A slot remembers the first generation issued for
 * its current occupant and the latest generation written. A handle resolves
 * only if its generation falls inside that range; a newly attached node may
 * only read the latest generation and write the one after it. Reusing an
 * index moves the range past every generation issued before, which makes
 * handles from earlier frames stale.
 */
class ResourceSlotTable {
public:
    explicit ResourceSlotTable(uint32_t capacity = GraphConfig::kMaxResourceIds);

    void configure(const GraphConfig& config);

    // Throws GraphError(IdSpaceExhausted) once the frame has used every index
    ResourceId allocate(ResourceKind kind);

    // Extends the slot's valid range to cover a declared write
    void recordWrite(ResourceId id);

    bool validate(ResourceId id, ResourceKind kind) const;
    bool validate(ResourceId id) const;
    bool isLive(uint16_t index) const;
    // Generation of the slot's current contents. The slot must be live.
    uint16_t latestGeneration(uint16_t index) const { return slots[index].latestGeneration; }

    // Retires every live slot; the next allocate starts from index 0
    void beginFrame();

    void clear();

    uint32_t allocatedThisFrame() const { return nextIndex; }
    uint32_t capacity() const { return maxSlots; }
    bool validatesGenerations() const { return validateGenerations; }

private:
    struct Slot {
        ResourceKind kind = ResourceKind::Texture;
        uint16_t firstGeneration = 0;
        uint16_t latestGeneration = 0;
        bool live = false;
    };

    eastl::vector<Slot> slots;
    uint32_t nextIndex = 0;
    uint32_t maxSlots;
    bool validateGenerations = true;
};

} // namespace ember
