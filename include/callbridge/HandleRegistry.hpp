#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "callbridge/WireValue.hpp"

namespace callbridge {

// Low 32 bits: slot index + 1. High 32 bits: generation of the slot.
// 0 is never issued.
using Handle = uint64_t;

struct HandleEntry {
    Handle handle = 0;
    ObjectKind kind = CALLBRIDGE_OBJECT_INVALID;
    uint64_t pointer = 0;
    bool live = false;
    uint32_t creation_call_id = 0;
};

/**
 * HandleRegistry - arena of native object handles
 *
 * A handle names a slot and the generation the slot had when the handle was
 * issued. Disposed slots are recycled with the next generation, so a handle
 * value is never issued twice and a disposed handle stays invalid even if the
 * native allocator hands the same pointer out again. A slot whose generation
 * is exhausted is retired.
 * The registry only maps handles to pointers; it never owns native memory.
 */
class HandleRegistry {
   public:
    HandleRegistry() = default;
    HandleRegistry(const HandleRegistry&) = delete;
    HandleRegistry& operator=(const HandleRegistry&) = delete;

    // Throws DuplicateHandle if the pointer is already live.
    Handle register_object(ObjectKind kind, uint64_t pointer, uint32_t creation_call_id = 0);

    // Returns the live handle for pointer, registering it first if needed.
    // A live pointer that comes back under another kind is a DuplicateHandle.
    Handle adopt(ObjectKind kind, uint64_t pointer, uint32_t creation_call_id = 0);

    // Throws InvalidHandle if the handle is unknown or no longer live.
    RawObjectRef resolve(Handle handle) const;
    RawObjectRef resolve(Handle handle, ObjectKind expected) const;

    // Clears liveness and returns the reference the native side must destroy.
    // Later calls for the same handle return nullopt.
    std::optional<RawObjectRef> invalidate(Handle handle);

    std::optional<Handle> find_live(uint64_t pointer) const;
    std::optional<HandleEntry> entry(Handle handle) const;

    bool is_live(Handle handle) const;
    size_t live_count() const;
    std::vector<Handle> live_handles() const;

    // Slots allocated so far, live or free.
    size_t slot_count() const;

   private:
    // Entry whose current generation matches the handle, or nullptr.
    const HandleEntry* slot(Handle handle) const;
    Handle insert_locked(ObjectKind kind, uint64_t pointer, uint32_t creation_call_id);

    mutable std::mutex mutex_;
    std::vector<HandleEntry> entries_;
    std::vector<uint32_t> free_slots_;
    std::unordered_map<uint64_t, Handle> live_by_pointer_;
};

}  // namespace callbridge
