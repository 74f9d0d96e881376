#include "callbridge/HandleRegistry.hpp"

#include "callbridge/BridgeError.hpp"
#include "callbridge/Log.hpp"

namespace callbridge {

namespace {

constexpr uint64_t INDEX_MASK = 0xFFFFFFFFull;
constexpr uint32_t LAST_GENERATION = 0xFFFFFFFFu;

uint32_t generation_of(Handle handle) {
    return static_cast<uint32_t>(handle >> 32);
}

Handle make_handle(size_t index, uint32_t generation) {
    return (static_cast<uint64_t>(generation) << 32) | (static_cast<uint64_t>(index) + 1);
}

}  // namespace

const HandleEntry* HandleRegistry::slot(Handle handle) const {
    uint64_t index = handle & INDEX_MASK;
    if (index == 0 || index > entries_.size()) return nullptr;
    const HandleEntry& e = entries_[index - 1];
    return e.handle == handle ? &e : nullptr;
}

Handle HandleRegistry::insert_locked(ObjectKind kind, uint64_t pointer, uint32_t creation_call_id) {
    size_t index;
    uint32_t generation = 0;
    if (!free_slots_.empty()) {
        index = free_slots_.back();
        free_slots_.pop_back();
        generation = generation_of(entries_[index].handle) + 1;
    } else {
        index = entries_.size();
        entries_.emplace_back();
    }

    HandleEntry& e = entries_[index];
    e.handle = make_handle(index, generation);
    e.kind = kind;
    e.pointer = pointer;
    e.live = true;
    e.creation_call_id = creation_call_id;
    live_by_pointer_[pointer] = e.handle;

    CALLBRIDGE_TRACE("registry", "registered handle " << e.handle << " (" << object_kind_name(kind) << ")");
    return e.handle;
}

Handle HandleRegistry::register_object(ObjectKind kind, uint64_t pointer, uint32_t creation_call_id) {
    if (!is_known_object_kind(static_cast<uint8_t>(kind))) {
        throw BridgeError(ErrorKind::InvalidArgument, "cannot register object of unknown kind");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = live_by_pointer_.find(pointer);
    if (it != live_by_pointer_.end()) {
        const HandleEntry& existing = *slot(it->second);
        CALLBRIDGE_ERROR("registry", "native pointer reused while still live (handle "
                << existing.handle << ", " << object_kind_name(existing.kind) << ")");
        throw BridgeError::duplicate_handle(existing.handle, existing.kind, pointer);
    }

    return insert_locked(kind, pointer, creation_call_id);
}

Handle HandleRegistry::adopt(ObjectKind kind, uint64_t pointer, uint32_t creation_call_id) {
    if (!is_known_object_kind(static_cast<uint8_t>(kind))) {
        throw BridgeError(ErrorKind::UnsupportedValueKind, "runtime returned an object of unknown kind");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = live_by_pointer_.find(pointer);
    if (it != live_by_pointer_.end()) {
        const HandleEntry& existing = *slot(it->second);
        if (existing.kind == kind) return existing.handle;

        CALLBRIDGE_ERROR("registry", "live pointer of handle " << existing.handle << " came back as "
                << object_kind_name(kind) << " instead of " << object_kind_name(existing.kind));
        throw BridgeError::duplicate_handle(existing.handle, existing.kind, pointer);
    }

    return insert_locked(kind, pointer, creation_call_id);
}

RawObjectRef HandleRegistry::resolve(Handle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const HandleEntry* e = slot(handle);
    if (!e) {
        uint64_t index = handle & INDEX_MASK;
        bool recycled = index != 0 && index <= entries_.size() &&
            generation_of(handle) < generation_of(entries_[index - 1].handle);
        throw BridgeError::invalid_handle(handle, CALLBRIDGE_OBJECT_INVALID,
            recycled ? "has been disposed" : "is not registered");
    }
    if (!e->live) {
        throw BridgeError::invalid_handle(handle, e->kind, "has been disposed");
    }
    return RawObjectRef{e->kind, e->pointer};
}

RawObjectRef HandleRegistry::resolve(Handle handle, ObjectKind expected) const {
    RawObjectRef ref = resolve(handle);
    if (ref.kind != expected) {
        throw BridgeError::invalid_handle(handle, ref.kind,
            std::string("is not a ") + object_kind_name(expected));
    }
    return ref;
}

std::optional<RawObjectRef> HandleRegistry::invalidate(Handle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!slot(handle)) return std::nullopt;

    HandleEntry& e = entries_[(handle & INDEX_MASK) - 1];
    if (!e.live) return std::nullopt;

    e.live = false;
    live_by_pointer_.erase(e.pointer);
    if (generation_of(handle) != LAST_GENERATION) {
        free_slots_.push_back(static_cast<uint32_t>((handle & INDEX_MASK) - 1));
    }
    CALLBRIDGE_TRACE("registry", "invalidated handle " << handle);
    return RawObjectRef{e.kind, e.pointer};
}

std::optional<Handle> HandleRegistry::find_live(uint64_t pointer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = live_by_pointer_.find(pointer);
    if (it == live_by_pointer_.end()) return std::nullopt;
    return it->second;
}

std::optional<HandleEntry> HandleRegistry::entry(Handle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const HandleEntry* e = slot(handle);
    if (!e) return std::nullopt;
    return *e;
}

bool HandleRegistry::is_live(Handle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const HandleEntry* e = slot(handle);
    return e && e->live;
}

size_t HandleRegistry::live_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_by_pointer_.size();
}

size_t HandleRegistry::slot_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<Handle> HandleRegistry::live_handles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Handle> out;
    out.reserve(live_by_pointer_.size());
    for (const auto& e : entries_) {
        if (e.live) out.push_back(e.handle);
    }
    return out;
}

}  // namespace callbridge
