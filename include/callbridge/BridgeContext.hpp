#pragma once

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>

#include "callbridge/BridgeConfig.hpp"
#include "callbridge/CallDispatcher.hpp"
#include "callbridge/CallbackChannel.hpp"
#include "callbridge/CallbackManager.hpp"
#include "callbridge/HandleRegistry.hpp"
#include "callbridge/NativeLibrary.hpp"
#include "callbridge/WireValue.hpp"

namespace callbridge {

// Host-side name for a native object. Never carries the native address.
struct ObjectHandle {
    Handle handle = 0;
    ObjectKind kind = CALLBRIDGE_OBJECT_INVALID;

    bool operator==(const ObjectHandle& other) const { return handle == other.handle && kind == other.kind; }
    bool operator!=(const ObjectHandle& other) const { return !(*this == other); }
};

/**
 * BridgeContext - everything one native runtime instance needs on the host side
 *
 * Owns the handle registry, the dispatcher bound to the runtime, the callback
 * channel and the callback manager. The context address is the user_data the
 * runtime hands back with every reverse callback, so several contexts can share
 * one process.
 *
 * Native pointers never leave the context. Every raw object reference it hands
 * out, in results, byte-level replies or callbacks, carries the registry handle
 * in its 64-bit field, and every reference it receives is resolved through the
 * registry before the request is forwarded.
 *
 * Every call into the runtime holds the lifecycle lock shared; close() takes it
 * exclusively, so the runtime is never destroyed under a call in progress.
 * Teardown destroys live objects, destroys the runtime (which cancels in-flight
 * calls and delivers their final callbacks), and then drains the channel.
 */
class BridgeContext {
   public:
    BridgeContext(const callbridge_native_api* api, const RuntimeOptions& options);
    ~BridgeContext();

    BridgeContext(const BridgeContext&) = delete;
    BridgeContext& operator=(const BridgeContext&) = delete;

    // Loads config.native_library and the sources under config.root_path.
    static std::unique_ptr<BridgeContext> from_config(const BridgeConfig& config);

    static RuntimeOptions options_for(const std::string& root_path,
        const std::map<std::string, std::string>& files,
        const std::map<std::string, std::string>& env);

    std::string version() const;

    // ---- objects ----

    ObjectHandle construct_object(ObjectKind kind, const KwargsMap& kwargs);
    WireValue call_object_method(const ObjectHandle& object, const std::string& method, const KwargsMap& kwargs);
    CallHandle call_object_method_async(const ObjectHandle& object, const std::string& method,
        const KwargsMap& kwargs);

    // Byte-level entry points. Object references in requests and replies carry
    // handles. Every reference in a request must name a live handle of the
    // stated kind, otherwise InvalidHandle is raised and nothing is forwarded.
    Bytes call_object_constructor(const Bytes& request);
    Bytes call_object_method(const Bytes& request);

    // Idempotent. Returns true when this call released the object.
    bool dispose(Handle handle);

    // The reference to put on the wire for a live object. Throws InvalidHandle.
    RawObjectRef reference(const ObjectHandle& object) const;

    static ObjectHandle handle_of(const RawObjectRef& reference) { return ObjectHandle{reference.pointer, reference.kind}; }

    // ---- functions ----

    CallHandle call_function(const std::string& name, const KwargsMap& kwargs, const EnvVars& env = {});
    CallHandle call_function_parse(const std::string& name, const KwargsMap& kwargs, const EnvVars& env = {});
    CallHandle call_function_stream(const std::string& name, const KwargsMap& kwargs, const EnvVars& env,
        PartialSink on_partial, TickSink on_tick = nullptr);

    bool cancel(uint32_t call_id) { return callbacks_.cancel(call_id); }

    // Tears everything down early. The destructor does the same.
    void close();
    bool closed() const { return closed_.load(); }

    HandleRegistry& registry() { return registry_; }
    const HandleRegistry& registry() const { return registry_; }
    CallbackManager& callbacks() { return callbacks_; }
    const CallDispatcher& dispatcher() const { return dispatcher_; }

   private:
    BridgeContext(std::unique_ptr<NativeLibrary> library, const RuntimeOptions& options);

    void open(const RuntimeOptions& options);

    // Reverse entry points handed to create_runtime.
    static void on_result(void* user_data, uint32_t call_id, int is_done, callbridge_call_status status,
        const uint8_t* data, size_t length);
    static void on_tick(void* user_data, uint32_t call_id);

    static CallbackHooks hooks_for(BridgeContext* self);

    // Both require the lifecycle lock.
    void require_open() const;
    bool dispose_locked(Handle handle);

    // Handle-carrying references to native ones and back.
    RawObjectRef to_native(const RawObjectRef& reference) const;
    KwargsMap to_native(const KwargsMap& kwargs) const;
    RawObjectRef to_host(const RawObjectRef& native, uint32_t creation_call_id = 0);
    WireValue to_host(const WireValue& value, uint32_t creation_call_id = 0);

    bool native_cancel(uint32_t call_id);

    CallHandle start_function(Selector selector, const std::string& name, const KwargsMap& kwargs,
        const EnvVars& env, PartialSink on_partial = nullptr, TickSink on_tick = nullptr);

    // Only set by from_config; destroyed after everything that uses its table.
    std::unique_ptr<NativeLibrary> library_;

    HandleRegistry registry_;
    CallDispatcher dispatcher_;
    CallbackChannel channel_;
    CallbackManager callbacks_;

    mutable std::shared_mutex lifecycle_mutex_;
    std::atomic<bool> closed_{false};
    bool torn_down_ = false;  // guarded by lifecycle_mutex_
};

}  // namespace callbridge
