#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "callbridge/WireValue.hpp"
#include "callbridge/callbridge_abi.h"

namespace callbridge {

enum class Selector {
    CallFunction,
    CallFunctionParse,
    CallFunctionStream,
    CallObjectConstructor,
    CallObjectMethod,
    CallObjectMethodAsync,
    DestroyObject,
};

const char* selector_name(Selector selector);
bool is_async_selector(Selector selector);

struct RuntimeOptions {
    std::string root_path;
    std::string src_files_json = "{}";
    std::string env_vars_json = "{}";
};

/**
 * CallDispatcher - synchronous hop across the C ABI
 *
 * Holds the API table and the runtime it was bound to; keeps nothing between
 * calls. A non-OK native status is raised as BridgeError with the native
 * diagnostic relayed untouched.
 */
class CallDispatcher {
   public:
    explicit CallDispatcher(const callbridge_native_api* api);

    std::string version() const;

    callbridge_runtime create_runtime(const RuntimeOptions& options,
        callbridge_result_callback on_result,
        callbridge_tick_callback on_tick,
        void* user_data) const;
    void destroy_runtime(callbridge_runtime runtime) const;

    void bind(callbridge_runtime runtime) { runtime_.store(runtime); }
    callbridge_runtime runtime() const { return runtime_.load(); }

    // Async selectors need a non-zero call_id and return an empty buffer once
    // the runtime has accepted the request.
    Bytes invoke(Selector selector, const Bytes& request, uint32_t call_id = 0) const;

    // Returns whether the runtime still had the call in flight.
    bool cancel(uint32_t call_id) const;

    const callbridge_native_api* api() const { return api_; }

   private:
    Bytes take_buffer(callbridge_buffer& buffer) const;
    void raise(Selector selector, callbridge_status status, callbridge_buffer& error) const;
    callbridge_runtime require_runtime() const;

    const callbridge_native_api* api_;
    std::atomic<callbridge_runtime> runtime_{nullptr};
};

}  // namespace callbridge
