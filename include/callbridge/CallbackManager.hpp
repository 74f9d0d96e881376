#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "callbridge/BridgeError.hpp"
#include "callbridge/CallDispatcher.hpp"
#include "callbridge/CallbackChannel.hpp"
#include "callbridge/WireValue.hpp"

namespace callbridge {

enum class CallState {
    Active,
    CancelRequested,
    Completed,
};

const char* call_state_name(CallState state);

enum class CallStatus {
    Success,
    Failed,
    Cancelled,
};

struct CallOutcome {
    CallStatus status = CallStatus::Success;
    WireValue value;
    ErrorKind error = ErrorKind::NativeFailure;
    std::string diagnostic;

    bool ok() const { return status == CallStatus::Success; }

    // Returns the value or raises the failure as BridgeError.
    const WireValue& value_or_throw() const;
};

using PartialSink = std::function<void(const WireValue&)>;
using TickSink = std::function<void()>;

// What the caller keeps for one asynchronous call.
struct CallHandle {
    uint32_t call_id = 0;
    std::shared_future<CallOutcome> outcome;

    bool valid() const { return call_id != 0 && outcome.valid(); }
    bool ready() const;
    const CallOutcome& wait() const { return outcome.get(); }
    bool wait_for(std::chrono::milliseconds timeout) const;
};

// Lets the owner step in between the runtime and the pending calls. Either
// member may be empty.
struct CallbackHooks {
    // Applied to every decoded result and partial before anyone sees it.
    std::function<WireValue(const WireValue& value, uint32_t call_id)> map_value;

    // Replaces CallDispatcher::cancel for native cancellation.
    std::function<bool(uint32_t call_id)> native_cancel;
};

class CallbackManager {
   public:
    explicit CallbackManager(const CallDispatcher& dispatcher, CallbackHooks hooks = {});
    ~CallbackManager();

    CallbackManager(const CallbackManager&) = delete;
    CallbackManager& operator=(const CallbackManager&) = delete;

    // Registers the pending call before the request is handed to the runtime,
    // so the runtime can never call back for an id that is not yet tracked.
    CallHandle start(Selector selector, const Bytes& request, PartialSink on_partial = nullptr,
        TickSink on_tick = nullptr);

    // Entry for every reverse callback. Unknown ids are dropped.
    void on_native_callback(const CallbackMessage& message);

    // True only for Active -> CancelRequested.
    bool cancel(uint32_t call_id);
    bool cancel(const CallHandle& handle) { return cancel(handle.call_id); }

    // Completes every pending call as Cancelled.
    void shutdown(const std::string& reason);

    size_t pending_count() const;

    // nullopt once the call has completed or was never issued.
    std::optional<CallState> state_of(uint32_t call_id) const;

   private:
    struct PendingCall {
        uint32_t call_id = 0;
        Selector selector = Selector::CallFunction;
        CallState state = CallState::Active;
        std::promise<CallOutcome> completion;
        PartialSink on_partial;
        TickSink on_tick;
    };

    uint32_t next_call_id();
    void complete(uint32_t call_id, CallOutcome outcome);
    void deliver_partial(const CallbackMessage& message);
    CallOutcome outcome_from(const CallbackMessage& message) const;
    WireValue decode(const CallbackMessage& message) const;
    bool native_cancel(uint32_t call_id) const;

    const CallDispatcher& dispatcher_;
    CallbackHooks hooks_;

    mutable std::mutex mutex_;
    std::unordered_map<uint32_t, PendingCall> pending_;
    uint32_t last_call_id_ = 0;
    bool shut_down_ = false;
};

}  // namespace callbridge
