#pragma once

#ifndef CALLBRIDGE_CALLBACK_CHANNEL_HPP
#define CALLBRIDGE_CALLBACK_CHANNEL_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

#include "callbridge/WireValue.hpp"
#include "callbridge/callbridge_abi.h"

#include <uv.h>

namespace callbridge {

enum class CallbackEvent {
    Partial,
    Tick,
    Final,
};

struct CallbackMessage {
    uint32_t call_id = 0;
    CallbackEvent event = CallbackEvent::Final;
    callbridge_call_status status = CALLBRIDGE_CALL_SUCCESS;
    Bytes payload;
};

// Carries native -> host callbacks from arbitrary runtime threads to a single
// dispatch thread. The dispatch thread runs a private libuv loop woken by a
// uv_async_t; messages are consumed in the order they were posted.
//
// The loop state is shared with the dispatch thread, so the channel may be
// stopped or even destroyed from inside its own consumer. Destroying it there
// drops whatever is still queued.
class CallbackChannel {
   public:
    using Consumer = std::function<void(CallbackMessage&)>;

    explicit CallbackChannel(Consumer consumer);
    ~CallbackChannel();

    CallbackChannel(const CallbackChannel&) = delete;
    CallbackChannel& operator=(const CallbackChannel&) = delete;

    void start();

    // Safe from any thread. Returns false once the channel is closed.
    bool post(CallbackMessage message);

    // Drains everything already posted, then stops the loop and joins the thread.
    // On the dispatch thread it only asks the loop to stop after the current
    // drain; a later stop() from another thread joins.
    void stop();

    bool on_dispatch_thread() const;
    uint64_t delivered() const;

   private:
    struct State;

    static void on_async(uv_async_t* handle);
    static void drain(State& state);
    static void run(State& state);

    // Requires state mutex.
    static void request_stop(State& state);

    std::shared_ptr<State> state_;
    std::thread thread_;
    std::thread::id thread_id_;
    std::atomic<bool> stopped_{false};
};

}  // namespace callbridge

#endif  // CALLBRIDGE_CALLBACK_CHANNEL_HPP
