#include "callbridge/CallbackChannel.hpp"

#include <deque>
#include <exception>
#include <mutex>

#include "callbridge/Log.hpp"

namespace callbridge {

struct CallbackChannel::State {
    explicit State(Consumer c) : consumer(std::move(c)) {
        uv_loop_init(&loop);
        async_handle.data = this;
        uv_async_init(&loop, &async_handle, &CallbackChannel::on_async);
    }

    ~State() {
        int r = uv_loop_close(&loop);
        if (r != 0) {
            CALLBRIDGE_ERROR("channel", "closing callback loop failed: " << uv_strerror(r));
        }
    }

    Consumer consumer;

    uv_loop_t loop;
    uv_async_t async_handle;

    std::mutex mutex;
    std::deque<CallbackMessage> queue;
    bool stopping = false;
    bool closed = false;

    // Set when the channel is destroyed from its own consumer.
    std::atomic<bool> discard{false};
    std::atomic<uint64_t> delivered{0};
};

// libuv async callback. Runs on the dispatch thread.
void CallbackChannel::on_async(uv_async_t* handle) {
    auto* state = static_cast<State*>(handle->data);
    if (state) drain(*state);
}

CallbackChannel::CallbackChannel(Consumer consumer) : state_(std::make_shared<State>(std::move(consumer))) {}

CallbackChannel::~CallbackChannel() {
    if (thread_.joinable() && on_dispatch_thread()) {
        // The thread still holds the state and lets its loop run out.
        {
            std::lock_guard<std::mutex> lk(state_->mutex);
            state_->discard.store(true);
            request_stop(*state_);
        }
        CALLBRIDGE_DEBUG("channel", "destroyed on the dispatch thread; dropping queued callbacks");
        thread_.detach();
        return;
    }
    stop();
}

void CallbackChannel::start() {
    if (thread_.joinable() || stopped_.load()) return;
    std::shared_ptr<State> state = state_;
    thread_ = std::thread([state]() { run(*state); });
    thread_id_ = thread_.get_id();
}

void CallbackChannel::run(State& state) {
    // Returns once the async handle is closed and no other handles remain.
    uv_run(&state.loop, UV_RUN_DEFAULT);
}

bool CallbackChannel::post(CallbackMessage message) {
    std::lock_guard<std::mutex> lk(state_->mutex);
    if (state_->closed) {
        CALLBRIDGE_DEBUG("channel", "dropping callback for call " << message.call_id << " after close");
        return false;
    }
    state_->queue.push_back(std::move(message));
    uv_async_send(&state_->async_handle);
    return true;
}

void CallbackChannel::request_stop(State& state) {
    if (state.closed) return;
    state.stopping = true;
    uv_async_send(&state.async_handle);
}

void CallbackChannel::drain(State& state) {
    while (true) {
        std::deque<CallbackMessage> batch;
        {
            std::lock_guard<std::mutex> lk(state.mutex);
            if (state.discard.load()) state.queue.clear();
            if (state.queue.empty()) {
                if (state.stopping && !state.closed) {
                    state.closed = true;
                    uv_close(reinterpret_cast<uv_handle_t*>(&state.async_handle), nullptr);
                }
                return;
            }
            batch.swap(state.queue);
        }

        for (auto& msg : batch) {
            if (state.discard.load()) break;
            try {
                state.consumer(msg);
            } catch (const std::exception& e) {
                CALLBRIDGE_ERROR("channel", "callback consumer threw for call " << msg.call_id << ": " << e.what());
            }
            state.delivered.fetch_add(1);
        }
    }
}

void CallbackChannel::stop() {
    if (stopped_.load()) return;

    {
        std::lock_guard<std::mutex> lk(state_->mutex);
        request_stop(*state_);
    }

    if (thread_.joinable()) {
        if (on_dispatch_thread()) {
            CALLBRIDGE_DEBUG("channel", "stop requested on the dispatch thread; join deferred");
            return;
        }
        thread_.join();
    } else {
        // Never started: drain and close inline.
        run(*state_);
    }
    stopped_.store(true);
}

bool CallbackChannel::on_dispatch_thread() const {
    return std::this_thread::get_id() == thread_id_;
}

uint64_t CallbackChannel::delivered() const {
    return state_->delivered.load();
}

}  // namespace callbridge
