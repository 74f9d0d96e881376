#include "callbridge/CallbackManager.hpp"

#include <exception>
#include <vector>

#include "callbridge/Log.hpp"
#include "callbridge/WireCodec.hpp"

namespace callbridge {

const char* call_state_name(CallState state) {
    switch (state) {
        case CallState::Active:
            return "Active";
        case CallState::CancelRequested:
            return "CancelRequested";
        case CallState::Completed:
            return "Completed";
    }
    return "Unknown";
}

const WireValue& CallOutcome::value_or_throw() const {
    switch (status) {
        case CallStatus::Success:
            return value;
        case CallStatus::Cancelled:
            throw BridgeError(ErrorKind::Cancelled, CALLBRIDGE_CANCELLED, diagnostic);
        case CallStatus::Failed:
            break;
    }
    throw BridgeError(error, diagnostic);
}

bool CallHandle::ready() const {
    return outcome.valid() && outcome.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

bool CallHandle::wait_for(std::chrono::milliseconds timeout) const {
    return outcome.valid() && outcome.wait_for(timeout) == std::future_status::ready;
}

CallbackManager::CallbackManager(const CallDispatcher& dispatcher, CallbackHooks hooks)
    : dispatcher_(dispatcher), hooks_(std::move(hooks)) {}

CallbackManager::~CallbackManager() {
    shutdown("callback manager destroyed");
}

uint32_t CallbackManager::next_call_id() {
    // Ids only move forward; after wrapping, ids still pending are skipped.
    do {
        ++last_call_id_;
        if (last_call_id_ == 0) last_call_id_ = 1;
    } while (pending_.count(last_call_id_) != 0);
    return last_call_id_;
}

CallHandle CallbackManager::start(Selector selector, const Bytes& request, PartialSink on_partial,
    TickSink on_tick) {
    if (!is_async_selector(selector)) {
        throw BridgeError(ErrorKind::InvalidArgument,
            std::string(selector_name(selector)) + " is not an asynchronous entry point");
    }

    CallHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            throw BridgeError(ErrorKind::BridgeClosed, "callback manager has been shut down");
        }
        handle.call_id = next_call_id();
        PendingCall& pc = pending_[handle.call_id];
        pc.call_id = handle.call_id;
        pc.selector = selector;
        pc.on_partial = std::move(on_partial);
        pc.on_tick = std::move(on_tick);
        handle.outcome = pc.completion.get_future().share();
    }

    CALLBRIDGE_TRACE("callbacks", "start call " << handle.call_id << " via " << selector_name(selector));

    try {
        dispatcher_.invoke(selector, request, handle.call_id);
    } catch (const std::exception& e) {
        CALLBRIDGE_DEBUG("callbacks", "submit of call " << handle.call_id << " failed: " << e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(handle.call_id);
        throw;
    }

    return handle;
}

WireValue CallbackManager::decode(const CallbackMessage& message) const {
    WireValue value = wire::decode_value(message.payload);
    if (hooks_.map_value) return hooks_.map_value(value, message.call_id);
    return value;
}

bool CallbackManager::native_cancel(uint32_t call_id) const {
    if (hooks_.native_cancel) return hooks_.native_cancel(call_id);
    return dispatcher_.cancel(call_id);
}

CallOutcome CallbackManager::outcome_from(const CallbackMessage& message) const {
    CallOutcome out;
    switch (message.status) {
        case CALLBRIDGE_CALL_SUCCESS:
            try {
                out.value = decode(message);
                out.status = CallStatus::Success;
            } catch (const BridgeError& e) {
                out.status = CallStatus::Failed;
                out.error = e.kind();
                out.diagnostic = e.diagnostic();
            }
            return out;
        case CALLBRIDGE_CALL_ERROR:
            out.status = CallStatus::Failed;
            out.error = ErrorKind::NativeFailure;
            out.diagnostic = message.payload.empty() ? "Unknown error"
                                                     : std::string(message.payload.begin(), message.payload.end());
            return out;
        case CALLBRIDGE_CALL_CANCELLED:
            out.status = CallStatus::Cancelled;
            out.error = ErrorKind::Cancelled;
            out.diagnostic = message.payload.empty() ? "call cancelled"
                                                     : std::string(message.payload.begin(), message.payload.end());
            return out;
    }

    out.status = CallStatus::Failed;
    out.error = ErrorKind::NativeFailure;
    out.diagnostic = "unknown callback status " + std::to_string(static_cast<int>(message.status));
    return out;
}

void CallbackManager::on_native_callback(const CallbackMessage& message) {
    switch (message.event) {
        case CallbackEvent::Partial:
            deliver_partial(message);
            return;

        case CallbackEvent::Tick: {
            TickSink sink;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = pending_.find(message.call_id);
                if (it == pending_.end()) return;
                sink = it->second.on_tick;
            }
            if (sink) sink();
            return;
        }

        case CallbackEvent::Final: {
            PendingCall pc;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = pending_.find(message.call_id);
                if (it == pending_.end()) {
                    // Late or duplicate delivery, e.g. a cancel that raced a natural completion.
                    CALLBRIDGE_TRACE("callbacks", "dropping final callback for untracked call " << message.call_id);
                    return;
                }
                pc = std::move(it->second);
                pending_.erase(it);
            }
            CallOutcome outcome = outcome_from(message);
            CALLBRIDGE_TRACE("callbacks", "call " << message.call_id << " completed ("
                    << static_cast<int>(outcome.status) << ")");
            pc.completion.set_value(std::move(outcome));
            return;
        }
    }
}

void CallbackManager::deliver_partial(const CallbackMessage& message) {
    PartialSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(message.call_id);
        if (it == pending_.end()) return;
        sink = it->second.on_partial;
    }
    if (!sink) return;

    WireValue chunk;
    try {
        chunk = decode(message);
    } catch (const BridgeError& e) {
        CALLBRIDGE_WARN("callbacks", "failed to decode partial result for call " << message.call_id << ": "
                << e.what());
        return;
    }

    try {
        sink(chunk);
    } catch (const std::exception& e) {
        CallOutcome failed;
        failed.status = CallStatus::Failed;
        failed.error = ErrorKind::NativeFailure;
        failed.diagnostic = std::string("streaming chunk handler threw an exception: ") + e.what();
        complete(message.call_id, std::move(failed));

        try {
            native_cancel(message.call_id);
        } catch (const BridgeError& ce) {
            CALLBRIDGE_WARN("callbacks", "cancel after handler failure of call " << message.call_id
                    << " failed: " << ce.what());
        }
    }
}

void CallbackManager::complete(uint32_t call_id, CallOutcome outcome) {
    PendingCall pc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(call_id);
        if (it == pending_.end()) return;
        pc = std::move(it->second);
        pending_.erase(it);
    }
    pc.completion.set_value(std::move(outcome));
}

bool CallbackManager::cancel(uint32_t call_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(call_id);
        if (it == pending_.end() || it->second.state != CallState::Active) {
            return false;
        }
        it->second.state = CallState::CancelRequested;
    }

    CALLBRIDGE_DEBUG("callbacks", "cancel requested for call " << call_id);
    try {
        native_cancel(call_id);
    } catch (const BridgeError& e) {
        // The state change stands; the runtime still owes a final callback.
        CALLBRIDGE_WARN("callbacks", "native cancel of call " << call_id << " failed: " << e.what());
    }
    return true;
}

void CallbackManager::shutdown(const std::string& reason) {
    std::vector<PendingCall> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
        remaining.reserve(pending_.size());
        for (auto& kv : pending_) {
            remaining.push_back(std::move(kv.second));
        }
        pending_.clear();
    }

    if (!remaining.empty()) {
        CALLBRIDGE_INFO("callbacks", "cancelling " << remaining.size() << " pending call(s): " << reason);
    }
    for (auto& pc : remaining) {
        CallOutcome out;
        out.status = CallStatus::Cancelled;
        out.error = ErrorKind::Cancelled;
        out.diagnostic = reason;
        pc.completion.set_value(std::move(out));
    }
}

size_t CallbackManager::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::optional<CallState> CallbackManager::state_of(uint32_t call_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(call_id);
    if (it == pending_.end()) return std::nullopt;
    return it->second.state;
}

}  // namespace callbridge
