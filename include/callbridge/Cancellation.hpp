#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace callbridge {

namespace detail {
struct CancellationState {
    std::mutex mutex;
    bool cancelled = false;
    uint64_t next_id = 1;
    std::map<uint64_t, std::function<void()>> callbacks;
};
}  // namespace detail

class CancellationToken;

// Unregisters its callback when destroyed.
class CancellationRegistration {
   public:
    CancellationRegistration() = default;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}
    ~CancellationRegistration() { reset(); }

    CancellationRegistration(CancellationRegistration&& other) noexcept
        : state_(std::move(other.state_)), id_(other.id_) {
        other.id_ = 0;
    }
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    void reset();

   private:
    std::shared_ptr<detail::CancellationState> state_;
    uint64_t id_ = 0;
};

// Observer side. A default-constructed token can never be cancelled.
class CancellationToken {
   public:
    CancellationToken() = default;

    bool can_be_cancelled() const { return state_ != nullptr; }
    bool cancelled() const;

    // Runs fn once on cancel. If already cancelled, runs it immediately on the
    // calling thread.
    CancellationRegistration on_cancel(std::function<void()> fn) const;

   private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
   public:
    CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

    CancellationToken token() const { return CancellationToken(state_); }

    // Callbacks run on the calling thread, outside the token's lock. Only the
    // first cancel runs them.
    void cancel();
    bool cancelled() const;

   private:
    std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace callbridge
