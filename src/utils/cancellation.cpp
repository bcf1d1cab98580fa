#include "utils/cancellation.hpp"

#include <map>
#include <mutex>
#include <utility>

namespace margin::utils {
namespace detail {

struct CancellationState {
    std::recursive_mutex mutex;
    bool cancelled = false;
    std::uint64_t next_id = 1;
    std::map<std::uint64_t, std::function<void()>> callbacks;
};

}  // namespace detail

CancellationSubscription::CancellationSubscription(
    std::shared_ptr<detail::CancellationState> state,
    std::uint64_t id)
    : state_(std::move(state)), id_(id) {}

CancellationSubscription::CancellationSubscription(CancellationSubscription&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

CancellationSubscription& CancellationSubscription::operator=(CancellationSubscription&& other) noexcept {
    if (this != &other) {
        Reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

CancellationSubscription::~CancellationSubscription() {
    Reset();
}

void CancellationSubscription::Reset() {
    if (!state_) {
        return;
    }
    {
        // Cancel() holds the lock while callbacks run, so taking it here
        // waits out a callback that is in flight.
        std::lock_guard<std::recursive_mutex> lock(state_->mutex);
        state_->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

CancellationToken::CancellationToken(std::shared_ptr<detail::CancellationState> state)
    : state_(std::move(state)) {}

bool CancellationToken::IsCancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationSubscription CancellationToken::Subscribe(Callback callback) const {
    if (!state_ || !callback) {
        return {};
    }
    std::unique_lock<std::recursive_mutex> lock(state_->mutex);
    if (state_->cancelled) {
        lock.unlock();
        callback();
        return {};
    }
    const auto id = state_->next_id++;
    state_->callbacks.emplace(id, std::move(callback));
    return CancellationSubscription(state_, id);
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

void CancellationSource::Cancel() {
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    if (state_->cancelled) {
        return;
    }
    state_->cancelled = true;
    auto callbacks = std::move(state_->callbacks);
    state_->callbacks.clear();
    for (auto& entry : callbacks) {
        entry.second();
    }
}

bool CancellationSource::IsCancelled() const {
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationToken CancellationSource::Token() const {
    return CancellationToken(state_);
}

}  // namespace margin::utils
