#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace margin::utils {

namespace detail {
struct CancellationState;
}

// Unregisters its callback on destruction. Once it has returned, the
// callback is guaranteed not to be running.
class CancellationSubscription {
public:
    CancellationSubscription() = default;
    CancellationSubscription(std::shared_ptr<detail::CancellationState> state, std::uint64_t id);
    CancellationSubscription(CancellationSubscription&& other) noexcept;
    CancellationSubscription& operator=(CancellationSubscription&& other) noexcept;
    CancellationSubscription(const CancellationSubscription&) = delete;
    CancellationSubscription& operator=(const CancellationSubscription&) = delete;
    ~CancellationSubscription();

    void Reset();

private:
    std::shared_ptr<detail::CancellationState> state_;
    std::uint64_t id_ = 0;
};

// Read side handed to executors. A default-constructed token never fires.
class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken() = default;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state);

    bool IsCancelled() const;

    // Runs callback on the cancelling thread, or immediately if the token
    // is already cancelled.
    CancellationSubscription Subscribe(Callback callback) const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();

    void Cancel();
    bool IsCancelled() const;
    CancellationToken Token() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace margin::utils
