#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>

namespace ferry {

/**
 * Cooperative cancellation flag plus triggers.
 * Triggers (typically "close this stream") run once, on the canceling thread,
 * so blocked I/O unwinds without waiting for its own timeout.
 */
class CancellationToken {
public:
    using Callback = std::function<void()>;

    void cancel();
    bool is_canceled() const { return m_canceled.load(std::memory_order_acquire); }

    // Throws CancellationError once cancel() has been called.
    void throw_if_canceled() const;

    // Runs the callback immediately if already canceled. Returns an id for unsubscribe().
    size_t subscribe(Callback callback);
    void unsubscribe(size_t id);

private:
    std::atomic<bool> m_canceled{false};
    std::mutex m_mutex;
    std::map<size_t, Callback> m_callbacks;
    size_t m_next_id = 1;
};

// Unsubscribes on scope exit.
class CancellationSubscription {
public:
    CancellationSubscription(CancellationToken* token, CancellationToken::Callback callback)
        : m_token(token), m_id(token ? token->subscribe(std::move(callback)) : 0) {}
    ~CancellationSubscription() {
        if (m_token) m_token->unsubscribe(m_id);
    }

    CancellationSubscription(const CancellationSubscription&) = delete;
    CancellationSubscription& operator=(const CancellationSubscription&) = delete;

private:
    CancellationToken* m_token;
    size_t m_id;
};

} // namespace ferry
