#include "cancellation.h"
#include "errors.h"

#include <vector>

namespace ferry {

void CancellationToken::cancel() {
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_canceled.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        for (auto& entry : m_callbacks) {
            callbacks.push_back(std::move(entry.second));
        }
        m_callbacks.clear();
    }
    for (auto& cb : callbacks) {
        cb();
    }
}

void CancellationToken::throw_if_canceled() const {
    if (is_canceled()) {
        throw CancellationError();
    }
}

size_t CancellationToken::subscribe(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_canceled.load(std::memory_order_acquire)) {
            size_t id = m_next_id++;
            m_callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::unsubscribe(size_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callbacks.erase(id);
}

} // namespace ferry
