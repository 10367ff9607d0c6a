#include "batch_queue.hpp"

#include <utility>

CBatchQueue::CBatchQueue() : m_stopped(false) {}

bool CBatchQueue::Push(SBatch batch) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopped) {
            return false;
        }
        m_queue.push(std::move(batch));
    }
    m_cond.notify_one();
    return true;
}

bool CBatchQueue::Pop(SBatch& batch) {
    std::unique_lock<std::mutex> lock(m_mutex);

    m_cond.wait(lock, [this]() {
        return !m_queue.empty() || m_stopped;
    });

    if (m_stopped && m_queue.empty()) {
        return false;
    }

    batch = std::move(m_queue.front());
    m_queue.pop();
    return true;
}

void CBatchQueue::Stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopped = true;
    }
    m_cond.notify_all();
}

size_t CBatchQueue::Size() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}
