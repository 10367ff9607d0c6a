#pragma once

#include "diff.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

// Hand-off point between the input session and the engine thread. A batch pushed
// here happens-before every observation of it made after Pop returns.
class CBatchQueue {
public:
    CBatchQueue();
    virtual ~CBatchQueue() = default;

    // Returns false, dropping the batch, once the queue is stopped.
    virtual bool Push(SBatch batch);
    // Blocks until a batch is available. Returns false once stopped and drained.
    bool Pop(SBatch& batch);
    void Stop();
    size_t Size();

private:
    std::queue<SBatch> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cond;
    bool m_stopped;
};
