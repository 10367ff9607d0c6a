#pragma once

#include "aggregate_sink.hpp"
#include "batch_queue.hpp"
#include "config.hpp"
#include "group_reduce.hpp"
#include "input_session.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <thread>
#include <vector>

// Owns everything between the input session and the sinks:
// session -> batch queue -> engine thread -> sinks.
class CAggregationPipeline {
public:
    CAggregationPipeline(const SEngineConfig& engine_cfg, uint32_t num_categories);
    ~CAggregationPipeline();

    CAggregationPipeline(const CAggregationPipeline&) = delete;
    CAggregationPipeline& operator=(const CAggregationPipeline&) = delete;

    std::shared_ptr<CInputSession> Session() const { return m_session; }

    // Sinks must be subscribed before Start.
    void Subscribe(std::shared_ptr<IAggregateSink> sink);
    void Start();
    // Processes every batch flushed so far, then joins the engine thread. Rethrows the
    // exception that stopped the engine thread, if any.
    void Stop();

    // Engine state may only be inspected while the pipeline is stopped.
    const CGroupReduceEngine& Engine() const { return m_engine; }
    uint64_t BatchesProcessed() const { return m_batches.load(); }
    uint64_t DiffsEmitted() const { return m_diffs_emitted.load(); }

private:
    void RunEngine();

    std::shared_ptr<CBatchQueue> m_queue;
    std::shared_ptr<CInputSession> m_session;
    CGroupReduceEngine m_engine;
    std::vector<std::shared_ptr<IAggregateSink>> m_sinks;

    std::thread m_engine_thread;
    std::atomic<uint64_t> m_batches{0};
    std::atomic<uint64_t> m_diffs_emitted{0};
    std::exception_ptr m_failure;
};
