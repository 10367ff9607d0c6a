#include "aggregation_pipeline.hpp"

#include "logger.hpp"

#include <stdexcept>

CAggregationPipeline::CAggregationPipeline(const SEngineConfig& engine_cfg, uint32_t num_categories)
    : m_queue(std::make_shared<CBatchQueue>()),
      m_session(std::make_shared<CInputSession>(m_queue, num_categories)),
      m_engine(engine_cfg.shards, engine_cfg.workers) {}

CAggregationPipeline::~CAggregationPipeline() {
    if (m_engine_thread.joinable()) {
        m_queue->Stop();
        m_engine_thread.join();
    }
}

void CAggregationPipeline::Subscribe(std::shared_ptr<IAggregateSink> sink) {
    if (m_engine_thread.joinable()) {
        throw std::logic_error("Subscribe called on a running pipeline");
    }
    m_sinks.push_back(std::move(sink));
}

void CAggregationPipeline::Start() {
    if (m_engine_thread.joinable()) {
        return;
    }
    m_engine_thread = std::thread([this]() { RunEngine(); });
}

void CAggregationPipeline::Stop() {
    m_queue->Stop();
    if (m_engine_thread.joinable()) {
        m_engine_thread.join();
    }
    if (m_failure) {
        std::rethrow_exception(m_failure);
    }
}

void CAggregationPipeline::RunEngine() {
    SBatch batch;
    while (m_queue->Pop(batch)) {
        try {
            const auto diffs = m_engine.ApplyBatch(batch);
            for (const auto& sink : m_sinks) {
                sink->OnBatch(batch.time, diffs);
            }
            m_diffs_emitted += diffs.size();
            ++m_batches;
        } catch (const std::exception& e) {
            Log(LogLevel::ERROR, "Engine", "Batch " + std::to_string(batch.time) + " failed: " + e.what());
            m_failure = std::current_exception();
            m_queue->Stop();
            break;
        }
    }
    Log(LogLevel::INFO, "Engine", "Thread finished.");
}
