#pragma once
#include "config.hpp"
#include "input_session.hpp"
#include "record.hpp"

#include <atomic>
#include <cstdint>
#include <random>
#include <vector>

// round(w_i * num_records) per category, with w_i proportional to (i+1)^-exponent.
std::vector<uint64_t> CategoryCounts(uint32_t num_categories, uint64_t num_records, double exponent);

struct SGeneratorStats {
    uint64_t inserted = 0;
    uint64_t retracted = 0;
    uint64_t batches = 0;
    std::vector<uint64_t> inserted_per_category;
};

// Deterministic skewed trade source. Stages records in the session and commits every
// batch_size records (and the final partial batch) with CommitNext. Retractions target
// records committed by an earlier batch, so they reach the engine as -1 diffs.
class CSyntheticGenerator {
public:
    explicit CSyntheticGenerator(const SSourceConfig& cfg);

    // Returns early, after committing what was staged, once keep_running turns false.
    SGeneratorStats Run(CInputSession& session, const std::atomic<bool>& keep_running);

private:
    SRecord Next(uint32_t category);
    void Commit(CInputSession& session, SGeneratorStats& stats);

    SSourceConfig m_cfg;
    std::mt19937_64 m_rng;
    std::uniform_int_distribution<int64_t> m_time_dist;
    std::uniform_int_distribution<int64_t> m_tick_dist;
    std::bernoulli_distribution m_retract_dist;
    // Retraction candidates, tracked only when retract_probability > 0.
    std::vector<SRecord> m_batch_records;
    std::vector<SRecord> m_committed_records;
};
