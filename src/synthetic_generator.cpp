#include "synthetic_generator.hpp"

#include "logger.hpp"

#include <cmath>
#include <numeric>

std::vector<uint64_t> CategoryCounts(uint32_t num_categories, uint64_t num_records, double exponent) {
    std::vector<double> weights(num_categories);
    for (uint32_t i = 0; i < num_categories; ++i) {
        weights[i] = 1.0 / std::pow(static_cast<double>(i + 1), exponent);
    }
    const double sum = std::accumulate(weights.begin(), weights.end(), 0.0);

    std::vector<uint64_t> counts(num_categories);
    for (uint32_t i = 0; i < num_categories; ++i) {
        counts[i] = static_cast<uint64_t>(std::llround(weights[i] / sum * static_cast<double>(num_records)));
    }
    return counts;
}

CSyntheticGenerator::CSyntheticGenerator(const SSourceConfig& cfg)
    : m_cfg(cfg),
      m_rng(cfg.seed),
      m_time_dist(cfg.start_time, cfg.end_time),
      m_tick_dist(cfg.min_price * CPrice::kScale, cfg.max_price * CPrice::kScale - 1),
      m_retract_dist(cfg.retract_probability) {}

SGeneratorStats CSyntheticGenerator::Run(CInputSession& session, const std::atomic<bool>& keep_running) {
    SGeneratorStats stats;
    stats.inserted_per_category.assign(m_cfg.num_categories, 0);
    const auto counts = CategoryCounts(m_cfg.num_categories, m_cfg.num_records, m_cfg.weight_exponent);

    uint64_t staged = 0;
    for (uint32_t category = 0; category < m_cfg.num_categories; ++category) {
        for (uint64_t n = 0; n < counts[category]; ++n) {
            if ((staged & 1023) == 0 && !keep_running.load(std::memory_order_relaxed)) {
                Log(LogLevel::INFO, "Generator", "Stopped early after " + std::to_string(stats.inserted) + " records.");
                Commit(session, stats);
                return stats;
            }

            const SRecord record = Next(category);
            session.Insert(record);
            ++stats.inserted;
            ++stats.inserted_per_category[category];

            if (m_cfg.retract_probability > 0.0) {
                m_batch_records.push_back(record);
                if (!m_committed_records.empty() && m_retract_dist(m_rng)) {
                    std::uniform_int_distribution<size_t> pick(0, m_committed_records.size() - 1);
                    const size_t idx = pick(m_rng);
                    session.Retract(m_committed_records[idx]);
                    m_committed_records[idx] = m_committed_records.back();
                    m_committed_records.pop_back();
                    ++stats.retracted;
                }
            }

            if (++staged % m_cfg.batch_size == 0) {
                Commit(session, stats);
            }
        }
    }
    Commit(session, stats);
    Log(LogLevel::INFO, "Generator", "Generated " + std::to_string(stats.inserted) + " records, " +
                                         std::to_string(stats.retracted) + " retractions in " +
                                         std::to_string(stats.batches) + " batches.");
    return stats;
}

SRecord CSyntheticGenerator::Next(uint32_t category) {
    const int64_t timestamp = m_time_dist(m_rng);
    const CPrice price = CPrice::FromRaw(m_tick_dist(m_rng));
    return SRecord{timestamp, category, price};
}

void CSyntheticGenerator::Commit(CInputSession& session, SGeneratorStats& stats) {
    if (session.CommitNext() > 0) {
        ++stats.batches;
    }
    m_committed_records.insert(m_committed_records.end(), m_batch_records.begin(), m_batch_records.end());
    m_batch_records.clear();
}
