#include "aggregate_sink.hpp"

#include "logger.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

void CLogSink::OnBatch(uint64_t /*time*/, const std::vector<SAggregateDiff>& diffs) {
    for (const auto& diff : diffs) {
        std::ostringstream oss;
        oss << "HOURLY: " << diff;
        Log(LogLevel::INFO, "Sink", oss.str());
    }
}

CFileSink::CFileSink(const SOutputConfig& cfg) : m_cfg(cfg) {}

void CFileSink::OnBatch(uint64_t /*time*/, const std::vector<SAggregateDiff>& diffs) {
    if (diffs.empty()) {
        return;
    }

    RotateLogsIfNeeded(m_cfg.filename, m_cfg.max_file_mb * 1024ull * 1024ull, m_cfg.max_files);

    std::ofstream out(m_cfg.filename, std::ios::app);
    if (!out) {
        Log(LogLevel::ERROR, "Writer", "Failed to open output file: " + m_cfg.filename);
        return;
    }
    for (const auto& diff : diffs) {
        WriteDiff(out, diff);
        if (m_cfg.console_report) {
            WriteDiff(std::cout, diff);
        }
    }
    out.flush();
    if (m_cfg.console_report) {
        std::cout.flush();
    }
}

void CFileSink::WriteDiff(std::ostream& os, const SAggregateDiff& diff) {
    os << "time=" << diff.time
       << " bucket=" << FormatIsoUtc(diff.record.bucket)
       << " category=" << diff.record.category
       << " high=" << diff.record.high
       << " diff=" << (diff.multiplicity > 0 ? "+" : "") << diff.multiplicity
       << "\n";
}

void CTableSink::OnBatch(uint64_t time, const std::vector<SAggregateDiff>& diffs) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& diff : diffs) {
        const SGroupKey key = diff.record.Key();
        auto it = m_table.find(key);
        std::ostringstream oss;
        if (diff.multiplicity == -1) {
            if (it == m_table.end() || it->second != diff.record) {
                oss << "retraction of a record that is not live at time " << time << ": " << diff.record;
                throw std::logic_error(oss.str());
            }
            m_table.erase(it);
            ++m_retractions;
        } else if (diff.multiplicity == 1) {
            if (it != m_table.end()) {
                oss << "second live record for one group at time " << time << ": " << diff.record
                    << " over " << it->second;
                throw std::logic_error(oss.str());
            }
            m_table.emplace(key, diff.record);
            ++m_insertions;
        } else {
            oss << "aggregate diff multiplicity must be +1 or -1, got " << diff.multiplicity;
            throw std::logic_error(oss.str());
        }
    }
}

std::optional<SAggregateRecord> CTableSink::Get(const SGroupKey& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_table.find(key);
    if (it == m_table.end()) {
        return std::nullopt;
    }
    return it->second;
}

CTableSink::Table CTableSink::Snapshot() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_table;
}

size_t CTableSink::Size() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_table.size();
}

uint64_t CTableSink::Insertions() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_insertions;
}

uint64_t CTableSink::Retractions() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_retractions;
}
