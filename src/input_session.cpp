#include "input_session.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

CInputSession::CInputSession(std::shared_ptr<CBatchQueue> out, uint32_t num_categories)
    : m_out(std::move(out)), m_num_categories(num_categories) {}

void CInputSession::Insert(const SRecord& record) {
    Update(SInsert{record});
}

void CInputSession::Retract(const SRecord& record) {
    Update(SRetract{record});
}

void CInputSession::Update(const RecordUpdate& update) {
    const SRecord& record = RecordOf(update);
    if (auto defect = record.Defect(m_num_categories)) {
        throw std::invalid_argument(*defect);
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    StageLocked(record, MultiplicityOf(update));
}

SAck CInputSession::Submit(const RecordUpdate& update) {
    const SRecord& record = RecordOf(update);
    if (auto defect = record.Defect(m_num_categories)) {
        return {false, *defect};
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    StageLocked(record, MultiplicityOf(update));
    return {true, {}};
}

SIngestReport CInputSession::SubmitAll(const std::vector<RecordUpdate>& updates) {
    SIngestReport report;
    for (size_t i = 0; i < updates.size(); ++i) {
        SAck ack = Submit(updates[i]);
        if (ack.accepted) {
            ++report.accepted;
            continue;
        }
        std::ostringstream oss;
        oss << "Rejected record #" << i << " " << RecordOf(updates[i]) << ": " << ack.reason;
        Log(LogLevel::ERROR, "Session", oss.str());
        report.rejections.push_back({i, RecordOf(updates[i]), std::move(ack.reason)});
    }
    return report;
}

void CInputSession::AdvanceTo(uint64_t time) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_last_committed && time <= *m_last_committed) {
        throw COrderingError("advance_to(" + std::to_string(time) + ") is not after committed time " +
                             std::to_string(*m_last_committed));
    }
    if (time < m_time) {
        throw COrderingError("advance_to(" + std::to_string(time) + ") is before pending time " +
                             std::to_string(m_time));
    }
    m_time = time;
}

size_t CInputSession::Flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    SBatch batch;
    batch.time = m_time;
    batch.diffs.reserve(m_staged.size());
    for (const auto& entry : m_staged) {
        if (entry.second != 0) {
            batch.diffs.push_back({entry.first, entry.second, m_time});
        }
    }
    if (batch.diffs.empty()) {
        m_staged.clear();
        return 0;
    }
    if (m_last_committed && m_time <= *m_last_committed) {
        throw COrderingError("flush at already committed time " + std::to_string(m_time) +
                             "; advance_to a later time first");
    }

    const size_t published = batch.diffs.size();
    if (!m_out->Push(std::move(batch))) {
        throw CQueueClosedError("batch queue is stopped; batch at time " + std::to_string(m_time) +
                                " was not published");
    }
    m_last_committed = m_time;
    m_staged.clear();
    return published;
}

size_t CInputSession::CommitNext() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_staged.empty()) {
            return 0;
        }
        const uint64_t next = m_last_committed ? *m_last_committed + 1 : 1;
        m_time = std::max(m_time, next);
    }
    return Flush();
}

uint64_t CInputSession::Time() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_time;
}

std::optional<uint64_t> CInputSession::LastCommitted() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_committed;
}

size_t CInputSession::Staged() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_staged.size();
}

void CInputSession::StageLocked(const SRecord& record, int64_t multiplicity) {
    m_staged[record] += multiplicity;
}
