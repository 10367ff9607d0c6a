#pragma once

#include "batch_queue.hpp"
#include "diff.hpp"
#include "record.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct SAck {
    bool accepted = false;
    std::string reason;
};

struct SRejection {
    size_t index = 0;
    SRecord record;
    std::string reason;
};

struct SIngestReport {
    size_t accepted = 0;
    std::vector<SRejection> rejections;
};

// Stages record diffs at a pending logical time and publishes them to the batch
// queue as one atomic batch on Flush. Nothing reaches the queue before Flush.
class CInputSession {
public:
    CInputSession(std::shared_ptr<CBatchQueue> out, uint32_t num_categories);
    virtual ~CInputSession() = default;

    // Stage a record. Throws std::invalid_argument for a record the engine must not see.
    void Insert(const SRecord& record);
    void Retract(const SRecord& record);
    void Update(const RecordUpdate& update);

    // Same as Update but reports a defective record instead of throwing.
    virtual SAck Submit(const RecordUpdate& update);
    SIngestReport SubmitAll(const std::vector<RecordUpdate>& updates);

    // Throws COrderingError if time <= the last committed time or time < the pending time.
    void AdvanceTo(uint64_t time);
    // Publishes the staged diffs at the pending time and returns how many were published.
    // An empty stage publishes nothing and leaves the time uncommitted. Throws
    // CQueueClosedError, keeping the stage, when the queue no longer accepts batches.
    size_t Flush();
    // AdvanceTo the time after the last commit (1 when nothing was committed yet, or the
    // pending time if that is later), then Flush. Does nothing for an empty stage.
    size_t CommitNext();

    uint64_t Time();
    std::optional<uint64_t> LastCommitted();
    size_t Staged();

private:
    void StageLocked(const SRecord& record, int64_t multiplicity);

    std::shared_ptr<CBatchQueue> m_out;
    uint32_t m_num_categories;

    std::mutex m_mutex;
    std::map<SRecord, int64_t> m_staged;
    uint64_t m_time = 0;
    std::optional<uint64_t> m_last_committed;
};
