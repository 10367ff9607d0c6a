#pragma once
#include "config.hpp"
#include "diff.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <vector>

// Consumer of the engine's aggregate-diff stream. OnBatch is called once per
// committed batch, in logical time order, from the pipeline's engine thread.
class IAggregateSink {
public:
    virtual ~IAggregateSink() = default;
    virtual void OnBatch(uint64_t time, const std::vector<SAggregateDiff>& diffs) = 0;
};

class CLogSink : public IAggregateSink {
public:
    void OnBatch(uint64_t time, const std::vector<SAggregateDiff>& diffs) override;
};

// Appends diffs to output.filename, rotating it by size.
class CFileSink : public IAggregateSink {
public:
    explicit CFileSink(const SOutputConfig& cfg);
    void OnBatch(uint64_t time, const std::vector<SAggregateDiff>& diffs) override;

    static void WriteDiff(std::ostream& os, const SAggregateDiff& diff);

private:
    SOutputConfig m_cfg;
};

// Materializes the stream into a table keyed by (bucket, category). Throws
// std::logic_error when a diff does not match the live table.
class CTableSink : public IAggregateSink {
public:
    using Table = std::map<SGroupKey, SAggregateRecord>;

    void OnBatch(uint64_t time, const std::vector<SAggregateDiff>& diffs) override;

    std::optional<SAggregateRecord> Get(const SGroupKey& key);
    Table Snapshot();
    size_t Size();
    uint64_t Insertions();
    uint64_t Retractions();

private:
    std::mutex m_mutex;
    Table m_table;
    uint64_t m_insertions = 0;
    uint64_t m_retractions = 0;
};
