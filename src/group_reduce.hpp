#pragma once
#include "diff.hpp"
#include "record.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include <boost/asio/thread_pool.hpp>

// Incrementally maintains max(price) per (hour bucket, category) over a signed
// multiset of records and emits only the changes of that maximum.
//
// The group table is split into shards by key hash. Within one ApplyBatch call every
// shard is reduced by exactly one task, so groups need no locking. ApplyBatch, Query
// and the counters must not be called concurrently with each other.
class CGroupReduceEngine {
public:
    CGroupReduceEngine(size_t shards, size_t workers);
    ~CGroupReduceEngine();

    CGroupReduceEngine(const CGroupReduceEngine&) = delete;
    CGroupReduceEngine& operator=(const CGroupReduceEngine&) = delete;

    // Merges the whole batch first, then recomputes each touched group once. The result is
    // sorted by key with the retraction ahead of the insertion, so it does not depend on the
    // order of diffs inside the batch.
    std::vector<SAggregateDiff> ApplyBatch(const SBatch& batch);

    // Live aggregate of the group, or nullopt when no price has positive multiplicity.
    std::optional<SAggregateRecord> Query(const SGroupKey& key) const;

    size_t GroupCount() const;
    size_t LiveCount() const;
    size_t ShardCount() const { return m_shards.size(); }

private:
    struct SGroupState {
        std::map<CPrice, int64_t> counts;  // net multiplicity per price, never zero
        std::optional<CPrice> high;        // max price with positive multiplicity

        void Merge(CPrice price, int64_t delta);
        std::optional<CPrice> ScanHigh() const;
    };

    using PriceDeltas = std::map<CPrice, int64_t>;
    using ShardDeltas = std::unordered_map<SGroupKey, PriceDeltas, SGroupKeyHash>;
    using GroupTable = std::unordered_map<SGroupKey, SGroupState, SGroupKeyHash>;

    size_t ShardOf(const SGroupKey& key) const;
    static void ReduceShard(GroupTable& groups, const ShardDeltas& deltas, uint64_t time,
                            std::vector<SAggregateDiff>& out);

    std::vector<GroupTable> m_shards;
    std::unique_ptr<boost::asio::thread_pool> m_pool;
};
