#include "group_reduce.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <tuple>

#include <boost/asio/post.hpp>

CGroupReduceEngine::CGroupReduceEngine(size_t shards, size_t workers)
    : m_shards(shards) {
    if (shards == 0) {
        throw std::invalid_argument("engine needs at least one shard");
    }
    if (workers > 1) {
        m_pool = std::make_unique<boost::asio::thread_pool>(workers);
    }
}

CGroupReduceEngine::~CGroupReduceEngine() {
    if (m_pool) {
        m_pool->join();
    }
}

std::vector<SAggregateDiff> CGroupReduceEngine::ApplyBatch(const SBatch& batch) {
    std::vector<ShardDeltas> deltas(m_shards.size());
    for (const auto& diff : batch.diffs) {
        if (diff.multiplicity == 0) {
            continue;
        }
        const SGroupKey key = SGroupKey::Of(diff.record);
        deltas[ShardOf(key)][key][diff.record.price] += diff.multiplicity;
    }

    std::vector<std::vector<SAggregateDiff>> outputs(m_shards.size());
    std::vector<std::future<void>> pending;
    for (size_t i = 0; i < m_shards.size(); ++i) {
        if (deltas[i].empty()) {
            continue;
        }
        if (!m_pool) {
            ReduceShard(m_shards[i], deltas[i], batch.time, outputs[i]);
            continue;
        }
        auto task = std::make_shared<std::packaged_task<void()>>([this, i, &deltas, &outputs, &batch]() {
            ReduceShard(m_shards[i], deltas[i], batch.time, outputs[i]);
        });
        pending.push_back(task->get_future());
        boost::asio::post(*m_pool, [task]() { (*task)(); });
    }
    // Every task references locals of this frame: wait for all of them before any rethrow.
    for (auto& f : pending) {
        f.wait();
    }
    for (auto& f : pending) {
        f.get();
    }

    std::vector<SAggregateDiff> result;
    for (auto& out : outputs) {
        result.insert(result.end(), out.begin(), out.end());
    }
    std::sort(result.begin(), result.end(), [](const SAggregateDiff& a, const SAggregateDiff& b) {
        return std::make_tuple(a.record.bucket, a.record.category, a.multiplicity) <
               std::make_tuple(b.record.bucket, b.record.category, b.multiplicity);
    });
    return result;
}

std::optional<SAggregateRecord> CGroupReduceEngine::Query(const SGroupKey& key) const {
    const auto& groups = m_shards[ShardOf(key)];
    const auto it = groups.find(key);
    if (it == groups.end() || !it->second.high) {
        return std::nullopt;
    }
    return SAggregateRecord{key.bucket, key.category, *it->second.high};
}

size_t CGroupReduceEngine::GroupCount() const {
    size_t total = 0;
    for (const auto& groups : m_shards) {
        total += groups.size();
    }
    return total;
}

size_t CGroupReduceEngine::LiveCount() const {
    size_t total = 0;
    for (const auto& groups : m_shards) {
        total += static_cast<size_t>(std::count_if(
            groups.begin(), groups.end(), [](const auto& entry) { return entry.second.high.has_value(); }));
    }
    return total;
}

size_t CGroupReduceEngine::ShardOf(const SGroupKey& key) const {
    return SGroupKeyHash{}(key) % m_shards.size();
}

void CGroupReduceEngine::ReduceShard(GroupTable& groups, const ShardDeltas& deltas, uint64_t time,
                                     std::vector<SAggregateDiff>& out) {
    for (const auto& entry : deltas) {
        const SGroupKey& key = entry.first;
        SGroupState& state = groups[key];
        const std::optional<CPrice> before = state.high;

        for (const auto& delta : entry.second) {
            if (delta.second != 0) {
                state.Merge(delta.first, delta.second);
            }
        }

        const std::optional<CPrice> after = state.high;
        if (before != after) {
            if (before) {
                out.push_back({{key.bucket, key.category, *before}, -1, time});
            }
            if (after) {
                out.push_back({{key.bucket, key.category, *after}, +1, time});
            }
        }
        if (state.counts.empty()) {
            groups.erase(key);
        }
    }
}

void CGroupReduceEngine::SGroupState::Merge(CPrice price, int64_t delta) {
    auto it = counts.find(price);
    int64_t count = delta;
    if (it == counts.end()) {
        counts.emplace(price, delta);
    } else {
        it->second += delta;
        count = it->second;
        if (count == 0) {
            counts.erase(it);
        }
    }

    if (count > 0) {
        if (!high || *high < price) {
            high = price;
        }
    } else if (high && *high == price) {
        high = ScanHigh();
    }
}

std::optional<CPrice> CGroupReduceEngine::SGroupState::ScanHigh() const {
    for (auto it = counts.rbegin(); it != counts.rend(); ++it) {
        if (it->second > 0) {
            return it->first;
        }
    }
    return std::nullopt;
}
