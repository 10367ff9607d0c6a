#pragma once
#include "record.hpp"

#include <cstdint>
#include <ostream>
#include <vector>

struct SDiff {
    SRecord record;
    int64_t multiplicity = 0;
    uint64_t time = 0;
};

// Diffs committed together by one flush of the input session.
struct SBatch {
    uint64_t time = 0;
    std::vector<SDiff> diffs;
};

struct SAggregateRecord {
    int64_t bucket = 0;
    uint32_t category = 0;
    CPrice high;

    SGroupKey Key() const { return {bucket, category}; }

    friend bool operator==(const SAggregateRecord& a, const SAggregateRecord& b) {
        return a.bucket == b.bucket && a.category == b.category && a.high == b.high;
    }
    friend bool operator!=(const SAggregateRecord& a, const SAggregateRecord& b) { return !(a == b); }
};

struct SAggregateDiff {
    SAggregateRecord record;
    int64_t multiplicity = 0;  // -1 retracts an earlier emission, +1 asserts a new one
    uint64_t time = 0;

    friend bool operator==(const SAggregateDiff& a, const SAggregateDiff& b) {
        return a.record == b.record && a.multiplicity == b.multiplicity && a.time == b.time;
    }
};

inline std::ostream& operator<<(std::ostream& os, const SAggregateRecord& r) {
    return os << "(bucket=" << r.bucket << ", category=" << r.category << ", high=" << r.high << ")";
}

inline std::ostream& operator<<(std::ostream& os, const SAggregateDiff& d) {
    return os << d.record << " " << (d.multiplicity > 0 ? "+" : "") << d.multiplicity << " @" << d.time;
}
