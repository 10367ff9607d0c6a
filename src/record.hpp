#pragma once
#include "price.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

constexpr int64_t kBucketWidthSec = 3600;

// Mathematical floor: -1 lands in [-3600, 0), not in [0, 3600). Throws std::out_of_range
// when the bucket start would be below INT64_MIN.
int64_t FloorToBucket(int64_t timestamp, int64_t width = kBucketWidthSec);
// Smallest timestamp whose bucket start is representable.
int64_t MinBucketTimestamp(int64_t width = kBucketWidthSec);

struct SRecord {
    int64_t timestamp = 0;
    uint32_t category = 0;
    CPrice price;

    bool IsValid(uint32_t num_categories) const;
    // Reason the record must not enter the engine, if any.
    std::optional<std::string> Defect(uint32_t num_categories) const;


    friend bool operator==(const SRecord& a, const SRecord& b) {
        return a.timestamp == b.timestamp && a.category == b.category && a.price == b.price;
    }
    friend bool operator!=(const SRecord& a, const SRecord& b) { return !(a == b); }
    friend bool operator<(const SRecord& a, const SRecord& b) {
        return std::tie(a.timestamp, a.category, a.price) < std::tie(b.timestamp, b.category, b.price);
    }
};

std::ostream& operator<<(std::ostream& os, const SRecord& record);

struct SGroupKey {
    int64_t bucket = 0;
    uint32_t category = 0;

    static SGroupKey Of(const SRecord& record) { return {FloorToBucket(record.timestamp), record.category}; }

    friend bool operator==(const SGroupKey& a, const SGroupKey& b) {
        return a.bucket == b.bucket && a.category == b.category;
    }
    friend bool operator!=(const SGroupKey& a, const SGroupKey& b) { return !(a == b); }
    friend bool operator<(const SGroupKey& a, const SGroupKey& b) {
        return std::tie(a.bucket, a.category) < std::tie(b.bucket, b.category);
    }
};

struct SGroupKeyHash {
    size_t operator()(const SGroupKey& key) const noexcept {
        const size_t h = std::hash<int64_t>{}(key.bucket);
        return h ^ (std::hash<uint32_t>{}(key.category) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2));
    }
};

struct SRecordHash {
    size_t operator()(const SRecord& r) const noexcept {
        const size_t h = SGroupKeyHash{}({r.timestamp, r.category});
        return h ^ (std::hash<CPrice>{}(r.price) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2));
    }
};

struct SInsert {
    SRecord record;
};

struct SRetract {
    SRecord record;
};

using RecordUpdate = std::variant<SInsert, SRetract>;

int64_t MultiplicityOf(const RecordUpdate& update);
const SRecord& RecordOf(const RecordUpdate& update);
