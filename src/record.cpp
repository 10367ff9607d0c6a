#include "record.hpp"

#include <limits>
#include <stdexcept>

int64_t FloorToBucket(int64_t timestamp, int64_t width) {
    if (width <= 0) {
        throw std::invalid_argument("bucket width must be > 0");
    }
    int64_t rem = timestamp % width;
    if (rem < 0) {
        rem += width;
    }
    if (timestamp < std::numeric_limits<int64_t>::min() + rem) {
        throw std::out_of_range("bucket of timestamp " + std::to_string(timestamp) + " is below the int64 range");
    }
    return timestamp - rem;
}

int64_t MinBucketTimestamp(int64_t width) {
    if (width <= 0) {
        throw std::invalid_argument("bucket width must be > 0");
    }
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
    // kMin % width is in (-width, 0], so this rounds kMin up to a multiple of width.
    return kMin - kMin % width;
}

bool SRecord::IsValid(uint32_t num_categories) const {
    return !Defect(num_categories).has_value();
}

std::optional<std::string> SRecord::Defect(uint32_t num_categories) const {
    if (!price.IsPositive()) {
        return "price must be > 0, got " + price.ToString();
    }
    if (timestamp < MinBucketTimestamp()) {
        return "timestamp " + std::to_string(timestamp) + " has no representable hour bucket";
    }
    if (category >= num_categories) {
        return "category " + std::to_string(category) + " out of range [0, " + std::to_string(num_categories) + ")";
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const SRecord& record) {
    return os << "{ts=" << record.timestamp << " category=" << record.category << " price=" << record.price << "}";
}

int64_t MultiplicityOf(const RecordUpdate& update) {
    return std::holds_alternative<SInsert>(update) ? 1 : -1;
}

const SRecord& RecordOf(const RecordUpdate& update) {
    return std::visit([](const auto& u) -> const SRecord& { return u.record; }, update);
}
