#include "price.hpp"

#include "errors.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace {
constexpr uint64_t kMaxTicks = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}
}

CPrice CPrice::Parse(std::string_view text) {
    const std::string original(text);
    if (text.empty()) {
        throw std::invalid_argument("empty price");
    }

    bool negative = false;
    if (text.front() == '-' || text.front() == '+') {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    const auto dot = text.find('.');
    const std::string_view int_part = text.substr(0, dot);
    std::string_view frac_part = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

    if (int_part.empty() && frac_part.empty()) {
        throw std::invalid_argument("not a decimal number: " + original);
    }
    for (char c : int_part) {
        if (!IsDigit(c)) {
            throw std::invalid_argument("not a decimal number: " + original);
        }
    }
    for (char c : frac_part) {
        if (!IsDigit(c)) {
            throw std::invalid_argument("not a decimal number: " + original);
        }
    }

    // Trailing zeros carry no precision.
    while (frac_part.size() > static_cast<size_t>(kScaleDigits) && frac_part.back() == '0') {
        frac_part.remove_suffix(1);
    }
    if (frac_part.size() > static_cast<size_t>(kScaleDigits)) {
        throw CPrecisionError("price has more than " + std::to_string(kScaleDigits) +
                              " fractional digits: " + original);
    }

    uint64_t units = 0;
    for (char c : int_part) {
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (units > (kMaxTicks / static_cast<uint64_t>(kScale) - digit) / 10) {
            throw CPrecisionError("price out of range: " + original);
        }
        units = units * 10 + digit;
    }

    uint64_t fraction = 0;
    for (size_t i = 0; i < static_cast<size_t>(kScaleDigits); ++i) {
        fraction = fraction * 10 + (i < frac_part.size() ? static_cast<uint64_t>(frac_part[i] - '0') : 0);
    }

    const uint64_t whole = units * static_cast<uint64_t>(kScale);
    if (whole > kMaxTicks - fraction) {
        throw CPrecisionError("price out of range: " + original);
    }
    const int64_t ticks = static_cast<int64_t>(whole + fraction);
    return CPrice(negative ? -ticks : ticks);
}

CPrice CPrice::FromUnits(int64_t units) {
    if (units > std::numeric_limits<int64_t>::max() / kScale ||
        units < std::numeric_limits<int64_t>::min() / kScale) {
        throw CPrecisionError("price out of range: " + std::to_string(units));
    }
    return CPrice(units * kScale);
}

std::string CPrice::ToString() const {
    const bool negative = m_ticks < 0;
    // Magnitude in unsigned space so that INT64_MIN does not overflow.
    const uint64_t magnitude = negative ? static_cast<uint64_t>(-(m_ticks + 1)) + 1
                                        : static_cast<uint64_t>(m_ticks);
    const uint64_t units = magnitude / static_cast<uint64_t>(kScale);
    std::string frac = std::to_string(magnitude % static_cast<uint64_t>(kScale));
    frac.insert(0, static_cast<size_t>(kScaleDigits) - frac.size(), '0');
    while (frac.size() > 2 && frac.back() == '0') {
        frac.pop_back();
    }
    return (negative ? "-" : "") + std::to_string(units) + "." + frac;
}

std::ostream& operator<<(std::ostream& os, CPrice price) {
    return os << price.ToString();
}
