#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

// Exact decimal price stored as a signed count of 1e-8 ticks.
class CPrice {
public:
    static constexpr int kScaleDigits = 8;
    static constexpr int64_t kScale = 100'000'000;

    constexpr CPrice() = default;

    static constexpr CPrice FromRaw(int64_t ticks) { return CPrice(ticks); }
    // Parses "123", "-0.5", "15.00". Throws CPrecisionError when the value has more
    // than kScaleDigits significant fractional digits or overflows, std::invalid_argument
    // when the text is not a decimal number.
    static CPrice Parse(std::string_view text);
    static CPrice FromUnits(int64_t units);

    constexpr int64_t Raw() const { return m_ticks; }
    bool IsPositive() const { return m_ticks > 0; }

    // Shortest form with at least two fractional digits: 15.00, 10.125, 0.00000001.
    std::string ToString() const;

    friend constexpr bool operator==(CPrice a, CPrice b) { return a.m_ticks == b.m_ticks; }
    friend constexpr bool operator!=(CPrice a, CPrice b) { return a.m_ticks != b.m_ticks; }
    friend constexpr bool operator<(CPrice a, CPrice b) { return a.m_ticks < b.m_ticks; }
    friend constexpr bool operator>(CPrice a, CPrice b) { return a.m_ticks > b.m_ticks; }
    friend constexpr bool operator<=(CPrice a, CPrice b) { return a.m_ticks <= b.m_ticks; }
    friend constexpr bool operator>=(CPrice a, CPrice b) { return a.m_ticks >= b.m_ticks; }

private:
    explicit constexpr CPrice(int64_t ticks) : m_ticks(ticks) {}

    int64_t m_ticks = 0;
};

std::ostream& operator<<(std::ostream& os, CPrice price);

namespace std {
template <>
struct hash<CPrice> {
    size_t operator()(CPrice p) const noexcept { return std::hash<int64_t>{}(p.Raw()); }
};
}
