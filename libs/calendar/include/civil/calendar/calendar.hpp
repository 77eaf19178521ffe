#pragma once
// =============================================================================
// Civil Time - Calendar Instant and Proleptic Gregorian Arithmetic
// Version: 1.2.0
// =============================================================================

#include "civil/common/types.hpp"
#include "civil/common/error.hpp"

namespace civil::calendar {

// =============================================================================
// Constants
// =============================================================================

inline constexpr Int64 NANOS_PER_SECOND = 1'000'000'000LL;
inline constexpr Int64 SECONDS_PER_MINUTE = 60;
inline constexpr Int64 SECONDS_PER_HOUR = 3600;
inline constexpr Int64 SECONDS_PER_DAY = 86400;

// =============================================================================
// Date Calculations
// =============================================================================

[[nodiscard]] bool is_leap_year(Int64 year);

// Returns 0 when month is outside 1-12
[[nodiscard]] Int32 days_in_month(Int64 year, Int32 month);

struct YearMonthDay {
    Int64 year = 1970;
    Int32 month = 1;
    Int32 day = 1;

    auto operator<=>(const YearMonthDay&) const = default;
};

// Days relative to 1970-01-01. Month must be 1-12; day is taken linearly,
// so day 0 is the last day of the previous month.
[[nodiscard]] Int64 days_from_civil(Int64 year, Int32 month, Int64 day);
[[nodiscard]] YearMonthDay civil_from_days(Int64 days);

// Floor division helpers, remainder has the sign of the divisor
[[nodiscard]] constexpr Int64 floor_div(Int64 a, Int64 b) {
    Int64 q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

[[nodiscard]] constexpr Int64 floor_mod(Int64 a, Int64 b) {
    return a - floor_div(a, b) * b;
}

// =============================================================================
// Instant - normalized calendar reading in UTC reference
// =============================================================================

struct Instant {
    Int32 year = 1970;
    Int32 month = 1;        // 1-12
    Int32 day = 1;          // 1-31
    Int32 hour = 0;         // 0-23
    Int32 minute = 0;       // 0-59
    Int32 second = 0;       // 0-59
    Int32 nanosecond = 0;   // 0-999999999

    // Out-of-range fields carry into the next larger unit, so
    // make(2021, 2, 29) is 2021-03-01 and make(2020, 13, 1) is 2021-01-01.
    // A resulting year outside Int32 saturates at the nearest limit.
    [[nodiscard]] static Instant make(Int64 year, Int64 month, Int64 day,
                                      Int64 hour = 0, Int64 minute = 0,
                                      Int64 second = 0, Int64 nanosecond = 0);

    // As make(), but empty when the resulting year does not fit in Int32
    [[nodiscard]] static Optional<Instant> try_make(Int64 year, Int64 month, Int64 day,
                                                    Int64 hour = 0, Int64 minute = 0,
                                                    Int64 second = 0, Int64 nanosecond = 0);

    [[nodiscard]] static Instant from_system_time(SystemTimePoint tp);
    [[nodiscard]] static Instant now();

    [[nodiscard]] SystemTimePoint to_system_time() const;
    [[nodiscard]] Int64 days_since_epoch() const;
    [[nodiscard]] Int64 nanoseconds_of_day() const;

    // Fields are public, so a reading built by hand may be out of range
    [[nodiscard]] Instant normalized() const;

    // Adds calendar years, months and days, then renormalizes
    [[nodiscard]] Instant add_date(Int32 years, Int32 months, Int32 days) const;
    [[nodiscard]] Optional<Instant> try_add_date(Int32 years, Int32 months, Int32 days) const;
    [[nodiscard]] Instant truncate_to_day() const;

    [[nodiscard]] String to_string() const;

    auto operator<=>(const Instant&) const = default;
};

// =============================================================================
// Layouts
// =============================================================================

enum class Layout : UInt8 {
    DATE,        // 2006-01-02
    TIME,        // 15:04:05.999999999
    DATE_TIME    // 2006-01-02T15:04:05.999999999
};

[[nodiscard]] StringView layout_string(Layout layout);

// Strict parse of value against layout. Fields missing from the layout take
// their zero reading (year 0, January 1, midnight).
[[nodiscard]] Result<Instant> parse_layout(Layout layout, StringView value);

// Canonical text of the reading; the fraction drops trailing zeros and is
// omitted entirely when zero.
[[nodiscard]] String format_layout(Layout layout, const Instant& instant);

} // namespace civil::calendar
