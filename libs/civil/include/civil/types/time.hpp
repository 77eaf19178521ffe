#pragma once
// =============================================================================
// Civil Time - Time
// Version: 1.2.0
// A time of day with nanosecond precision and no time zone
// =============================================================================

#include "civil/common/types.hpp"
#include "civil/common/error.hpp"
#include "civil/calendar/calendar.hpp"
#include "civil/types/scalar.hpp"

namespace civil {

struct Time {
    Int32 hour = 0;         // 0-23
    Int32 minute = 0;       // 0-59
    Int32 second = 0;       // 0-59
    Int32 nanosecond = 0;   // 0-999999999

    [[nodiscard]] static Time of(const calendar::Instant& instant);

    // Strict 15:04:05.999999999, fraction optional
    [[nodiscard]] static Result<Time> parse(StringView text);

    // HH:MM:SS[.fffffffff]; never fails unless options.strict
    [[nodiscard]] Result<String> to_text(const EncodeOptions& options = {}) const;

    [[nodiscard]] String value() const;
    [[nodiscard]] Result<void> scan(const ScalarValue& src);

    [[nodiscard]] bool is_valid() const;
    [[nodiscard]] bool is_zero() const {
        return hour == 0 && minute == 0 && second == 0 && nanosecond == 0;
    }
    [[nodiscard]] String to_string() const { return value(); }

    [[nodiscard]] Int64 nanoseconds_of_day() const;

    [[nodiscard]] bool before(const Time& other) const { return *this < other; }
    [[nodiscard]] bool after(const Time& other) const { return *this > other; }

    auto operator<=>(const Time&) const = default;
};

} // namespace civil
