#pragma once
// =============================================================================
// Civil Time - Date
// Version: 1.2.0
// A calendar date with no time zone: year, month and day of the proleptic
// Gregorian calendar
// =============================================================================

#include "civil/common/types.hpp"
#include "civil/common/error.hpp"
#include "civil/calendar/calendar.hpp"
#include "civil/types/scalar.hpp"

namespace civil {

// Fields are not checked on construction. to_text() refuses a year outside
// [0, 9999] and parse() applies full calendar validation, so only valid
// dates survive a round trip.
struct Date {
    Int32 year = 0;
    Int32 month = 0;      // 1-12
    Int32 day = 0;        // 1-31

    static constexpr Int32 MIN_YEAR = 0;
    static constexpr Int32 MAX_YEAR = 9999;

    // Text form of the zero Date, accepted by parse()
    static constexpr StringView ZERO_TEXT = "0000-00-00";

    [[nodiscard]] static Date of(const calendar::Instant& instant);
    [[nodiscard]] static Date today();

    // Strict YYYY-MM-DD
    [[nodiscard]] static Result<Date> parse(StringView text);

    // YYYY-MM-DD; fails only for an out-of-range year unless options.strict
    [[nodiscard]] Result<String> to_text(const EncodeOptions& options = {}) const;

    // Storage adapter
    [[nodiscard]] String value() const;
    [[nodiscard]] Result<void> scan(const ScalarValue& src);

    [[nodiscard]] bool is_valid() const;
    [[nodiscard]] bool is_zero() const { return year == 0 && month == 0 && day == 0; }
    [[nodiscard]] String to_string() const { return value(); }

    // Calendar arithmetic; a day that does not exist in the target month
    // rolls into the next one (2020-02-29 plus one year is 2021-03-01).
    // The date is returned unchanged when the result year overflows Int32.
    [[nodiscard]] Date shifted(Int32 years, Int32 months, Int32 days) const;
    [[nodiscard]] Date add_days(Int32 days) const;
    [[nodiscard]] Date add_months(Int32 months) const;
    [[nodiscard]] Date add_years(Int32 years) const;

    // Signed number of days from other to this date
    [[nodiscard]] Int64 days_since(const Date& other) const;

    // Midnight of this date, normalized
    [[nodiscard]] calendar::Instant to_instant() const;

    [[nodiscard]] bool before(const Date& other) const { return *this < other; }
    [[nodiscard]] bool after(const Date& other) const { return *this > other; }

    auto operator<=>(const Date&) const = default;
};

} // namespace civil
