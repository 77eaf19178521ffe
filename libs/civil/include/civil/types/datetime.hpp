#pragma once
// =============================================================================
// Civil Time - DateTime
// Version: 1.2.0
// A Date and a Time of day read together, with no time zone
// =============================================================================

#include "civil/types/date.hpp"
#include "civil/types/time.hpp"

namespace civil {

struct DateTime {
    Date date;
    Time time;

    static constexpr char SEPARATOR = 'T';

    // Date from the instant truncated to its day, Time from the remainder
    [[nodiscard]] static DateTime of(const calendar::Instant& instant);
    [[nodiscard]] static DateTime now();

    // Splits on the first 'T' and decodes each side strictly
    [[nodiscard]] static Result<DateTime> parse(StringView text);

    [[nodiscard]] Result<String> to_text(const EncodeOptions& options = {}) const;

    [[nodiscard]] String value() const;
    [[nodiscard]] Result<void> scan(const ScalarValue& src);

    [[nodiscard]] bool is_valid() const { return date.is_valid() && time.is_valid(); }
    [[nodiscard]] bool is_zero() const { return date.is_zero() && time.is_zero(); }
    [[nodiscard]] String to_string() const { return value(); }

    [[nodiscard]] calendar::Instant to_instant() const;

    [[nodiscard]] bool before(const DateTime& other) const { return *this < other; }
    [[nodiscard]] bool after(const DateTime& other) const { return *this > other; }

    auto operator<=>(const DateTime&) const = default;
};

} // namespace civil
