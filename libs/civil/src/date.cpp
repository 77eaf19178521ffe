// =============================================================================
// Civil Time - Date Implementation
// Version: 1.2.0
// =============================================================================

#include <civil/types/date.hpp>
#include <sstream>
#include <iomanip>

namespace civil {

// =============================================================================
// Construction
// =============================================================================

Date Date::of(const calendar::Instant& instant) {
    calendar::Instant n = instant.normalized();
    return Date{n.year, n.month, n.day};
}

Date Date::today() {
    return of(calendar::Instant::now());
}

// =============================================================================
// Text
// =============================================================================

Result<Date> Date::parse(StringView text) {
    if (text == ZERO_TEXT) {
        return Date{};
    }

    auto parsed = calendar::parse_layout(calendar::Layout::DATE, text);
    if (parsed.is_error()) {
        ErrorInfo info = parsed.error();
        info.message = "invalid date: " + info.message;
        info.component = "Date";
        return info;
    }
    return of(parsed.value());
}

Result<String> Date::to_text(const EncodeOptions& options) const {
    if (year < MIN_YEAR || year > MAX_YEAR) {
        ErrorInfo info(ErrorCode::OUT_OF_RANGE,
            std::format("Date.to_text: year '{}' outside of range [{},{}]", year, MIN_YEAR, MAX_YEAR),
            "Date");
        info.with_context("year", std::to_string(year));
        return info;
    }
    if (options.strict && !is_valid()) {
        return make_error<String>(ErrorCode::OUT_OF_RANGE,
            "Date.to_text: '" + value() + "' is not a valid calendar date", "Date");
    }
    return value();
}

String Date::value() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::internal
        << std::setw(4) << year << "-"
        << std::setw(2) << month << "-"
        << std::setw(2) << day;
    return oss.str();
}

// =============================================================================
// Storage Adapter
// =============================================================================

Result<void> Date::scan(const ScalarValue& src) {
    return std::visit(overloaded{
        [this](const String& text) -> Result<void> {
            auto parsed = Date::parse(text);
            if (parsed.is_error()) return parsed.error();
            *this = parsed.value();
            return {};
        },
        [this](const calendar::Instant& instant) -> Result<void> {
            *this = Date::of(instant);
            return {};
        },
        [&src](const auto&) -> Result<void> {
            return unsupported_scan("Date", src);
        }
    }, src);
}

// =============================================================================
// Validation
// =============================================================================

bool Date::is_valid() const {
    if (year < MIN_YEAR || year > MAX_YEAR) return false;
    if (month < 1 || month > 12) return false;
    return day >= 1 && day <= calendar::days_in_month(year, month);
}

// =============================================================================
// Arithmetic
// =============================================================================

calendar::Instant Date::to_instant() const {
    return calendar::Instant::make(year, month, day);
}

Date Date::shifted(Int32 years, Int32 months, Int32 days) const {
    auto result = to_instant().try_add_date(years, months, days);
    return result ? of(*result) : *this;
}

Date Date::add_days(Int32 days) const {
    return shifted(0, 0, days);
}

Date Date::add_months(Int32 months) const {
    return shifted(0, months, 0);
}

Date Date::add_years(Int32 years) const {
    return shifted(years, 0, 0);
}

Int64 Date::days_since(const Date& other) const {
    return to_instant().days_since_epoch() - other.to_instant().days_since_epoch();
}

} // namespace civil
