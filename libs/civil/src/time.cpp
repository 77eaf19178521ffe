// =============================================================================
// Civil Time - Time Implementation
// Version: 1.2.0
// =============================================================================

#include <civil/types/time.hpp>
#include <sstream>
#include <iomanip>

namespace civil {

Time Time::of(const calendar::Instant& instant) {
    calendar::Instant n = instant.normalized();
    return Time{n.hour, n.minute, n.second, n.nanosecond};
}

Result<Time> Time::parse(StringView text) {
    auto parsed = calendar::parse_layout(calendar::Layout::TIME, text);
    if (parsed.is_error()) {
        ErrorInfo info = parsed.error();
        info.message = "invalid time: " + info.message;
        info.component = "Time";
        return info;
    }
    return of(parsed.value());
}

Result<String> Time::to_text(const EncodeOptions& options) const {
    if (options.strict && !is_valid()) {
        return make_error<String>(ErrorCode::OUT_OF_RANGE,
            "Time.to_text: '" + value() + "' is not a valid time of day", "Time");
    }
    return value();
}

String Time::value() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::internal
        << std::setw(2) << hour << ":"
        << std::setw(2) << minute << ":"
        << std::setw(2) << second;
    if (nanosecond != 0) {
        oss << "." << std::setw(9) << nanosecond;
    }
    return oss.str();
}

Result<void> Time::scan(const ScalarValue& src) {
    return std::visit(overloaded{
        [this](const String& text) -> Result<void> {
            auto parsed = Time::parse(text);
            if (parsed.is_error()) return parsed.error();
            *this = parsed.value();
            return {};
        },
        [this](const calendar::Instant& instant) -> Result<void> {
            *this = Time::of(instant);
            return {};
        },
        [&src](const auto&) -> Result<void> {
            return unsupported_scan("Time", src);
        }
    }, src);
}

bool Time::is_valid() const {
    return hour >= 0 && hour < 24
        && minute >= 0 && minute < 60
        && second >= 0 && second < 60
        && nanosecond >= 0 && nanosecond < calendar::NANOS_PER_SECOND;
}

Int64 Time::nanoseconds_of_day() const {
    return (static_cast<Int64>(hour) * calendar::SECONDS_PER_HOUR
          + static_cast<Int64>(minute) * calendar::SECONDS_PER_MINUTE
          + second) * calendar::NANOS_PER_SECOND + nanosecond;
}

} // namespace civil
