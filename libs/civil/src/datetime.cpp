// =============================================================================
// Civil Time - DateTime Implementation
// Version: 1.2.0
// =============================================================================

#include <civil/types/datetime.hpp>

namespace civil {

namespace {

ErrorInfo datetime_error(ErrorInfo info) {
    info.message = "invalid datetime: " + info.message;
    info.component = "DateTime";
    return info;
}

} // anonymous namespace

DateTime DateTime::of(const calendar::Instant& instant) {
    // Hours past midnight carry into the date before the split
    calendar::Instant n = instant.normalized();
    return DateTime{Date::of(n.truncate_to_day()), Time::of(n)};
}

DateTime DateTime::now() {
    return of(calendar::Instant::now());
}

Result<DateTime> DateTime::parse(StringView text) {
    auto pos = text.find(SEPARATOR);
    if (pos == StringView::npos) {
        ErrorInfo info(ErrorCode::PARSE_ERROR,
            std::format("invalid datetime: \"{}\" has no '{}' separator", text, SEPARATOR),
            "DateTime");
        info.with_context("input", String(text));
        return info;
    }

    auto date = Date::parse(text.substr(0, pos));
    if (date.is_error()) return datetime_error(date.error());

    auto time = Time::parse(text.substr(pos + 1));
    if (time.is_error()) return datetime_error(time.error());

    return DateTime{date.value(), time.value()};
}

Result<String> DateTime::to_text(const EncodeOptions& options) const {
    auto date_text = date.to_text(options);
    if (date_text.is_error()) return date_text.error();

    auto time_text = time.to_text(options);
    if (time_text.is_error()) return time_text.error();

    return date_text.value() + SEPARATOR + time_text.value();
}

String DateTime::value() const {
    return date.value() + SEPARATOR + time.value();
}

Result<void> DateTime::scan(const ScalarValue& src) {
    return std::visit(overloaded{
        [this](const String& text) -> Result<void> {
            auto parsed = DateTime::parse(text);
            if (parsed.is_error()) return parsed.error();
            *this = parsed.value();
            return {};
        },
        [this](const calendar::Instant& instant) -> Result<void> {
            *this = DateTime::of(instant);
            return {};
        },
        [&src](const auto&) -> Result<void> {
            return unsupported_scan("DateTime", src);
        }
    }, src);
}

calendar::Instant DateTime::to_instant() const {
    return calendar::Instant::make(date.year, date.month, date.day,
                                   time.hour, time.minute, time.second, time.nanosecond);
}

} // namespace civil
