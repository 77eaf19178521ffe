// =============================================================================
// Civil Time - Strict Layout Parser and Formatter
// Version: 1.2.0
// =============================================================================

#include <civil/calendar/calendar.hpp>
#include <array>
#include <sstream>
#include <iomanip>

namespace civil::calendar {

namespace {

enum class Element : UInt8 {
    LONG_YEAR,      // 2006
    ZERO_MONTH,     // 01
    ZERO_DAY,       // 02
    HOUR,          // 15
    ZERO_MINUTE,    // 04
    ZERO_SECOND,    // 05
    FRAC_SECOND9    // .999999999
};

// A literal prefix followed by one field
struct Chunk {
    StringView prefix;
    Element element;
    StringView text;
};

constexpr std::array<Chunk, 3> DATE_CHUNKS{{
    {"", Element::LONG_YEAR, "2006"},
    {"-", Element::ZERO_MONTH, "01"},
    {"-", Element::ZERO_DAY, "02"},
}};

constexpr std::array<Chunk, 4> TIME_CHUNKS{{
    {"", Element::HOUR, "15"},
    {":", Element::ZERO_MINUTE, "04"},
    {":", Element::ZERO_SECOND, "05"},
    {"", Element::FRAC_SECOND9, ".999999999"},
}};

constexpr std::array<Chunk, 7> DATE_TIME_CHUNKS{{
    {"", Element::LONG_YEAR, "2006"},
    {"-", Element::ZERO_MONTH, "01"},
    {"-", Element::ZERO_DAY, "02"},
    {"T", Element::HOUR, "15"},
    {":", Element::ZERO_MINUTE, "04"},
    {":", Element::ZERO_SECOND, "05"},
    {"", Element::FRAC_SECOND9, ".999999999"},
}};

constexpr Size MAX_FRACTION_DIGITS = 9;

bool is_digit(StringView s, Size i) {
    return i < s.size() && s[i] >= '0' && s[i] <= '9';
}

// Reads one or two digits; fixed requires exactly two
Optional<Int32> take_number(StringView& s, bool fixed) {
    if (!is_digit(s, 0)) return nullopt;
    if (!is_digit(s, 1)) {
        if (fixed) return nullopt;
        Int32 n = s[0] - '0';
        s.remove_prefix(1);
        return n;
    }
    Int32 n = (s[0] - '0') * 10 + (s[1] - '0');
    s.remove_prefix(2);
    return n;
}

String quote(StringView s) {
    std::ostringstream oss;
    oss << std::quoted(s);
    return oss.str();
}

ErrorInfo shape_error(Layout layout, StringView value, StringView rest, StringView element) {
    ErrorInfo info(ErrorCode::PARSE_ERROR,
        "parsing time " + quote(value) + " as " + quote(layout_string(layout)) +
        ": cannot parse " + quote(rest) + " as " + quote(element),
        "calendar");
    info.with_context("input", String(value));
    info.with_context("layout", String(layout_string(layout)));
    return info;
}

ErrorInfo message_error(Layout layout, StringView value, StringView message) {
    ErrorInfo info(ErrorCode::PARSE_ERROR,
        "parsing time " + quote(value) + String(message), "calendar");
    info.with_context("input", String(value));
    info.with_context("layout", String(layout_string(layout)));
    return info;
}

ErrorInfo range_error(Layout layout, StringView value, StringView field) {
    return message_error(layout, value, ": " + String(field) + " out of range");
}

template<Size N>
Result<Instant> parse_chunks(const std::array<Chunk, N>& chunks, Layout layout, StringView value) {
    StringView rest = value;

    Int32 year = 0, month = 1, day = 1;
    Int32 hour = 0, minute = 0, second = 0, nanosecond = 0;

    for (const auto& chunk : chunks) {
        if (!chunk.prefix.empty()) {
            if (!starts_with(rest, chunk.prefix)) {
                return shape_error(layout, value, rest, chunk.prefix);
            }
            rest.remove_prefix(chunk.prefix.size());
        }

        StringView before = rest;
        switch (chunk.element) {
            case Element::LONG_YEAR: {
                if (rest.size() < 4 || !is_digits(rest.substr(0, 4))) {
                    return shape_error(layout, value, before, chunk.text);
                }
                year = (rest[0] - '0') * 1000 + (rest[1] - '0') * 100
                     + (rest[2] - '0') * 10 + (rest[3] - '0');
                rest.remove_prefix(4);
                break;
            }
            case Element::ZERO_MONTH: {
                auto n = take_number(rest, true);
                if (!n) return shape_error(layout, value, before, chunk.text);
                if (*n < 1 || *n > 12) return range_error(layout, value, "month");
                month = *n;
                break;
            }
            case Element::ZERO_DAY: {
                auto n = take_number(rest, true);
                if (!n) return shape_error(layout, value, before, chunk.text);
                if (*n < 1 || *n > 31) return range_error(layout, value, "day");
                day = *n;
                break;
            }
            case Element::HOUR: {
                auto n = take_number(rest, false);
                if (!n) return shape_error(layout, value, before, chunk.text);
                if (*n > 23) return range_error(layout, value, "hour");
                hour = *n;
                break;
            }
            case Element::ZERO_MINUTE: {
                auto n = take_number(rest, true);
                if (!n) return shape_error(layout, value, before, chunk.text);
                if (*n > 59) return range_error(layout, value, "minute");
                minute = *n;
                break;
            }
            case Element::ZERO_SECOND: {
                auto n = take_number(rest, true);
                if (!n) return shape_error(layout, value, before, chunk.text);
                if (*n > 59) return range_error(layout, value, "second");
                second = *n;
                break;
            }
            case Element::FRAC_SECOND9: {
                // Optional in the value: absent unless '.' is followed by a digit
                if (rest.size() < 2 || rest[0] != '.' || !is_digit(rest, 1)) break;
                Size digits = 0;
                while (is_digit(rest, 1 + digits)) ++digits;
                if (digits > MAX_FRACTION_DIGITS) {
                    return range_error(layout, value, "fractional second");
                }
                Int32 ns = 0;
                for (Size i = 0; i < MAX_FRACTION_DIGITS; ++i) {
                    ns = ns * 10 + (i < digits ? rest[1 + i] - '0' : 0);
                }
                nanosecond = ns;
                rest.remove_prefix(1 + digits);
                break;
            }
        }
    }

    if (!rest.empty()) {
        return message_error(layout, value, ": extra text: " + quote(rest));
    }

    if (day > days_in_month(year, month)) {
        return range_error(layout, value, "day");
    }

    Instant result;
    result.year = year;
    result.month = month;
    result.day = day;
    result.hour = hour;
    result.minute = minute;
    result.second = second;
    result.nanosecond = nanosecond;
    return result;
}

} // anonymous namespace

StringView layout_string(Layout layout) {
    switch (layout) {
        case Layout::DATE: return "2006-01-02";
        case Layout::TIME: return "15:04:05.999999999";
        case Layout::DATE_TIME: return "2006-01-02T15:04:05.999999999";
    }
    return "";
}

Result<Instant> parse_layout(Layout layout, StringView value) {
    switch (layout) {
        case Layout::DATE: return parse_chunks(DATE_CHUNKS, layout, value);
        case Layout::TIME: return parse_chunks(TIME_CHUNKS, layout, value);
        case Layout::DATE_TIME: return parse_chunks(DATE_TIME_CHUNKS, layout, value);
    }
    return make_error<Instant>(ErrorCode::INVALID_ARGUMENT, "unknown layout", "calendar");
}

String format_layout(Layout layout, const Instant& instant) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::internal;

    if (layout != Layout::TIME) {
        oss << std::setw(4) << instant.year << "-"
            << std::setw(2) << instant.month << "-"
            << std::setw(2) << instant.day;
        if (layout == Layout::DATE) return oss.str();
        oss << "T";
    }

    oss << std::setw(2) << instant.hour << ":"
        << std::setw(2) << instant.minute << ":"
        << std::setw(2) << instant.second;

    if (instant.nanosecond != 0) {
        std::ostringstream frac;
        frac << std::setfill('0') << std::setw(9) << instant.nanosecond;
        String digits = frac.str();
        digits.erase(digits.find_last_not_of('0') + 1);
        oss << "." << digits;
    }

    return oss.str();
}

} // namespace civil::calendar
