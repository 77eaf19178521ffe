// =============================================================================
// Civil Time - Calendar Implementation
// Version: 1.2.0
// =============================================================================

#include <civil/calendar/calendar.hpp>
#include <algorithm>
#include <limits>

namespace civil::calendar {

// Days in each month (non-leap year)
static constexpr Int32 DAYS_IN_MONTH[] = {
    0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31
};

// Days from 0000-03-01 to 1970-01-01
static constexpr Int64 EPOCH_SHIFT = 719468;
static constexpr Int64 DAYS_PER_ERA = 146097;

// =============================================================================
// Date Calculations
// =============================================================================

bool is_leap_year(Int64 year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

Int32 days_in_month(Int64 year, Int32 month) {
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return DAYS_IN_MONTH[month];
}

// Eras are 400-year blocks starting on March 1st, which puts the leap day at
// the end of each year of the era.
Int64 days_from_civil(Int64 year, Int32 month, Int64 day) {
    Int64 y = year - (month <= 2 ? 1 : 0);
    Int64 era = floor_div(y, 400);
    Int64 yoe = y - era * 400;
    Int64 mp = (month + 9) % 12;
    Int64 doy = (153 * mp + 2) / 5;
    Int64 doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * DAYS_PER_ERA + doe - EPOCH_SHIFT + (day - 1);
}

YearMonthDay civil_from_days(Int64 days) {
    Int64 z = days + EPOCH_SHIFT;
    Int64 era = floor_div(z, DAYS_PER_ERA);
    Int64 doe = z - era * DAYS_PER_ERA;
    Int64 yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    Int64 doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    Int64 mp = (5 * doy + 2) / 153;

    YearMonthDay ymd;
    ymd.day = static_cast<Int32>(doy - (153 * mp + 2) / 5 + 1);
    ymd.month = static_cast<Int32>(mp < 10 ? mp + 3 : mp - 9);
    ymd.year = yoe + era * 400 + (ymd.month <= 2 ? 1 : 0);
    return ymd;
}

// =============================================================================
// Instant Implementation
// =============================================================================

namespace {

// Normalized fields plus the year before narrowing to Int32
struct Normalized {
    Int64 year = 0;
    Instant fields;
};

Normalized normalize(Int64 year, Int64 month, Int64 day,
                     Int64 hour, Int64 minute, Int64 second, Int64 nanosecond) {
    Int64 m0 = month - 1;
    year += floor_div(m0, 12);
    m0 = floor_mod(m0, 12);

    second += floor_div(nanosecond, NANOS_PER_SECOND);
    nanosecond = floor_mod(nanosecond, NANOS_PER_SECOND);
    minute += floor_div(second, 60);
    second = floor_mod(second, 60);
    hour += floor_div(minute, 60);
    minute = floor_mod(minute, 60);
    day += floor_div(hour, 24);
    hour = floor_mod(hour, 24);

    YearMonthDay ymd = civil_from_days(days_from_civil(year, static_cast<Int32>(m0 + 1), day));

    Normalized result;
    result.year = ymd.year;
    result.fields.year = static_cast<Int32>(std::clamp<Int64>(ymd.year,
        std::numeric_limits<Int32>::min(), std::numeric_limits<Int32>::max()));
    result.fields.month = ymd.month;
    result.fields.day = ymd.day;
    result.fields.hour = static_cast<Int32>(hour);
    result.fields.minute = static_cast<Int32>(minute);
    result.fields.second = static_cast<Int32>(second);
    result.fields.nanosecond = static_cast<Int32>(nanosecond);
    return result;
}

} // anonymous namespace

Instant Instant::make(Int64 year, Int64 month, Int64 day,
                      Int64 hour, Int64 minute, Int64 second, Int64 nanosecond) {
    return normalize(year, month, day, hour, minute, second, nanosecond).fields;
}

Optional<Instant> Instant::try_make(Int64 year, Int64 month, Int64 day,
                                    Int64 hour, Int64 minute, Int64 second, Int64 nanosecond) {
    Normalized result = normalize(year, month, day, hour, minute, second, nanosecond);
    if (result.year != result.fields.year) return nullopt;
    return result.fields;
}

Instant Instant::from_system_time(SystemTimePoint tp) {
    Int64 since_epoch = std::chrono::duration_cast<Nanoseconds>(tp.time_since_epoch()).count();
    Int64 seconds = floor_div(since_epoch, NANOS_PER_SECOND);
    Int64 nanos = floor_mod(since_epoch, NANOS_PER_SECOND);
    Int64 days = floor_div(seconds, SECONDS_PER_DAY);
    Int64 second_of_day = floor_mod(seconds, SECONDS_PER_DAY);

    YearMonthDay ymd = civil_from_days(days);

    Instant result;
    result.year = static_cast<Int32>(ymd.year);
    result.month = ymd.month;
    result.day = ymd.day;
    result.hour = static_cast<Int32>(second_of_day / SECONDS_PER_HOUR);
    result.minute = static_cast<Int32>((second_of_day % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE);
    result.second = static_cast<Int32>(second_of_day % SECONDS_PER_MINUTE);
    result.nanosecond = static_cast<Int32>(nanos);
    return result;
}

Instant Instant::now() {
    return from_system_time(SystemClock::now());
}

SystemTimePoint Instant::to_system_time() const {
    Int64 seconds = days_since_epoch() * SECONDS_PER_DAY
                  + static_cast<Int64>(hour) * SECONDS_PER_HOUR
                  + static_cast<Int64>(minute) * SECONDS_PER_MINUTE
                  + second;
    auto since_epoch = Seconds(seconds) + Nanoseconds(nanosecond);
    return SystemTimePoint(std::chrono::duration_cast<SystemClock::duration>(since_epoch));
}

Int64 Instant::days_since_epoch() const {
    return days_from_civil(year, month, day);
}

Int64 Instant::nanoseconds_of_day() const {
    return (static_cast<Int64>(hour) * SECONDS_PER_HOUR
          + static_cast<Int64>(minute) * SECONDS_PER_MINUTE
          + second) * NANOS_PER_SECOND + nanosecond;
}

Instant Instant::normalized() const {
    return make(year, month, day, hour, minute, second, nanosecond);
}

Instant Instant::add_date(Int32 years, Int32 months, Int32 days) const {
    return make(static_cast<Int64>(year) + years,
                static_cast<Int64>(month) + months,
                static_cast<Int64>(day) + days,
                hour, minute, second, nanosecond);
}

Optional<Instant> Instant::try_add_date(Int32 years, Int32 months, Int32 days) const {
    return try_make(static_cast<Int64>(year) + years,
                    static_cast<Int64>(month) + months,
                    static_cast<Int64>(day) + days,
                    hour, minute, second, nanosecond);
}

Instant Instant::truncate_to_day() const {
    Instant result = *this;
    result.hour = 0;
    result.minute = 0;
    result.second = 0;
    result.nanosecond = 0;
    return result;
}

String Instant::to_string() const {
    return format_layout(Layout::DATE_TIME, *this) + "Z";
}

} // namespace civil::calendar
