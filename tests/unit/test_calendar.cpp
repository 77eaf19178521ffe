#include "../framework/test_framework.hpp"
#include "civil/calendar/calendar.hpp"
#include <limits>

using namespace civil;
using namespace civil::calendar;
using namespace civil::test;

void test_leap_years() {
    ASSERT_TRUE(is_leap_year(2020));
    ASSERT_TRUE(is_leap_year(2000));
    ASSERT_TRUE(is_leap_year(0));
    ASSERT_FALSE(is_leap_year(1900));
    ASSERT_FALSE(is_leap_year(2021));
    ASSERT_TRUE(is_leap_year(-4));
}

void test_days_in_month() {
    ASSERT_EQ(days_in_month(2020, 2), 29);
    ASSERT_EQ(days_in_month(2021, 2), 28);
    ASSERT_EQ(days_in_month(2021, 4), 30);
    ASSERT_EQ(days_in_month(2021, 12), 31);
    ASSERT_EQ(days_in_month(2021, 0), 0);
    ASSERT_EQ(days_in_month(2021, 13), 0);
}

void test_civil_day_numbers() {
    ASSERT_EQ(days_from_civil(1970, 1, 1), 0);
    ASSERT_EQ(days_from_civil(1970, 1, 2), 1);
    ASSERT_EQ(days_from_civil(1969, 12, 31), -1);
    ASSERT_EQ(days_from_civil(2000, 3, 1), 11017);

    ASSERT_EQ(civil_from_days(0), (YearMonthDay{1970, 1, 1}));
    ASSERT_EQ(civil_from_days(11016), (YearMonthDay{2000, 2, 29}));
    ASSERT_EQ(civil_from_days(-719528), (YearMonthDay{0, 1, 1}));

    // Day 0 is the last day of the previous month
    ASSERT_EQ(civil_from_days(days_from_civil(2020, 3, 0)), (YearMonthDay{2020, 2, 29}));

    for (Int64 n = -800000; n <= 3000000; n += 997) {
        auto ymd = civil_from_days(n);
        ASSERT_EQ(days_from_civil(ymd.year, ymd.month, ymd.day), n);
    }
}

void test_floor_division() {
    ASSERT_EQ(floor_div(7, 2), 3);
    ASSERT_EQ(floor_div(-7, 2), -4);
    ASSERT_EQ(floor_mod(-7, 2), 1);
    ASSERT_EQ(floor_mod(-12, 12), 0);
    ASSERT_EQ(floor_div(-1, 12), -1);
    ASSERT_EQ(floor_mod(-1, 12), 11);
}

void test_instant_make_normalizes() {
    auto feb29 = Instant::make(2021, 2, 29);
    ASSERT_EQ(feb29.month, 3);
    ASSERT_EQ(feb29.day, 1);

    auto month13 = Instant::make(2020, 13, 1);
    ASSERT_EQ(month13.year, 2021);
    ASSERT_EQ(month13.month, 1);

    auto month0 = Instant::make(2020, 0, 15);
    ASSERT_EQ(month0.year, 2019);
    ASSERT_EQ(month0.month, 12);

    auto rollover = Instant::make(2020, 12, 31, 23, 59, 60);
    ASSERT_EQ(rollover.year, 2021);
    ASSERT_EQ(rollover.month, 1);
    ASSERT_EQ(rollover.day, 1);
    ASSERT_EQ(rollover.hour, 0);
    ASSERT_EQ(rollover.second, 0);

    auto negative = Instant::make(2020, 1, 1, 0, 0, 0, -1);
    ASSERT_EQ(negative.year, 2019);
    ASSERT_EQ(negative.second, 59);
    ASSERT_EQ(negative.nanosecond, 999999999);
}

void test_instant_add_date() {
    auto leap = Instant::make(2020, 2, 29, 3, 42, 31, 876);

    auto next_year = leap.add_date(1, 0, 0);
    ASSERT_EQ(next_year.year, 2021);
    ASSERT_EQ(next_year.month, 3);
    ASSERT_EQ(next_year.day, 1);
    ASSERT_EQ(next_year.hour, 3);
    ASSERT_EQ(next_year.nanosecond, 876);

    auto back = leap.add_date(0, -2, 0);
    ASSERT_EQ(back.year, 2019);
    ASSERT_EQ(back.month, 12);
    ASSERT_EQ(back.day, 29);

    auto days = leap.add_date(0, 0, 1);
    ASSERT_EQ(days.month, 3);
    ASSERT_EQ(days.day, 1);
}

void test_instant_normalized() {
    Instant reading{2020, 2, 29, 25, 0, 0, 0};
    auto n = reading.normalized();
    ASSERT_EQ(n, Instant::make(2020, 3, 1, 1));
    ASSERT_EQ(n.normalized(), n);

    Instant past_month_end{2020, 2, 31, 0, 0, 0, 0};
    ASSERT_EQ(past_month_end.normalized(), Instant::make(2020, 3, 2));
}

void test_instant_year_limits() {
    constexpr Int64 max_year = std::numeric_limits<Int32>::max();
    constexpr Int64 min_year = std::numeric_limits<Int32>::min();

    ASSERT_TRUE(Instant::try_make(max_year, 12, 31).has_value());
    ASSERT_FALSE(Instant::try_make(max_year + 1, 1, 1).has_value());
    ASSERT_FALSE(Instant::try_make(max_year, 12, 32).has_value());
    ASSERT_FALSE(Instant::try_make(min_year, 1, 1, 0, 0, 0, -1).has_value());
    ASSERT_EQ(Instant::try_make(2020, 2, 30).value(), Instant::make(2020, 3, 1));

    // make saturates instead of wrapping
    ASSERT_EQ(Instant::make(max_year + 1, 1, 1).year, std::numeric_limits<Int32>::max());
    ASSERT_EQ(Instant::make(min_year - 1, 1, 1).year, std::numeric_limits<Int32>::min());

    auto last = Instant::make(max_year, 12, 31);
    ASSERT_FALSE(last.try_add_date(1, 0, 0).has_value());
    ASSERT_FALSE(last.try_add_date(0, 0, 1).has_value());
    auto previous = last.try_add_date(0, 0, -1);
    ASSERT_TRUE(previous.has_value());
    ASSERT_EQ(previous->day, 30);

    auto leap = Instant::make(2020, 2, 29, 3, 42, 31, 876);
    ASSERT_EQ(leap.try_add_date(1, 0, 0).value(), leap.add_date(1, 0, 0));
}

void test_instant_system_time() {
    auto epoch = Instant::from_system_time(SystemTimePoint{});
    ASSERT_EQ(epoch, Instant{});

    auto reading = Instant::make(2020, 2, 29, 3, 42, 31, 876000);
    auto tp = reading.to_system_time();
    ASSERT_EQ(Instant::from_system_time(tp), reading);

    auto before_epoch = Instant::make(1969, 12, 31, 23, 59, 59);
    ASSERT_EQ(Instant::from_system_time(before_epoch.to_system_time()), before_epoch);

    auto now = Instant::now();
    ASSERT_GE(now.year, 2024);
}

void test_instant_truncate() {
    auto reading = Instant::make(2020, 2, 29, 3, 42, 31, 876);
    auto midnight = reading.truncate_to_day();
    ASSERT_EQ(midnight, Instant::make(2020, 2, 29));
    ASSERT_EQ(reading.nanoseconds_of_day(),
              ((3 * 3600 + 42 * 60 + 31) * NANOS_PER_SECOND) + 876);
    ASSERT_EQ(reading.to_string(), "2020-02-29T03:42:31.000000876Z");
}

void test_parse_date_layout() {
    auto parsed = parse_layout(Layout::DATE, "2020-02-29");
    ASSERT_TRUE(parsed.is_success());
    ASSERT_EQ(parsed->year, 2020);
    ASSERT_EQ(parsed->month, 2);
    ASSERT_EQ(parsed->day, 29);
    ASSERT_EQ(parsed->hour, 0);

    auto not_leap = parse_layout(Layout::DATE, "2021-02-29");
    ASSERT_TRUE(not_leap.is_error());
    ASSERT_EQ(not_leap.error().message, "parsing time \"2021-02-29\": day out of range");

    auto bad_month = parse_layout(Layout::DATE, "2020-13-01");
    ASSERT_EQ(bad_month.error().message, "parsing time \"2020-13-01\": month out of range");
    ASSERT_EQ(bad_month.error().code, ErrorCode::PARSE_ERROR);
    ASSERT_EQ(bad_month.error().context.at("input"), "2020-13-01");

    auto negative_day = parse_layout(Layout::DATE, "2020-02--1");
    ASSERT_EQ(negative_day.error().message,
              "parsing time \"2020-02--1\" as \"2006-01-02\": cannot parse \"-1\" as \"02\"");

    auto short_year = parse_layout(Layout::DATE, "0-02-29");
    ASSERT_EQ(short_year.error().message,
              "parsing time \"0-02-29\" as \"2006-01-02\": cannot parse \"0-02-29\" as \"2006\"");

    auto trailing = parse_layout(Layout::DATE, "2020-02-29x");
    ASSERT_EQ(trailing.error().message, "parsing time \"2020-02-29x\": extra text: \"x\"");

    ASSERT_TRUE(parse_layout(Layout::DATE, "2020-2-29").is_error());
    ASSERT_TRUE(parse_layout(Layout::DATE, "").is_error());
    ASSERT_TRUE(parse_layout(Layout::DATE, "2020-00-10").is_error());
    ASSERT_TRUE(parse_layout(Layout::DATE, "2020-01-00").is_error());
}

void test_parse_time_layout() {
    auto parsed = parse_layout(Layout::TIME, "03:42:31.000000876");
    ASSERT_TRUE(parsed.is_success());
    ASSERT_EQ(parsed->hour, 3);
    ASSERT_EQ(parsed->minute, 42);
    ASSERT_EQ(parsed->second, 31);
    ASSERT_EQ(parsed->nanosecond, 876);

    auto single_hour = parse_layout(Layout::TIME, "3:04:05");
    ASSERT_TRUE(single_hour.is_success());
    ASSERT_EQ(single_hour->hour, 3);

    auto short_fraction = parse_layout(Layout::TIME, "12:00:00.5");
    ASSERT_EQ(short_fraction->nanosecond, 500000000);

    auto negative = parse_layout(Layout::TIME, "-3:42:31.000000876");
    ASSERT_EQ(negative.error().message,
              "parsing time \"-3:42:31.000000876\" as \"15:04:05.999999999\": "
              "cannot parse \"-3:42:31.000000876\" as \"15\"");

    auto hour24 = parse_layout(Layout::TIME, "24:00:00");
    ASSERT_EQ(hour24.error().message, "parsing time \"24:00:00\": hour out of range");

    auto second75 = parse_layout(Layout::TIME, "01:00:75");
    ASSERT_EQ(second75.error().message, "parsing time \"01:00:75\": second out of range");

    auto ten_digits = parse_layout(Layout::TIME, "12:23:34.1231231234");
    ASSERT_EQ(ten_digits.error().message,
              "parsing time \"12:23:34.1231231234\": fractional second out of range");

    ASSERT_TRUE(parse_layout(Layout::TIME, "00:-1:00").is_error());
    ASSERT_TRUE(parse_layout(Layout::TIME, "12:00:00.").is_error());
    ASSERT_TRUE(parse_layout(Layout::TIME, "12:00").is_error());
}

void test_parse_date_time_layout() {
    auto parsed = parse_layout(Layout::DATE_TIME, "9999-12-31T23:59:59.999999999");
    ASSERT_TRUE(parsed.is_success());
    ASSERT_EQ(*parsed, Instant::make(9999, 12, 31, 23, 59, 59, 999999999));

    auto no_separator = parse_layout(Layout::DATE_TIME, "2020-02-29 03:42:31");
    ASSERT_CONTAINS(no_separator.error().message, "cannot parse \" 03:42:31\" as \"T\"");
}

void test_format_layout() {
    auto reading = Instant::make(2020, 2, 29, 3, 42, 31, 500000000);
    ASSERT_EQ(format_layout(Layout::DATE, reading), "2020-02-29");
    ASSERT_EQ(format_layout(Layout::TIME, reading), "03:42:31.5");
    ASSERT_EQ(format_layout(Layout::DATE_TIME, reading), "2020-02-29T03:42:31.5");
    ASSERT_EQ(format_layout(Layout::TIME, Instant{}), "00:00:00");
    ASSERT_EQ(layout_string(Layout::DATE_TIME), "2006-01-02T15:04:05.999999999");
}

int main() {
    TestSuite suite("Calendar Tests");

    suite.add_test("Leap years", test_leap_years);
    suite.add_test("Days in month", test_days_in_month);
    suite.add_test("Civil day numbers", test_civil_day_numbers);
    suite.add_test("Floor division", test_floor_division);
    suite.add_test("Instant::make normalizes", test_instant_make_normalizes);
    suite.add_test("Instant add_date", test_instant_add_date);
    suite.add_test("Instant normalized", test_instant_normalized);
    suite.add_test("Instant year limits", test_instant_year_limits);
    suite.add_test("Instant system time", test_instant_system_time);
    suite.add_test("Instant truncate", test_instant_truncate);
    suite.add_test("Parse date layout", test_parse_date_layout);
    suite.add_test("Parse time layout", test_parse_time_layout);
    suite.add_test("Parse date-time layout", test_parse_date_time_layout);
    suite.add_test("Format layout", test_format_layout);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
