#include "../framework/test_framework.hpp"
#include "civil/types/datetime.hpp"

using namespace civil;
using namespace civil::test;

struct RoundTripCase {
    const char* name;
    DateTime in;
    const char* text;
    bool encode_fails;
    bool decode_fails;
};

void test_round_trip_table() {
    const RoundTripCase cases[] = {
        {"zero date with time", {Date{0, 0, 0}, Time{3, 42, 31, 876}},
            "0000-00-00T03:42:31.000000876", false, false},
        {"zero date zero time", {Date{0, 0, 0}, Time{0, 0, 0, 0}},
            "0000-00-00T00:00:00", false, false},
        {"default", DateTime{}, "0000-00-00T00:00:00", false, false},
        {"leap day", {Date{2020, 2, 29}, Time{3, 42, 31, 876}},
            "2020-02-29T03:42:31.000000876", false, false},
        {"prior christmas", {Date{2019, 12, 25}, Time{1, 2, 3, 4}},
            "2019-12-25T01:02:03.000000004", false, false},
        {"future christmas", {Date{2345, 12, 25}, Time{12, 23, 34, 45}},
            "2345-12-25T12:23:34.000000045", false, false},
        {"first day", {Date{0, 1, 1}, Time{}}, "0000-01-01T00:00:00", false, false},
        {"last day", {Date{9999, 12, 31}, Time{23, 59, 59, 999999999}},
            "9999-12-31T23:59:59.999999999", false, false},
        {"bad day", {Date{2020, 3, -4}, Time{12, 23, 34, 5}},
            "2020-03--4T12:23:34.000000005", false, true},
        {"bad month", {Date{2020, 13, 4}, Time{12, 23, 34, 5}},
            "2020-13-04T12:23:34.000000005", false, true},
        {"bad year", {Date{-2020, 3, 4}, Time{12, 23, 34, 5}}, "", true, false},
        {"bad hour", {Date{2020, 3, 4}, Time{24, 0, 0, 0}},
            "2020-03-04T24:00:00", false, true},
        {"bad minute", {Date{2020, 3, 4}, Time{0, -1, 0, 0}},
            "2020-03-04T00:-1:00", false, true},
        {"bad second", {Date{2020, 3, 4}, Time{1, 0, 75, 0}},
            "2020-03-04T01:00:75", false, true},
        {"bad nanosecond", {Date{2020, 3, 4}, Time{12, 23, 34, 1231231234}},
            "2020-03-04T12:23:34.1231231234", false, true},
    };

    for (const auto& tc : cases) {
        auto text = tc.in.to_text();
        if (tc.encode_fails) {
            ASSERT_TRUE(text.is_error());
            ASSERT_EQ(text.error().code, ErrorCode::OUT_OF_RANGE);
            continue;
        }
        ASSERT_TRUE(text.is_success());
        ASSERT_EQ(text.value(), tc.text);

        auto decoded = DateTime::parse(text.value());
        if (tc.decode_fails) {
            ASSERT_TRUE(decoded.is_error());
            ASSERT_EQ(decoded.error().code, ErrorCode::PARSE_ERROR);
            continue;
        }
        ASSERT_TRUE(decoded.is_success());
        ASSERT_EQ(decoded.value(), tc.in);
    }
}

DateTime leap_reading() {
    return DateTime{Date{2020, 2, 29}, Time{3, 42, 31, 876}};
}

void test_encode() {
    auto text = leap_reading().to_text();
    ASSERT_TRUE(text.is_success());
    ASSERT_EQ(text.value(), "2020-02-29T03:42:31.000000876");

    EncodeOptions strict;
    strict.strict = true;
    DateTime bad_time{Date{2020, 3, 4}, Time{24, 0, 0, 0}};
    ASSERT_TRUE(bad_time.to_text().is_success());
    ASSERT_TRUE(bad_time.to_text(strict).is_error());
}

void test_decode() {
    auto good = DateTime::parse("2020-02-29T03:42:31.000000876");
    ASSERT_TRUE(good.is_success());
    ASSERT_EQ(good.value(), leap_reading());

    auto short_year = DateTime::parse("0-02-29T03:42:31.000000876");
    ASSERT_TRUE(short_year.is_error());
    ASSERT_CONTAINS(short_year.error().message, "invalid datetime: invalid date: ");
    ASSERT_EQ(short_year.error().component, "DateTime");

    auto bad_time = DateTime::parse("2020-02-29T24:00:00");
    ASSERT_CONTAINS(bad_time.error().message, "invalid datetime: invalid time: ");

    auto no_separator = DateTime::parse("2020-02-29 03:42:31");
    ASSERT_TRUE(no_separator.is_error());
    ASSERT_EQ(no_separator.error().code, ErrorCode::PARSE_ERROR);
    ASSERT_CONTAINS(no_separator.error().message, "no 'T' separator");

    ASSERT_TRUE(DateTime::parse("2020-02-29T").is_error());
    ASSERT_TRUE(DateTime::parse("T03:42:31").is_error());
    ASSERT_TRUE(DateTime::parse("2020-02-29T03:42:31T").is_error());
}

void test_value() {
    ASSERT_EQ(leap_reading().value(), "2020-02-29T03:42:31.000000876");
    ASSERT_EQ(leap_reading().to_string(), "2020-02-29T03:42:31.000000876");

    DateTime out_of_range{Date{-1, 1, 1}, Time{}};
    ASSERT_EQ(out_of_range.value(), "-001-01-01T00:00:00");
}

void test_scan_string() {
    DateTime dt;
    ASSERT_TRUE(dt.scan(ScalarValue{String("2020-02-29T03:42:31.000000876")}).is_success());
    ASSERT_EQ(dt, leap_reading());
}

void test_scan_instant() {
    DateTime dt;
    ASSERT_TRUE(dt.scan(ScalarValue{calendar::Instant::make(2020, 2, 29, 3, 42, 31, 876)}).is_success());
    ASSERT_EQ(dt, leap_reading());

    // Hours past midnight carry into the date
    DateTime late;
    ASSERT_TRUE(late.scan(ScalarValue{calendar::Instant{2020, 2, 29, 25, 0, 0, 0}}).is_success());
    ASSERT_EQ(late, (DateTime{Date{2020, 3, 1}, Time{1, 0, 0, 0}}));
    ASSERT_EQ(late.value(), "2020-03-01T01:00:00");
}

void test_scan_failure_keeps_value() {
    DateTime dt = leap_reading();

    ASSERT_TRUE(dt.scan(ScalarValue{String("2020-02-29T25:00:00")}).is_error());
    ASSERT_EQ(dt, leap_reading());

    auto bad_type = dt.scan(ScalarValue{ByteBuffer{}});
    ASSERT_TRUE(bad_type.is_error());
    ASSERT_EQ(bad_type.error().message, "cannot scan into DateTime: unsupported type bytes");
    ASSERT_EQ(dt, leap_reading());
}

void test_instants() {
    auto instant = calendar::Instant::make(1999, 12, 31, 23, 59, 59, 999999999);
    auto dt = DateTime::of(instant);
    ASSERT_EQ(dt.date, (Date{1999, 12, 31}));
    ASSERT_EQ(dt.time, (Time{23, 59, 59, 999999999}));
    ASSERT_EQ(dt.to_instant(), instant);

    auto rolled = DateTime::of(calendar::Instant{2020, 2, 31, 23, 0, 0, 0});
    ASSERT_EQ(rolled.date, (Date{2020, 3, 2}));
    ASSERT_EQ(rolled.time, (Time{23, 0, 0, 0}));

    // Out-of-range fields normalize
    DateTime overflow{Date{2020, 12, 31}, Time{24, 0, 0, 0}};
    ASSERT_EQ(overflow.to_instant(), calendar::Instant::make(2021, 1, 1));

    auto now = DateTime::now();
    ASSERT_TRUE(now.is_valid());
}

void test_queries() {
    ASSERT_TRUE(leap_reading().is_valid());
    ASSERT_FALSE((DateTime{Date{2021, 2, 29}, Time{}}).is_valid());
    ASSERT_FALSE((DateTime{Date{2021, 2, 28}, Time{24, 0, 0, 0}}).is_valid());
    ASSERT_TRUE(DateTime{}.is_zero());
    ASSERT_FALSE(leap_reading().is_zero());

    DateTime earlier{Date{2020, 2, 29}, Time{23, 59, 59, 0}};
    DateTime later{Date{2020, 3, 1}, Time{}};
    ASSERT_TRUE(earlier.before(later));
    ASSERT_TRUE(later.after(earlier));
    ASSERT_LT(earlier, later);
}

int main() {
    TestSuite suite("DateTime Tests");

    suite.add_test("Round trip table", test_round_trip_table);
    suite.add_test("Encode", test_encode);
    suite.add_test("Decode", test_decode);
    suite.add_test("Value", test_value);
    suite.add_test("Scan string", test_scan_string);
    suite.add_test("Scan instant", test_scan_instant);
    suite.add_test("Scan failure keeps value", test_scan_failure_keeps_value);
    suite.add_test("Instants", test_instants);
    suite.add_test("Queries", test_queries);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
