#include "../framework/test_framework.hpp"
#include "civil/types/scalar.hpp"
#include "civil/common/logging.hpp"

using namespace civil;
using namespace civil::test;

void test_type_names() {
    ASSERT_EQ(scalar_type_name(ScalarValue{}), "null");
    ASSERT_EQ(scalar_type_name(ScalarValue{Int64{1}}), "int64");
    ASSERT_EQ(scalar_type_name(ScalarValue{Float64{0.5}}), "float64");
    ASSERT_EQ(scalar_type_name(ScalarValue{false}), "bool");
    ASSERT_EQ(scalar_type_name(ScalarValue{ByteBuffer{}}), "bytes");
    ASSERT_EQ(scalar_type_name(ScalarValue{String("2020-02-29")}), "string");
    ASSERT_EQ(scalar_type_name(ScalarValue{calendar::Instant{}}), "instant");
}

void test_unsupported_scan() {
    ErrorInfo info = unsupported_scan("Date", ScalarValue{Int64{20200229}});
    ASSERT_EQ(info.code, ErrorCode::UNSUPPORTED_TYPE);
    ASSERT_EQ(info.message, "cannot scan into Date: unsupported type int64");
    ASSERT_EQ(info.component, "Date");
    ASSERT_EQ(info.context.at("type"), "int64");

    ErrorInfo null_info = unsupported_scan("Time", ScalarValue{});
    ASSERT_EQ(null_info.message, "cannot scan into Time: unsupported type null");
}

void test_unsupported_scan_logs() {
    auto logger = logging::LogManager::instance().get_logger("civil.scalar");
    auto sink = std::make_shared<logging::MemorySink>(logging::LogLevel::DBG);
    logger->add_sink(sink);
    logger->set_level(logging::LogLevel::DBG);

    (void)unsupported_scan("DateTime", ScalarValue{true});

    auto entries = sink->entries();
    ASSERT_EQ(entries.size(), 1u);
    ASSERT_EQ(entries[0].level, logging::LogLevel::DBG);
    ASSERT_EQ(entries[0].logger_name, "civil.scalar");
    ASSERT_EQ(entries[0].message, "rejected scan of bool into DateTime");

    // Quiet at the default level
    logger->set_level(logging::LogLevel::WARN);
    sink->clear();
    (void)unsupported_scan("DateTime", ScalarValue{true});
    ASSERT_TRUE(sink->entries().empty());
}

void test_encode_options_default() {
    EncodeOptions options;
    ASSERT_FALSE(options.strict);
}

int main() {
    TestSuite suite("Scalar Tests");

    suite.add_test("Type names", test_type_names);
    suite.add_test("Unsupported scan", test_unsupported_scan);
    suite.add_test("Unsupported scan logs", test_unsupported_scan_logs);
    suite.add_test("EncodeOptions default", test_encode_options_default);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
