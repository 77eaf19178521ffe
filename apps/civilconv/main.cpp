// =============================================================================
// Civil Time - civilconv Command Line Converter
// Version: 1.2.0
// =============================================================================

#include <iostream>
#include <limits>
#include <string>
#include <type_traits>

#include "civil/common/types.hpp"
#include "civil/common/error.hpp"
#include "civil/common/logging.hpp"
#include "civil/common/cli.hpp"
#include "civil/config/config.hpp"
#include "civil/serialization/json.hpp"
#include "civil/types/date.hpp"
#include "civil/types/time.hpp"
#include "civil/types/datetime.hpp"

namespace cfg = civil::config;
namespace logging = civil::logging;
namespace ser = civil::serialization;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_CONVERSION_ERROR = 1;
constexpr int EXIT_USAGE_ERROR = 2;

enum class Mode { ENCODE, DECODE, VALUE, NOW };

struct Request {
    Mode mode = Mode::ENCODE;
    civil::String input;
    civil::Int32 years = 0;
    civil::Int32 months = 0;
    civil::Int32 days = 0;
    civil::EncodeOptions options;

    [[nodiscard]] bool shifts() const { return years != 0 || months != 0 || days != 0; }
};

int usage_error(civil::StringView message) {
    std::cerr << "civilconv: " << message << "\n";
    return EXIT_USAGE_ERROR;
}

civil::String describe(const civil::Date& date) {
    return std::format("year={} month={} day={}", date.year, date.month, date.day);
}

civil::String describe(const civil::Time& time) {
    return std::format("hour={} minute={} second={} nanosecond={}",
                       time.hour, time.minute, time.second, time.nanosecond);
}

civil::String describe(const civil::DateTime& datetime) {
    return describe(datetime.date) + " " + describe(datetime.time);
}

civil::Result<civil::Date> shift(const civil::Date& date, const Request& req) {
    if (!req.shifts()) return date;
    auto shifted = date.to_instant().try_add_date(req.years, req.months, req.days);
    if (!shifted) {
        return civil::make_error<civil::Date>(civil::ErrorCode::OUT_OF_RANGE,
                                              "date arithmetic overflows the year range");
    }
    return civil::Date::of(*shifted);
}

template<typename T>
civil::Result<T> read_input(const Request& req) {
    switch (req.mode) {
        case Mode::ENCODE:
            return T::parse(req.input);
        case Mode::DECODE: {
            T target;
            auto result = ser::unmarshal_json(req.input, target);
            if (result.is_error()) return result.error();
            return target;
        }
        case Mode::VALUE: {
            T target;
            auto result = target.scan(civil::ScalarValue{req.input});
            if (result.is_error()) return result.error();
            return target;
        }
        case Mode::NOW:
            return T::of(civil::calendar::Instant::now());
    }
    return civil::make_error<T>(civil::ErrorCode::INVALID_ARGUMENT, "unknown mode", "civilconv");
}

template<typename T>
int convert(const Request& req, logging::Logger& logger) {
    auto fail = [&logger](const civil::ErrorInfo& error) {
        logger.info("conversion failed: {} from {}",
                    civil::format_error_code(error.code), error.component);
        std::cerr << "civilconv: " << error.message << "\n";
        return EXIT_CONVERSION_ERROR;
    };

    auto input = read_input<T>(req);
    if (input.is_error()) return fail(input.error());

    T value = input.value();
    if constexpr (std::is_same_v<T, civil::Date>) {
        auto shifted = shift(value, req);
        if (shifted.is_error()) return fail(shifted.error());
        value = shifted.value();
    } else if constexpr (std::is_same_v<T, civil::DateTime>) {
        auto shifted = shift(value.date, req);
        if (shifted.is_error()) return fail(shifted.error());
        value.date = shifted.value();
    }

    if (req.mode == Mode::VALUE) {
        std::cout << value.value() << "\n";
        return EXIT_OK;
    }

    if (req.mode == Mode::DECODE) {
        std::cout << describe(value) << "\n";
    }

    auto json = ser::marshal_json(value, req.options);
    if (json.is_error()) return fail(json.error());
    std::cout << json.value() << "\n";
    return EXIT_OK;
}

bool read_shift(const civil::cli::ArgParser& parser, const civil::String& name, civil::Int32& out) {
    if (!parser.has(name)) return true;
    auto n = parser.get_int(name);
    if (!n || *n < std::numeric_limits<civil::Int32>::min() ||
        *n > std::numeric_limits<civil::Int32>::max()) {
        return false;
    }
    out = static_cast<civil::Int32>(*n);
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    civil::cli::ArgParser parser("civilconv",
        "Convert civil dates and times between text, JSON and stored values");
    parser.add_option("config", 'c', "INI configuration file")
          .add_option("log-level", 'l', "TRACE, DEBUG, INFO, WARN, ERROR or OFF")
          .add_flag("strict", 's', "Range-check every field when encoding")
          .add_option("type", 't', "date, time or datetime")
          .add_option("encode", 'e', "Parse TEXT and print its JSON encoding")
          .add_option("decode", 'd', "Decode a JSON string, print its fields and re-encode")
          .add_option("value", 'v', "Scan TEXT as a stored value and print it")
          .add_flag("now", 'n', "Use the current UTC time")
          .add_option("add-days", 0, "Days to add")
          .add_option("add-months", 0, "Months to add")
          .add_option("add-years", 0, "Years to add")
          .add_flag("print-config", 0, "Print the effective configuration and exit")
          .add_flag("version", 0, "Print the version and exit");

    if (!parser.parse(argc, argv)) {
        if (parser.help_requested()) return EXIT_OK;
        return usage_error(parser.error());
    }

    if (parser.flag("version")) {
        std::cout << "civilconv " << civil::LIBRARY_VERSION.to_string() << "\n";
        return EXIT_OK;
    }

    // Configuration and logging
    cfg::ConfigFile config = cfg::default_civil_config();
    if (auto path = parser.get("config")) {
        auto loaded = cfg::load_civil_config(*path);
        if (loaded.is_error()) return usage_error(loaded.error().message);
        config = std::move(loaded.value());
    }
    if (auto level = parser.get("log-level")) {
        config.set(cfg::sections::LOGGING, cfg::keys::LEVEL, *level);
    }
    if (auto applied = cfg::apply_logging(config); applied.is_error()) {
        return usage_error(applied.error().message);
    }

    auto logger = logging::LogManager::instance().get_logger("civilconv");
    if (config.is_loaded()) {
        logger->info("loaded configuration from {}", config.path().string());
    }

    if (parser.flag("print-config")) {
        std::cout << config.to_string();
        return EXIT_OK;
    }

    auto options = cfg::encode_options(config);
    if (options.is_error()) return usage_error(options.error().message);

    Request req;
    req.options = options.value();
    if (parser.flag("strict")) req.options.strict = true;

    int modes = 0;
    if (auto text = parser.get("encode")) { req.mode = Mode::ENCODE; req.input = *text; ++modes; }
    if (auto text = parser.get("decode")) { req.mode = Mode::DECODE; req.input = *text; ++modes; }
    if (auto text = parser.get("value")) { req.mode = Mode::VALUE; req.input = *text; ++modes; }
    if (parser.flag("now")) { req.mode = Mode::NOW; ++modes; }
    if (modes != 1) {
        return usage_error("exactly one of --encode, --decode, --value or --now is required");
    }

    if (!read_shift(parser, "add-years", req.years) ||
        !read_shift(parser, "add-months", req.months) ||
        !read_shift(parser, "add-days", req.days)) {
        return usage_error("--add-days, --add-months and --add-years take a 32-bit integer");
    }

    civil::String type = civil::to_lower(parser.get("type").value_or(""));
    if (type != "date" && type != "time" && type != "datetime") {
        return usage_error("--type must be date, time or datetime");
    }
    if (type == "time" && req.shifts()) {
        return usage_error("date arithmetic does not apply to --type time");
    }

    logger->debug("converting {} (strict={})", type, req.options.strict);
    int code = EXIT_OK;
    {
        logging::ScopedTimer timer(logger, "civilconv " + type);
        if (type == "date") code = convert<civil::Date>(req, *logger);
        else if (type == "datetime") code = convert<civil::DateTime>(req, *logger);
        else code = convert<civil::Time>(req, *logger);
    }
    logging::LogManager::instance().shutdown();
    return code;
}
