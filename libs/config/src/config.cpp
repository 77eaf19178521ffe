// =============================================================================
// Civil Time - Configuration File Parser Implementation
// Version: 1.2.0
// =============================================================================

#include <civil/config/config.hpp>
#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace civil::config {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

bool is_true_value(StringView sv) {
    String lower = to_lower(sv);
    return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

bool is_false_value(StringView sv) {
    String lower = to_lower(sv);
    return lower == "false" || lower == "no" || lower == "off" || lower == "0";
}

String unquote(String value) {
    if (value.size() >= 2) {
        if ((value.front() == '"' && value.back() == '"') ||
            (value.front() == '\'' && value.back() == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

} // anonymous namespace

// =============================================================================
// ConfigValue Implementation
// =============================================================================

Result<Int64> ConfigValue::to_int() const {
    if (value_.empty()) {
        return make_error<Int64>(ErrorCode::INVALID_ARGUMENT, "Empty value", "config");
    }
    Int64 result = 0;
    const char* first = value_.data();
    const char* last = first + value_.size();
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec == std::errc::result_out_of_range) {
        return make_error<Int64>(ErrorCode::OUT_OF_RANGE,
            "Integer out of range: " + value_, "config");
    }
    if (ec != std::errc{} || ptr != last) {
        return make_error<Int64>(ErrorCode::INVALID_ARGUMENT,
            "Invalid integer format: " + value_, "config");
    }
    return result;
}

Result<bool> ConfigValue::to_bool() const {
    if (is_true_value(value_)) return true;
    if (is_false_value(value_)) return false;
    return make_error<bool>(ErrorCode::INVALID_ARGUMENT,
        "Cannot parse boolean: " + value_, "config");
}

Int64 ConfigValue::to_int_or(Int64 default_val) const {
    auto result = to_int();
    return result.is_success() ? result.value() : default_val;
}

bool ConfigValue::to_bool_or(bool default_val) const {
    auto result = to_bool();
    return result.is_success() ? result.value() : default_val;
}

String ConfigValue::to_string_or(StringView default_val) const {
    return value_.empty() ? String(default_val) : value_;
}

// =============================================================================
// ConfigSection Implementation
// =============================================================================

static const ConfigValue EMPTY_VALUE;

bool ConfigSection::has(StringView key) const {
    return values_.find(key) != values_.end();
}

const ConfigValue& ConfigSection::get(StringView key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : EMPTY_VALUE;
}

String ConfigSection::get_string(StringView key, StringView default_val) const {
    return get(key).to_string_or(default_val);
}

Int64 ConfigSection::get_int(StringView key, Int64 default_val) const {
    return get(key).to_int_or(default_val);
}

bool ConfigSection::get_bool(StringView key, bool default_val) const {
    return get(key).to_bool_or(default_val);
}

void ConfigSection::set(StringView key, StringView value) {
    values_[String(key)] = ConfigValue(String(value));
}

void ConfigSection::set(StringView key, Int64 value) {
    values_[String(key)] = ConfigValue(std::to_string(value));
}

void ConfigSection::set(StringView key, bool value) {
    values_[String(key)] = ConfigValue(value ? "true" : "false");
}

void ConfigSection::remove(StringView key) {
    auto it = values_.find(key);
    if (it != values_.end()) {
        values_.erase(it);
    }
}

Vector<String> ConfigSection::keys() const {
    Vector<String> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// ConfigFile Implementation
// =============================================================================

void ConfigFile::parse_stream(std::istream& in) {
    String current_section(DEFAULT_SECTION);
    add_section(current_section);

    String line;
    while (std::getline(in, line)) {
        String trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
            continue;
        }

        if (trimmed[0] == '[' && trimmed.back() == ']') {
            current_section = trim(StringView(trimmed).substr(1, trimmed.size() - 2));
            add_section(current_section);
            continue;
        }

        // key=value or key:value
        Size sep_pos = std::min(trimmed.find('='), trimmed.find(':'));
        if (sep_pos != String::npos) {
            String key = trim(StringView(trimmed).substr(0, sep_pos));
            String value = unquote(trim(StringView(trimmed).substr(sep_pos + 1)));
            section(current_section).set(key, value);
        }
    }
}

Result<void> ConfigFile::load(const Path& path) {
    std::ifstream file(path);
    if (!file) {
        ErrorInfo info(ErrorCode::FILE_NOT_FOUND,
            "Cannot open config file: " + path.string(), "config");
        info.with_context("path", path.string());
        return info;
    }

    filepath_ = path;
    sections_.clear();
    parse_stream(file);

    if (file.bad()) {
        return make_error<void>(ErrorCode::IO_ERROR,
            "Error reading config file: " + path.string(), "config");
    }
    return {};
}

Result<void> ConfigFile::save(const Path& path) const {
    std::ofstream file(path);
    if (!file) {
        return make_error<void>(ErrorCode::IO_ERROR,
            "Cannot create config file: " + path.string(), "config");
    }

    file << to_string();
    if (!file) {
        return make_error<void>(ErrorCode::IO_ERROR,
            "Error writing config file: " + path.string(), "config");
    }
    return {};
}

bool ConfigFile::has_section(StringView name) const {
    return sections_.find(name) != sections_.end();
}

static const ConfigSection EMPTY_SECTION;

ConfigSection& ConfigFile::section(StringView name) {
    auto it = sections_.find(name);
    if (it == sections_.end()) {
        return add_section(name);
    }
    return it->second;
}

const ConfigSection& ConfigFile::section(StringView name) const {
    auto it = sections_.find(name);
    return it != sections_.end() ? it->second : EMPTY_SECTION;
}

ConfigSection& ConfigFile::add_section(StringView name) {
    auto [it, _] = sections_.emplace(String(name), ConfigSection(String(name)));
    return it->second;
}

bool ConfigFile::has(StringView section_name, StringView key) const {
    return section(section_name).has(key);
}

String ConfigFile::get_string(StringView section_name, StringView key, StringView default_val) const {
    return section(section_name).get_string(key, default_val);
}

Int64 ConfigFile::get_int(StringView section_name, StringView key, Int64 default_val) const {
    return section(section_name).get_int(key, default_val);
}

bool ConfigFile::get_bool(StringView section_name, StringView key, bool default_val) const {
    return section(section_name).get_bool(key, default_val);
}

void ConfigFile::set(StringView section_name, StringView key, StringView value) {
    section(section_name).set(key, value);
}

void ConfigFile::merge(const ConfigFile& other) {
    for (const auto& [name, sec] : other.sections_) {
        auto& target = section(name);
        for (const auto& [key, value] : sec) {
            target.set(key, value.str());
        }
    }
    if (other.is_loaded()) {
        filepath_ = other.filepath_;
    }
}

Vector<String> ConfigFile::section_names() const {
    Vector<String> result;
    result.reserve(sections_.size());
    for (const auto& [name, _] : sections_) {
        result.push_back(name);
    }
    return result;
}

String ConfigFile::to_string() const {
    std::ostringstream oss;

    auto write_section = [&oss](const ConfigSection& sec, bool header) {
        if (sec.empty()) return;
        if (header) oss << "[" << sec.name() << "]\n";
        for (const auto& [key, value] : sec) {
            oss << key << " = " << value.str() << "\n";
        }
        oss << "\n";
    };

    // Keys before the first header belong to the default section
    write_section(section(DEFAULT_SECTION), false);
    for (const auto& [name, sec] : sections_) {
        if (name == DEFAULT_SECTION) continue;
        write_section(sec, true);
    }

    return oss.str();
}

// =============================================================================
// Environment Variable Support
// =============================================================================

Optional<String> get_env(StringView name) {
    const char* value = std::getenv(String(name).c_str());
    if (value) {
        return String(value);
    }
    return nullopt;
}

String get_env_or(StringView name, StringView default_val) {
    auto value = get_env(name);
    return value.has_value() ? value.value() : String(default_val);
}

Result<void> set_env(StringView name, StringView value) {
    if (setenv(String(name).c_str(), String(value).c_str(), 1) != 0) {
        return make_error<void>(ErrorCode::IO_ERROR,
            "Failed to set environment variable " + String(name), "config");
    }
    return {};
}

Result<void> unset_env(StringView name) {
    if (unsetenv(String(name).c_str()) != 0) {
        return make_error<void>(ErrorCode::IO_ERROR,
            "Failed to unset environment variable " + String(name), "config");
    }
    return {};
}

String expand_env(StringView str) {
    String result;
    result.reserve(str.size());

    for (Size i = 0; i < str.size(); ++i) {
        if (str[i] == '$' && i + 1 < str.size() && str[i + 1] == '{') {
            Size end = str.find('}', i + 2);
            if (end != StringView::npos) {
                auto value = get_env(str.substr(i + 2, end - i - 2));
                if (value) {
                    result += value.value();
                }
                i = end;
                continue;
            }
        }
        result += str[i];
    }

    return result;
}

// =============================================================================
// ConfigBuilder Implementation
// =============================================================================

ConfigBuilder::ConfigBuilder() : current_section_(ConfigFile::DEFAULT_SECTION) {
    config_.add_section(current_section_);
}

ConfigBuilder& ConfigBuilder::section(StringView name) {
    current_section_ = String(name);
    config_.add_section(current_section_);
    return *this;
}

ConfigBuilder& ConfigBuilder::set(StringView key, StringView value) {
    config_.section(current_section_).set(key, value);
    return *this;
}

ConfigBuilder& ConfigBuilder::set(StringView key, Int64 value) {
    config_.section(current_section_).set(key, value);
    return *this;
}

ConfigBuilder& ConfigBuilder::set(StringView key, bool value) {
    config_.section(current_section_).set(key, value);
    return *this;
}

ConfigFile ConfigBuilder::build() {
    return std::move(config_);
}

// =============================================================================
// Factory Functions
// =============================================================================

Result<ConfigFile> load_config(const Path& path) {
    ConfigFile config;
    auto result = config.load(path);
    if (result.is_error()) {
        return result.error();
    }
    return config;
}

Result<ConfigFile> parse_config(StringView content) {
    ConfigFile config;
    std::istringstream iss{String(content)};
    config.parse_stream(iss);
    return config;
}

// =============================================================================
// Civil-Specific Configuration
// =============================================================================

ConfigFile default_civil_config() {
    ConfigBuilder builder;

    builder.section(sections::CODEC)
        .set(keys::STRICT_ENCODING, false);

    builder.section(sections::LOGGING)
        .set(keys::LEVEL, "WARN")
        .set(keys::CONSOLE, true)
        .set(keys::MAX_FILE_SIZE, static_cast<Int64>(10 * 1024 * 1024));

    return builder.build();
}

Result<ConfigFile> load_civil_config(const Path& path) {
    auto loaded = load_config(path);
    if (loaded.is_error()) {
        return loaded.error();
    }
    ConfigFile config = default_civil_config();
    config.merge(loaded.value());
    return config;
}

Result<EncodeOptions> encode_options(const ConfigFile& config) {
    ConfigValue strict(config.get_string(sections::CODEC, keys::STRICT_ENCODING, "false"));
    if (auto env = get_env(STRICT_ENCODING_ENV)) {
        strict = ConfigValue(*env);
    }

    auto flag = strict.to_bool();
    if (flag.is_error()) {
        ErrorInfo info = flag.error();
        info.message = std::format("{}.{}: {}", sections::CODEC, keys::STRICT_ENCODING, info.message);
        return info;
    }

    EncodeOptions options;
    options.strict = flag.value();
    return options;
}

Result<logging::LogLevel> log_level(const ConfigFile& config) {
    String name = config.get_string(sections::LOGGING, keys::LEVEL, "WARN");
    auto level = logging::parse_level(name);
    if (!level) {
        return make_error<logging::LogLevel>(ErrorCode::INVALID_ARGUMENT,
            std::format("{}.{}: unknown log level '{}'", sections::LOGGING, keys::LEVEL, name),
            "config");
    }
    return *level;
}

Result<void> apply_logging(const ConfigFile& config) {
    auto level = log_level(config);
    if (level.is_error()) return level.error();

    auto max_size = config.section(sections::LOGGING).get(keys::MAX_FILE_SIZE).to_int_or(10 * 1024 * 1024);
    if (max_size <= 0) {
        return make_error<void>(ErrorCode::OUT_OF_RANGE,
            std::format("{}.{}: must be positive", sections::LOGGING, keys::MAX_FILE_SIZE), "config");
    }

    Vector<SharedPtr<logging::LogSink>> sinks;
    if (config.get_bool(sections::LOGGING, keys::CONSOLE, true)) {
        sinks.push_back(std::make_shared<logging::ConsoleSink>(level.value()));
    }
    String file = expand_env(config.get_string(sections::LOGGING, keys::FILE));
    if (!file.empty()) {
        auto sink = std::make_shared<logging::FileSink>(
            Path(file), level.value(), static_cast<Size>(max_size));
        if (!sink->is_open()) {
            return make_error<void>(ErrorCode::IO_ERROR,
                "Cannot open log file: " + file, "config");
        }
        sinks.push_back(std::move(sink));
    }

    auto& manager = logging::LogManager::instance();
    manager.replace_sinks(sinks);
    manager.set_global_level(level.value());
    return {};
}

} // namespace civil::config
