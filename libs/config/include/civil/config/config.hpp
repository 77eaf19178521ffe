#pragma once
// =============================================================================
// Civil Time - Configuration File Parser
// Version: 1.2.0
// INI configuration for codec and logging settings
// =============================================================================

#include "civil/common/types.hpp"
#include "civil/common/error.hpp"
#include "civil/common/logging.hpp"
#include "civil/types/scalar.hpp"
#include <istream>
#include <map>

namespace civil::config {

// =============================================================================
// Configuration Value
// =============================================================================

class ConfigValue {
private:
    String value_;

public:
    ConfigValue() = default;
    explicit ConfigValue(String value) : value_(std::move(value)) {}

    [[nodiscard]] const String& str() const { return value_; }
    [[nodiscard]] bool empty() const { return value_.empty(); }

    // Type conversions
    [[nodiscard]] Result<Int64> to_int() const;
    [[nodiscard]] Result<bool> to_bool() const;

    // With defaults
    [[nodiscard]] Int64 to_int_or(Int64 default_val) const;
    [[nodiscard]] bool to_bool_or(bool default_val) const;
    [[nodiscard]] String to_string_or(StringView default_val) const;
};

// =============================================================================
// Configuration Section
// =============================================================================

class ConfigSection {
private:
    String name_;
    std::map<String, ConfigValue, std::less<>> values_;

public:
    ConfigSection() = default;
    explicit ConfigSection(String name) : name_(std::move(name)) {}

    [[nodiscard]] const String& name() const { return name_; }

    [[nodiscard]] bool has(StringView key) const;
    [[nodiscard]] const ConfigValue& get(StringView key) const;

    [[nodiscard]] String get_string(StringView key, StringView default_val = "") const;
    [[nodiscard]] Int64 get_int(StringView key, Int64 default_val = 0) const;
    [[nodiscard]] bool get_bool(StringView key, bool default_val = false) const;

    void set(StringView key, StringView value);
    void set(StringView key, const char* value) { set(key, StringView(value)); }
    void set(StringView key, Int64 value);
    void set(StringView key, bool value);
    void remove(StringView key);

    [[nodiscard]] Vector<String> keys() const;
    [[nodiscard]] Size size() const { return values_.size(); }
    [[nodiscard]] bool empty() const { return values_.empty(); }

    auto begin() const { return values_.begin(); }
    auto end() const { return values_.end(); }
};

// =============================================================================
// Configuration File
// =============================================================================

class ConfigFile {
private:
    Path filepath_;
    std::map<String, ConfigSection, std::less<>> sections_;

    void parse_stream(std::istream& in);

    friend Result<ConfigFile> parse_config(StringView content);

public:
    static constexpr StringView DEFAULT_SECTION = "default";

    ConfigFile() = default;

    // File operations
    [[nodiscard]] Result<void> load(const Path& path);
    [[nodiscard]] Result<void> save(const Path& path) const;

    [[nodiscard]] const Path& path() const { return filepath_; }
    [[nodiscard]] bool is_loaded() const { return !filepath_.empty(); }

    // Section access
    [[nodiscard]] bool has_section(StringView name) const;
    [[nodiscard]] ConfigSection& section(StringView name);
    [[nodiscard]] const ConfigSection& section(StringView name) const;
    ConfigSection& add_section(StringView name);

    [[nodiscard]] bool has(StringView section, StringView key) const;
    [[nodiscard]] String get_string(StringView section, StringView key, StringView default_val = "") const;
    [[nodiscard]] Int64 get_int(StringView section, StringView key, Int64 default_val = 0) const;
    [[nodiscard]] bool get_bool(StringView section, StringView key, bool default_val = false) const;

    void set(StringView section, StringView key, StringView value);

    // Values from other override values here, section by section
    void merge(const ConfigFile& other);

    [[nodiscard]] Vector<String> section_names() const;
    [[nodiscard]] Size section_count() const { return sections_.size(); }

    // INI text, default section first
    [[nodiscard]] String to_string() const;
};

// =============================================================================
// Environment Variable Support
// =============================================================================

[[nodiscard]] Optional<String> get_env(StringView name);
[[nodiscard]] String get_env_or(StringView name, StringView default_val);
[[nodiscard]] Result<void> set_env(StringView name, StringView value);
[[nodiscard]] Result<void> unset_env(StringView name);

// Expand ${VAR} references; unset variables expand to nothing
[[nodiscard]] String expand_env(StringView str);

// =============================================================================
// Configuration Builder (Fluent API)
// =============================================================================

class ConfigBuilder {
private:
    ConfigFile config_;
    String current_section_;

public:
    ConfigBuilder();

    ConfigBuilder& section(StringView name);
    ConfigBuilder& set(StringView key, StringView value);
    ConfigBuilder& set(StringView key, const char* value) { return set(key, StringView(value)); }
    ConfigBuilder& set(StringView key, Int64 value);
    ConfigBuilder& set(StringView key, bool value);

    [[nodiscard]] ConfigFile build();
};

// =============================================================================
// Factory Functions
// =============================================================================

[[nodiscard]] Result<ConfigFile> load_config(const Path& path);
[[nodiscard]] Result<ConfigFile> parse_config(StringView content);

// =============================================================================
// Civil-Specific Configuration
// =============================================================================

namespace sections {
    constexpr StringView CODEC = "codec";
    constexpr StringView LOGGING = "logging";
}

namespace keys {
    constexpr StringView STRICT_ENCODING = "strict_encoding";
    constexpr StringView LEVEL = "level";
    constexpr StringView CONSOLE = "console";
    constexpr StringView FILE = "file";
    constexpr StringView MAX_FILE_SIZE = "max_file_size";
}

// Overrides [codec] strict_encoding when set
constexpr StringView STRICT_ENCODING_ENV = "CIVIL_STRICT_ENCODING";

[[nodiscard]] ConfigFile default_civil_config();

// Defaults merged with the file at path
[[nodiscard]] Result<ConfigFile> load_civil_config(const Path& path);

[[nodiscard]] Result<EncodeOptions> encode_options(const ConfigFile& config);
[[nodiscard]] Result<logging::LogLevel> log_level(const ConfigFile& config);

// Rebuilds the global logging setup from [logging]
[[nodiscard]] Result<void> apply_logging(const ConfigFile& config);

} // namespace civil::config
