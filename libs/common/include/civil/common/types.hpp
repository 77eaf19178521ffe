#pragma once
// =============================================================================
// Civil Time - Core Types (C++20)
// Version: 1.2.0
// =============================================================================

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <variant>
#include <memory>
#include <chrono>
#include <format>
#include <filesystem>
#include <source_location>
#include <unordered_map>

namespace civil {

// =============================================================================
// Fundamental Types
// =============================================================================
using Byte = std::uint8_t;
using UInt8 = std::uint8_t;
using UInt16 = std::uint16_t;
using Int32 = std::int32_t;
using UInt32 = std::uint32_t;
using Int64 = std::int64_t;
using Float64 = double;
using Size = std::size_t;

// =============================================================================
// String Types
// =============================================================================
using String = std::string;
using StringView = std::string_view;

// =============================================================================
// Container Types
// =============================================================================
using ByteBuffer = std::vector<Byte>;
template<typename T> using Vector = std::vector<T>;

// =============================================================================
// Smart Pointers
// =============================================================================
template<typename T> using SharedPtr = std::shared_ptr<T>;

// =============================================================================
// Optional and Variant
// =============================================================================
template<typename T> using Optional = std::optional<T>;
template<typename... Ts> using Variant = std::variant<Ts...>;
inline constexpr std::nullopt_t nullopt = std::nullopt;

// =============================================================================
// Time Types
// =============================================================================
using Clock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using SystemTimePoint = SystemClock::time_point;
using Nanoseconds = std::chrono::nanoseconds;
using Microseconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

// =============================================================================
// Filesystem
// =============================================================================
using Path = std::filesystem::path;

// =============================================================================
// Version
// =============================================================================
struct Version {
    UInt16 major = 0;
    UInt16 minor = 0;
    UInt16 patch = 0;

    [[nodiscard]] String to_string() const {
        return std::format("{}.{}.{}", major, minor, patch);
    }

    auto operator<=>(const Version&) const = default;
};

inline constexpr Version LIBRARY_VERSION{1, 2, 0};

// =============================================================================
// String Utilities
// =============================================================================
[[nodiscard]] String to_upper(StringView str);
[[nodiscard]] String to_lower(StringView str);
[[nodiscard]] String trim(StringView str);
[[nodiscard]] bool starts_with(StringView str, StringView prefix);
[[nodiscard]] bool is_digits(StringView str);

// Escapes quotes, backslashes and control characters for a JSON string body
[[nodiscard]] String escape_json(StringView str);

} // namespace civil
