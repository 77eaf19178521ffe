#pragma once
// =============================================================================
// Civil Time - Persistence Scalar Values
// Version: 1.2.0
// Input shapes accepted by Date/Time/DateTime::scan
// =============================================================================

#include "civil/common/types.hpp"
#include "civil/common/error.hpp"
#include "civil/calendar/calendar.hpp"

namespace civil {

// The scalar set a storage driver hands back for a column. Only text and
// calendar instants carry a civil reading; the other alternatives are
// rejected by scan().
using ScalarValue = Variant<
    std::monostate,        // SQL NULL
    Int64,
    Float64,
    bool,
    ByteBuffer,
    String,
    calendar::Instant
>;

[[nodiscard]] StringView scalar_type_name(const ScalarValue& value);

// Error returned by scan() for an alternative the target cannot hold
[[nodiscard]] ErrorInfo unsupported_scan(StringView target, const ScalarValue& value);

// Options for to_text(). Strict encoding range-checks every field instead of
// only the year.
struct EncodeOptions {
    bool strict = false;
};

template<typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};

template<typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

} // namespace civil
