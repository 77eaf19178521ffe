#pragma once
// =============================================================================
// Civil Time - JSON String Boundary
// Version: 1.2.0
// Civil values travel through JSON as string literals
// =============================================================================

#include "civil/common/types.hpp"
#include "civil/common/error.hpp"
#include "civil/types/scalar.hpp"
#include <concepts>

namespace civil::serialization {

// =============================================================================
// String Literals
// =============================================================================

// Wraps text in quotes, escaping as needed
[[nodiscard]] String quote_json_string(StringView text);

// Decodes exactly one JSON string literal. Surrounding whitespace is allowed;
// null, numbers, objects and anything after the closing quote are rejected.
[[nodiscard]] Result<String> unquote_json_string(StringView json);

// =============================================================================
// Text Codec
// =============================================================================

template<typename T>
concept TextCodec = requires(const T& value, StringView text, const EncodeOptions& options) {
    { value.to_text(options) } -> std::same_as<Result<String>>;
    { T::parse(text) } -> std::same_as<Result<T>>;
};

template<TextCodec T>
[[nodiscard]] Result<String> marshal_json(const T& value, const EncodeOptions& options = {}) {
    auto text = value.to_text(options);
    if (text.is_error()) return text.error();
    return quote_json_string(text.value());
}

// On failure target keeps its previous value
template<TextCodec T>
[[nodiscard]] Result<void> unmarshal_json(StringView json, T& target) {
    auto text = unquote_json_string(json);
    if (text.is_error()) return text.error();

    auto parsed = T::parse(text.value());
    if (parsed.is_error()) return parsed.error();

    target = std::move(parsed.value());
    return {};
}

} // namespace civil::serialization
