// =============================================================================
// Civil Time - JSON String Boundary Implementation
// Version: 1.2.0
// =============================================================================

#include <civil/serialization/json.hpp>

namespace civil::serialization {

namespace {

constexpr StringView WHITESPACE = " \t\n\r";

ErrorInfo json_error(StringView json, StringView reason) {
    ErrorInfo info(ErrorCode::PARSE_ERROR,
        std::format("invalid JSON string: {}", reason), "json");
    info.with_context("input", String(json));
    return info;
}

Optional<UInt32> read_hex4(StringView s, Size pos) {
    if (pos + 4 > s.size()) return nullopt;
    UInt32 value = 0;
    for (Size i = pos; i < pos + 4; ++i) {
        char c = s[i];
        value <<= 4;
        if (c >= '0' && c <= '9') value |= static_cast<UInt32>(c - '0');
        else if (c >= 'a' && c <= 'f') value |= static_cast<UInt32>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= static_cast<UInt32>(c - 'A' + 10);
        else return nullopt;
    }
    return value;
}

void append_utf8(String& out, UInt32 cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // anonymous namespace

String quote_json_string(StringView text) {
    return "\"" + escape_json(text) + "\"";
}

Result<String> unquote_json_string(StringView json) {
    auto first = json.find_first_not_of(WHITESPACE);
    if (first == StringView::npos) {
        return json_error(json, "empty input");
    }
    auto last = json.find_last_not_of(WHITESPACE);
    StringView literal = json.substr(first, last - first + 1);

    if (literal == "null") {
        return json_error(json, "null is not a civil value");
    }
    if (literal.front() != '"') {
        return json_error(json, "expected a string literal");
    }

    String result;
    Size i = 1;
    while (i < literal.size()) {
        char c = literal[i];
        if (c == '"') {
            if (i + 1 != literal.size()) {
                return json_error(json, "unexpected text after closing quote");
            }
            return result;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return json_error(json, "control character in string");
        }
        if (c != '\\') {
            result += c;
            ++i;
            continue;
        }

        if (i + 1 >= literal.size()) break;
        char esc = literal[i + 1];
        i += 2;
        switch (esc) {
            case '"':  result += '"'; break;
            case '\\': result += '\\'; break;
            case '/':  result += '/'; break;
            case 'b':  result += '\b'; break;
            case 'f':  result += '\f'; break;
            case 'n':  result += '\n'; break;
            case 'r':  result += '\r'; break;
            case 't':  result += '\t'; break;
            case 'u': {
                auto cp = read_hex4(literal, i);
                if (!cp) return json_error(json, "malformed \\u escape");
                i += 4;
                if (*cp >= 0xD800 && *cp <= 0xDBFF) {
                    // High surrogate must be followed by an escaped low surrogate
                    if (i + 1 >= literal.size() || literal[i] != '\\' || literal[i + 1] != 'u') {
                        return json_error(json, "unpaired surrogate");
                    }
                    auto low = read_hex4(literal, i + 2);
                    if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                        return json_error(json, "unpaired surrogate");
                    }
                    i += 6;
                    *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                } else if (*cp >= 0xDC00 && *cp <= 0xDFFF) {
                    return json_error(json, "unpaired surrogate");
                }
                append_utf8(result, *cp);
                break;
            }
            default:
                return json_error(json, std::format("invalid escape '\\{}'", esc));
        }
    }

    return json_error(json, "unterminated string");
}

} // namespace civil::serialization
