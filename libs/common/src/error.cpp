#include "civil/common/error.hpp"
#include <sstream>

namespace civil {

const char* CivilErrorCategory::name() const noexcept { return "civil"; }

String CivilErrorCategory::message(int code) const {
    switch (static_cast<ErrorCode>(code)) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::UNKNOWN_ERROR: return "Unknown error";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::OUT_OF_RANGE: return "Out of range";
        case ErrorCode::IO_ERROR: return "I/O error";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::PARSE_ERROR: return "Parse error";
        case ErrorCode::UNSUPPORTED_TYPE: return "Unsupported type";
        default: return "Unknown civil error";
    }
}

const std::error_category& civil_error_category() noexcept {
    static CivilErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode e) noexcept {
    return {static_cast<int>(e), civil_error_category()};
}

ErrorInfo::ErrorInfo(ErrorCode c, String msg, String comp, std::source_location loc)
    : code(c), message(std::move(msg)), component(std::move(comp)), location(loc) {}

ErrorInfo& ErrorInfo::with_context(String key, String value) {
    context[std::move(key)] = std::move(value);
    return *this;
}

String ErrorInfo::to_string() const {
    return std::format("[{}] {}: {}", static_cast<int>(code),
        civil_error_category().message(static_cast<int>(code)), message);
}

String ErrorInfo::to_json() const {
    std::ostringstream oss;
    oss << R"({"code":)" << static_cast<int>(code)
        << R"(,"message":")" << escape_json(message) << R"(")"
        << R"(,"component":")" << escape_json(component) << R"("})";
    return oss.str();
}

String ErrorInfo::format_full() const {
    std::ostringstream oss;
    oss << "Error: " << to_string() << "\n";
    oss << "  Component: " << (component.empty() ? "unknown" : component) << "\n";
    oss << "  Location: " << location.file_name() << ":" << location.line() << "\n";
    oss << "  Function: " << location.function_name() << "\n";
    if (!context.empty()) {
        oss << "  Context:\n";
        for (const auto& [k, v] : context) {
            oss << "    " << k << ": " << v << "\n";
        }
    }
    return oss.str();
}

CivilException::CivilException(ErrorInfo info)
    : std::runtime_error(info.to_string()), error_info_(std::move(info)) {}

CivilException::CivilException(ErrorCode code, const String& message, std::source_location loc)
    : std::runtime_error(message), error_info_(code, message, "", loc) {}

String CivilException::detailed_message() const {
    return error_info_.format_full();
}

StringView error_category_name(ErrorCode code) {
    int c = static_cast<int>(code);
    if (c >= 1000 && c < 1100) return "General";
    if (c >= 1100 && c < 1200) return "I/O";
    if (c >= 2000 && c < 2100) return "Conversion";
    return "Unknown";
}

String format_error_code(ErrorCode code) {
    return std::format("CIVIL{:04d}", static_cast<int>(code));
}

} // namespace civil
