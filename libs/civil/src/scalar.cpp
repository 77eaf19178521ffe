// =============================================================================
// Civil Time - Persistence Scalar Values Implementation
// Version: 1.2.0
// =============================================================================

#include <civil/types/scalar.hpp>
#include <civil/common/logging.hpp>

namespace civil {

StringView scalar_type_name(const ScalarValue& value) {
    return std::visit(overloaded{
        [](const std::monostate&) -> StringView { return "null"; },
        [](const Int64&) -> StringView { return "int64"; },
        [](const Float64&) -> StringView { return "float64"; },
        [](const bool&) -> StringView { return "bool"; },
        [](const ByteBuffer&) -> StringView { return "bytes"; },
        [](const String&) -> StringView { return "string"; },
        [](const calendar::Instant&) -> StringView { return "instant"; }
    }, value);
}

ErrorInfo unsupported_scan(StringView target, const ScalarValue& value) {
    StringView type = scalar_type_name(value);

    auto logger = logging::LogManager::instance().get_logger("civil.scalar");
    logger->debug("rejected scan of {} into {}", type, target);

    ErrorInfo info(ErrorCode::UNSUPPORTED_TYPE,
        std::format("cannot scan into {}: unsupported type {}", target, type),
        String(target));
    info.with_context("type", String(type));
    return info;
}

} // namespace civil
