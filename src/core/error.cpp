#include <flatrow/core/error.hpp>

#include <fmt/core.h>

#include <utility>

namespace flatrow {

namespace {

auto describe(FaultReason reason, std::size_t record_number, const std::string& detail)
    -> std::string {
    std::string message;
    switch (reason) {
        case FaultReason::InvalidSyntax:
            message = fmt::format("record {} is malformed", record_number);
            break;
        case FaultReason::WrongColumnCount:
            message = fmt::format("record {} has the wrong number of columns", record_number);
            break;
        case FaultReason::InvalidConversion:
            message = fmt::format("record {} could not be converted", record_number);
            break;
    }
    if (!detail.empty()) {
        message += ": ";
        message += detail;
    }
    return message;
}

}  // namespace

auto to_string(FaultReason reason) -> std::string_view {
    switch (reason) {
        case FaultReason::InvalidSyntax:
            return "invalid syntax";
        case FaultReason::WrongColumnCount:
            return "wrong column count";
        case FaultReason::InvalidConversion:
            return "invalid conversion";
    }
    return "unknown";
}

RecordProcessingError::RecordProcessingError(FaultReason reason, std::size_t record_number,
                                             std::string detail)
    : std::runtime_error(describe(reason, record_number, detail)),
      reason_(reason),
      record_number_(record_number),
      detail_(std::move(detail)) {}

}  // namespace flatrow
