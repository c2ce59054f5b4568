#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace flatrow {

/// Invalid construction arguments: null collaborators, inconsistent options,
/// duplicate column names.
class ConfigurationError : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
};

/// An operation was called in a state that does not allow it.
class UsageError : public std::logic_error {
   public:
    using std::logic_error::logic_error;
};

/// Why a record could not be processed.
enum class FaultReason : std::uint8_t {
    InvalidSyntax,
    WrongColumnCount,
    InvalidConversion,
};

[[nodiscard]] auto to_string(FaultReason reason) -> std::string_view;

/// A physical record could not be turned into values.
///
/// Recoverable through the reader's error handler; when nobody handles it the
/// reader rethrows it and refuses further use.
class RecordProcessingError : public std::runtime_error {
   public:
    RecordProcessingError(FaultReason reason, std::size_t record_number, std::string detail);

    [[nodiscard]] auto reason() const noexcept -> FaultReason { return reason_; }

    /// Physical records consumed when the fault was raised. For column count and
    /// conversion faults this is the 1-based position of the offending record;
    /// a malformed record is not counted, so it follows the last good one.
    [[nodiscard]] auto record_number() const noexcept -> std::size_t { return record_number_; }

    /// Message of the underlying tokenizer or conversion failure.
    [[nodiscard]] auto detail() const noexcept -> const std::string& { return detail_; }

   private:
    FaultReason reason_;
    std::size_t record_number_;
    std::string detail_;
};

}  // namespace flatrow
