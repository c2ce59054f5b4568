#pragma once

#include <expected>
#include <optional>
#include <string>

namespace flatrow {

/// Options controlling how separated values are tokenized.
struct Options {
    /// Token between fields. May span several characters.
    std::string separator = ",";
    /// Token between records. When unset, any of "\r\n", "\n" or "\r" ends a record.
    std::optional<std::string> record_separator;
    /// Character enclosing fields that contain separators, line breaks or quotes.
    char quote = '"';
    /// Treat the first physical record as a header.
    bool is_first_record_schema = false;
    /// Keep spaces and tabs surrounding field values.
    bool preserve_whitespace = false;

    /// Check the options for consistency. Returns a description of the first problem found.
    [[nodiscard]] auto validate() const -> std::expected<void, std::string>;
};

}  // namespace flatrow
