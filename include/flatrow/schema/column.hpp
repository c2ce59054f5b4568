#pragma once

#include <flatrow/core/metadata.hpp>
#include <flatrow/core/value.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace flatrow::schema {

enum class ColumnKind : std::uint8_t {
    String,
    Int64,
    Double,
    Boolean,
    Date,
    Custom,
    /// Consumes a raw field and produces no value.
    Ignored,
    /// Metadata column: produces the record number without consuming a raw field.
    RecordNumber,
};

[[nodiscard]] auto to_string(ColumnKind kind) -> std::string_view;

/// A single raw field could not be converted to its column's type.
struct ConversionError {
    std::string column;
    std::string text;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

/// Converts the text of a Custom column. Errors are reported as plain messages.
using ColumnParser = std::function<std::expected<Value, std::string>(std::string_view)>;

/// Definition of one column in a schema.
struct ColumnDef {
    std::string name;
    ColumnKind kind = ColumnKind::String;
    /// Blank text converts to null. Non-nullable typed columns reject blank text.
    bool nullable = true;
    /// Date layout using %Y, %m and %d; other characters must match literally.
    std::string format;
    /// RecordNumber: count physical rows (header, filtered and malformed rows
    /// included) instead of records returned so far.
    bool include_skipped = false;
    ColumnParser parser;

    [[nodiscard]] auto is_metadata() const noexcept -> bool {
        return kind == ColumnKind::RecordNumber;
    }

    [[nodiscard]] auto is_ignored() const noexcept -> bool { return kind == ColumnKind::Ignored; }

    /// Convert raw text. Not meaningful for metadata or ignored columns.
    [[nodiscard]] auto parse(std::string_view text) const -> std::expected<Value, ConversionError>;

    /// Value of a metadata column for the record being parsed.
    [[nodiscard]] auto compute(const ProcessMetadata& metadata) const -> Value;
};

[[nodiscard]] auto string_column(std::string name) -> ColumnDef;
[[nodiscard]] auto int64_column(std::string name) -> ColumnDef;
[[nodiscard]] auto double_column(std::string name) -> ColumnDef;
[[nodiscard]] auto boolean_column(std::string name) -> ColumnDef;
[[nodiscard]] auto date_column(std::string name, std::string format = "%Y-%m-%d") -> ColumnDef;
[[nodiscard]] auto custom_column(std::string name, ColumnParser parser) -> ColumnDef;
[[nodiscard]] auto ignored_column() -> ColumnDef;
[[nodiscard]] auto record_number_column(std::string name, bool include_skipped = false)
    -> ColumnDef;

/// Same column, rejecting blank input instead of producing null.
[[nodiscard]] auto required(ColumnDef column) -> ColumnDef;

}  // namespace flatrow::schema
