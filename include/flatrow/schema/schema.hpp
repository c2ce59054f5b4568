#pragma once

#include <flatrow/core/metadata.hpp>
#include <flatrow/core/value.hpp>
#include <flatrow/schema/column.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace flatrow::schema {

/// Ordered list of column definitions describing one record layout.
class Schema {
   public:
    Schema() = default;

    /// Throws ConfigurationError when two named columns share a name.
    explicit Schema(std::vector<ColumnDef> columns);

    /// Append a column. Throws ConfigurationError on a duplicate name.
    auto add_column(ColumnDef column) -> Schema&;

    /// Every column definition, metadata columns included.
    [[nodiscard]] auto column_count() const noexcept -> std::size_t { return columns_.size(); }

    /// Columns computed from reading state rather than raw input.
    [[nodiscard]] auto metadata_column_count() const noexcept -> std::size_t {
        return metadata_count_;
    }

    /// Columns read from raw input, ignored columns included.
    [[nodiscard]] auto physical_column_count() const noexcept -> std::size_t {
        return columns_.size() - metadata_count_;
    }

    [[nodiscard]] auto columns() const noexcept -> std::span<const ColumnDef> { return columns_; }

    [[nodiscard]] auto find(const std::string& name) const -> const ColumnDef*;

    /// Position of the named column among the parsed values.
    [[nodiscard]] auto value_index(const std::string& name) const -> std::optional<std::size_t>;

    /// Names of the columns that produce values, in value order.
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;

    /// Convert raw fields to values, one per non-ignored column. Raw fields past
    /// the physical columns are ignored; missing ones are treated as blank.
    [[nodiscard]] auto parse_values(const ProcessMetadata& metadata,
                                    std::span<const std::string> fields) const
        -> std::expected<std::vector<Value>, ConversionError>;

   private:
    std::vector<ColumnDef> columns_;
    std::unordered_map<std::string, std::size_t> index_;
    std::size_t metadata_count_ = 0;
};

}  // namespace flatrow::schema
