#include <flatrow/schema/schema.hpp>

#include <flatrow/core/error.hpp>

#include <fmt/core.h>

#include <string_view>
#include <utility>

namespace flatrow::schema {

Schema::Schema(std::vector<ColumnDef> columns) {
    columns_.reserve(columns.size());
    for (auto& column : columns) {
        add_column(std::move(column));
    }
}

auto Schema::add_column(ColumnDef column) -> Schema& {
    if (!column.is_ignored()) {
        if (index_.contains(column.name)) {
            throw ConfigurationError(
                fmt::format("schema already has a column named '{}'", column.name));
        }
        index_.emplace(column.name, columns_.size());
    }
    if (column.is_metadata()) {
        ++metadata_count_;
    }
    columns_.push_back(std::move(column));
    return *this;
}

auto Schema::find(const std::string& name) const -> const ColumnDef* {
    if (auto it = index_.find(name); it != index_.end()) {
        return &columns_[it->second];
    }
    return nullptr;
}

auto Schema::value_index(const std::string& name) const -> std::optional<std::size_t> {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    std::size_t position = 0;
    for (std::size_t i = 0; i < it->second; ++i) {
        if (!columns_[i].is_ignored()) {
            ++position;
        }
    }
    return position;
}

auto Schema::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& column : columns_) {
        if (!column.is_ignored()) {
            names.push_back(column.name);
        }
    }
    return names;
}

auto Schema::parse_values(const ProcessMetadata& metadata,
                          std::span<const std::string> fields) const
    -> std::expected<std::vector<Value>, ConversionError> {
    std::vector<Value> values;
    values.reserve(columns_.size());
    std::size_t field = 0;
    for (const auto& column : columns_) {
        if (column.is_metadata()) {
            values.push_back(column.compute(metadata));
            continue;
        }
        const std::string_view text =
            field < fields.size() ? std::string_view(fields[field]) : std::string_view{};
        ++field;
        if (column.is_ignored()) {
            continue;
        }
        auto value = column.parse(text);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        values.push_back(std::move(*value));
    }
    return values;
}

}  // namespace flatrow::schema
