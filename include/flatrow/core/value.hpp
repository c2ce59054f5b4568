#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace flatrow {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// A single parsed field. std::monostate is the null value.
using Value = std::variant<std::monostate, std::string, std::int64_t, double, bool, Date>;

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

/// Render a value for display. Null renders as an empty string, dates as YYYY-MM-DD.
[[nodiscard]] auto to_string(const Value& value) -> std::string;

/// Days since epoch for a proleptic Gregorian date; nullopt when the date does not exist.
[[nodiscard]] auto make_date(int year, unsigned month, unsigned day) -> std::optional<Date>;

}  // namespace flatrow
