#include <flatrow/core/value.hpp>

#include <fmt/core.h>

#include <chrono>
#include <type_traits>

namespace flatrow {

namespace {

auto format_date(Date date) -> std::string {
    const std::chrono::sys_days days{std::chrono::days{date.days}};
    const std::chrono::year_month_day ymd{days};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

}  // namespace

auto to_string(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return {};
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto make_date(int year, unsigned month, unsigned day) -> std::optional<Date> {
    const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                                          std::chrono::day{day}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    const std::chrono::sys_days days{ymd};
    return Date{.days = static_cast<std::int32_t>(days.time_since_epoch().count())};
}

}  // namespace flatrow
