#include <flatrow/schema/column.hpp>

#include <fmt/core.h>

#include <array>
#include <cctype>
#include <charconv>
#include <system_error>
#include <utility>

namespace flatrow::schema {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto iequals(std::string_view a, std::string_view b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

constexpr std::array<std::string_view, 5> kTrueTokens = {"true", "t", "yes", "y", "1"};
constexpr std::array<std::string_view, 5> kFalseTokens = {"false", "f", "no", "n", "0"};

auto try_parse_int(std::string_view text, std::int64_t& out) -> bool {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    return !text.empty() && result.ec == std::errc() && result.ptr == end;
}

auto try_parse_double(std::string_view text, double& out) -> bool {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    return !text.empty() && result.ec == std::errc() && result.ptr == end;
}

auto try_parse_bool(std::string_view text, bool& out) -> bool {
    for (auto token : kTrueTokens) {
        if (iequals(text, token)) {
            out = true;
            return true;
        }
    }
    for (auto token : kFalseTokens) {
        if (iequals(text, token)) {
            out = false;
            return true;
        }
    }
    return false;
}

// Reads up to `max_digits` digits starting at `pos`.
auto read_number(std::string_view text, std::size_t& pos, std::size_t max_digits, int& out)
    -> bool {
    const std::size_t start = pos;
    out = 0;
    while (pos < text.size() && pos - start < max_digits &&
           std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
        out = out * 10 + (text[pos] - '0');
        ++pos;
    }
    return pos > start;
}

auto try_parse_date(std::string_view text, std::string_view format) -> std::expected<Date, std::string> {
    int year = 0;
    int month = 0;
    int day = 0;
    std::size_t pos = 0;
    for (std::size_t f = 0; f < format.size(); ++f) {
        if (format[f] == '%' && f + 1 < format.size()) {
            const char directive = format[++f];
            bool ok = true;
            switch (directive) {
                case 'Y':
                    ok = read_number(text, pos, 4, year);
                    break;
                case 'm':
                    ok = read_number(text, pos, 2, month);
                    break;
                case 'd':
                    ok = read_number(text, pos, 2, day);
                    break;
                case '%':
                    ok = pos < text.size() && text[pos++] == '%';
                    break;
                default:
                    return std::unexpected(
                        fmt::format("unsupported date directive '%{}'", directive));
            }
            if (!ok) {
                return std::unexpected(fmt::format("does not match date format '{}'", format));
            }
            continue;
        }
        if (pos >= text.size() || text[pos] != format[f]) {
            return std::unexpected(fmt::format("does not match date format '{}'", format));
        }
        ++pos;
    }
    if (pos != text.size()) {
        return std::unexpected(fmt::format("does not match date format '{}'", format));
    }
    auto date = make_date(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    if (!date) {
        return std::unexpected("is not a valid calendar date");
    }
    return *date;
}

}  // namespace

auto to_string(ColumnKind kind) -> std::string_view {
    switch (kind) {
        case ColumnKind::String:
            return "String";
        case ColumnKind::Int64:
            return "Int64";
        case ColumnKind::Double:
            return "Double";
        case ColumnKind::Boolean:
            return "Boolean";
        case ColumnKind::Date:
            return "Date";
        case ColumnKind::Custom:
            return "Custom";
        case ColumnKind::Ignored:
            return "Ignored";
        case ColumnKind::RecordNumber:
            return "RecordNumber";
    }
    return "Unknown";
}

auto ConversionError::format() const -> std::string {
    return fmt::format("column '{}': '{}' {}", column, text, message);
}

auto ColumnDef::parse(std::string_view text) const -> std::expected<Value, ConversionError> {
    const auto fail = [&](std::string message) {
        return std::unexpected(ConversionError{
            .column = name,
            .text = std::string(text),
            .message = std::move(message),
        });
    };

    const auto trimmed = trim(text);
    if (trimmed.empty() && kind != ColumnKind::Custom) {
        if (nullable) {
            return Value{};
        }
        if (kind == ColumnKind::String) {
            return Value{std::string(text)};
        }
        return fail("is blank but a value is required");
    }

    switch (kind) {
        case ColumnKind::String:
            return Value{std::string(text)};
        case ColumnKind::Int64: {
            std::int64_t value = 0;
            if (!try_parse_int(trimmed, value)) {
                return fail("is not a valid 64-bit integer");
            }
            return Value{value};
        }
        case ColumnKind::Double: {
            double value = 0.0;
            if (!try_parse_double(trimmed, value)) {
                return fail("is not a valid floating point number");
            }
            return Value{value};
        }
        case ColumnKind::Boolean: {
            bool value = false;
            if (!try_parse_bool(trimmed, value)) {
                return fail("is not a valid boolean");
            }
            return Value{value};
        }
        case ColumnKind::Date: {
            auto date = try_parse_date(trimmed, format);
            if (!date) {
                return fail(std::move(date.error()));
            }
            return Value{*date};
        }
        case ColumnKind::Custom: {
            if (!parser) {
                return fail("has no parser configured");
            }
            auto value = parser(text);
            if (!value) {
                return fail(std::move(value.error()));
            }
            return std::move(*value);
        }
        case ColumnKind::Ignored:
        case ColumnKind::RecordNumber:
            break;
    }
    return Value{};
}

auto ColumnDef::compute(const ProcessMetadata& metadata) const -> Value {
    if (kind != ColumnKind::RecordNumber) {
        return Value{};
    }
    const std::size_t number =
        include_skipped ? metadata.physical_record_count : metadata.logical_record_count + 1;
    return Value{static_cast<std::int64_t>(number)};
}

auto string_column(std::string name) -> ColumnDef {
    return ColumnDef{.name = std::move(name), .kind = ColumnKind::String};
}

auto int64_column(std::string name) -> ColumnDef {
    return ColumnDef{.name = std::move(name), .kind = ColumnKind::Int64};
}

auto double_column(std::string name) -> ColumnDef {
    return ColumnDef{.name = std::move(name), .kind = ColumnKind::Double};
}

auto boolean_column(std::string name) -> ColumnDef {
    return ColumnDef{.name = std::move(name), .kind = ColumnKind::Boolean};
}

auto date_column(std::string name, std::string format) -> ColumnDef {
    return ColumnDef{.name = std::move(name), .kind = ColumnKind::Date, .format = std::move(format)};
}

auto custom_column(std::string name, ColumnParser parser) -> ColumnDef {
    return ColumnDef{
        .name = std::move(name), .kind = ColumnKind::Custom, .parser = std::move(parser)};
}

auto ignored_column() -> ColumnDef {
    return ColumnDef{.kind = ColumnKind::Ignored};
}

auto record_number_column(std::string name, bool include_skipped) -> ColumnDef {
    return ColumnDef{.name = std::move(name),
                     .kind = ColumnKind::RecordNumber,
                     .include_skipped = include_skipped};
}

auto required(ColumnDef column) -> ColumnDef {
    column.nullable = false;
    return column;
}

}  // namespace flatrow::schema
