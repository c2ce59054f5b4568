#include <flatrow/core/options.hpp>

#include <fmt/core.h>

#include <array>
#include <string_view>

namespace flatrow {

namespace {

constexpr std::array<std::string_view, 3> kLineBreaks = {"\r\n", "\n", "\r"};

auto printable(std::string_view token) -> std::string {
    std::string out;
    for (char ch : token) {
        switch (ch) {
            case '\r':
                out += "\\r";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += ch;
        }
    }
    return out;
}

}  // namespace

auto Options::validate() const -> std::expected<void, std::string> {
    if (separator.empty()) {
        return std::unexpected("the separator cannot be empty");
    }
    if (separator.find(quote) != std::string::npos) {
        return std::unexpected(
            fmt::format("the separator '{}' cannot contain the quote character", printable(separator)));
    }
    if (record_separator.has_value()) {
        if (record_separator->empty()) {
            return std::unexpected("the record separator cannot be empty");
        }
        if (*record_separator == separator) {
            return std::unexpected(fmt::format(
                "the separator and record separator cannot be the same ('{}')", printable(separator)));
        }
        return {};
    }
    for (auto line_break : kLineBreaks) {
        if (separator == line_break) {
            return std::unexpected(fmt::format(
                "the separator '{}' collides with the default record separator",
                printable(separator)));
        }
    }
    return {};
}

}  // namespace flatrow
