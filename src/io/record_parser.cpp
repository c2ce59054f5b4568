#include <flatrow/io/record_parser.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <utility>

namespace flatrow::io {

namespace {

auto is_blank(char ch) -> bool {
    return ch == ' ' || ch == '\t';
}

auto printable(char ch) -> std::string {
    switch (ch) {
        case '\r':
            return "\\r";
        case '\n':
            return "\\n";
        case '\t':
            return "\\t";
        default:
            return std::string(1, ch);
    }
}

}  // namespace

auto SyntaxError::format() const -> std::string {
    return fmt::format("{} (field {})", message, field);
}

RecordParser::RecordParser(Options options) : options_(std::move(options)) {}

void RecordParser::feed(std::string_view chunk) {
    if (pos_ > 0) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
    buffer_.append(chunk);
}

auto RecordParser::match(std::string_view token, std::size_t pos) const -> Match {
    const std::size_t available = buffer_.size() - pos;
    const std::size_t count = std::min(available, token.size());
    if (std::string_view(buffer_).substr(pos, count) != token.substr(0, count)) {
        return Match::No;
    }
    if (count == token.size()) {
        return Match::Yes;
    }
    return finished_ ? Match::No : Match::Partial;
}

auto RecordParser::match_record_end(std::size_t pos, std::size_t& length) const -> Match {
    if (options_.record_separator.has_value()) {
        length = options_.record_separator->size();
        return match(*options_.record_separator, pos);
    }
    if (pos >= buffer_.size()) {
        return finished_ ? Match::No : Match::Partial;
    }
    const char ch = buffer_[pos];
    if (ch == '\n') {
        length = 1;
        return Match::Yes;
    }
    if (ch != '\r') {
        return Match::No;
    }
    // A lone '\r' at the end of the buffer may be the first half of "\r\n".
    if (pos + 1 < buffer_.size()) {
        length = buffer_[pos + 1] == '\n' ? 2 : 1;
        return Match::Yes;
    }
    if (!finished_) {
        return Match::Partial;
    }
    length = 1;
    return Match::Yes;
}

auto RecordParser::at_delimiter(std::size_t pos) const -> bool {
    std::size_t length = 0;
    return match(options_.separator, pos) != Match::No ||
           match_record_end(pos, length) != Match::No;
}

auto RecordParser::skip_blanks(std::size_t pos) const -> std::size_t {
    if (options_.preserve_whitespace) {
        return pos;
    }
    while (pos < buffer_.size() && is_blank(buffer_[pos]) && !at_delimiter(pos)) {
        ++pos;
    }
    return pos;
}

auto RecordParser::resync(std::size_t pos, SyntaxError error) -> ParseStep {
    while (pos < buffer_.size()) {
        std::size_t length = 0;
        const Match end = match_record_end(pos, length);
        if (end == Match::Partial) {
            return NeedInput{};
        }
        if (end == Match::Yes) {
            pos_ = pos + length;
            return error;
        }
        ++pos;
    }
    if (!finished_) {
        return NeedInput{};
    }
    pos_ = buffer_.size();
    return error;
}

auto RecordParser::next() -> ParseStep {
    if (pos_ >= buffer_.size()) {
        if (finished_) {
            return EndOfInput{};
        }
        return NeedInput{};
    }

    const char quote = options_.quote;
    const std::size_t size = buffer_.size();
    RecordFields fields;
    std::size_t i = pos_;

    while (true) {
        std::string field;
        i = skip_blanks(i);

        if (i < size && buffer_[i] == quote) {
            ++i;
            while (true) {
                if (i >= size) {
                    if (!finished_) {
                        return NeedInput{};
                    }
                    pos_ = size;
                    return SyntaxError{.message = "unterminated quoted field",
                                       .field = fields.size() + 1};
                }
                const char ch = buffer_[i];
                if (ch != quote) {
                    field += ch;
                    ++i;
                    continue;
                }
                if (i + 1 >= size && !finished_) {
                    return NeedInput{};
                }
                if (i + 1 < size && buffer_[i + 1] == quote) {
                    field += quote;
                    i += 2;
                    continue;
                }
                ++i;
                break;
            }
            i = skip_blanks(i);
        } else {
            const std::size_t start = i;
            while (true) {
                if (i >= size) {
                    if (!finished_) {
                        return NeedInput{};
                    }
                    break;
                }
                std::size_t length = 0;
                const Match sep = match(options_.separator, i);
                const Match end = match_record_end(i, length);
                if (sep == Match::Partial || end == Match::Partial) {
                    return NeedInput{};
                }
                if (sep == Match::Yes || end == Match::Yes) {
                    break;
                }
                ++i;
            }
            field.assign(buffer_, start, i - start);
            if (!options_.preserve_whitespace) {
                while (!field.empty() && is_blank(field.back())) {
                    field.pop_back();
                }
            }
        }

        if (i >= size) {
            if (!finished_) {
                return NeedInput{};
            }
            fields.push_back(std::move(field));
            pos_ = size;
            return fields;
        }

        const Match sep = match(options_.separator, i);
        if (sep == Match::Partial) {
            return NeedInput{};
        }
        if (sep == Match::Yes) {
            fields.push_back(std::move(field));
            i += options_.separator.size();
            continue;
        }

        std::size_t length = 0;
        const Match end = match_record_end(i, length);
        if (end == Match::Partial) {
            return NeedInput{};
        }
        if (end == Match::Yes) {
            fields.push_back(std::move(field));
            pos_ = i + length;
            return fields;
        }

        // Only a closing quote can be followed by something that is not a delimiter.
        return resync(i, SyntaxError{
                             .message = fmt::format("unexpected character '{}' after closing quote",
                                                    printable(buffer_[i])),
                             .field = fields.size() + 1,
                         });
    }
}

}  // namespace flatrow::io
