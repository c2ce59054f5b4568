#pragma once

#include <flatrow/core/options.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace flatrow::io {

using RecordFields = std::vector<std::string>;

/// Tokenizer failure for a single record.
struct SyntaxError {
    std::string message;
    /// 1-based field within the record where the problem was found.
    std::size_t field = 0;

    [[nodiscard]] auto format() const -> std::string;
};

/// The buffered input ends inside a record; feed more or finish.
struct NeedInput {};

/// All input was consumed and finish() was called.
struct EndOfInput {};

using ParseStep = std::variant<RecordFields, SyntaxError, NeedInput, EndOfInput>;

/// Push tokenizer splitting buffered text into records of string fields.
///
/// The parser never performs I/O: callers feed() chunks as they arrive and
/// call finish() once the input is exhausted. next() either yields a complete
/// record or leaves its position untouched and asks for more input, so a
/// record split across chunks is re-read from its first character once the
/// rest arrives. After a SyntaxError the parser has already moved past the end
/// of the offending line.
class RecordParser {
   public:
    explicit RecordParser(Options options);

    void feed(std::string_view chunk);
    void finish() noexcept { finished_ = true; }

    [[nodiscard]] auto finished() const noexcept -> bool { return finished_; }
    [[nodiscard]] auto options() const noexcept -> const Options& { return options_; }

    [[nodiscard]] auto next() -> ParseStep;

   private:
    enum class Match : std::uint8_t {
        No,
        Yes,
        Partial,
    };

    [[nodiscard]] auto match(std::string_view token, std::size_t pos) const -> Match;
    [[nodiscard]] auto match_record_end(std::size_t pos, std::size_t& length) const -> Match;
    [[nodiscard]] auto at_delimiter(std::size_t pos) const -> bool;
    [[nodiscard]] auto skip_blanks(std::size_t pos) const -> std::size_t;
    [[nodiscard]] auto resync(std::size_t pos, SyntaxError error) -> ParseStep;

    Options options_;
    std::string buffer_;
    std::size_t pos_ = 0;
    bool finished_ = false;
};

}  // namespace flatrow::io
