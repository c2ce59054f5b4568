#pragma once

#include <flatrow/core/options.hpp>
#include <flatrow/io/byte_source.hpp>
#include <flatrow/io/record_parser.hpp>

#include <boost/asio/awaitable.hpp>

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <vector>

namespace flatrow::io {

using RecordResult = std::expected<RecordFields, SyntaxError>;

/// Pulls records out of a ByteSource through a RecordParser.
///
/// Every operation exists in a blocking and a suspendable form; both drive the
/// same parser and may be mixed on one stream as long as calls do not overlap.
class RecordStream {
   public:
    static constexpr std::size_t kChunkSize = 64 * 1024;

    RecordStream(std::unique_ptr<ByteSource> source, Options options);

    /// True once every record has been returned. Reads ahead as needed.
    [[nodiscard]] auto is_end_of_stream() -> bool;
    [[nodiscard]] auto async_is_end_of_stream() -> boost::asio::awaitable<bool>;

    /// Next record, or the syntax error that made it unreadable.
    /// Throws UsageError when called at the end of the stream.
    [[nodiscard]] auto read_record() -> RecordResult;
    [[nodiscard]] auto async_read_record() -> boost::asio::awaitable<RecordResult>;

    [[nodiscard]] auto options() const noexcept -> const Options& { return parser_.options(); }

   private:
    [[nodiscard]] auto fill() -> ParseStep;
    [[nodiscard]] auto async_fill() -> boost::asio::awaitable<ParseStep>;
    void accept_chunk(std::size_t count);
    [[nodiscard]] auto take_pending() -> RecordResult;

    std::unique_ptr<ByteSource> source_;
    RecordParser parser_;
    std::vector<char> chunk_;
    std::optional<ParseStep> pending_;
};

}  // namespace flatrow::io
