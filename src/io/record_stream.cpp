#include <flatrow/io/record_stream.hpp>

#include <flatrow/core/error.hpp>

#include <string_view>
#include <utility>
#include <variant>

namespace flatrow::io {

RecordStream::RecordStream(std::unique_ptr<ByteSource> source, Options options)
    : source_(std::move(source)), parser_(std::move(options)), chunk_(kChunkSize) {}

void RecordStream::accept_chunk(std::size_t count) {
    if (count == 0) {
        parser_.finish();
        return;
    }
    parser_.feed(std::string_view(chunk_.data(), count));
}

auto RecordStream::fill() -> ParseStep {
    auto step = parser_.next();
    while (std::holds_alternative<NeedInput>(step)) {
        accept_chunk(source_->read_some(chunk_));
        step = parser_.next();
    }
    return step;
}

auto RecordStream::async_fill() -> boost::asio::awaitable<ParseStep> {
    auto step = parser_.next();
    while (std::holds_alternative<NeedInput>(step)) {
        accept_chunk(co_await source_->async_read_some(chunk_));
        step = parser_.next();
    }
    co_return step;
}

auto RecordStream::take_pending() -> RecordResult {
    if (std::holds_alternative<EndOfInput>(*pending_)) {
        throw UsageError("read_record: the stream has no more records");
    }
    ParseStep step = std::move(*pending_);
    pending_.reset();
    if (auto* error = std::get_if<SyntaxError>(&step)) {
        return std::unexpected(std::move(*error));
    }
    return std::get<RecordFields>(std::move(step));
}

auto RecordStream::is_end_of_stream() -> bool {
    if (!pending_) {
        pending_ = fill();
    }
    return std::holds_alternative<EndOfInput>(*pending_);
}

auto RecordStream::async_is_end_of_stream() -> boost::asio::awaitable<bool> {
    if (!pending_) {
        pending_ = co_await async_fill();
    }
    co_return std::holds_alternative<EndOfInput>(*pending_);
}

auto RecordStream::read_record() -> RecordResult {
    if (!pending_) {
        pending_ = fill();
    }
    return take_pending();
}

auto RecordStream::async_read_record() -> boost::asio::awaitable<RecordResult> {
    if (!pending_) {
        pending_ = co_await async_fill();
    }
    co_return take_pending();
}

}  // namespace flatrow::io
