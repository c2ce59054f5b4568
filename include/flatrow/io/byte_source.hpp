#pragma once

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <cstddef>
#include <istream>
#include <span>

namespace flatrow::io {

/// Character input feeding the tokenizer.
///
/// Both forms return the number of characters copied into `buffer`; zero means
/// the input is exhausted. The suspendable form is the only place where a
/// reading coroutine may yield.
class ByteSource {
   public:
    virtual ~ByteSource() = default;

    [[nodiscard]] virtual auto read_some(std::span<char> buffer) -> std::size_t = 0;

    [[nodiscard]] virtual auto async_read_some(std::span<char> buffer)
        -> boost::asio::awaitable<std::size_t> = 0;
};

/// Reads from a std::istream. The suspendable form completes without suspending.
class IstreamSource final : public ByteSource {
   public:
    explicit IstreamSource(std::istream& input) : input_(input) {}

    [[nodiscard]] auto read_some(std::span<char> buffer) -> std::size_t override;

    [[nodiscard]] auto async_read_some(std::span<char> buffer)
        -> boost::asio::awaitable<std::size_t> override;

   private:
    std::istream& input_;
};

/// Reads from an Asio stream (socket, pipe, serial port) that supports both
/// read_some and async_read_some.
template <typename Stream>
class AsioStreamSource final : public ByteSource {
   public:
    explicit AsioStreamSource(Stream& stream) : stream_(stream) {}

    [[nodiscard]] auto read_some(std::span<char> buffer) -> std::size_t override {
        boost::system::error_code ec;
        const std::size_t count =
            stream_.read_some(boost::asio::buffer(buffer.data(), buffer.size()), ec);
        return checked(count, ec);
    }

    [[nodiscard]] auto async_read_some(std::span<char> buffer)
        -> boost::asio::awaitable<std::size_t> override {
        boost::system::error_code ec;
        const std::size_t count = co_await stream_.async_read_some(
            boost::asio::buffer(buffer.data(), buffer.size()),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        co_return checked(count, ec);
    }

   private:
    static auto checked(std::size_t count, const boost::system::error_code& ec) -> std::size_t {
        if (ec == boost::asio::error::eof) {
            return 0;
        }
        if (ec) {
            throw boost::system::system_error(ec);
        }
        return count;
    }

    Stream& stream_;
};

}  // namespace flatrow::io
