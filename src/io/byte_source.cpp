#include <flatrow/io/byte_source.hpp>

#include <ios>

namespace flatrow::io {

auto IstreamSource::read_some(std::span<char> buffer) -> std::size_t {
    if (buffer.empty() || input_.eof()) {
        return 0;
    }
    input_.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (input_.bad()) {
        throw std::ios_base::failure("failed to read from input stream");
    }
    return static_cast<std::size_t>(input_.gcount());
}

auto IstreamSource::async_read_some(std::span<char> buffer) -> boost::asio::awaitable<std::size_t> {
    co_return read_some(buffer);
}

}  // namespace flatrow::io
