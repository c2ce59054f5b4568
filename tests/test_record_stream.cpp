#include <flatrow/core/error.hpp>
#include <flatrow/io/record_stream.hpp>

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using flatrow::io::RecordFields;
using flatrow::io::RecordStream;
using flatrow::testing::TrickleSource;

namespace {

auto drain(RecordStream& stream) -> std::vector<RecordFields> {
    std::vector<RecordFields> rows;
    while (!stream.is_end_of_stream()) {
        auto record = stream.read_record();
        REQUIRE(record.has_value());
        rows.push_back(std::move(*record));
    }
    return rows;
}

auto async_drain(RecordStream& stream) -> boost::asio::awaitable<std::vector<RecordFields>> {
    std::vector<RecordFields> rows;
    while (!co_await stream.async_is_end_of_stream()) {
        auto record = co_await stream.async_read_record();
        if (record) {
            rows.push_back(std::move(*record));
        }
    }
    co_return rows;
}

const std::string kText = "id,name\n1,\"Smith, J\"\r\n2,\"multi\nline\"\n3,x";

const std::vector<RecordFields> kExpected = {
    {"id", "name"}, {"1", "Smith, J"}, {"2", "multi\nline"}, {"3", "x"}};

}  // namespace

TEST_CASE("Record stream over an istream", "[io][stream]") {
    std::istringstream input(kText);
    RecordStream stream(std::make_unique<flatrow::io::IstreamSource>(input), flatrow::Options{});

    REQUIRE(drain(stream) == kExpected);

    SECTION("end of stream is sticky") {
        REQUIRE(stream.is_end_of_stream());
        REQUIRE(stream.is_end_of_stream());
    }

    SECTION("reading past the end is a usage error") {
        REQUIRE_THROWS_AS(stream.read_record(), flatrow::UsageError);
    }
}

TEST_CASE("Record stream reassembles records from tiny chunks", "[io][stream]") {
    auto source = std::make_unique<TrickleSource>(kText, 1);
    const auto* trickle = source.get();
    RecordStream stream(std::move(source), flatrow::Options{});

    REQUIRE(drain(stream) == kExpected);
    REQUIRE(trickle->reads() > kText.size());
}

TEST_CASE("Record stream reads without checking for the end first", "[io][stream]") {
    std::istringstream input("a\nb\n");
    RecordStream stream(std::make_unique<flatrow::io::IstreamSource>(input), flatrow::Options{});

    REQUIRE(stream.read_record().value() == RecordFields{"a"});
    REQUIRE(stream.read_record().value() == RecordFields{"b"});
    REQUIRE(stream.is_end_of_stream());
}

TEST_CASE("Record stream reports syntax errors and continues", "[io][stream]") {
    std::istringstream input("\"bad\"x\ngood\n");
    RecordStream stream(std::make_unique<flatrow::io::IstreamSource>(input), flatrow::Options{});

    auto first = stream.read_record();
    REQUIRE_FALSE(first.has_value());
    REQUIRE(first.error().field == 1);

    auto second = stream.read_record();
    REQUIRE(second.has_value());
    REQUIRE(*second == RecordFields{"good"});
    REQUIRE(stream.is_end_of_stream());
}

TEST_CASE("Record stream suspendable forms", "[io][stream][async]") {
    SECTION("istream source") {
        std::istringstream input(kText);
        RecordStream stream(std::make_unique<flatrow::io::IstreamSource>(input),
                            flatrow::Options{});
        REQUIRE(flatrow::testing::run(async_drain(stream)) == kExpected);
    }

    SECTION("source that yields on every read") {
        RecordStream stream(std::make_unique<TrickleSource>(kText, 3), flatrow::Options{});
        REQUIRE(flatrow::testing::run(async_drain(stream)) == kExpected);
    }
}
