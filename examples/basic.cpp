#include <flatrow/flatrow.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

void print_record(const std::vector<flatrow::Value>& values) {
    std::string line;
    for (const auto& value : values) {
        if (!line.empty()) {
            line += " | ";
        }
        line += flatrow::is_null(value) ? "<null>" : flatrow::to_string(value);
    }
    fmt::print("  {}\n", line);
}

}  // namespace

auto main() -> int {
    spdlog::set_level(spdlog::level::debug);

    // Header-derived schema: every column is a string named after the header.
    fmt::print("=== Header schema ===\n");
    std::istringstream trades("symbol,price,qty\nAAPL,189.5,10\n\"BRK,B\",412.25,3\n");
    flatrow::Options options;
    options.is_first_record_schema = true;
    flatrow::SeparatedValueReader header_reader(trades, options);
    for (const auto& name : header_reader.schema()->column_names()) {
        fmt::print("  column: {}\n", name);
    }
    while (header_reader.read()) {
        print_record(header_reader.values());
    }

    // Typed schema with a record number column and a recovering error handler.
    fmt::print("\n=== Typed schema ===\n");
    auto schema = std::make_shared<flatrow::schema::Schema>();
    schema->add_column(flatrow::schema::record_number_column("row"))
        .add_column(flatrow::schema::string_column("symbol"))
        .add_column(flatrow::schema::double_column("price"))
        .add_column(flatrow::schema::date_column("settle"));

    std::istringstream typed("AAPL,189.5,2024-03-01\nMSFT,oops,2024-03-01\nGOOG,141.2,2024-03-04\n");
    flatrow::SeparatedValueReader typed_reader(typed, schema);
    typed_reader.on_error([](flatrow::ProcessingErrorEvent& event) {
        fmt::print("  skipping: {}\n", event.error.what());
        event.handled = true;
    });
    while (typed_reader.read()) {
        print_record(typed_reader.values());
    }
    fmt::print("physical records: {}, logical records: {}\n",
               typed_reader.metadata().physical_record_count,
               typed_reader.metadata().logical_record_count);

    // Mixed layouts chosen per record.
    fmt::print("\n=== Schema selector ===\n");
    auto header_schema = std::make_shared<flatrow::schema::Schema>(std::vector{
        flatrow::schema::ignored_column(),
        flatrow::schema::date_column("batch_date"),
    });
    auto detail_schema = std::make_shared<flatrow::schema::Schema>(std::vector{
        flatrow::schema::ignored_column(),
        flatrow::schema::string_column("account"),
        flatrow::schema::int64_column("amount"),
    });
    auto selector = std::make_shared<flatrow::schema::SchemaSelector>();
    selector->when([](auto fields) { return !fields.empty() && fields[0] == "H"; }, header_schema)
        .when([](auto fields) { return !fields.empty() && fields[0] == "D"; }, detail_schema);

    std::istringstream batch("H,2024-03-01\nD,ACC-1,250\nD,ACC-2,-40\nT,2\n");
    flatrow::SeparatedValueReader batch_reader(batch, selector);
    while (batch_reader.read()) {
        print_record(batch_reader.values());
    }

    return 0;
}
