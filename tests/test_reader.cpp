#include <flatrow/reader/reader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

using namespace flatrow;

namespace {

auto texts(const std::vector<Value>& values) -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(values.size());
    for (const auto& value : values) {
        out.push_back(to_string(value));
    }
    return out;
}

auto with_header() -> Options {
    Options options;
    options.is_first_record_schema = true;
    return options;
}

auto make_schema(std::vector<schema::ColumnDef> columns) -> SchemaPtr {
    return std::make_shared<schema::Schema>(std::move(columns));
}

}  // namespace

TEST_CASE("Header row defines a string schema", "[reader]") {
    std::istringstream input("a,b,c\n1,2,3\n4,5,6\n");
    SeparatedValueReader reader(input, with_header());

    auto resolved = reader.schema();
    REQUIRE(resolved != nullptr);
    REQUIRE(resolved->column_names() == std::vector<std::string>{"a", "b", "c"});
    for (const auto& column : resolved->columns()) {
        REQUIRE(column.kind == schema::ColumnKind::String);
    }

    REQUIRE(reader.read());
    REQUIRE(texts(reader.values()) == std::vector<std::string>{"1", "2", "3"});
    REQUIRE(reader.read());
    REQUIRE(texts(reader.values()) == std::vector<std::string>{"4", "5", "6"});
    REQUIRE_FALSE(reader.read());
    REQUIRE(reader.end_of_file());

    REQUIRE(reader.metadata().physical_record_count == 3);
    REQUIRE(reader.metadata().logical_record_count == 2);
    REQUIRE(reader.schema() == resolved);
}

TEST_CASE("Header schema is resolved by the first read", "[reader]") {
    std::istringstream input("name\nalpha\n");
    SeparatedValueReader reader(input, with_header());

    REQUIRE(reader.read());
    REQUIRE(std::get<std::string>(reader.values().at(0)) == "alpha");
    REQUIRE(reader.schema()->column_names() == std::vector<std::string>{"name"});
}

TEST_CASE("Header row is discarded when a schema is supplied", "[reader]") {
    auto fixed = make_schema({schema::int64_column("x"), schema::int64_column("y")});

    SECTION("fixed schema") {
        std::istringstream input("first,second\n1,2\n");
        SeparatedValueReader reader(input, fixed, with_header());
        REQUIRE(reader.schema() == fixed);
        REQUIRE(reader.metadata().physical_record_count == 1);
        REQUIRE(reader.read());
        REQUIRE(std::get<std::int64_t>(reader.values().at(1)) == 2);
        REQUIRE_FALSE(reader.read());
    }

    SECTION("selector") {
        auto selector = std::make_shared<schema::SchemaSelector>();
        selector->with_default(fixed);
        std::istringstream input("first,second\n1,2\n");
        SeparatedValueReader reader(input, SelectorPtr(selector), with_header());
        REQUIRE(reader.schema() == nullptr);
        REQUIRE(reader.read());
        REQUIRE(std::get<std::int64_t>(reader.values().at(0)) == 1);
        REQUIRE(reader.metadata().physical_record_count == 2);
    }

    SECTION("skip consumes the header first") {
        std::istringstream input("first,second\n1,2\n3,4\n");
        SeparatedValueReader reader(input, fixed, with_header());
        REQUIRE(reader.skip());
        REQUIRE(reader.read());
        REQUIRE(std::get<std::int64_t>(reader.values().at(0)) == 3);
        REQUIRE(reader.metadata().physical_record_count == 3);
    }
}

TEST_CASE("Without a schema records are raw strings", "[reader]") {
    std::istringstream input("a,b\n\"c,d\"\n");
    SeparatedValueReader reader(input);

    REQUIRE(reader.read());
    REQUIRE(texts(reader.values()) == std::vector<std::string>{"a", "b"});
    REQUIRE(reader.read());
    REQUIRE(texts(reader.values()) == std::vector<std::string>{"c,d"});
    REQUIRE_FALSE(reader.read());
}

TEST_CASE("Typed schema converts every column", "[reader]") {
    auto typed = make_schema({
        schema::string_column("symbol"),
        schema::double_column("price"),
        schema::boolean_column("active"),
        schema::date_column("settle"),
        schema::int64_column("qty"),
    });
    std::istringstream input("AAPL, 189.5 ,yes,2024-03-01,\n");
    SeparatedValueReader reader(input, typed);

    REQUIRE(reader.read());
    auto values = reader.values();
    REQUIRE(values.size() == 5);
    REQUIRE(std::get<std::string>(values[0]) == "AAPL");
    REQUIRE(std::get<double>(values[1]) == 189.5);
    REQUIRE(std::get<bool>(values[2]));
    REQUIRE(std::get<Date>(values[3]) == *make_date(2024, 3, 1));
    REQUIRE(is_null(values[4]));
}

TEST_CASE("Extra fields beyond the schema are ignored", "[reader]") {
    std::istringstream input("1,2,3,4\n");
    SeparatedValueReader reader(input, make_schema({schema::int64_column("a")}));
    REQUIRE(reader.read());
    REQUIRE(reader.values().size() == 1);
}

TEST_CASE("Record counters", "[reader]") {
    std::istringstream input("h\n1\nSKIP\n2\n3\n4\n");
    SeparatedValueReader reader(input, with_header());
    reader.on_record_read([](RecordReadEvent& event) {
        for (const auto& field : event.fields) {
            if (field == "SKIP") {
                event.skip = true;
            }
        }
    });

    std::vector<std::string> seen;
    REQUIRE(reader.read());
    seen.push_back(to_string(reader.values().at(0)));
    REQUIRE(reader.read());
    seen.push_back(to_string(reader.values().at(0)));

    // An explicit skip leaves the previous record in place.
    REQUIRE(reader.skip());
    REQUIRE(to_string(reader.values().at(0)) == "2");

    REQUIRE(reader.read());
    seen.push_back(to_string(reader.values().at(0)));
    REQUIRE_FALSE(reader.read());

    REQUIRE(seen == std::vector<std::string>{"1", "2", "4"});
    // 3 reads + 1 filtered + 1 skipped + header
    REQUIRE(reader.metadata().physical_record_count == 6);
    REQUIRE(reader.metadata().logical_record_count == 3);
}

TEST_CASE("Skip filter sees only rows offered to read", "[reader]") {
    std::istringstream input("h\nskipped\nread\n");
    SeparatedValueReader reader(input, with_header());
    std::vector<std::string> offered;
    reader.on_record_read([&offered](RecordReadEvent& event) {
        offered.emplace_back(event.fields[0]);
    });

    REQUIRE(reader.skip());
    REQUIRE(reader.read());
    REQUIRE(offered == std::vector<std::string>{"read"});
    REQUIRE_FALSE(reader.skip());
}

TEST_CASE("Skip filter runs before column count validation", "[reader]") {
    std::istringstream input("short\n1,2\n");
    SeparatedValueReader reader(
        input, make_schema({schema::int64_column("a"), schema::int64_column("b")}));
    reader.on_record_read([](RecordReadEvent& event) { event.skip = event.fields.size() < 2; });

    REQUIRE(reader.read());
    REQUIRE(std::get<std::int64_t>(reader.values().at(1)) == 2);
    REQUIRE(reader.metadata().physical_record_count == 2);
    REQUIRE(reader.metadata().logical_record_count == 1);
}

TEST_CASE("Values are a copy", "[reader]") {
    std::istringstream input("x,y\n");
    SeparatedValueReader reader(input);
    REQUIRE(reader.read());

    auto values = reader.values();
    values[0] = Value{std::string("changed")};
    values.pop_back();

    REQUIRE(texts(reader.values()) == std::vector<std::string>{"x", "y"});
}

TEST_CASE("Record number columns", "[reader]") {
    SECTION("count records returned") {
        auto numbered = make_schema({
            schema::record_number_column("n"),
            schema::string_column("a"),
            schema::string_column("b"),
        });
        std::istringstream input("x,y\nskip,me\nz,w\n");
        SeparatedValueReader reader(input, numbered);
        reader.on_record_read([](RecordReadEvent& event) { event.skip = event.fields[0] == "skip"; });

        REQUIRE(reader.read());
        REQUIRE(std::get<std::int64_t>(reader.values().at(0)) == 1);
        REQUIRE(reader.read());
        REQUIRE(std::get<std::int64_t>(reader.values().at(0)) == 2);
        REQUIRE(std::get<std::string>(reader.values().at(1)) == "z");
    }

    SECTION("count physical rows") {
        auto numbered = make_schema({
            schema::string_column("a"),
            schema::record_number_column("line", true),
        });
        std::istringstream input("header\nfirst\nsecond\n");
        SeparatedValueReader reader(input, numbered, with_header());

        REQUIRE(reader.read());
        REQUIRE(std::get<std::int64_t>(reader.values().at(1)) == 2);
        REQUIRE(reader.skip());
        REQUIRE_FALSE(reader.read());
    }

    SECTION("metadata columns need no raw field") {
        auto numbered = make_schema({
            schema::record_number_column("n"),
            schema::string_column("only"),
        });
        std::istringstream input("value\n");
        SeparatedValueReader reader(input, numbered);
        REQUIRE(reader.read());
        REQUIRE(texts(reader.values()) == std::vector<std::string>{"1", "value"});
    }

    SECTION("each metadata column lowers the minimum by one field") {
        auto numbered = make_schema({
            schema::record_number_column("n"),
            schema::string_column("a"),
            schema::string_column("b"),
        });
        std::istringstream input("x\n");
        SeparatedValueReader reader(input, numbered);

        REQUIRE(reader.read());
        auto values = reader.values();
        REQUIRE(values.size() == 3);
        REQUIRE(std::get<std::int64_t>(values[0]) == 1);
        REQUIRE(std::get<std::string>(values[1]) == "x");
        REQUIRE(is_null(values[2]));
    }

    SECTION("rows shorter than the minimum are rejected") {
        auto numbered = make_schema({
            schema::record_number_column("n"),
            schema::string_column("a"),
            schema::string_column("b"),
            schema::string_column("c"),
        });
        std::istringstream input("x\nx,y\n");
        SeparatedValueReader reader(input, numbered);
        std::vector<std::string> details;
        reader.on_error([&details](ProcessingErrorEvent& event) {
            details.push_back(event.error.detail());
            event.handled = true;
        });

        REQUIRE(reader.read());
        REQUIRE(texts(reader.values()) == std::vector<std::string>{"1", "x", "y", ""});
        REQUIRE(details == std::vector<std::string>{"expected at least 2 fields, found 1"});
    }
}

TEST_CASE("Selector routes records to schemas", "[reader][selector]") {
    auto header = make_schema({schema::ignored_column(), schema::date_column("batch")});
    auto detail = make_schema({
        schema::ignored_column(),
        schema::string_column("account"),
        schema::int64_column("amount"),
    });
    auto selector = std::make_shared<schema::SchemaSelector>();
    selector->when([](auto fields) { return fields[0] == "H"; }, header)
        .when([](auto fields) { return fields[0] == "D"; }, detail);

    std::istringstream input("H,2024-03-01\nD,ACC-1,250\nT,1\n");
    SeparatedValueReader reader(input, SelectorPtr(selector));

    REQUIRE(reader.read());
    REQUIRE(std::get<Date>(reader.values().at(0)) == *make_date(2024, 3, 1));

    REQUIRE(reader.read());
    auto values = reader.values();
    REQUIRE(values.size() == 2);
    REQUIRE(std::get<std::string>(values[0]) == "ACC-1");
    REQUIRE(std::get<std::int64_t>(values[1]) == 250);

    // No rule matches and there is no default: the raw fields come back.
    REQUIRE(reader.read());
    REQUIRE(texts(reader.values()) == std::vector<std::string>{"T", "1"});

    REQUIRE_FALSE(reader.read());
    REQUIRE(reader.schema() == nullptr);
}

TEST_CASE("Selector record numbers follow the reader", "[reader][selector]") {
    auto numbered = make_schema({schema::record_number_column("n"), schema::string_column("v")});
    auto selector = std::make_shared<schema::SchemaSelector>();
    selector->with_default(numbered);

    std::istringstream input("a\nb\n");
    SeparatedValueReader reader(input, SelectorPtr(selector));
    REQUIRE(reader.read());
    REQUIRE(reader.read());
    REQUIRE(texts(reader.values()) == std::vector<std::string>{"2", "b"});
}

TEST_CASE("Reader honours separator options", "[reader]") {
    Options options;
    options.separator = ";";
    options.record_separator = "|";
    std::istringstream input("a;b|c;\"d|e\"|");
    SeparatedValueReader reader(input, options);

    REQUIRE(reader.options().separator == ";");
    REQUIRE(reader.read());
    REQUIRE(texts(reader.values()) == std::vector<std::string>{"a", "b"});
    REQUIRE(reader.read());
    REQUIRE(texts(reader.values()) == std::vector<std::string>{"c", "d|e"});
    REQUIRE_FALSE(reader.read());
}

TEST_CASE("Empty input", "[reader]") {
    std::istringstream input("");

    SECTION("raw") {
        SeparatedValueReader reader(input);
        REQUIRE_FALSE(reader.read());
        REQUIRE(reader.end_of_file());
        REQUIRE_FALSE(reader.skip());
    }

    SECTION("header inference leaves the schema undefined") {
        SeparatedValueReader reader(input, with_header());
        REQUIRE_THROWS_AS(reader.schema(), UsageError);
        REQUIRE_FALSE(reader.read());
        REQUIRE_FALSE(reader.has_error());
    }
}
