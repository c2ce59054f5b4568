#include <flatrow/reader/reader.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <iterator>
#include <utility>

namespace flatrow {

namespace {

constexpr std::string_view kReadingWithErrors =
    "cannot continue reading with errors; a previous operation failed";

auto checked_source(std::unique_ptr<io::ByteSource> source) -> std::unique_ptr<io::ByteSource> {
    if (source == nullptr) {
        throw ConfigurationError("reader: the input source cannot be null");
    }
    return source;
}

auto validated(Options options) -> Options {
    if (auto valid = options.validate(); !valid) {
        throw ConfigurationError(fmt::format("reader: {}", valid.error()));
    }
    return options;
}

}  // namespace

/// Marks a public operation as in flight. An operation that never reaches
/// complete(), because it threw or its coroutine was destroyed while suspended,
/// latches the reader's error state.
class SeparatedValueReader::Operation {
   public:
    Operation(SeparatedValueReader& reader, std::string_view name) : reader_(reader) {
        reader_.ensure_usable(name);
        reader_.in_operation_ = true;
    }

    Operation(const Operation&) = delete;
    auto operator=(const Operation&) -> Operation& = delete;

    ~Operation() {
        reader_.in_operation_ = false;
        if (!completed_) {
            reader_.has_error_ = true;
        }
    }

    void complete() noexcept { completed_ = true; }

   private:
    SeparatedValueReader& reader_;
    bool completed_ = false;
};

SeparatedValueReader::SeparatedValueReader(std::unique_ptr<io::ByteSource> source,
                                           Options options)
    : SeparatedValueReader(std::move(source), nullptr, nullptr, SchemaMode::None,
                           std::move(options)) {}

SeparatedValueReader::SeparatedValueReader(std::unique_ptr<io::ByteSource> source,
                                           SchemaPtr schema, Options options)
    : SeparatedValueReader(std::move(source), std::move(schema), nullptr, SchemaMode::Fixed,
                           std::move(options)) {}

SeparatedValueReader::SeparatedValueReader(std::unique_ptr<io::ByteSource> source,
                                           SelectorPtr selector, Options options)
    : SeparatedValueReader(std::move(source), nullptr, std::move(selector), SchemaMode::Selector,
                           std::move(options)) {}

SeparatedValueReader::SeparatedValueReader(std::istream& input, Options options)
    : SeparatedValueReader(std::make_unique<io::IstreamSource>(input), std::move(options)) {}

SeparatedValueReader::SeparatedValueReader(std::istream& input, SchemaPtr schema,
                                           Options options)
    : SeparatedValueReader(std::make_unique<io::IstreamSource>(input), std::move(schema),
                           std::move(options)) {}

SeparatedValueReader::SeparatedValueReader(std::istream& input, SelectorPtr selector,
                                           Options options)
    : SeparatedValueReader(std::make_unique<io::IstreamSource>(input), std::move(selector),
                           std::move(options)) {}

SeparatedValueReader::SeparatedValueReader(std::unique_ptr<io::ByteSource> source,
                                           SchemaPtr schema, SelectorPtr selector,
                                           SchemaMode mode, Options options)
    : options_(validated(std::move(options))),
      stream_(checked_source(std::move(source)), options_),
      mode_(mode),
      selector_(std::move(selector)) {
    if (mode_ == SchemaMode::Fixed && schema == nullptr) {
        throw ConfigurationError("reader: the schema cannot be null");
    }
    if (mode_ == SchemaMode::Selector && selector_ == nullptr) {
        throw ConfigurationError("reader: the schema selector cannot be null");
    }
    metadata_.schema = std::move(schema);
    metadata_.options = &options_;

    if (mode_ == SchemaMode::Selector) {
        resolve_schema_ = [selector = selector_](std::span<const std::string> fields) {
            return selector->select(fields);
        };
    } else {
        resolve_schema_ = [this](std::span<const std::string>) { return metadata_.schema; };
    }
}

void SeparatedValueReader::ensure_usable(std::string_view operation) const {
    if (has_error_) {
        throw UsageError(fmt::format("{}: {}", operation, kReadingWithErrors));
    }
    if (in_operation_) {
        throw UsageError(
            fmt::format("{}: another operation on this reader has not completed", operation));
    }
}

// ─── Row acquisition ──────────────────────────────────────────────────────────
//  The only code that differs between the blocking and suspendable paths.

auto SeparatedValueReader::next_row() -> std::optional<io::RecordResult> {
    if (stream_.is_end_of_stream()) {
        return std::nullopt;
    }
    return stream_.read_record();
}

auto SeparatedValueReader::async_next_row()
    -> boost::asio::awaitable<std::optional<io::RecordResult>> {
    if (co_await stream_.async_is_end_of_stream()) {
        co_return std::nullopt;
    }
    co_return co_await stream_.async_read_record();
}

// ─── Protocol ─────────────────────────────────────────────────────────────────

auto SeparatedValueReader::needs_header() const noexcept -> bool {
    return options_.is_first_record_schema && metadata_.physical_record_count == 0;
}

auto SeparatedValueReader::accept(std::optional<io::RecordResult> row) -> PulledRow {
    if (!row) {
        end_of_file_ = true;
        values_.reset();
        return PulledRow{.status = RowStatus::End};
    }
    // A malformed row is not counted; the fault carries the rows consumed before it.
    if (!row->has_value()) {
        report(RecordProcessingError(FaultReason::InvalidSyntax, metadata_.physical_record_count,
                                     row->error().format()));
        return PulledRow{.status = RowStatus::Recovered};
    }
    ++metadata_.physical_record_count;
    return PulledRow{.status = RowStatus::Row, .fields = std::move(**row)};
}

auto SeparatedValueReader::accept_header(PulledRow row) -> bool {
    // A recovered malformed row is not counted, so the next row is the header.
    if (row.status == RowStatus::Recovered) {
        return false;
    }
    if (row.status == RowStatus::End) {
        return true;
    }
    if (mode_ != SchemaMode::None) {
        spdlog::debug("discarded header record with {} fields", row.fields.size());
        return true;
    }
    auto inferred = std::make_shared<schema::Schema>();
    for (auto& name : row.fields) {
        inferred->add_column(schema::string_column(std::move(name)));
    }
    spdlog::debug("inferred schema with {} columns from header", inferred->column_count());
    metadata_.schema = std::move(inferred);
    return true;
}

auto SeparatedValueReader::accept_for_read(PulledRow row) -> std::optional<bool> {
    switch (row.status) {
        case RowStatus::End:
            return false;
        case RowStatus::Recovered:
            return std::nullopt;
        case RowStatus::Row:
            break;
    }
    // The filter runs before validation: a filtered row never raises a fault.
    if (is_skipped(row.fields)) {
        spdlog::debug("record {} skipped by filter", metadata_.physical_record_count);
        return std::nullopt;
    }
    auto record_schema = resolve_schema_(row.fields);
    if (record_schema != nullptr &&
        row.fields.size() + record_schema->metadata_column_count() <
            record_schema->physical_column_count()) {
        const std::size_t minimum =
            record_schema->physical_column_count() - record_schema->metadata_column_count();
        report(RecordProcessingError(
            FaultReason::WrongColumnCount, metadata_.physical_record_count,
            fmt::format("expected at least {} fields, found {}", minimum, row.fields.size())));
        return std::nullopt;
    }
    auto values = parse_values(record_schema, std::move(row.fields));
    if (!values) {
        return std::nullopt;
    }
    values_ = std::move(*values);
    ++metadata_.logical_record_count;
    return true;
}

auto SeparatedValueReader::is_skipped(std::span<const std::string> fields) const -> bool {
    if (!record_filter_) {
        return false;
    }
    RecordReadEvent event{.fields = fields};
    record_filter_(event);
    return event.skip;
}

auto SeparatedValueReader::parse_values(const SchemaPtr& record_schema, io::RecordFields fields)
    -> std::optional<std::vector<Value>> {
    if (record_schema == nullptr) {
        return std::vector<Value>(std::make_move_iterator(fields.begin()),
                                  std::make_move_iterator(fields.end()));
    }
    std::expected<std::vector<Value>, schema::ConversionError> parsed;
    if (mode_ == SchemaMode::Selector) {
        ProcessMetadata context = metadata_;
        context.schema = record_schema;
        parsed = record_schema->parse_values(context, fields);
    } else {
        parsed = record_schema->parse_values(metadata_, fields);
    }
    if (!parsed) {
        report(RecordProcessingError(FaultReason::InvalidConversion,
                                     metadata_.physical_record_count, parsed.error().format()));
        return std::nullopt;
    }
    return std::move(*parsed);
}

void SeparatedValueReader::report(const RecordProcessingError& error) {
    if (error_handler_) {
        ProcessingErrorEvent event{.error = error};
        error_handler_(event);
        if (event.handled) {
            spdlog::debug("recovered from {} in record {}", to_string(error.reason()),
                          error.record_number());
            return;
        }
    }
    throw error;
}

auto SeparatedValueReader::committed_schema(std::string_view operation) const -> SchemaPtr {
    if (mode_ == SchemaMode::Selector) {
        return nullptr;
    }
    if (metadata_.schema == nullptr) {
        throw UsageError(fmt::format("{}: the schema has not been defined", operation));
    }
    return metadata_.schema;
}

// ─── Public operations ────────────────────────────────────────────────────────

auto SeparatedValueReader::read() -> bool {
    Operation operation(*this, "read");
    while (needs_header() && !accept_header(accept(next_row()))) {
    }
    while (true) {
        if (auto result = accept_for_read(accept(next_row()))) {
            operation.complete();
            return *result;
        }
    }
}

auto SeparatedValueReader::async_read() -> boost::asio::awaitable<bool> {
    Operation operation(*this, "async_read");
    while (needs_header() && !accept_header(accept(co_await async_next_row()))) {
    }
    while (true) {
        if (auto result = accept_for_read(accept(co_await async_next_row()))) {
            operation.complete();
            co_return *result;
        }
    }
}

auto SeparatedValueReader::skip() -> bool {
    Operation operation(*this, "skip");
    while (needs_header() && !accept_header(accept(next_row()))) {
    }
    const bool consumed = accept(next_row()).status != RowStatus::End;
    operation.complete();
    return consumed;
}

auto SeparatedValueReader::async_skip() -> boost::asio::awaitable<bool> {
    Operation operation(*this, "async_skip");
    while (needs_header() && !accept_header(accept(co_await async_next_row()))) {
    }
    const bool consumed = accept(co_await async_next_row()).status != RowStatus::End;
    operation.complete();
    co_return consumed;
}

auto SeparatedValueReader::values() const -> std::vector<Value> {
    if (has_error_) {
        throw UsageError(fmt::format("values: {}", kReadingWithErrors));
    }
    if (end_of_file_) {
        throw UsageError("values: there are no more records");
    }
    if (!values_) {
        throw UsageError("values: read must be called before values are available");
    }
    return *values_;
}

auto SeparatedValueReader::async_values() const -> boost::asio::awaitable<std::vector<Value>> {
    co_return values();
}

auto SeparatedValueReader::schema() -> SchemaPtr {
    Operation operation(*this, "schema");
    while (needs_header() && !accept_header(accept(next_row()))) {
    }
    operation.complete();
    return committed_schema("schema");
}

auto SeparatedValueReader::async_schema() -> boost::asio::awaitable<SchemaPtr> {
    Operation operation(*this, "async_schema");
    while (needs_header() && !accept_header(accept(co_await async_next_row()))) {
    }
    operation.complete();
    co_return committed_schema("async_schema");
}

}  // namespace flatrow
