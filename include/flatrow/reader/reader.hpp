#pragma once

#include <flatrow/core/error.hpp>
#include <flatrow/core/metadata.hpp>
#include <flatrow/core/options.hpp>
#include <flatrow/core/value.hpp>
#include <flatrow/io/byte_source.hpp>
#include <flatrow/io/record_stream.hpp>
#include <flatrow/schema/schema.hpp>
#include <flatrow/schema/selector.hpp>

#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace flatrow {

/// Raised for every physical row before its columns are parsed.
struct RecordReadEvent {
    std::span<const std::string> fields;
    /// Set to drop the row without producing a record.
    bool skip = false;
};

/// Raised for every record processing fault before it is thrown.
struct ProcessingErrorEvent {
    const RecordProcessingError& error;
    /// Set to continue with the next row instead of failing the read.
    bool handled = false;
};

using SchemaPtr = std::shared_ptr<const schema::Schema>;
using SelectorPtr = std::shared_ptr<const schema::SchemaSelector>;
using RecordFilter = std::function<void(RecordReadEvent&)>;
using ErrorHandler = std::function<void(ProcessingErrorEvent&)>;

/// Forward-only cursor over the records of a flat file.
///
/// Each operation comes in a blocking and a suspendable form with the same
/// contract. Only one operation may be in flight at a time.
class Reader {
   public:
    virtual ~Reader() = default;

    /// Advance to the next record. Returns false once the input is exhausted.
    [[nodiscard]] virtual auto read() -> bool = 0;
    [[nodiscard]] virtual auto async_read() -> boost::asio::awaitable<bool> = 0;

    /// Discard the next physical record without parsing it. The values of the
    /// last record read stay available.
    [[nodiscard]] virtual auto skip() -> bool = 0;
    [[nodiscard]] virtual auto async_skip() -> boost::asio::awaitable<bool> = 0;

    /// Copy of the values of the current record.
    [[nodiscard]] virtual auto values() const -> std::vector<Value> = 0;
    [[nodiscard]] virtual auto async_values() const
        -> boost::asio::awaitable<std::vector<Value>> = 0;

    /// Schema governing the records, or null when it is chosen per record.
    [[nodiscard]] virtual auto schema() -> SchemaPtr = 0;
    [[nodiscard]] virtual auto async_schema() -> boost::asio::awaitable<SchemaPtr> = 0;
};

/// Reads records whose fields are separated by a separator token.
///
/// Rows flow tokenizer -> record filter -> schema -> values. Record processing
/// faults (malformed syntax, too few columns, failed conversions) go to the
/// error handler first; an unhandled fault is thrown and, like any other
/// exception escaping an operation, leaves the reader permanently unusable.
class SeparatedValueReader final : public Reader {
   public:
    /// Records are returned as raw strings unless the first record is a header,
    /// in which case it defines a schema of string columns.
    explicit SeparatedValueReader(std::unique_ptr<io::ByteSource> source, Options options = {});

    SeparatedValueReader(std::unique_ptr<io::ByteSource> source, SchemaPtr schema,
                         Options options = {});

    SeparatedValueReader(std::unique_ptr<io::ByteSource> source, SelectorPtr selector,
                         Options options = {});

    explicit SeparatedValueReader(std::istream& input, Options options = {});
    SeparatedValueReader(std::istream& input, SchemaPtr schema, Options options = {});
    SeparatedValueReader(std::istream& input, SelectorPtr selector, Options options = {});

    SeparatedValueReader(const SeparatedValueReader&) = delete;
    auto operator=(const SeparatedValueReader&) -> SeparatedValueReader& = delete;

    void on_record_read(RecordFilter filter) { record_filter_ = std::move(filter); }
    void on_error(ErrorHandler handler) { error_handler_ = std::move(handler); }

    [[nodiscard]] auto read() -> bool override;
    [[nodiscard]] auto async_read() -> boost::asio::awaitable<bool> override;

    [[nodiscard]] auto skip() -> bool override;
    [[nodiscard]] auto async_skip() -> boost::asio::awaitable<bool> override;

    [[nodiscard]] auto values() const -> std::vector<Value> override;
    [[nodiscard]] auto async_values() const -> boost::asio::awaitable<std::vector<Value>> override;

    [[nodiscard]] auto schema() -> SchemaPtr override;
    [[nodiscard]] auto async_schema() -> boost::asio::awaitable<SchemaPtr> override;

    [[nodiscard]] auto metadata() const noexcept -> const ProcessMetadata& { return metadata_; }
    [[nodiscard]] auto options() const noexcept -> const Options& { return options_; }
    [[nodiscard]] auto end_of_file() const noexcept -> bool { return end_of_file_; }
    [[nodiscard]] auto has_error() const noexcept -> bool { return has_error_; }

   private:
    enum class SchemaMode : std::uint8_t {
        None,
        Fixed,
        Selector,
    };

    enum class RowStatus : std::uint8_t {
        Row,
        Recovered,
        End,
    };

    /// Outcome of pulling one physical row from the tokenizer.
    struct PulledRow {
        RowStatus status = RowStatus::End;
        io::RecordFields fields;
    };

    class Operation;

    SeparatedValueReader(std::unique_ptr<io::ByteSource> source, SchemaPtr schema,
                         SelectorPtr selector, SchemaMode mode, Options options);

    void ensure_usable(std::string_view operation) const;

    [[nodiscard]] auto next_row() -> std::optional<io::RecordResult>;
    [[nodiscard]] auto async_next_row() -> boost::asio::awaitable<std::optional<io::RecordResult>>;

    [[nodiscard]] auto needs_header() const noexcept -> bool;
    [[nodiscard]] auto accept(std::optional<io::RecordResult> row) -> PulledRow;
    [[nodiscard]] auto accept_header(PulledRow row) -> bool;
    [[nodiscard]] auto accept_for_read(PulledRow row) -> std::optional<bool>;
    [[nodiscard]] auto committed_schema(std::string_view operation) const -> SchemaPtr;

    [[nodiscard]] auto is_skipped(std::span<const std::string> fields) const -> bool;
    [[nodiscard]] auto parse_values(const SchemaPtr& record_schema, io::RecordFields fields)
        -> std::optional<std::vector<Value>>;
    void report(const RecordProcessingError& error);

    Options options_;
    io::RecordStream stream_;
    SchemaMode mode_;
    SelectorPtr selector_;
    std::function<SchemaPtr(std::span<const std::string>)> resolve_schema_;
    ProcessMetadata metadata_;
    RecordFilter record_filter_;
    ErrorHandler error_handler_;
    std::optional<std::vector<Value>> values_;
    bool end_of_file_ = false;
    bool has_error_ = false;
    bool in_operation_ = false;
};

}  // namespace flatrow
