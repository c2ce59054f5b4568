#pragma once

#include <flatrow/core/options.hpp>

#include <cstddef>
#include <memory>

namespace flatrow {

namespace schema {
class Schema;
}

/// Per-session reading state, also handed to columns as their parse context.
struct ProcessMetadata {
    /// Committed schema; null when none is defined or a selector picks one per record.
    std::shared_ptr<const schema::Schema> schema;
    const Options* options = nullptr;
    /// Rows consumed from the tokenizer, header, filtered and malformed rows included.
    std::size_t physical_record_count = 0;
    /// Rows handed back to the caller by successful reads.
    std::size_t logical_record_count = 0;
};

}  // namespace flatrow
