#pragma once

#include <flatrow/schema/schema.hpp>

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace flatrow::schema {

using SchemaPredicate = std::function<bool(std::span<const std::string>)>;

/// Picks a schema per record from its raw fields, for streams that mix record
/// layouts (e.g. header, detail and trailer rows).
///
///   SchemaSelector selector;
///   selector.when([](auto fields) { return fields[0] == "H"; }, header_schema)
///       .when([](auto fields) { return fields[0] == "D"; }, detail_schema);
class SchemaSelector {
   public:
    /// Rules are tried in registration order; the first matching one wins.
    auto when(SchemaPredicate predicate, std::shared_ptr<const Schema> schema) -> SchemaSelector&;

    /// Schema used when no rule matches. Without one, unmatched records are
    /// returned as raw strings.
    auto with_default(std::shared_ptr<const Schema> schema) -> SchemaSelector&;

    [[nodiscard]] auto select(std::span<const std::string> fields) const
        -> std::shared_ptr<const Schema>;

   private:
    struct Rule {
        SchemaPredicate predicate;
        std::shared_ptr<const Schema> schema;
    };

    std::vector<Rule> rules_;
    std::shared_ptr<const Schema> default_;
};

}  // namespace flatrow::schema
