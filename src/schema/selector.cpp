#include <flatrow/schema/selector.hpp>

#include <flatrow/core/error.hpp>

#include <utility>

namespace flatrow::schema {

auto SchemaSelector::when(SchemaPredicate predicate, std::shared_ptr<const Schema> schema)
    -> SchemaSelector& {
    if (!predicate) {
        throw ConfigurationError("schema selector rule needs a predicate");
    }
    if (schema == nullptr) {
        throw ConfigurationError("schema selector rule needs a schema");
    }
    rules_.push_back(Rule{.predicate = std::move(predicate), .schema = std::move(schema)});
    return *this;
}

auto SchemaSelector::with_default(std::shared_ptr<const Schema> schema) -> SchemaSelector& {
    default_ = std::move(schema);
    return *this;
}

auto SchemaSelector::select(std::span<const std::string> fields) const
    -> std::shared_ptr<const Schema> {
    for (const auto& rule : rules_) {
        if (rule.predicate(fields)) {
            return rule.schema;
        }
    }
    return default_;
}

}  // namespace flatrow::schema
