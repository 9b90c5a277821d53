#pragma once

#include "relq/query/predicate.hpp"
#include "relq/schema/schema_model.hpp"

#include <string_view>

namespace relq::filter {

// Lowers every relation condition of predicate (evaluated against model) into
// KeysIn semi-joins so the result only references the model's own columns.
// Throws QueryError with UnknownRelation, UnknownField or InvalidFilter.
[[nodiscard]] query::PredicatePtr translate_relation_filters(const schema::SchemaModel& schema,
                                                             std::string_view model,
                                                             const query::PredicatePtr& predicate);

// "There is a row reachable through relation that satisfies inner". inner must
// already be translated against relation.target.
[[nodiscard]] query::PredicatePtr related_exists(const schema::RelationField& relation, query::PredicatePtr inner);

// Predicate on relation.target selecting the rows linked to parent_row.
[[nodiscard]] query::PredicatePtr scope_to_parent(const schema::RelationField& relation, const query::Row& parent_row);

}  // namespace relq::filter
