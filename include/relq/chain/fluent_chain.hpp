#pragma once

#include "relq/core/query_context.hpp"
#include "relq/query/predicate.hpp"
#include "relq/query/query.hpp"
#include "relq/schema/schema_model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace relq::chain {

struct ChainStep final {
    std::string relation{};
    // Relation filter on the target model; only valid on a final many step.
    query::PredicatePtr where{};
    std::vector<query::OrderTerm> order_by{};
    std::optional<std::size_t> take{};
    std::size_t skip = 0U;
};

// root locator followed by relation traversals, e.g. user(email).posts().
struct FluentChain final {
    std::string model{};
    schema::UniqueSelector root{};
    std::vector<ChainStep> steps{};

    FluentChain& then(std::string relation, query::PredicatePtr where = {});
};

enum class AnchorCardinality {
    Single,
    Many
};

struct ChainStepTrace final {
    std::string source_model{};
    std::string relation{};
    std::string target_model{};
    AnchorCardinality cardinality = AnchorCardinality::Single;
};

struct ChainPlan final {
    query::Query root_query{};
    // Present for non-empty chains; addressed through the root selector.
    std::optional<query::Query> target_query{};
    std::vector<ChainStepTrace> trace{};
    AnchorCardinality result_cardinality = AnchorCardinality::Single;
    std::string root_model{};
    std::string final_model{};
    // Inverse of each step, innermost (pointing back at the root) first.
    std::vector<const schema::RelationField*> inverse_path{};
    query::PredicatePtr final_filter{};
    std::vector<query::OrderTerm> order_by{};
    std::optional<std::size_t> take{};
    std::size_t skip = 0U;
};

struct ChainResult final {
    bool many = false;
    std::vector<query::Row> rows{};
    std::size_t queries_issued = 0U;
    std::vector<std::string> diagnostics{};
};

// Validates the chain without touching storage. Throws QueryError with
// ChainCardinality, UnknownModel, UnknownRelation, InvalidSelector or
// InvalidFilter.
[[nodiscard]] ChainPlan compile_chain(const schema::SchemaModel& schema, const FluentChain& chain);

// Query (b) with the root row addressed by root_predicate.
[[nodiscard]] query::Query bind_target_query(const schema::SchemaModel& schema,
                                             const ChainPlan& plan,
                                             const query::PredicatePtr& root_predicate);

// Runs the root lookup and the target fetch as two separate transactions.
[[nodiscard]] ChainResult resolve_chain(const QueryContext& context, const FluentChain& chain);

[[nodiscard]] std::string explain_chain(const ChainPlan& plan);

}  // namespace relq::chain
