#pragma once

#include "relq/query/predicate.hpp"
#include "relq/query/query.hpp"
#include "relq/read/read_spec.hpp"
#include "relq/schema/schema_model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relq::read {

enum class FetchStrategy {
    ParentOwnsKey,
    ChildOwnsKey,
    JoinTable
};

// One batched fetch. Children attach to the parent whose parent_columns equal
// their child_columns (through the join table for JoinTable steps).
struct FetchStep final {
    std::size_t index = 0U;
    std::size_t level = 1U;
    std::optional<std::size_t> parent_step{};
    std::string relation{};
    std::string parent_model{};
    std::string target_model{};
    bool many = false;
    FetchStrategy strategy = FetchStrategy::ChildOwnsKey;
    std::vector<std::string> parent_columns{};
    std::vector<std::string> child_columns{};
    std::string join_table{};
    std::string join_parent_column{};
    std::string join_child_column{};
    query::PredicatePtr where{};
    std::vector<query::OrderTerm> order_by{};
    std::optional<std::size_t> take{};
    std::size_t skip = 0U;
    std::vector<std::string> path{};
};

struct FetchPlan final {
    std::string root_model{};
    // Breadth-first: every step of level N precedes the steps of level N + 1.
    std::vector<FetchStep> steps{};
    std::size_t depth = 0U;
};

// Validates spec against the schema and lays out the level-by-level fetches.
// Throws QueryError with UnknownModel, UnknownRelation, UnknownField,
// InvalidFilter or MalformedDirective.
[[nodiscard]] FetchPlan compile_fetch_plan(const schema::SchemaModel& schema,
                                           std::string_view root_model,
                                           const ReadSpec& spec);

[[nodiscard]] std::string explain_fetch_plan(const FetchPlan& plan);
[[nodiscard]] std::string to_string(FetchStrategy strategy);

}  // namespace relq::read
