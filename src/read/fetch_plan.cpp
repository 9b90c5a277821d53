#include "relq/read/fetch_plan.hpp"

#include "relq/core/errors.hpp"
#include "relq/filter/relation_filter.hpp"

#include <algorithm>
#include <deque>
#include <set>
#include <utility>

namespace relq::read {

namespace {

struct PendingLevel final {
    const ReadSpec* spec = nullptr;
    std::optional<std::size_t> parent_step{};
    std::string model{};
    std::size_t level = 1U;
    std::vector<std::string> path{};
};

FetchStrategy strategy_for(const schema::RelationField& relation) noexcept
{
    switch (relation.ownership) {
    case schema::RelationOwnership::Self:
        return FetchStrategy::ParentOwnsKey;
    case schema::RelationOwnership::Target:
        return FetchStrategy::ChildOwnsKey;
    case schema::RelationOwnership::JoinTable:
        return FetchStrategy::JoinTable;
    }
    return FetchStrategy::ChildOwnsKey;
}

bool has_arguments(const IncludeEntry& entry) noexcept
{
    return entry.where != nullptr || !entry.order_by.empty() || entry.take.has_value() || entry.skip != 0U;
}

}  // namespace

FetchPlan compile_fetch_plan(const schema::SchemaModel& schema, std::string_view root_model, const ReadSpec& spec)
{
    FetchPlan plan{};
    plan.root_model = schema.model(root_model).name;

    std::deque<PendingLevel> pending;
    pending.push_back(PendingLevel{&spec, std::nullopt, plan.root_model, 1U, {plan.root_model}});

    while (!pending.empty()) {
        auto current = std::move(pending.front());
        pending.pop_front();

        const auto& parent = schema.model(current.model);
        std::set<std::string> seen;
        for (const auto& entry : current.spec->includes) {
            auto path = current.path;
            path.push_back(entry.relation);

            const auto* relation = parent.find_relation(entry.relation);
            if (relation == nullptr) {
                throw QueryError{make_error_code(RelqErrc::UnknownRelation),
                                 "model '" + parent.name + "' has no relation field '" + entry.relation + "'",
                                 path};
            }
            if (!seen.insert(entry.relation).second) {
                throw QueryError{make_error_code(RelqErrc::MalformedDirective),
                                 "relation '" + parent.name + "." + entry.relation + "' is included twice",
                                 path};
            }
            if (!relation->is_list() && has_arguments(entry)) {
                throw QueryError{make_error_code(RelqErrc::InvalidFilter),
                                 "filter, order and limit only apply to list relations",
                                 path};
            }

            const auto& target = schema.model(relation->target);
            for (const auto& term : entry.order_by) {
                if (target.find_field(term.column) == nullptr) {
                    auto field_path = path;
                    field_path.push_back(term.column);
                    throw QueryError{make_error_code(RelqErrc::UnknownField),
                                     "model '" + target.name + "' has no field '" + term.column + "'",
                                     std::move(field_path)};
                }
            }

            FetchStep step{};
            step.index = plan.steps.size();
            step.level = current.level;
            step.parent_step = current.parent_step;
            step.relation = relation->name;
            step.parent_model = parent.name;
            step.target_model = target.name;
            step.many = relation->is_list();
            step.strategy = strategy_for(*relation);
            step.parent_columns = relation->local_columns;
            step.child_columns = relation->target_columns;
            if (step.strategy == FetchStrategy::JoinTable) {
                step.join_table = relation->join_table;
                step.join_parent_column = relation->join_local_column;
                step.join_child_column = relation->join_target_column;
            }
            step.where = filter::translate_relation_filters(schema, target.name, entry.where);
            step.order_by = entry.order_by;
            step.take = entry.take;
            step.skip = entry.skip;
            step.path = path;

            plan.depth = std::max(plan.depth, step.level);
            plan.steps.push_back(step);

            if (!entry.nested.empty()) {
                pending.push_back(PendingLevel{&entry.nested, step.index, target.name, current.level + 1U, std::move(path)});
            }
        }
    }
    return plan;
}

std::string explain_fetch_plan(const FetchPlan& plan)
{
    std::string text = "level 0: " + plan.root_model + "\n";
    for (const auto& step : plan.steps) {
        text.append("level " + std::to_string(step.level) + ": " + join_path(step.path) + " -> " + step.target_model
                    + " [" + to_string(step.strategy) + (step.many ? ", many" : ", single") + "]");
        if (step.parent_step.has_value()) {
            text.append(" parent #" + std::to_string(*step.parent_step));
        }
        if (step.where && step.where->kind() != query::PredicateKind::True) {
            text.append(" where " + query::describe(step.where));
        }
        text.push_back('\n');
    }
    return text;
}

std::string to_string(FetchStrategy strategy)
{
    switch (strategy) {
    case FetchStrategy::ParentOwnsKey:
        return "parent-owns-key";
    case FetchStrategy::ChildOwnsKey:
        return "child-owns-key";
    case FetchStrategy::JoinTable:
        return "join-table";
    }
    return "unknown";
}

}  // namespace relq::read
