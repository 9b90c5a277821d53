#include "relq/chain/fluent_chain.hpp"

#include "relq/core/engine_telemetry.hpp"
#include "relq/core/errors.hpp"
#include "relq/filter/relation_filter.hpp"
#include "relq/txn/transaction_executor.hpp"

#include <utility>

namespace relq::chain {

namespace {

using query::Predicate;
using query::PredicatePtr;

std::string to_string(AnchorCardinality cardinality)
{
    return cardinality == AnchorCardinality::Many ? "many" : "single";
}

bool has_arguments(const ChainStep& step) noexcept
{
    return step.where != nullptr || !step.order_by.empty() || step.take.has_value() || step.skip != 0U;
}

std::vector<query::Row> run_query(txn::TransactionExecutor& executor, const query::Query& query, const std::vector<std::string>& path)
{
    std::vector<query::Row> rows;
    txn::TransactionScope scope{executor};
    if (auto ec = executor.query(scope.handle(), query, rows)) {
        throw QueryError{make_error_code(RelqErrc::TransactionAborted), "chain query failed: " + ec.message(), path, ec};
    }
    if (auto ec = scope.commit()) {
        throw QueryError{make_error_code(RelqErrc::TransactionAborted), "chain read commit failed: " + ec.message(), path, ec};
    }
    return rows;
}

}  // namespace

FluentChain& FluentChain::then(std::string relation, query::PredicatePtr where)
{
    ChainStep step{};
    step.relation = std::move(relation);
    step.where = std::move(where);
    steps.push_back(std::move(step));
    return *this;
}

ChainPlan compile_chain(const schema::SchemaModel& schema, const FluentChain& chain)
{
    const auto& root = schema.model(chain.model);
    std::vector<std::string> path{root.name};

    if (!schema.is_unique_selector(root.name, chain.root)) {
        throw QueryError{make_error_code(RelqErrc::InvalidSelector),
                         "root locator " + query::to_string(chain.root) + " does not address a unique constraint of '"
                             + root.name + "'",
                         path};
    }

    ChainPlan plan{};
    plan.root_model = root.name;
    plan.final_model = root.name;
    plan.root_query.table = root.name;
    plan.root_query.where = query::match_row(chain.root);
    plan.root_query.take = 1U;

    auto anchor = AnchorCardinality::Single;
    const auto* current = &root;
    for (std::size_t i = 0U; i < chain.steps.size(); ++i) {
        const auto& step = chain.steps[i];
        path.push_back(step.relation);

        if (anchor == AnchorCardinality::Many) {
            throw QueryError{make_error_code(RelqErrc::ChainCardinality),
                             "cannot traverse '" + step.relation + "' from a list of '" + current->name + "' rows",
                             path};
        }
        const auto* relation = current->find_relation(step.relation);
        if (relation == nullptr) {
            throw QueryError{make_error_code(RelqErrc::UnknownRelation),
                             "model '" + current->name + "' has no relation field '" + step.relation + "'",
                             path};
        }

        anchor = relation->is_list() ? AnchorCardinality::Many : AnchorCardinality::Single;
        const bool last = i + 1U == chain.steps.size();
        if (has_arguments(step) && (!last || anchor != AnchorCardinality::Many)) {
            throw QueryError{make_error_code(RelqErrc::ChainCardinality),
                             "relation arguments on '" + current->name + "." + step.relation
                                 + "' require a final list relation",
                             path};
        }

        plan.trace.push_back(ChainStepTrace{current->name, relation->name, relation->target, anchor});
        plan.inverse_path.insert(plan.inverse_path.begin(), &schema.inverse(*relation));
        current = &schema.model(relation->target);

        if (last) {
            plan.final_filter = filter::translate_relation_filters(schema, current->name, step.where);
            plan.order_by = step.order_by;
            plan.take = step.take;
            plan.skip = step.skip;
        }
    }

    plan.result_cardinality = anchor;
    plan.final_model = current->name;
    if (!plan.trace.empty()) {
        plan.target_query = bind_target_query(schema, plan, plan.root_query.where);
    }
    return plan;
}

query::Query bind_target_query(const schema::SchemaModel& schema, const ChainPlan& plan, const PredicatePtr& root_predicate)
{
    // Walk back from the root: each inverse relation lifts the predicate one
    // model further along the chain.
    PredicatePtr predicate = root_predicate;
    for (auto it = plan.inverse_path.rbegin(); it != plan.inverse_path.rend(); ++it) {
        const auto* inverse = *it;
        const auto quantifier = inverse->is_list() ? query::RelationQuantifier::Some : query::RelationQuantifier::Is;
        predicate = Predicate::related(inverse->name, quantifier, std::move(predicate));
    }

    query::Query query{};
    query.table = plan.final_model;
    query.where = Predicate::all_of(
        {filter::translate_relation_filters(schema, plan.final_model, predicate), plan.final_filter});
    query.order_by = plan.order_by;
    query.skip = plan.skip;
    query.take = plan.result_cardinality == AnchorCardinality::Single ? std::optional<std::size_t>{1U} : plan.take;
    return query;
}

ChainResult resolve_chain(const QueryContext& context, const FluentChain& chain)
{
    auto* telemetry = context.telemetry();
    ChainPlan plan{};
    try {
        plan = compile_chain(context.schema(), chain);
    } catch (const QueryError&) {
        if (telemetry != nullptr) {
            telemetry->record_chain_rejected();
        }
        throw;
    }

    ChainResult result{};
    result.many = plan.result_cardinality == AnchorCardinality::Many;
    const std::vector<std::string> path{plan.root_model};

    auto roots = run_query(context.executor(), plan.root_query, path);
    ++result.queries_issued;
    result.diagnostics.push_back("root " + plan.root_model + " matched " + std::to_string(roots.size()) + " row(s)");

    if (!plan.target_query.has_value() || roots.empty()) {
        if (!plan.target_query.has_value()) {
            result.rows = std::move(roots);
        }
        if (telemetry != nullptr) {
            telemetry->record_chain_resolved();
        }
        return result;
    }

    const auto& primary_key = context.schema().primary_key(plan.root_model);
    query::Row identity;
    for (const auto& column : primary_key) {
        identity[column] = roots.front().at(column);
    }

    const auto target = bind_target_query(context.schema(), plan, query::match_row(identity));
    result.rows = run_query(context.executor(), target, path);
    ++result.queries_issued;
    result.diagnostics.push_back(plan.final_model + " fetch returned " + std::to_string(result.rows.size())
                                 + " row(s)");

    if (telemetry != nullptr) {
        telemetry->record_chain_resolved();
    }
    return result;
}

std::string explain_chain(const ChainPlan& plan)
{
    std::string text = "root: " + query::describe(plan.root_query) + "\n";
    for (std::size_t i = 0U; i < plan.trace.size(); ++i) {
        const auto& step = plan.trace[i];
        text.append("step " + std::to_string(i + 1U) + ": " + step.source_model + "." + step.relation + " -> "
                    + step.target_model + " (" + to_string(step.cardinality) + ")\n");
    }
    if (plan.target_query.has_value()) {
        text.append("target: " + query::describe(*plan.target_query) + "\n");
    }
    return text;
}

}  // namespace relq::chain
