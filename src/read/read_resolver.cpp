#include "relq/read/read_resolver.hpp"

#include "relq/core/engine_telemetry.hpp"
#include "relq/core/errors.hpp"
#include "relq/filter/relation_filter.hpp"
#include "relq/read/fetch_plan.hpp"
#include "relq/txn/transaction_executor.hpp"

#include <algorithm>
#include <cstddef>
#include <future>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

namespace relq::read {

namespace {

using query::KeyTuple;
using query::Row;

using KeySet = std::set<KeyTuple, query::KeyTupleLess>;

// Rows fetched by one step plus, for every parent row, the indices of its
// children in fetch order.
struct StepRows final {
    std::vector<Row> rows{};
    std::vector<std::vector<std::size_t>> children{};
    std::size_t queries = 0U;
    std::string diagnostic{};
};

std::vector<Row> run_query(txn::TransactionExecutor& executor,
                           txn::TransactionHandle handle,
                           const query::Query& query,
                           const std::vector<std::string>& path)
{
    std::vector<Row> rows;
    if (auto ec = executor.query(handle, query, rows)) {
        throw QueryError{make_error_code(RelqErrc::TransactionAborted),
                         "read of '" + query.table + "' failed: " + ec.message(),
                         path,
                         ec};
    }
    return rows;
}

std::vector<KeyTuple> distinct_keys(const std::vector<Row>& rows, const std::vector<std::string>& columns)
{
    KeySet seen;
    std::vector<KeyTuple> keys;
    for (const auto& row : rows) {
        auto key = query::project(row, columns);
        if (query::has_null(key) || !seen.insert(key).second) {
            continue;
        }
        keys.push_back(std::move(key));
    }
    return keys;
}

void apply_window(const FetchStep& step, std::vector<std::size_t>& children)
{
    if (step.skip > 0U) {
        const auto skip = std::min(step.skip, children.size());
        children.erase(children.begin(), children.begin() + static_cast<std::ptrdiff_t>(skip));
    }
    if (step.take.has_value() && children.size() > *step.take) {
        children.resize(*step.take);
    }
    if (!step.many && children.size() > 1U) {
        children.resize(1U);
    }
}

StepRows fetch_step(txn::TransactionExecutor& executor,
                    txn::TransactionHandle handle,
                    const FetchStep& step,
                    const std::vector<Row>& parents)
{
    StepRows result{};
    result.children.resize(parents.size());

    const auto parent_keys = distinct_keys(parents, step.parent_columns);
    if (parent_keys.empty()) {
        result.diagnostic = join_path(step.path) + ": no parent keys, fetch skipped";
        return result;
    }

    if (step.strategy != FetchStrategy::JoinTable) {
        query::Query query{};
        query.table = step.target_model;
        query.where = query::Predicate::all_of({query::match_keys(step.child_columns, parent_keys), step.where});
        query.order_by = step.order_by;
        result.rows = run_query(executor, handle, query, step.path);
        result.queries = 1U;

        std::map<KeyTuple, std::vector<std::size_t>, query::KeyTupleLess> by_key;
        for (std::size_t i = 0U; i < result.rows.size(); ++i) {
            by_key[query::project(result.rows[i], step.child_columns)].push_back(i);
        }
        for (std::size_t p = 0U; p < parents.size(); ++p) {
            const auto key = query::project(parents[p], step.parent_columns);
            if (query::has_null(key)) {
                continue;
            }
            const auto found = by_key.find(key);
            if (found != by_key.end()) {
                result.children[p] = found->second;
                apply_window(step, result.children[p]);
            }
        }
    } else {
        query::Query links{};
        links.table = step.join_table;
        links.where = query::match_keys({step.join_parent_column}, parent_keys);
        const auto link_rows = run_query(executor, handle, links, step.path);

        std::map<KeyTuple, KeySet, query::KeyTupleLess> targets_of;
        std::vector<KeyTuple> target_keys;
        KeySet seen;
        for (const auto& link : link_rows) {
            auto target_key = query::project(link, {step.join_child_column});
            targets_of[query::project(link, {step.join_parent_column})].insert(target_key);
            if (seen.insert(target_key).second) {
                target_keys.push_back(std::move(target_key));
            }
        }
        result.queries = 1U;

        if (!target_keys.empty()) {
            query::Query query{};
            query.table = step.target_model;
            query.where = query::Predicate::all_of({query::match_keys(step.child_columns, target_keys), step.where});
            query.order_by = step.order_by;
            result.rows = run_query(executor, handle, query, step.path);
            ++result.queries;
        }

        for (std::size_t p = 0U; p < parents.size(); ++p) {
            const auto found = targets_of.find(query::project(parents[p], step.parent_columns));
            if (found == targets_of.end()) {
                continue;
            }
            for (std::size_t i = 0U; i < result.rows.size(); ++i) {
                if (found->second.count(query::project(result.rows[i], step.child_columns)) != 0U) {
                    result.children[p].push_back(i);
                }
            }
            apply_window(step, result.children[p]);
        }
    }

    result.diagnostic = join_path(step.path) + ": " + to_string(step.strategy) + " fetched "
                        + std::to_string(result.rows.size()) + " row(s) for " + std::to_string(parents.size())
                        + " parent(s)";
    return result;
}

class Assembler final {
public:
    Assembler(const FetchPlan& plan, const std::vector<Row>& roots, const std::vector<StepRows>& steps)
        : plan_{plan}
        , roots_{roots}
        , steps_{steps}
        , root_children_{}
        , step_children_(plan.steps.size())
    {
        for (const auto& step : plan.steps) {
            if (step.parent_step.has_value()) {
                step_children_[*step.parent_step].push_back(step.index);
            } else {
                root_children_.push_back(step.index);
            }
        }
    }

    std::vector<ResultRecord> build() const
    {
        std::vector<ResultRecord> records;
        records.reserve(roots_.size());
        for (std::size_t i = 0U; i < roots_.size(); ++i) {
            records.push_back(make_record(roots_[i], root_children_, i));
        }
        return records;
    }

private:
    ResultRecord make_record(const Row& row, const std::vector<std::size_t>& child_steps, std::size_t row_index) const
    {
        ResultRecord record{};
        record.fields = row;
        record.relations.reserve(child_steps.size());
        for (const auto step_index : child_steps) {
            const auto& step = plan_.steps[step_index];
            const auto& fetched = steps_[step_index];
            RelationResult relation{};
            relation.relation = step.relation;
            relation.many = step.many;
            if (row_index < fetched.children.size()) {
                for (const auto child : fetched.children[row_index]) {
                    relation.records.push_back(make_record(fetched.rows[child], step_children_[step_index], child));
                }
            }
            record.relations.push_back(std::move(relation));
        }
        return record;
    }

    const FetchPlan& plan_;
    const std::vector<Row>& roots_;
    const std::vector<StepRows>& steps_;
    std::vector<std::size_t> root_children_;
    std::vector<std::vector<std::size_t>> step_children_;
};

}  // namespace

RootFetch RootFetch::find_many(std::string model, query::PredicatePtr where)
{
    RootFetch fetch{};
    fetch.model = std::move(model);
    fetch.where = std::move(where);
    return fetch;
}

RootFetch RootFetch::find_unique(std::string model, const schema::UniqueSelector& selector)
{
    RootFetch fetch{};
    fetch.model = std::move(model);
    fetch.where = query::match_row(selector);
    fetch.single = true;
    return fetch;
}

const RelationResult* ResultRecord::find(std::string_view relation) const noexcept
{
    for (const auto& entry : relations) {
        if (entry.relation == relation) {
            return &entry;
        }
    }
    return nullptr;
}

const ResultRecord* ResultRecord::one(std::string_view relation) const
{
    const auto* entry = find(relation);
    if (entry == nullptr) {
        throw std::out_of_range{"relation '" + std::string{relation} + "' was not included"};
    }
    return entry->records.empty() ? nullptr : &entry->records.front();
}

const std::vector<ResultRecord>& ResultRecord::many(std::string_view relation) const
{
    const auto* entry = find(relation);
    if (entry == nullptr) {
        throw std::out_of_range{"relation '" + std::string{relation} + "' was not included"};
    }
    return entry->records;
}

ReadResult resolve_read(const QueryContext& context, const RootFetch& root, const ReadSpec& spec)
{
    const auto& schema = context.schema();
    const auto plan = compile_fetch_plan(schema, root.model, spec);

    query::Query root_query{};
    root_query.table = plan.root_model;
    root_query.where = filter::translate_relation_filters(schema, plan.root_model, root.where);
    root_query.order_by = root.order_by;
    root_query.skip = root.skip;
    root_query.take = root.single ? std::optional<std::size_t>{1U} : root.take;

    auto& executor = context.executor();
    txn::TransactionScope scope{executor};
    const std::vector<std::string> root_path{plan.root_model};

    ReadResult result{};
    const auto roots = run_query(executor, scope.handle(), root_query, root_path);
    result.queries_issued = 1U;
    result.levels = 1U;
    result.diagnostics.push_back("level 0: " + plan.root_model + " fetched " + std::to_string(roots.size()) + " row(s)");

    std::vector<StepRows> fetched(plan.steps.size());
    const auto parents_of = [&](const FetchStep& step) -> const std::vector<Row>& {
        return step.parent_step.has_value() ? fetched[*step.parent_step].rows : roots;
    };

    std::size_t begin = 0U;
    while (begin < plan.steps.size()) {
        const auto level = plan.steps[begin].level;
        auto end = begin;
        while (end < plan.steps.size() && plan.steps[end].level == level) {
            ++end;
        }

        if (context.read_options().parallel_relations && end - begin > 1U) {
            std::vector<std::future<StepRows>> futures;
            futures.reserve(end - begin);
            for (auto i = begin; i < end; ++i) {
                const auto& step = plan.steps[i];
                futures.push_back(std::async(std::launch::async, [&executor, &scope, &step, &parents = parents_of(step)] {
                    return fetch_step(executor, scope.handle(), step, parents);
                }));
            }
            for (auto i = begin; i < end; ++i) {
                fetched[i] = futures[i - begin].get();
            }
        } else {
            for (auto i = begin; i < end; ++i) {
                fetched[i] = fetch_step(executor, scope.handle(), plan.steps[i], parents_of(plan.steps[i]));
            }
        }

        for (auto i = begin; i < end; ++i) {
            result.queries_issued += fetched[i].queries;
            result.diagnostics.push_back("level " + std::to_string(level) + ": " + fetched[i].diagnostic);
        }
        ++result.levels;
        begin = end;
    }

    if (auto ec = scope.commit()) {
        throw QueryError{make_error_code(RelqErrc::TransactionAborted), "read commit failed: " + ec.message(), root_path, ec};
    }

    result.records = Assembler{plan, roots, fetched}.build();
    if (auto* telemetry = context.telemetry()) {
        telemetry->record_read(result.levels, result.queries_issued - 1U);
    }
    return result;
}

}  // namespace relq::read
