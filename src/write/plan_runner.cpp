#include "relq/write/plan_runner.hpp"

#include "relq/core/engine_telemetry.hpp"
#include "relq/core/errors.hpp"
#include "relq/filter/relation_filter.hpp"
#include "relq/schema/schema_model.hpp"
#include "relq/txn/transaction_executor.hpp"
#include "relq/write/write_planner.hpp"

#include <utility>

namespace relq::write {

namespace {

using query::Predicate;
using query::PredicatePtr;
using query::Row;

struct OperationFailure final {
    std::size_t index = QueryError::npos;
    std::error_code code{};
    std::string message{};
};

Row null_values(const std::vector<std::string>& columns)
{
    Row values;
    for (const auto& column : columns) {
        values.emplace(column, query::Value{});
    }
    return values;
}

// One attempt of a plan against an open transaction. Rows materialized by
// Lookup and Insert are cached by RowRef so later operations can read their keys.
class PlanRun final {
public:
    PlanRun(const QueryContext& context, const WritePlan& plan, txn::TransactionHandle handle)
        : schema_{context.schema()}
        , executor_{context.executor()}
        , plan_{plan}
        , handle_{handle}
        , rows_(plan.rows.size() + 1U)
        , found_(plan.rows.size() + 1U)
    {
    }

    std::optional<OperationFailure> run()
    {
        for (std::size_t index = 0U; index < plan_.operations.size(); ++index) {
            const auto& operation = plan_.operations[index];
            if (!guards_hold(operation)) {
                continue;
            }
            std::string message;
            if (auto ec = execute(operation, message)) {
                if (message.empty()) {
                    message = ec.message();
                }
                return OperationFailure{index,
                                        ec,
                                        "#" + std::to_string(index) + " " + to_string(operation.kind) + " " + operation.table
                                            + ": " + message};
            }
            ++executed_;
        }
        return std::nullopt;
    }

    std::error_code fetch_root(std::optional<Row>& root)
    {
        const auto* cached_root = cached(plan_.root);
        if (cached_root == nullptr) {
            return {};
        }
        query::Query query{};
        query.table = plan_.root_model;
        query.where = key_predicate(plan_.root_model, *cached_root);
        query.take = 1U;
        std::vector<Row> rows;
        if (auto ec = executor_.query(handle_, query, rows)) {
            return ec;
        }
        if (!rows.empty()) {
            root = std::move(rows.front());
        }
        return {};
    }

    [[nodiscard]] std::size_t executed() const noexcept { return executed_; }

private:
    bool guards_hold(const PlanOperation& operation) const
    {
        for (const auto& guard : operation.guards) {
            const auto& found = found_.at(guard.row.value);
            if (!found.has_value() || *found != (guard.expect == GuardExpectation::Found)) {
                return false;
            }
        }
        return true;
    }

    Row* cached(RowRef ref)
    {
        if (!ref.is_valid() || ref.value >= rows_.size() || !rows_[ref.value].has_value()) {
            return nullptr;
        }
        return &*rows_[ref.value];
    }

    std::error_code unavailable(RowRef ref, std::string& message) const
    {
        const auto& row = plan_.logical_row(ref);
        message = "row r" + std::to_string(ref.value) + " (" + row.model + " @ " + join_path(row.path)
                  + ") was not materialized";
        return make_error_code(RelqErrc::UniqueTargetNotFound);
    }

    PredicatePtr key_predicate(const std::string& table, const Row& row) const
    {
        const auto& key = schema_.primary_key(table);
        return query::match_key(key, query::project(row, key));
    }

    std::error_code run_command(const txn::StorageCommand& command, txn::StorageResult& result)
    {
        return executor_.execute(handle_, command, result);
    }

    std::error_code run_command(const txn::StorageCommand& command)
    {
        txn::StorageResult result{};
        return executor_.execute(handle_, command, result);
    }

    std::error_code execute(const PlanOperation& operation, std::string& message)
    {
        switch (operation.kind) {
        case PlanOperationKind::Lookup:
            return lookup(operation, message);
        case PlanOperationKind::Insert:
            return insert(operation, message);
        case PlanOperationKind::Update:
            return update_row(operation.table, operation.row, operation.values, message);
        case PlanOperationKind::Delete: {
            const auto* row = cached(operation.row);
            if (row == nullptr) {
                return unavailable(operation.row, message);
            }
            return delete_row(operation.table, *row);
        }
        case PlanOperationKind::LinkForeignKey: {
            Row values;
            if (auto ec = bind(operation.bindings, values, message)) {
                return ec;
            }
            return update_row(operation.table, operation.row, values, message);
        }
        case PlanOperationKind::UnlinkForeignKey:
            return update_row(operation.table, operation.row, null_values(operation.columns), message);
        case PlanOperationKind::JoinInsert:
        case PlanOperationKind::JoinDelete:
            return join(operation, message);
        case PlanOperationKind::ReplaceMembership:
            return replace_membership(operation, message);
        case PlanOperationKind::UpdateMany:
        case PlanOperationKind::DeleteMany:
            return apply_many(operation, message);
        }
        return {};
    }

    std::error_code lookup(const PlanOperation& operation, std::string& message)
    {
        std::vector<PredicatePtr> terms{query::match_row(operation.selector)};
        if (operation.relation != nullptr) {
            const auto* parent = cached(operation.scope_parent);
            if (parent == nullptr) {
                return unavailable(operation.scope_parent, message);
            }
            terms.push_back(filter::scope_to_parent(*operation.relation, *parent));
        }

        query::Query query{};
        query.table = operation.table;
        query.where = Predicate::all_of(std::move(terms));
        query.take = 2U;
        std::vector<Row> rows;
        if (auto ec = executor_.query(handle_, query, rows)) {
            return ec;
        }

        if (rows.empty()) {
            found_[operation.row.value] = false;
            if (operation.required) {
                message = "no " + operation.table + " row matches " + query::to_string(operation.selector);
                return make_error_code(RelqErrc::UniqueTargetNotFound);
            }
            return {};
        }
        found_[operation.row.value] = true;
        rows_[operation.row.value] = std::move(rows.front());
        return {};
    }

    std::error_code bind(const std::vector<ForeignKeyBinding>& bindings, Row& values, std::string& message)
    {
        for (const auto& binding : bindings) {
            const auto* referenced = cached(binding.referenced);
            if (referenced == nullptr) {
                return unavailable(binding.referenced, message);
            }
            const auto key = query::project(*referenced, binding.referenced_columns);
            for (std::size_t i = 0U; i < binding.columns.size() && i < key.size(); ++i) {
                values[binding.columns[i]] = key[i];
            }
        }
        return {};
    }

    std::error_code insert(const PlanOperation& operation, std::string& message)
    {
        auto values = operation.values;
        if (auto ec = bind(operation.bindings, values, message)) {
            return ec;
        }
        txn::StorageResult result{};
        if (auto ec = run_command(txn::InsertRow{operation.table, values}, result)) {
            return ec;
        }
        rows_[operation.row.value] = result.inserted_row.has_value() ? std::move(*result.inserted_row) : std::move(values);
        return {};
    }

    std::error_code update_row(const std::string& table, RowRef ref, const Row& values, std::string& message)
    {
        auto* row = cached(ref);
        if (row == nullptr) {
            return unavailable(ref, message);
        }
        if (values.empty()) {
            return {};
        }
        if (auto ec = run_command(txn::UpdateRows{table, key_predicate(table, *row), values})) {
            return ec;
        }
        for (const auto& [column, value] : values) {
            (*row)[column] = value;
        }
        return {};
    }

    // Join rows go first, optional referencing keys are nulled, required
    // ones are left for the executor to reject.
    std::error_code delete_row(const std::string& table, const Row& row)
    {
        for (const auto* relation : schema_.join_relations_of(table)) {
            const auto key = query::project(row, relation->local_columns);
            if (auto ec = run_command(txn::DeleteRows{relation->join_table, query::match_key({relation->join_local_column}, key)})) {
                return ec;
            }
        }
        for (const auto* relation : schema_.referencing_relations(table)) {
            if (!relation->optional) {
                continue;
            }
            const auto key = query::project(row, relation->target_columns);
            if (auto ec = run_command(txn::UpdateRows{relation->model,
                                                      query::match_key(relation->local_columns, key),
                                                      null_values(relation->local_columns)})) {
                return ec;
            }
        }
        return run_command(txn::DeleteRows{table, key_predicate(table, row)});
    }

    std::error_code join(const PlanOperation& operation, std::string& message)
    {
        const auto* left = cached(operation.row);
        if (left == nullptr) {
            return unavailable(operation.row, message);
        }
        const auto* right = cached(operation.other);
        if (right == nullptr) {
            return unavailable(operation.other, message);
        }

        Row link;
        link.emplace(operation.columns.at(0), query::project(*left, {operation.referenced_columns.at(0)}).front());
        link.emplace(operation.columns.at(1), query::project(*right, {operation.referenced_columns.at(1)}).front());

        if (operation.kind == PlanOperationKind::JoinDelete) {
            return run_command(txn::DeleteRows{operation.table, query::match_row(link)});
        }

        query::Query existing{};
        existing.table = operation.table;
        existing.where = query::match_row(link);
        existing.take = 1U;
        std::vector<Row> rows;
        if (auto ec = executor_.query(handle_, existing, rows)) {
            return ec;
        }
        if (!rows.empty()) {
            return {};
        }
        return run_command(txn::InsertRow{operation.table, std::move(link)});
    }

    std::error_code replace_membership(const PlanOperation& operation, std::string& message)
    {
        const auto& relation = *operation.relation;
        const auto* owner = cached(operation.row);
        if (owner == nullptr) {
            return unavailable(operation.row, message);
        }

        switch (relation.ownership) {
        case schema::RelationOwnership::Target: {
            const auto& key = schema_.primary_key(relation.target);
            std::vector<query::KeyTuple> keep;
            for (const auto member : operation.members) {
                if (const auto* row = cached(member)) {
                    keep.push_back(query::project(*row, key));
                }
            }
            auto where = filter::scope_to_parent(relation, *owner);
            if (!keep.empty()) {
                where = Predicate::all_of({where, Predicate::negate(query::match_keys(key, keep))});
            }

            if (!schema_.inverse(relation).optional) {
                query::Query linked{};
                linked.table = relation.target;
                linked.where = where;
                linked.take = 1U;
                std::vector<Row> rows;
                if (auto ec = executor_.query(handle_, linked, rows)) {
                    return ec;
                }
                if (!rows.empty()) {
                    message = "'" + relation.model + "." + relation.name + "' would orphan " + relation.target
                              + " rows whose foreign key is required";
                    return make_error_code(RelqErrc::CardinalityViolation);
                }
                return {};
            }
            return run_command(txn::UpdateRows{relation.target, where, null_values(relation.target_columns)});
        }
        case schema::RelationOwnership::JoinTable: {
            const auto owner_key = query::project(*owner, relation.local_columns);
            std::vector<query::Value> keep;
            for (const auto member : operation.members) {
                if (const auto* row = cached(member)) {
                    keep.push_back(query::project(*row, relation.target_columns).front());
                }
            }
            auto where = query::match_key({relation.join_local_column}, owner_key);
            if (!keep.empty()) {
                where = Predicate::all_of({where, Predicate::not_in(relation.join_target_column, std::move(keep))});
            }
            return run_command(txn::DeleteRows{relation.join_table, where});
        }
        case schema::RelationOwnership::Self:
            break;
        }
        message = "'" + relation.model + "." + relation.name + "' holds its own foreign key and has no membership to replace";
        return make_error_code(RelqErrc::MalformedDirective);
    }

    std::error_code apply_many(const PlanOperation& operation, std::string& message)
    {
        const auto* parent = cached(operation.row);
        if (parent == nullptr) {
            return unavailable(operation.row, message);
        }
        const auto& relation = *operation.relation;
        auto where = Predicate::all_of({filter::scope_to_parent(relation, *parent), operation.filter});

        if (operation.kind == PlanOperationKind::UpdateMany) {
            return run_command(txn::UpdateRows{relation.target, where, operation.values});
        }

        query::Query matched{};
        matched.table = relation.target;
        matched.where = where;
        std::vector<Row> rows;
        if (auto ec = executor_.query(handle_, matched, rows)) {
            return ec;
        }
        for (const auto& row : rows) {
            if (auto ec = delete_row(relation.target, row)) {
                return ec;
            }
        }
        return {};
    }

    const schema::SchemaModel& schema_;
    txn::TransactionExecutor& executor_;
    const WritePlan& plan_;
    txn::TransactionHandle handle_{};
    // Indexed by RowRef::value; slot 0 is unused.
    std::vector<std::optional<Row>> rows_{};
    std::vector<std::optional<bool>> found_{};
    std::size_t executed_ = 0U;
};

}  // namespace

WriteResult run_write_plan(const QueryContext& context, const WritePlan& plan)
{
    auto* telemetry = context.telemetry();
    if (telemetry != nullptr) {
        telemetry->record_write_attempt();
    }

    WriteResult result{};
    result.diagnostics = plan.diagnostics;

    for (;;) {
        ++result.attempts;
        txn::TransactionScope scope{context.executor()};
        if (!scope.handle().is_valid()) {
            if (telemetry != nullptr) {
                telemetry->record_write_failure();
            }
            const auto cause = make_error_code(StorageErrc::TransactionNotActive);
            throw QueryError{make_error_code(RelqErrc::TransactionAborted), "executor refused to begin a transaction", {plan.root_model}, cause};
        }

        PlanRun run{context, plan, scope.handle()};
        auto failure = run.run();
        if (!failure.has_value()) {
            std::optional<Row> root;
            if (context.write_options().return_root_row) {
                if (auto ec = run.fetch_root(root)) {
                    failure = OperationFailure{QueryError::npos, ec, "re-reading the written row failed: " + ec.message()};
                }
            }
            if (!failure.has_value()) {
                if (auto ec = scope.commit()) {
                    failure = OperationFailure{QueryError::npos, ec, "commit failed: " + ec.message()};
                } else {
                    result.row = std::move(root);
                    result.operations_executed = run.executed();
                    if (telemetry != nullptr) {
                        telemetry->record_write_success(result.operations_executed);
                    }
                    return result;
                }
            }
        }

        if (auto ec = scope.rollback()) {
            failure->message += " (rollback failed: " + ec.message() + ")";
        }
        if (telemetry != nullptr) {
            telemetry->record_rollback();
        }

        const bool conflict = failure->index != QueryError::npos
                              && failure->code == make_error_code(StorageErrc::UniqueViolation)
                              && plan.operations[failure->index].conflict_means_exists;
        if (conflict && context.write_options().retry_conflicts_as_connect && result.attempts == 1U) {
            if (telemetry != nullptr) {
                telemetry->record_conflict_retry();
            }
            result.diagnostics.push_back("unique conflict at #" + std::to_string(failure->index) + "; retrying as connect");
            continue;
        }

        if (telemetry != nullptr) {
            telemetry->record_write_failure();
        }
        auto path = failure->index != QueryError::npos ? plan.operations[failure->index].path
                                                       : std::vector<std::string>{plan.root_model};
        throw QueryError{make_error_code(RelqErrc::TransactionAborted), failure->message, std::move(path), failure->code, failure->index};
    }
}

WriteResult execute_write(const QueryContext& context, const WriteRequest& request)
{
    WritePlan plan;
    try {
        plan = plan_write(context.schema(), request);
    } catch (const QueryError&) {
        if (auto* telemetry = context.telemetry()) {
            telemetry->record_write_attempt();
            telemetry->record_write_failure();
        }
        throw;
    }
    return run_write_plan(context, plan);
}

}  // namespace relq::write
