#include "relq/write/plan_printer.hpp"

#include "relq/core/errors.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace relq::write {

namespace {

std::string join_columns(const std::vector<std::string>& columns)
{
    std::ostringstream oss;
    oss << "(";
    for (std::size_t i = 0U; i < columns.size(); ++i) {
        if (i > 0U) {
            oss << ", ";
        }
        oss << columns[i];
    }
    oss << ")";
    return oss.str();
}

std::string ref(RowRef row)
{
    return "r" + std::to_string(row.value);
}

}  // namespace

const char* to_string(PlanOperationKind kind) noexcept
{
    switch (kind) {
    case PlanOperationKind::Lookup:
        return "Lookup";
    case PlanOperationKind::Insert:
        return "Insert";
    case PlanOperationKind::Update:
        return "Update";
    case PlanOperationKind::Delete:
        return "Delete";
    case PlanOperationKind::LinkForeignKey:
        return "LinkForeignKey";
    case PlanOperationKind::UnlinkForeignKey:
        return "UnlinkForeignKey";
    case PlanOperationKind::JoinInsert:
        return "JoinInsert";
    case PlanOperationKind::JoinDelete:
        return "JoinDelete";
    case PlanOperationKind::ReplaceMembership:
        return "ReplaceMembership";
    case PlanOperationKind::UpdateMany:
        return "UpdateMany";
    case PlanOperationKind::DeleteMany:
        return "DeleteMany";
    }
    return "Unknown";
}

std::string describe_operation(const PlanOperation& operation)
{
    std::ostringstream oss;
    oss << to_string(operation.kind) << " " << operation.table << " " << ref(operation.row);
    if (operation.other.is_valid()) {
        oss << " " << ref(operation.other);
    }
    if (!operation.selector.empty()) {
        oss << " where " << query::to_string(operation.selector);
    }
    if (operation.scope_parent.is_valid() && operation.relation != nullptr) {
        oss << " within " << ref(operation.scope_parent) << "." << operation.relation->name;
    }
    if (operation.kind == PlanOperationKind::Lookup && !operation.required) {
        oss << " optional";
    }
    if (!operation.values.empty()) {
        oss << " set " << query::to_string(operation.values);
    }
    for (const auto& binding : operation.bindings) {
        oss << " bind " << join_columns(binding.columns) << "<-" << ref(binding.referenced) << "."
            << join_columns(binding.referenced_columns);
    }
    if (operation.kind == PlanOperationKind::UnlinkForeignKey) {
        oss << " null " << join_columns(operation.columns);
    }
    if (!operation.scope_parent.is_valid() && operation.relation != nullptr) {
        oss << " via " << operation.relation->name;
    }
    if (operation.kind == PlanOperationKind::ReplaceMembership) {
        oss << " keep [";
        for (std::size_t i = 0U; i < operation.members.size(); ++i) {
            if (i > 0U) {
                oss << ", ";
            }
            oss << ref(operation.members[i]);
        }
        oss << "]";
    }
    if (operation.filter && operation.filter->kind() != query::PredicateKind::True) {
        oss << " filter " << query::describe(operation.filter);
    }
    if (operation.deferred) {
        oss << " deferred";
    }
    if (operation.conflict_means_exists) {
        oss << " on-conflict:connect";
    }
    for (const auto& guard : operation.guards) {
        oss << " if " << ref(guard.row) << (guard.expect == GuardExpectation::Found ? " found" : " missing");
    }
    return oss.str();
}

std::string explain_write_plan(const WritePlan& plan, WritePlanPrinterOptions options)
{
    std::ostringstream oss;
    if (options.include_rows) {
        for (std::size_t i = 0U; i < plan.rows.size(); ++i) {
            oss << "r" << (i + 1U) << " " << plan.rows[i].model;
            if (options.include_paths) {
                oss << " @ " << join_path(plan.rows[i].path);
            }
            oss << "\n";
        }
    }
    for (std::size_t i = 0U; i < plan.operations.size(); ++i) {
        const auto& operation = plan.operations[i];
        oss << "#" << i << " " << describe_operation(operation);
        if (options.include_paths && !operation.path.empty()) {
            oss << " @ " << join_path(operation.path);
        }
        oss << "\n";
    }
    return oss.str();
}

}  // namespace relq::write
