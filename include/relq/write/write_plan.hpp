#pragma once

#include "relq/query/predicate.hpp"
#include "relq/query/value.hpp"
#include "relq/schema/schema_model.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace relq::write {

// Symbolic handle to a logical row; materialized by Lookup or Insert at run time.
struct RowRef final {
    std::uint32_t value = 0U;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0U; }
};

constexpr bool operator==(RowRef lhs, RowRef rhs) noexcept
{
    return lhs.value == rhs.value;
}

constexpr bool operator!=(RowRef lhs, RowRef rhs) noexcept
{
    return !(lhs == rhs);
}

enum class GuardExpectation {
    Found,
    Missing
};

// Runs the operation only when the Lookup of row ended with expect.
struct OperationGuard final {
    RowRef row{};
    GuardExpectation expect = GuardExpectation::Found;
};

enum class PlanOperationKind {
    Lookup,
    Insert,
    Update,
    Delete,
    LinkForeignKey,
    UnlinkForeignKey,
    JoinInsert,
    JoinDelete,
    ReplaceMembership,
    UpdateMany,
    DeleteMany
};

// Foreign key columns of the operation's row copied from another logical row.
struct ForeignKeyBinding final {
    std::vector<std::string> columns{};
    RowRef referenced{};
    std::vector<std::string> referenced_columns{};
    bool nullable = false;
};

struct PlanOperation final {
    PlanOperationKind kind = PlanOperationKind::Lookup;
    std::string table{};
    RowRef row{};
    // Second row of join operations.
    RowRef other{};
    // Lookup: unique selector; empty when the scope alone addresses the row.
    schema::UniqueSelector selector{};
    // Lookup: fail with UniqueTargetNotFound when nothing matches.
    bool required = true;
    query::Row values{};
    std::vector<ForeignKeyBinding> bindings{};
    // UnlinkForeignKey: columns to null. Join operations: {own side, other side}.
    std::vector<std::string> columns{};
    // Join operations: key columns read from row and other.
    std::vector<std::string> referenced_columns{};
    // Relation of scope_parent (Lookup) or row (ReplaceMembership, UpdateMany,
    // DeleteMany) bounding the affected rows.
    const schema::RelationField* relation = nullptr;
    RowRef scope_parent{};
    // ReplaceMembership: linked rows to keep; unmaterialized members are ignored.
    std::vector<RowRef> members{};
    query::PredicatePtr filter{};
    std::vector<OperationGuard> guards{};
    // LinkForeignKey split out of a foreign key cycle.
    bool deferred = false;
    // Insert behind connectOrCreate: a unique conflict means a concurrent
    // writer created the row first.
    bool conflict_means_exists = false;
    std::vector<std::string> path{};
};

struct LogicalRow final {
    std::string model{};
    std::vector<std::string> path{};
};

struct WritePlan final {
    std::string root_model{};
    RowRef root{};
    // rows[ref.value - 1] describes ref.
    std::vector<LogicalRow> rows{};
    std::vector<PlanOperation> operations{};
    std::vector<std::string> diagnostics{};

    [[nodiscard]] const LogicalRow& logical_row(RowRef ref) const { return rows.at(ref.value - 1U); }
};

[[nodiscard]] const char* to_string(PlanOperationKind kind) noexcept;

}  // namespace relq::write
