#pragma once

#include "relq/query/value.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relq::query {

enum class PredicateKind {
    True,
    False,
    Comparison,
    And,
    Or,
    Not,
    Relation,
    KeysIn
};

enum class ComparisonOp {
    Equal,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    In,
    NotIn,
    IsNull,
    IsNotNull
};

enum class RelationQuantifier {
    Some,
    Every,
    None,
    Is,
    IsNot
};

class Predicate;
using PredicatePtr = std::shared_ptr<const Predicate>;

struct ComparisonTerm final {
    std::string column{};
    ComparisonOp op = ComparisonOp::Equal;
    Value value{};
    std::vector<Value> values{};
};

// Untranslated condition expressed through a relation field of the owning model.
struct RelationTerm final {
    std::string relation{};
    RelationQuantifier quantifier = RelationQuantifier::Some;
    PredicatePtr inner{};
};

struct Subquery final {
    std::string table{};
    std::vector<std::string> projected_columns{};
    PredicatePtr where{};
};

// (columns...) IN (SELECT projected_columns FROM table WHERE ...). A row whose
// local columns contain a null never matches.
struct KeysInTerm final {
    std::vector<std::string> columns{};
    Subquery subquery{};
};

class Predicate final {
public:
    explicit Predicate(PredicateKind kind, std::vector<PredicatePtr> children = {});

    [[nodiscard]] PredicateKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::vector<PredicatePtr>& children() const noexcept { return children_; }
    [[nodiscard]] const ComparisonTerm& comparison() const noexcept { return comparison_; }
    [[nodiscard]] const RelationTerm& relation() const noexcept { return relation_; }
    [[nodiscard]] const KeysInTerm& keys_in() const noexcept { return keys_in_; }

    static PredicatePtr always_true();
    static PredicatePtr always_false();
    static PredicatePtr compare(std::string column, ComparisonOp op, Value value);
    static PredicatePtr equals(std::string column, Value value);
    static PredicatePtr in(std::string column, std::vector<Value> values);
    static PredicatePtr not_in(std::string column, std::vector<Value> values);
    static PredicatePtr is_null(std::string column);
    static PredicatePtr is_not_null(std::string column);
    static PredicatePtr all_of(std::vector<PredicatePtr> children);
    static PredicatePtr any_of(std::vector<PredicatePtr> children);
    static PredicatePtr negate(PredicatePtr child);
    static PredicatePtr related(std::string relation, RelationQuantifier quantifier, PredicatePtr inner = {});
    static PredicatePtr keys_in(std::vector<std::string> columns, Subquery subquery);

private:
    PredicateKind kind_ = PredicateKind::True;
    std::vector<PredicatePtr> children_{};
    ComparisonTerm comparison_{};
    RelationTerm relation_{};
    KeysInTerm keys_in_{};
};

// Conjunction of column == value for every entry of row.
[[nodiscard]] PredicatePtr match_row(const Row& row);
[[nodiscard]] PredicatePtr match_key(const std::vector<std::string>& columns, const KeyTuple& key);

// Disjunction over the tuples (single columns collapse to IN).
[[nodiscard]] PredicatePtr match_keys(const std::vector<std::string>& columns, const std::vector<KeyTuple>& keys);

[[nodiscard]] bool contains_relation_terms(const PredicatePtr& predicate);
[[nodiscard]] std::string describe(const PredicatePtr& predicate);
[[nodiscard]] std::string to_string(ComparisonOp op);
[[nodiscard]] std::string to_string(RelationQuantifier quantifier);

}  // namespace relq::query
