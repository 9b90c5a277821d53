#include "relq/query/predicate.hpp"

#include <stdexcept>
#include <utility>

namespace relq::query {

namespace {

std::string join(const std::vector<std::string>& values)
{
    std::string text;
    for (std::size_t i = 0U; i < values.size(); ++i) {
        if (i > 0U) {
            text.append(", ");
        }
        text.append(values[i]);
    }
    return text;
}

std::string describe_values(const std::vector<Value>& values)
{
    std::string text{"["};
    for (std::size_t i = 0U; i < values.size(); ++i) {
        if (i > 0U) {
            text.append(", ");
        }
        text.append(to_string(values[i]));
    }
    text.push_back(']');
    return text;
}

std::string describe_children(const std::vector<PredicatePtr>& children, const char* separator)
{
    std::string text{"("};
    for (std::size_t i = 0U; i < children.size(); ++i) {
        if (i > 0U) {
            text.append(separator);
        }
        text.append(describe(children[i]));
    }
    text.push_back(')');
    return text;
}

}  // namespace

Predicate::Predicate(PredicateKind kind, std::vector<PredicatePtr> children)
    : kind_{kind}
    , children_{std::move(children)}
{
}

PredicatePtr Predicate::always_true()
{
    return std::make_shared<const Predicate>(PredicateKind::True);
}

PredicatePtr Predicate::always_false()
{
    return std::make_shared<const Predicate>(PredicateKind::False);
}

PredicatePtr Predicate::compare(std::string column, ComparisonOp op, Value value)
{
    auto predicate = std::make_shared<Predicate>(PredicateKind::Comparison);
    predicate->comparison_.column = std::move(column);
    predicate->comparison_.op = op;
    predicate->comparison_.value = std::move(value);
    return predicate;
}

PredicatePtr Predicate::equals(std::string column, Value value)
{
    return compare(std::move(column), ComparisonOp::Equal, std::move(value));
}

PredicatePtr Predicate::in(std::string column, std::vector<Value> values)
{
    auto predicate = std::make_shared<Predicate>(PredicateKind::Comparison);
    predicate->comparison_.column = std::move(column);
    predicate->comparison_.op = ComparisonOp::In;
    predicate->comparison_.values = std::move(values);
    return predicate;
}

PredicatePtr Predicate::not_in(std::string column, std::vector<Value> values)
{
    auto predicate = std::make_shared<Predicate>(PredicateKind::Comparison);
    predicate->comparison_.column = std::move(column);
    predicate->comparison_.op = ComparisonOp::NotIn;
    predicate->comparison_.values = std::move(values);
    return predicate;
}

PredicatePtr Predicate::is_null(std::string column)
{
    return compare(std::move(column), ComparisonOp::IsNull, Value{});
}

PredicatePtr Predicate::is_not_null(std::string column)
{
    return compare(std::move(column), ComparisonOp::IsNotNull, Value{});
}

PredicatePtr Predicate::all_of(std::vector<PredicatePtr> children)
{
    std::vector<PredicatePtr> kept;
    kept.reserve(children.size());
    for (auto& child : children) {
        if (!child || child->kind() == PredicateKind::True) {
            continue;
        }
        if (child->kind() == PredicateKind::False) {
            return always_false();
        }
        kept.push_back(std::move(child));
    }
    if (kept.empty()) {
        return always_true();
    }
    if (kept.size() == 1U) {
        return kept.front();
    }
    return std::make_shared<const Predicate>(PredicateKind::And, std::move(kept));
}

PredicatePtr Predicate::any_of(std::vector<PredicatePtr> children)
{
    std::vector<PredicatePtr> kept;
    kept.reserve(children.size());
    for (auto& child : children) {
        if (!child || child->kind() == PredicateKind::True) {
            return always_true();
        }
        if (child->kind() == PredicateKind::False) {
            continue;
        }
        kept.push_back(std::move(child));
    }
    if (kept.empty()) {
        return always_false();
    }
    if (kept.size() == 1U) {
        return kept.front();
    }
    return std::make_shared<const Predicate>(PredicateKind::Or, std::move(kept));
}

PredicatePtr Predicate::negate(PredicatePtr child)
{
    if (!child || child->kind() == PredicateKind::True) {
        return always_false();
    }
    if (child->kind() == PredicateKind::False) {
        return always_true();
    }
    return std::make_shared<const Predicate>(PredicateKind::Not, std::vector<PredicatePtr>{std::move(child)});
}

PredicatePtr Predicate::related(std::string relation, RelationQuantifier quantifier, PredicatePtr inner)
{
    auto predicate = std::make_shared<Predicate>(PredicateKind::Relation);
    predicate->relation_.relation = std::move(relation);
    predicate->relation_.quantifier = quantifier;
    predicate->relation_.inner = inner ? std::move(inner) : always_true();
    return predicate;
}

PredicatePtr Predicate::keys_in(std::vector<std::string> columns, Subquery subquery)
{
    if (columns.empty() || columns.size() != subquery.projected_columns.size()) {
        throw std::invalid_argument{"Predicate::keys_in requires matching non-empty column lists"};
    }
    auto predicate = std::make_shared<Predicate>(PredicateKind::KeysIn);
    predicate->keys_in_.columns = std::move(columns);
    predicate->keys_in_.subquery = std::move(subquery);
    if (!predicate->keys_in_.subquery.where) {
        predicate->keys_in_.subquery.where = always_true();
    }
    return predicate;
}

PredicatePtr match_row(const Row& row)
{
    std::vector<PredicatePtr> terms;
    terms.reserve(row.size());
    for (const auto& [column, value] : row) {
        terms.push_back(Predicate::equals(column, value));
    }
    return Predicate::all_of(std::move(terms));
}

PredicatePtr match_key(const std::vector<std::string>& columns, const KeyTuple& key)
{
    if (has_null(key)) {
        return Predicate::always_false();
    }
    std::vector<PredicatePtr> terms;
    terms.reserve(columns.size());
    for (std::size_t i = 0U; i < columns.size() && i < key.size(); ++i) {
        terms.push_back(Predicate::equals(columns[i], key[i]));
    }
    return Predicate::all_of(std::move(terms));
}

PredicatePtr match_keys(const std::vector<std::string>& columns, const std::vector<KeyTuple>& keys)
{
    if (columns.size() == 1U) {
        std::vector<Value> values;
        values.reserve(keys.size());
        for (const auto& key : keys) {
            if (!key.empty() && !is_null(key.front())) {
                values.push_back(key.front());
            }
        }
        if (values.empty()) {
            return Predicate::always_false();
        }
        return Predicate::in(columns.front(), std::move(values));
    }

    std::vector<PredicatePtr> alternatives;
    alternatives.reserve(keys.size());
    for (const auto& key : keys) {
        alternatives.push_back(match_key(columns, key));
    }
    return Predicate::any_of(std::move(alternatives));
}

bool contains_relation_terms(const PredicatePtr& predicate)
{
    if (!predicate) {
        return false;
    }
    switch (predicate->kind()) {
    case PredicateKind::Relation:
        return true;
    case PredicateKind::KeysIn:
        return contains_relation_terms(predicate->keys_in().subquery.where);
    default:
        break;
    }
    for (const auto& child : predicate->children()) {
        if (contains_relation_terms(child)) {
            return true;
        }
    }
    return false;
}

std::string to_string(ComparisonOp op)
{
    switch (op) {
    case ComparisonOp::Equal:
        return "=";
    case ComparisonOp::NotEqual:
        return "!=";
    case ComparisonOp::Less:
        return "<";
    case ComparisonOp::LessEqual:
        return "<=";
    case ComparisonOp::Greater:
        return ">";
    case ComparisonOp::GreaterEqual:
        return ">=";
    case ComparisonOp::In:
        return "in";
    case ComparisonOp::NotIn:
        return "not in";
    case ComparisonOp::IsNull:
        return "is null";
    case ComparisonOp::IsNotNull:
        return "is not null";
    }
    return "?";
}

std::string to_string(RelationQuantifier quantifier)
{
    switch (quantifier) {
    case RelationQuantifier::Some:
        return "some";
    case RelationQuantifier::Every:
        return "every";
    case RelationQuantifier::None:
        return "none";
    case RelationQuantifier::Is:
        return "is";
    case RelationQuantifier::IsNot:
        return "is_not";
    }
    return "?";
}

std::string describe(const PredicatePtr& predicate)
{
    if (!predicate) {
        return "true";
    }

    switch (predicate->kind()) {
    case PredicateKind::True:
        return "true";
    case PredicateKind::False:
        return "false";
    case PredicateKind::Comparison: {
        const auto& term = predicate->comparison();
        switch (term.op) {
        case ComparisonOp::IsNull:
        case ComparisonOp::IsNotNull:
            return term.column + " " + to_string(term.op);
        case ComparisonOp::In:
        case ComparisonOp::NotIn:
            return term.column + " " + to_string(term.op) + " " + describe_values(term.values);
        default:
            return term.column + " " + to_string(term.op) + " " + to_string(term.value);
        }
    }
    case PredicateKind::And:
        return describe_children(predicate->children(), " and ");
    case PredicateKind::Or:
        return describe_children(predicate->children(), " or ");
    case PredicateKind::Not:
        return "not " + describe_children(predicate->children(), "");
    case PredicateKind::Relation: {
        const auto& term = predicate->relation();
        return term.relation + "." + to_string(term.quantifier) + "(" + describe(term.inner) + ")";
    }
    case PredicateKind::KeysIn: {
        const auto& term = predicate->keys_in();
        return "(" + join(term.columns) + ") in (select " + join(term.subquery.projected_columns) + " from "
               + term.subquery.table + " where " + describe(term.subquery.where) + ")";
    }
    }
    return "?";
}

}  // namespace relq::query
