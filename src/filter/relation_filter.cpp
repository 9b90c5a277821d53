#include "relq/filter/relation_filter.hpp"

#include "relq/core/errors.hpp"

#include <string>
#include <utility>
#include <vector>

namespace relq::filter {

namespace {

using query::Predicate;
using query::PredicateKind;
using query::PredicatePtr;
using query::RelationQuantifier;

bool quantifier_fits(const schema::RelationField& relation, RelationQuantifier quantifier) noexcept
{
    switch (quantifier) {
    case RelationQuantifier::Some:
    case RelationQuantifier::Every:
    case RelationQuantifier::None:
        return relation.is_list();
    case RelationQuantifier::Is:
    case RelationQuantifier::IsNot:
        return !relation.is_list();
    }
    return false;
}

PredicatePtr translate(const schema::SchemaModel& schema,
                       const schema::ModelDescriptor& model,
                       const PredicatePtr& predicate,
                       std::vector<std::string>& path)
{
    if (!predicate) {
        return Predicate::always_true();
    }

    switch (predicate->kind()) {
    case PredicateKind::True:
    case PredicateKind::False:
    case PredicateKind::KeysIn:
        return predicate;
    case PredicateKind::Comparison:
        if (model.find_field(predicate->comparison().column) == nullptr) {
            auto field_path = path;
            field_path.push_back(predicate->comparison().column);
            throw QueryError{make_error_code(RelqErrc::UnknownField),
                             "model '" + model.name + "' has no field '" + predicate->comparison().column + "'",
                             std::move(field_path)};
        }
        return predicate;
    case PredicateKind::And:
    case PredicateKind::Or: {
        std::vector<PredicatePtr> children;
        children.reserve(predicate->children().size());
        for (const auto& child : predicate->children()) {
            children.push_back(translate(schema, model, child, path));
        }
        return predicate->kind() == PredicateKind::And ? Predicate::all_of(std::move(children))
                                                       : Predicate::any_of(std::move(children));
    }
    case PredicateKind::Not:
        return Predicate::negate(
            predicate->children().empty() ? Predicate::always_true() : translate(schema, model, predicate->children().front(), path));
    case PredicateKind::Relation:
        break;
    }

    const auto& term = predicate->relation();
    path.push_back(term.relation);
    const auto* relation = model.find_relation(term.relation);
    if (relation == nullptr) {
        throw QueryError{make_error_code(RelqErrc::UnknownRelation),
                         "model '" + model.name + "' has no relation field '" + term.relation + "'",
                         path};
    }
    if (!quantifier_fits(*relation, term.quantifier)) {
        throw QueryError{make_error_code(RelqErrc::InvalidFilter),
                         "quantifier '" + query::to_string(term.quantifier) + "' does not fit "
                             + (relation->is_list() ? "list" : "single") + " relation '" + model.name + "."
                             + relation->name + "'",
                         path};
    }

    const auto& target = schema.model(relation->target);
    auto inner = translate(schema, target, term.inner, path);
    path.pop_back();

    switch (term.quantifier) {
    case RelationQuantifier::Some:
    case RelationQuantifier::Is:
        return related_exists(*relation, std::move(inner));
    case RelationQuantifier::None:
    case RelationQuantifier::IsNot:
        return Predicate::negate(related_exists(*relation, std::move(inner)));
    case RelationQuantifier::Every:
        return Predicate::negate(related_exists(*relation, Predicate::negate(std::move(inner))));
    }
    return Predicate::always_false();
}

}  // namespace

PredicatePtr translate_relation_filters(const schema::SchemaModel& schema,
                                        std::string_view model,
                                        const PredicatePtr& predicate)
{
    const auto& descriptor = schema.model(model);
    std::vector<std::string> path{descriptor.name};
    return translate(schema, descriptor, predicate, path);
}

PredicatePtr related_exists(const schema::RelationField& relation, PredicatePtr inner)
{
    if (relation.ownership != schema::RelationOwnership::JoinTable) {
        return Predicate::keys_in(relation.local_columns,
                                  query::Subquery{relation.target, relation.target_columns, std::move(inner)});
    }

    auto targets = Predicate::keys_in({relation.join_target_column},
                                      query::Subquery{relation.target, relation.target_columns, std::move(inner)});
    return Predicate::keys_in(relation.local_columns,
                              query::Subquery{relation.join_table, {relation.join_local_column}, std::move(targets)});
}

PredicatePtr scope_to_parent(const schema::RelationField& relation, const query::Row& parent_row)
{
    const auto key = query::project(parent_row, relation.local_columns);
    if (relation.ownership != schema::RelationOwnership::JoinTable) {
        return query::match_key(relation.target_columns, key);
    }
    return Predicate::keys_in(relation.target_columns,
                              query::Subquery{relation.join_table,
                                              {relation.join_target_column},
                                              query::match_key({relation.join_local_column}, key)});
}

}  // namespace relq::filter
