#include "relq/schema/schema_model.hpp"

#include "relq/core/errors.hpp"

#include <algorithm>
#include <set>
#include <unordered_set>
#include <utility>

namespace relq::schema {

namespace {

std::vector<std::string> sorted(std::vector<std::string> columns)
{
    std::sort(columns.begin(), columns.end());
    return columns;
}

bool same_column_set(const std::vector<std::string>& lhs, const std::vector<std::string>& rhs)
{
    return sorted(lhs) == sorted(rhs);
}

void add_unique_constraint(ModelDescriptor& model, std::vector<std::string> columns)
{
    const auto exists = std::any_of(model.unique_constraints.begin(),
                                    model.unique_constraints.end(),
                                    [&](const auto& constraint) { return same_column_set(constraint, columns); });
    if (!exists) {
        model.unique_constraints.push_back(std::move(columns));
    }
}

void require_columns(const ModelDescriptor& model, const std::vector<std::string>& columns)
{
    for (const auto& column : columns) {
        if (model.find_field(column) == nullptr) {
            throw SchemaError{SchemaErrc::UnknownField, "model '" + model.name + "' has no column '" + column + "'"};
        }
    }
}

void require_unique_name(const ModelDescriptor& model, const std::string& field)
{
    if (model.find_field(field) != nullptr || model.find_relation(field) != nullptr) {
        throw SchemaError{SchemaErrc::DuplicateRelation,
                          "model '" + model.name + "' already declares a field named '" + field + "'"};
    }
}

bool is_unique_column_set(const ModelDescriptor& model, const std::vector<std::string>& columns)
{
    return std::any_of(model.unique_constraints.begin(), model.unique_constraints.end(), [&](const auto& constraint) {
        return same_column_set(constraint, columns);
    });
}

}  // namespace

const ScalarField* ModelDescriptor::find_field(std::string_view field) const noexcept
{
    const auto it = std::find_if(fields.begin(), fields.end(), [&](const ScalarField& f) { return f.name == field; });
    return it == fields.end() ? nullptr : &*it;
}

const RelationField* ModelDescriptor::find_relation(std::string_view field) const noexcept
{
    const auto it = std::find_if(relations.begin(), relations.end(), [&](const RelationField& r) { return r.name == field; });
    return it == relations.end() ? nullptr : &*it;
}

const ModelDescriptor& SchemaModel::model(std::string_view name) const
{
    const auto* descriptor = find_model(name);
    if (descriptor == nullptr) {
        throw QueryError{make_error_code(RelqErrc::UnknownModel), "unknown model '" + std::string{name} + "'"};
    }
    return *descriptor;
}

const ModelDescriptor* SchemaModel::find_model(std::string_view name) const noexcept
{
    const auto it = table_index_.find(std::string{name});
    if (it == table_index_.end()) {
        return nullptr;
    }
    return &tables_[it->second];
}

const RelationField& SchemaModel::relation(std::string_view model_name, std::string_view field) const
{
    const auto& descriptor = model(model_name);
    const auto* relation = descriptor.find_relation(field);
    if (relation == nullptr) {
        throw QueryError{make_error_code(RelqErrc::UnknownRelation),
                         "model '" + descriptor.name + "' has no relation field '" + std::string{field} + "'",
                         {descriptor.name, std::string{field}}};
    }
    return *relation;
}

const RelationField* SchemaModel::find_relation(std::string_view model_name, std::string_view field) const noexcept
{
    const auto* descriptor = find_model(model_name);
    return descriptor == nullptr ? nullptr : descriptor->find_relation(field);
}

const RelationField& SchemaModel::inverse(const RelationField& relation) const
{
    return this->relation(relation.target, relation.inverse);
}

const std::vector<std::vector<std::string>>& SchemaModel::unique_constraints(std::string_view model_name) const
{
    return model(model_name).unique_constraints;
}

bool SchemaModel::is_unique_selector(std::string_view model_name, const UniqueSelector& selector) const
{
    const auto* descriptor = find_model(model_name);
    if (descriptor == nullptr || selector.empty()) {
        return false;
    }

    std::vector<std::string> columns;
    columns.reserve(selector.size());
    for (const auto& [column, value] : selector) {
        if (query::is_null(value) || descriptor->find_field(column) == nullptr) {
            return false;
        }
        columns.push_back(column);
    }
    return is_unique_column_set(*descriptor, columns);
}

const std::vector<std::string>& SchemaModel::primary_key(std::string_view model_name) const
{
    return model(model_name).primary_key;
}

const std::vector<RelationField>& SchemaModel::relations_of(std::string_view model_name) const
{
    return model(model_name).relations;
}

std::vector<const RelationField*> SchemaModel::referencing_relations(std::string_view model_name) const
{
    const auto& target = model(model_name);
    std::vector<const RelationField*> relations;
    for (const auto& table : tables_) {
        for (const auto& relation : table.relations) {
            if (relation.ownership == RelationOwnership::Self && relation.target == target.name) {
                relations.push_back(&relation);
            }
        }
    }
    return relations;
}

const ModelDescriptor& SchemaModel::join_table(const RelationField& relation) const
{
    if (relation.ownership != RelationOwnership::JoinTable) {
        throw QueryError{make_error_code(RelqErrc::UnknownRelation),
                         "relation '" + relation.model + "." + relation.name + "' has no join table",
                         {relation.model, relation.name}};
    }
    return model(relation.join_table);
}

std::vector<const RelationField*> SchemaModel::join_relations_of(std::string_view model_name) const
{
    std::vector<const RelationField*> relations;
    for (const auto& relation : model(model_name).relations) {
        if (relation.ownership == RelationOwnership::JoinTable) {
            relations.push_back(&relation);
        }
    }
    return relations;
}

SchemaBuilder& SchemaBuilder::add_model(std::string name,
                                        std::vector<ScalarField> fields,
                                        std::vector<std::vector<std::string>> unique_constraints)
{
    models_.push_back(PendingModel{std::move(name), std::move(fields), std::move(unique_constraints)});
    return *this;
}

SchemaBuilder& SchemaBuilder::add_one_to_one(RelationDeclaration declaration)
{
    relations_.push_back(PendingRelation{RelationCardinality::OneToOne, std::move(declaration)});
    return *this;
}

SchemaBuilder& SchemaBuilder::add_one_to_many(RelationDeclaration declaration)
{
    relations_.push_back(PendingRelation{RelationCardinality::OneToMany, std::move(declaration)});
    return *this;
}

SchemaBuilder& SchemaBuilder::add_many_to_many(ManyToManyDeclaration declaration)
{
    many_to_many_.push_back(std::move(declaration));
    return *this;
}

SchemaModel SchemaBuilder::build() const
{
    SchemaModel schema;

    for (const auto& pending : models_) {
        if (schema.table_index_.count(pending.name) != 0U) {
            throw SchemaError{SchemaErrc::DuplicateModel, "duplicate model '" + pending.name + "'"};
        }

        ModelDescriptor model{};
        model.name = pending.name;
        std::unordered_set<std::string> seen;
        for (const auto& field : pending.fields) {
            if (!seen.insert(field.name).second) {
                throw SchemaError{SchemaErrc::DuplicateField,
                                  "model '" + pending.name + "' declares '" + field.name + "' twice"};
            }
            model.fields.push_back(field);
            if (field.is_id) {
                model.primary_key.push_back(field.name);
            }
        }
        if (model.primary_key.empty()) {
            throw SchemaError{SchemaErrc::MissingPrimaryKey, "model '" + pending.name + "' has no id field"};
        }

        model.unique_constraints.push_back(model.primary_key);
        for (const auto& field : model.fields) {
            if (field.unique) {
                add_unique_constraint(model, {field.name});
            }
        }
        for (const auto& constraint : pending.unique_constraints) {
            require_columns(model, constraint);
            add_unique_constraint(model, constraint);
        }

        schema.table_index_.emplace(model.name, schema.tables_.size());
        schema.tables_.push_back(std::move(model));
    }

    const auto mutable_model = [&](const std::string& name) -> ModelDescriptor& {
        const auto it = schema.table_index_.find(name);
        if (it == schema.table_index_.end()) {
            throw SchemaError{SchemaErrc::UnknownModel, "relation references unknown model '" + name + "'"};
        }
        return schema.tables_[it->second];
    };

    for (const auto& pending : relations_) {
        const auto& declaration = pending.declaration;
        auto& owner = mutable_model(declaration.owner_model);
        auto& target = mutable_model(declaration.target_model);

        auto referenced = declaration.referenced_columns.empty() ? target.primary_key : declaration.referenced_columns;
        require_columns(owner, declaration.foreign_key_columns);
        require_columns(target, referenced);
        if (declaration.foreign_key_columns.empty() || declaration.foreign_key_columns.size() != referenced.size()) {
            throw SchemaError{SchemaErrc::ForeignKeyArityMismatch,
                              "relation '" + declaration.owner_model + "." + declaration.owner_field
                                  + "' foreign key arity does not match referenced columns"};
        }
        if (!is_unique_column_set(target, referenced)) {
            throw SchemaError{SchemaErrc::ReferencedColumnsNotUnique,
                              "relation '" + declaration.owner_model + "." + declaration.owner_field
                                  + "' must reference a unique column set of '" + target.name + "'"};
        }

        std::size_t nullable_count = 0U;
        for (const auto& column : declaration.foreign_key_columns) {
            if (owner.find_field(column)->nullable) {
                ++nullable_count;
            }
        }
        if (nullable_count != 0U && nullable_count != declaration.foreign_key_columns.size()) {
            throw SchemaError{SchemaErrc::MixedForeignKeyNullability,
                              "relation '" + declaration.owner_model + "." + declaration.owner_field
                                  + "' mixes nullable and required foreign key columns"};
        }
        const bool nullable = nullable_count != 0U;

        require_unique_name(owner, declaration.owner_field);
        require_unique_name(target, declaration.target_field);

        RelationField owner_side{};
        owner_side.name = declaration.owner_field;
        owner_side.model = owner.name;
        owner_side.target = target.name;
        owner_side.inverse = declaration.target_field;
        owner_side.relation_name = declaration.name;
        owner_side.cardinality = pending.cardinality;
        owner_side.ownership = RelationOwnership::Self;
        owner_side.list = false;
        owner_side.optional = nullable;
        owner_side.local_columns = declaration.foreign_key_columns;
        owner_side.target_columns = referenced;

        RelationField target_side{};
        target_side.name = declaration.target_field;
        target_side.model = target.name;
        target_side.target = owner.name;
        target_side.inverse = declaration.owner_field;
        target_side.relation_name = declaration.name;
        target_side.cardinality = pending.cardinality;
        target_side.ownership = RelationOwnership::Target;
        target_side.list = pending.cardinality == RelationCardinality::OneToMany;
        target_side.optional = pending.cardinality == RelationCardinality::OneToOne ? declaration.target_side_optional : true;
        target_side.local_columns = referenced;
        target_side.target_columns = declaration.foreign_key_columns;

        if (pending.cardinality == RelationCardinality::OneToOne) {
            add_unique_constraint(owner, declaration.foreign_key_columns);
        }

        schema.foreign_keys_.push_back(
            ForeignKeyConstraint{owner.name, declaration.foreign_key_columns, target.name, referenced, nullable});

        // owner and target may alias for self relations; push in two steps.
        owner.relations.push_back(std::move(owner_side));
        mutable_model(declaration.target_model).relations.push_back(std::move(target_side));
    }

    for (const auto& declaration : many_to_many_) {
        auto& model_a = mutable_model(declaration.model_a);
        auto& model_b = mutable_model(declaration.model_b);
        if (model_a.primary_key.size() != 1U || model_b.primary_key.size() != 1U) {
            throw SchemaError{SchemaErrc::ForeignKeyArityMismatch,
                              "many-to-many relation '" + declaration.model_a + "." + declaration.field_a
                                  + "' requires single-column primary keys"};
        }
        require_unique_name(model_a, declaration.field_a);
        require_unique_name(model_b, declaration.field_b);

        const auto table_name = declaration.name.empty() ? join_table_name(model_a.name, model_b.name)
                                                         : "_" + declaration.name;
        if (schema.table_index_.count(table_name) != 0U) {
            throw SchemaError{SchemaErrc::DuplicateModel, "duplicate join table '" + table_name + "'"};
        }

        // Column A always references the side listed first.
        const bool a_first = model_a.name <= model_b.name;
        const std::string column_a = a_first ? "A" : "B";
        const std::string column_b = a_first ? "B" : "A";

        const auto* pk_a = model_a.find_field(model_a.primary_key.front());
        const auto* pk_b = model_b.find_field(model_b.primary_key.front());

        ModelDescriptor join{};
        join.name = table_name;
        join.join_table = true;
        ScalarField join_a{};
        join_a.name = "A";
        join_a.type = a_first ? pk_a->type : pk_b->type;
        join_a.is_id = true;
        ScalarField join_b{};
        join_b.name = "B";
        join_b.type = a_first ? pk_b->type : pk_a->type;
        join_b.is_id = true;
        join.fields = {join_a, join_b};
        join.primary_key = {"A", "B"};
        join.unique_constraints = {join.primary_key};

        RelationField side_a{};
        side_a.name = declaration.field_a;
        side_a.model = model_a.name;
        side_a.target = model_b.name;
        side_a.inverse = declaration.field_b;
        side_a.relation_name = declaration.name;
        side_a.cardinality = RelationCardinality::ManyToMany;
        side_a.ownership = RelationOwnership::JoinTable;
        side_a.list = true;
        side_a.optional = true;
        side_a.local_columns = model_a.primary_key;
        side_a.target_columns = model_b.primary_key;
        side_a.join_table = table_name;
        side_a.join_local_column = column_a;
        side_a.join_target_column = column_b;

        RelationField side_b = side_a;
        side_b.name = declaration.field_b;
        side_b.model = model_b.name;
        side_b.target = model_a.name;
        side_b.inverse = declaration.field_a;
        side_b.local_columns = model_b.primary_key;
        side_b.target_columns = model_a.primary_key;
        side_b.join_local_column = column_b;
        side_b.join_target_column = column_a;

        schema.foreign_keys_.push_back(ForeignKeyConstraint{table_name, {column_a}, model_a.name, model_a.primary_key, false});
        schema.foreign_keys_.push_back(ForeignKeyConstraint{table_name, {column_b}, model_b.name, model_b.primary_key, false});

        model_a.relations.push_back(std::move(side_a));
        mutable_model(declaration.model_b).relations.push_back(std::move(side_b));

        schema.table_index_.emplace(table_name, schema.tables_.size());
        schema.tables_.push_back(std::move(join));
    }

    return schema;
}

std::string join_table_name(std::string_view model_a, std::string_view model_b)
{
    if (model_b < model_a) {
        std::swap(model_a, model_b);
    }
    return "_" + std::string{model_a} + "To" + std::string{model_b};
}

std::string to_string(RelationCardinality cardinality)
{
    switch (cardinality) {
    case RelationCardinality::OneToOne:
        return "one-to-one";
    case RelationCardinality::OneToMany:
        return "one-to-many";
    case RelationCardinality::ManyToMany:
        return "many-to-many";
    }
    return "unknown";
}

}  // namespace relq::schema
