#pragma once

#include "relq/query/value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace relq::schema {

enum class ScalarType {
    Int,
    Float,
    Bool,
    String
};

struct ScalarField final {
    std::string name{};
    ScalarType type = ScalarType::Int;
    bool nullable = false;
    bool is_id = false;
    bool autoincrement = false;
    bool unique = false;
    std::optional<query::Value> default_value{};
};

enum class RelationCardinality {
    OneToOne,
    OneToMany,
    ManyToMany
};

// Ownership seen from the side holding the field: Self stores the foreign key,
// Target means the related model stores it, JoinTable mediates many-to-many.
enum class RelationOwnership {
    Self,
    Target,
    JoinTable
};

// One side of a relation. Rows are linked when
// this.local_columns == target.target_columns; for JoinTable relations the
// columns are the primary keys and the join table carries the pairs.
struct RelationField final {
    std::string name{};
    std::string model{};
    std::string target{};
    std::string inverse{};
    std::string relation_name{};
    RelationCardinality cardinality = RelationCardinality::OneToMany;
    RelationOwnership ownership = RelationOwnership::Self;
    bool list = false;
    bool optional = true;
    std::vector<std::string> local_columns{};
    std::vector<std::string> target_columns{};
    std::string join_table{};
    std::string join_local_column{};
    std::string join_target_column{};

    [[nodiscard]] bool is_list() const noexcept { return list; }
    [[nodiscard]] bool owns_foreign_key() const noexcept { return ownership == RelationOwnership::Self; }
};

struct ForeignKeyConstraint final {
    std::string table{};
    std::vector<std::string> columns{};
    std::string referenced_table{};
    std::vector<std::string> referenced_columns{};
    bool nullable = false;
};

struct ModelDescriptor final {
    std::string name{};
    std::vector<ScalarField> fields{};
    std::vector<RelationField> relations{};
    std::vector<std::string> primary_key{};
    std::vector<std::vector<std::string>> unique_constraints{};
    bool join_table = false;

    [[nodiscard]] const ScalarField* find_field(std::string_view field) const noexcept;
    [[nodiscard]] const RelationField* find_relation(std::string_view field) const noexcept;
};

// Maps field names to the values of exactly one unique constraint.
using UniqueSelector = query::Row;

class SchemaModel final {
public:
    SchemaModel() = default;

    [[nodiscard]] const ModelDescriptor& model(std::string_view name) const;
    [[nodiscard]] const ModelDescriptor* find_model(std::string_view name) const noexcept;

    [[nodiscard]] const RelationField& relation(std::string_view model, std::string_view field) const;
    [[nodiscard]] const RelationField* find_relation(std::string_view model, std::string_view field) const noexcept;
    [[nodiscard]] const RelationField& inverse(const RelationField& relation) const;

    [[nodiscard]] const std::vector<std::vector<std::string>>& unique_constraints(std::string_view model) const;
    [[nodiscard]] bool is_unique_selector(std::string_view model, const UniqueSelector& selector) const;
    [[nodiscard]] const std::vector<std::string>& primary_key(std::string_view model) const;

    // Models followed by the implicit join tables.
    [[nodiscard]] const std::vector<ModelDescriptor>& tables() const noexcept { return tables_; }
    [[nodiscard]] const std::vector<ForeignKeyConstraint>& foreign_keys() const noexcept { return foreign_keys_; }
    [[nodiscard]] const std::vector<RelationField>& relations_of(std::string_view model) const;
    [[nodiscard]] std::vector<const RelationField*> join_relations_of(std::string_view model) const;
    // Owning-side relations whose foreign key points at model.
    [[nodiscard]] std::vector<const RelationField*> referencing_relations(std::string_view model) const;
    [[nodiscard]] const ModelDescriptor& join_table(const RelationField& relation) const;

private:
    std::vector<ModelDescriptor> tables_{};
    std::unordered_map<std::string, std::size_t> table_index_{};
    std::vector<ForeignKeyConstraint> foreign_keys_{};

    friend class SchemaBuilder;
};

struct RelationDeclaration final {
    std::string name{};
    // Side storing the foreign key columns.
    std::string owner_model{};
    std::string owner_field{};
    std::vector<std::string> foreign_key_columns{};
    // Referenced side; referenced_columns default to its primary key.
    std::string target_model{};
    std::string target_field{};
    std::vector<std::string> referenced_columns{};
    bool target_side_optional = true;
};

struct ManyToManyDeclaration final {
    std::string name{};
    std::string model_a{};
    std::string field_a{};
    std::string model_b{};
    std::string field_b{};
};

// Loader-side API. build() validates the catalog and throws SchemaError.
class SchemaBuilder final {
public:
    SchemaBuilder& add_model(std::string name,
                             std::vector<ScalarField> fields,
                             std::vector<std::vector<std::string>> unique_constraints = {});
    SchemaBuilder& add_one_to_one(RelationDeclaration declaration);
    SchemaBuilder& add_one_to_many(RelationDeclaration declaration);
    SchemaBuilder& add_many_to_many(ManyToManyDeclaration declaration);

    [[nodiscard]] SchemaModel build() const;

private:
    struct PendingModel final {
        std::string name{};
        std::vector<ScalarField> fields{};
        std::vector<std::vector<std::string>> unique_constraints{};
    };

    struct PendingRelation final {
        RelationCardinality cardinality = RelationCardinality::OneToMany;
        RelationDeclaration declaration{};
    };

    std::vector<PendingModel> models_{};
    std::vector<PendingRelation> relations_{};
    std::vector<ManyToManyDeclaration> many_to_many_{};
};

[[nodiscard]] std::string join_table_name(std::string_view model_a, std::string_view model_b);
[[nodiscard]] std::string to_string(RelationCardinality cardinality);

}  // namespace relq::schema
