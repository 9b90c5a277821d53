#pragma once

#include "relq/query/predicate.hpp"
#include "relq/query/value.hpp"
#include "relq/schema/schema_model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace relq::write {

struct RelationWrite;

// Scalar values of one row plus the directives on its relation fields.
struct WritePayload final {
    query::Row values{};
    std::vector<RelationWrite> relations{};

    WritePayload& set(std::string column, query::Value value);
    WritePayload& set(std::string column, const char* value);
    WritePayload& with(RelationWrite relation);
};

struct CreateDirective final {
    WritePayload data{};
};

struct ConnectDirective final {
    schema::UniqueSelector where{};
};

struct ConnectOrCreateDirective final {
    schema::UniqueSelector where{};
    WritePayload create{};
};

// where is required on list relations and defaults to the linked row on
// single relations.
struct UpdateDirective final {
    std::optional<schema::UniqueSelector> where{};
    WritePayload data{};
};

struct UpsertDirective final {
    std::optional<schema::UniqueSelector> where{};
    WritePayload create{};
    WritePayload update{};
};

struct DeleteDirective final {
    std::optional<schema::UniqueSelector> where{};
};

struct DisconnectDirective final {
    std::optional<schema::UniqueSelector> where{};
};

struct SetDirective final {
    std::vector<schema::UniqueSelector> members{};
};

struct UpdateManyDirective final {
    query::PredicatePtr where{};
    WritePayload data{};
};

struct DeleteManyDirective final {
    query::PredicatePtr where{};
};

using WriteDirective = std::variant<CreateDirective,
                                    ConnectDirective,
                                    ConnectOrCreateDirective,
                                    UpdateDirective,
                                    UpsertDirective,
                                    DeleteDirective,
                                    DisconnectDirective,
                                    SetDirective,
                                    UpdateManyDirective,
                                    DeleteManyDirective>;

// Mirrors the alternative order of WriteDirective.
enum class DirectiveKind {
    Create,
    Connect,
    ConnectOrCreate,
    Update,
    Upsert,
    Delete,
    Disconnect,
    Set,
    UpdateMany,
    DeleteMany
};

// Directives on one relation field, applied in list order.
struct RelationWrite final {
    std::string relation{};
    std::vector<WriteDirective> directives{};

    RelationWrite& add(WriteDirective directive);
};

enum class WriteKind {
    Create,
    Update
};

struct WriteRequest final {
    WriteKind kind = WriteKind::Create;
    std::string model{};
    std::optional<schema::UniqueSelector> where{};
    WritePayload data{};

    static WriteRequest create(std::string model, WritePayload data);
    static WriteRequest update(std::string model, schema::UniqueSelector where, WritePayload data);
};

[[nodiscard]] RelationWrite relation(std::string name, WriteDirective directive);
[[nodiscard]] RelationWrite relation(std::string name, std::vector<WriteDirective> directives);

[[nodiscard]] DirectiveKind directive_kind(const WriteDirective& directive) noexcept;
[[nodiscard]] const char* directive_name(DirectiveKind kind) noexcept;

}  // namespace relq::write
