#include "relq/write/write_planner.hpp"

#include "relq/core/errors.hpp"
#include "relq/filter/relation_filter.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <type_traits>
#include <utility>
#include <variant>

namespace relq::write {

namespace {

using query::Row;

enum class PayloadMode {
    Create,
    Update
};

enum class ChildState {
    // Inserted by this plan; its Insert can take bindings.
    New,
    // Materialized by a Lookup.
    Existing,
    // connectOrCreate: looked up, inserted when missing.
    Either
};

struct StagedOperation final {
    PlanOperation operation{};
    std::vector<std::size_t> after{};
};

// Row being written by a payload.
struct PayloadScope final {
    const schema::ModelDescriptor* model = nullptr;
    RowRef row{};
    PayloadMode mode = PayloadMode::Create;
    std::vector<std::string> path{};
    std::vector<OperationGuard> guards{};
};

bool selectors_equal(const Row& lhs, const Row& rhs)
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    auto left = lhs.begin();
    auto right = rhs.begin();
    for (; left != lhs.end(); ++left, ++right) {
        if (left->first != right->first || !query::values_equal(left->second, right->second)) {
            return false;
        }
    }
    return true;
}

bool is_linking(DirectiveKind kind) noexcept
{
    switch (kind) {
    case DirectiveKind::Create:
    case DirectiveKind::Connect:
    case DirectiveKind::ConnectOrCreate:
    case DirectiveKind::Upsert:
        return true;
    default:
        return false;
    }
}

bool allowed_in_create(DirectiveKind kind) noexcept
{
    return kind == DirectiveKind::Create || kind == DirectiveKind::Connect || kind == DirectiveKind::ConnectOrCreate;
}

std::vector<OperationGuard> with_guard(std::vector<OperationGuard> guards, RowRef row, GuardExpectation expect)
{
    guards.push_back(OperationGuard{row, expect});
    return guards;
}

std::vector<RowRef> needed_rows(const PlanOperation& operation)
{
    std::vector<RowRef> rows;
    switch (operation.kind) {
    case PlanOperationKind::Lookup:
        if (operation.scope_parent.is_valid()) {
            rows.push_back(operation.scope_parent);
        }
        break;
    case PlanOperationKind::Insert:
        break;
    case PlanOperationKind::JoinInsert:
    case PlanOperationKind::JoinDelete:
        rows.push_back(operation.row);
        rows.push_back(operation.other);
        break;
    default:
        rows.push_back(operation.row);
        break;
    }
    for (const auto& binding : operation.bindings) {
        rows.push_back(binding.referenced);
    }
    return rows;
}

class WritePlanner final {
public:
    explicit WritePlanner(const schema::SchemaModel& schema)
        : schema_{schema}
    {
    }

    WritePlan plan(const WriteRequest& request)
    {
        const auto& model = schema_.model(request.model);
        if (model.join_table) {
            throw QueryError{make_error_code(RelqErrc::UnknownModel), "'" + model.name + "' is not writable", {model.name}};
        }

        PayloadScope root{};
        root.model = &model;
        root.path = {model.name};
        root.row = new_row(model.name, root.path);
        plan_.root_model = model.name;
        plan_.root = root.row;

        validate_values(model, request.data.values, root.path);
        if (request.kind == WriteKind::Create) {
            root.mode = PayloadMode::Create;
            stage_insert(model, root.row, request.data.values, root.path, {}, false, {});
            register_created(model, root.row, request.data.values);
        } else {
            if (!request.where.has_value()) {
                throw QueryError{make_error_code(RelqErrc::MalformedDirective),
                                 "update of '" + model.name + "' requires a unique selector",
                                 root.path};
            }
            validate_selector(model, *request.where, root.path);
            root.mode = PayloadMode::Update;
            const auto lookup = stage_lookup(model, root.row, *request.where, true, nullptr, {}, root.path, {}, {});
            if (!request.data.values.empty()) {
                stage_update(model, root.row, request.data.values, root.path, {}, {lookup});
            }
        }

        plan_payload(root, request.data);
        plan_.operations = order();
        return std::move(plan_);
    }

private:
    RowRef new_row(const std::string& model, const std::vector<std::string>& path)
    {
        plan_.rows.push_back(LogicalRow{model, path});
        return RowRef{static_cast<std::uint32_t>(plan_.rows.size())};
    }

    std::size_t stage(PlanOperation operation, std::vector<std::size_t> after = {})
    {
        staged_.push_back(StagedOperation{std::move(operation), std::move(after)});
        return staged_.size() - 1U;
    }

    std::size_t stage_lookup(const schema::ModelDescriptor& target,
                             RowRef row,
                             const schema::UniqueSelector& selector,
                             bool required,
                             const schema::RelationField* scope,
                             RowRef scope_parent,
                             const std::vector<std::string>& path,
                             const std::vector<OperationGuard>& guards,
                             std::vector<std::size_t> after)
    {
        PlanOperation operation{};
        operation.kind = PlanOperationKind::Lookup;
        operation.table = target.name;
        operation.row = row;
        operation.selector = selector;
        operation.required = required;
        operation.relation = scope;
        operation.scope_parent = scope != nullptr ? scope_parent : RowRef{};
        operation.guards = guards;
        operation.path = path;
        return stage(std::move(operation), std::move(after));
    }

    std::size_t stage_insert(const schema::ModelDescriptor& target,
                             RowRef row,
                             const Row& values,
                             const std::vector<std::string>& path,
                             const std::vector<OperationGuard>& guards,
                             bool conflict_means_exists,
                             std::vector<std::size_t> after)
    {
        PlanOperation operation{};
        operation.kind = PlanOperationKind::Insert;
        operation.table = target.name;
        operation.row = row;
        operation.values = values;
        operation.guards = guards;
        operation.conflict_means_exists = conflict_means_exists;
        operation.path = path;
        const auto index = stage(std::move(operation), std::move(after));
        insert_of_[row.value] = index;
        return index;
    }

    std::size_t stage_update(const schema::ModelDescriptor& target,
                             RowRef row,
                             const Row& values,
                             const std::vector<std::string>& path,
                             const std::vector<OperationGuard>& guards,
                             std::vector<std::size_t> after)
    {
        PlanOperation operation{};
        operation.kind = PlanOperationKind::Update;
        operation.table = target.name;
        operation.row = row;
        operation.values = values;
        operation.guards = guards;
        operation.path = path;
        return stage(std::move(operation), std::move(after));
    }

    std::size_t stage_replace_membership(const schema::RelationField& relation,
                                         RowRef owner,
                                         std::vector<RowRef> members,
                                         const std::vector<std::string>& path,
                                         const std::vector<OperationGuard>& guards,
                                         std::vector<std::size_t> after)
    {
        PlanOperation operation{};
        operation.kind = PlanOperationKind::ReplaceMembership;
        operation.table = relation.ownership == schema::RelationOwnership::JoinTable ? relation.join_table : relation.target;
        operation.row = owner;
        operation.relation = &relation;
        operation.members = std::move(members);
        operation.guards = guards;
        operation.path = path;
        return stage(std::move(operation), std::move(after));
    }

    void validate_values(const schema::ModelDescriptor& model, const Row& values, const std::vector<std::string>& path) const
    {
        for (const auto& [column, value] : values) {
            (void)value;
            if (model.find_field(column) == nullptr) {
                auto field_path = path;
                field_path.push_back(column);
                throw QueryError{make_error_code(RelqErrc::UnknownField),
                                 "model '" + model.name + "' has no field '" + column + "'",
                                 std::move(field_path)};
            }
        }
    }

    void validate_selector(const schema::ModelDescriptor& model,
                           const schema::UniqueSelector& selector,
                           const std::vector<std::string>& path) const
    {
        if (!schema_.is_unique_selector(model.name, selector)) {
            throw QueryError{make_error_code(RelqErrc::InvalidSelector),
                             "selector " + query::to_string(selector) + " does not address a unique constraint of '"
                                 + model.name + "'",
                             path};
        }
    }

    void register_created(const schema::ModelDescriptor& model, RowRef row, const Row& values)
    {
        for (const auto& constraint : model.unique_constraints) {
            Row key;
            for (const auto& column : constraint) {
                const auto it = values.find(column);
                if (it == values.end() || query::is_null(it->second)) {
                    key.clear();
                    break;
                }
                key.emplace(column, it->second);
            }
            if (!key.empty()) {
                created_.push_back(CreatedRow{model.name, std::move(key), row});
            }
        }
    }

    std::optional<RowRef> find_created(const schema::ModelDescriptor& model, const schema::UniqueSelector& selector) const
    {
        for (const auto& created : created_) {
            if (created.model == model.name && selectors_equal(created.key, selector)) {
                return created.row;
            }
        }
        return std::nullopt;
    }

    [[noreturn]] void fail(RelqErrc code, const std::string& message, const std::vector<std::string>& path) const
    {
        throw QueryError{make_error_code(code), message, path};
    }

    void plan_payload(const PayloadScope& scope, const WritePayload& payload)
    {
        validate_values(*scope.model, payload.values, scope.path);

        for (const auto& write : payload.relations) {
            auto relation_path = scope.path;
            relation_path.push_back(write.relation);
            const auto* relation = scope.model->find_relation(write.relation);
            if (relation == nullptr) {
                fail(RelqErrc::UnknownRelation,
                     "model '" + scope.model->name + "' has no relation field '" + write.relation + "'",
                     relation_path);
            }

            const auto linking = std::count_if(write.directives.begin(), write.directives.end(), [](const WriteDirective& d) {
                return is_linking(directive_kind(d));
            });
            if (!relation->is_list() && linking > 1) {
                fail(RelqErrc::CardinalityViolation,
                     "single relation '" + scope.model->name + "." + relation->name + "' cannot link more than one row",
                     relation_path);
            }
            if (relation->owns_foreign_key() && linking > 0) {
                for (const auto& column : relation->local_columns) {
                    if (payload.values.count(column) != 0U) {
                        fail(RelqErrc::MalformedDirective,
                             "foreign key column '" + column + "' is written directly and through '" + relation->name + "'",
                             relation_path);
                    }
                }
            }

            for (std::size_t i = 0U; i < write.directives.size(); ++i) {
                const auto& directive = write.directives[i];
                auto path = scope.path;
                path.push_back(relation->is_list() ? relation->name + "[" + std::to_string(i) + "]" : relation->name);

                const auto kind = directive_kind(directive);
                if (scope.mode == PayloadMode::Create && !allowed_in_create(kind)) {
                    fail(RelqErrc::MalformedDirective,
                         std::string{directive_name(kind)} + " is not allowed inside a create payload",
                         path);
                }
                plan_directive(scope, *relation, directive, path);
            }
        }
    }

    void plan_directive(const PayloadScope& parent,
                        const schema::RelationField& relation,
                        const WriteDirective& directive,
                        const std::vector<std::string>& path)
    {
        const auto& target = schema_.model(relation.target);
        std::visit(
            [&](const auto& d) {
                using T = std::decay_t<decltype(d)>;
                if constexpr (std::is_same_v<T, CreateDirective>) {
                    plan_create(parent, relation, target, d, path);
                } else if constexpr (std::is_same_v<T, ConnectDirective>) {
                    plan_connect(parent, relation, target, d, path);
                } else if constexpr (std::is_same_v<T, ConnectOrCreateDirective>) {
                    plan_connect_or_create(parent, relation, target, d, path);
                } else if constexpr (std::is_same_v<T, UpdateDirective>) {
                    plan_update(parent, relation, target, d, path);
                } else if constexpr (std::is_same_v<T, UpsertDirective>) {
                    plan_upsert(parent, relation, target, d, path);
                } else if constexpr (std::is_same_v<T, DeleteDirective>) {
                    plan_delete(parent, relation, target, d, path);
                } else if constexpr (std::is_same_v<T, DisconnectDirective>) {
                    plan_disconnect(parent, relation, target, d, path);
                } else if constexpr (std::is_same_v<T, SetDirective>) {
                    plan_set(parent, relation, target, d, path);
                } else if constexpr (std::is_same_v<T, UpdateManyDirective>) {
                    plan_update_many(parent, relation, target, d, path);
                } else {
                    plan_delete_many(parent, relation, target, d, path);
                }
            },
            directive);
    }

    ForeignKeyBinding binding_to_child(const schema::RelationField& relation, RowRef child) const
    {
        return ForeignKeyBinding{relation.local_columns, child, relation.target_columns, relation.optional};
    }

    ForeignKeyBinding binding_to_parent(const schema::RelationField& relation, RowRef parent) const
    {
        return ForeignKeyBinding{relation.target_columns, parent, relation.local_columns, schema_.inverse(relation).optional};
    }

    std::size_t stage_link(const std::string& table,
                           RowRef owner,
                           ForeignKeyBinding binding,
                           const std::vector<std::string>& path,
                           const std::vector<OperationGuard>& guards,
                           std::vector<std::size_t> after)
    {
        PlanOperation operation{};
        operation.kind = PlanOperationKind::LinkForeignKey;
        operation.table = table;
        operation.row = owner;
        operation.bindings.push_back(std::move(binding));
        operation.guards = guards;
        operation.path = path;
        return stage(std::move(operation), std::move(after));
    }

    std::size_t stage_join(PlanOperationKind kind,
                           const schema::RelationField& relation,
                           RowRef parent,
                           RowRef child,
                           const std::vector<std::string>& path,
                           const std::vector<OperationGuard>& guards,
                           std::vector<std::size_t> after)
    {
        PlanOperation operation{};
        operation.kind = kind;
        operation.table = relation.join_table;
        operation.row = parent;
        operation.other = child;
        operation.columns = {relation.join_local_column, relation.join_target_column};
        operation.referenced_columns = {relation.local_columns.front(), relation.target_columns.front()};
        operation.guards = guards;
        operation.path = path;
        return stage(std::move(operation), std::move(after));
    }

    void add_after(std::size_t index, std::size_t predecessor)
    {
        staged_[index].after.push_back(predecessor);
    }

    // Attaches child to parent through relation. Bindings go onto pending
    // inserts; rows that already exist are patched with LinkForeignKey.
    void link(const PayloadScope& parent,
              const schema::RelationField& relation,
              RowRef child,
              ChildState state,
              const std::vector<OperationGuard>& guards,
              const std::vector<std::size_t>& after,
              const std::vector<std::string>& path)
    {
        const bool one_to_one = relation.cardinality == schema::RelationCardinality::OneToOne;

        switch (relation.ownership) {
        case schema::RelationOwnership::Self: {
            std::optional<std::size_t> displaced;
            if (one_to_one && state != ChildState::New) {
                // The child may already be claimed by another row of this model.
                const auto& inverse = schema_.inverse(relation);
                const auto displace_guards = state == ChildState::Either ? with_guard(guards, child, GuardExpectation::Found)
                                                                         : guards;
                std::vector<RowRef> keep;
                if (parent.mode == PayloadMode::Update) {
                    keep.push_back(parent.row);
                }
                displaced = stage_replace_membership(inverse, child, std::move(keep), path, displace_guards, after);
            }

            if (parent.mode == PayloadMode::Create) {
                const auto insert = insert_of_.at(parent.row.value);
                staged_[insert].operation.bindings.push_back(binding_to_child(relation, child));
                for (const auto predecessor : after) {
                    add_after(insert, predecessor);
                }
                if (displaced.has_value()) {
                    add_after(insert, *displaced);
                }
            } else {
                auto link_after = after;
                if (displaced.has_value()) {
                    link_after.push_back(*displaced);
                }
                stage_link(parent.model->name, parent.row, binding_to_child(relation, child), path, guards, std::move(link_after));
            }
            return;
        }
        case schema::RelationOwnership::Target: {
            std::optional<std::size_t> displaced;
            if (one_to_one && parent.mode == PayloadMode::Update) {
                std::vector<RowRef> keep;
                if (state != ChildState::New) {
                    keep.push_back(child);
                }
                displaced = stage_replace_membership(relation, parent.row, std::move(keep), path, guards, after);
            }

            auto link_after = after;
            if (displaced.has_value()) {
                link_after.push_back(*displaced);
            }

            if (state == ChildState::New || state == ChildState::Either) {
                const auto insert = insert_of_.at(child.value);
                staged_[insert].operation.bindings.push_back(binding_to_parent(relation, parent.row));
                for (const auto predecessor : link_after) {
                    add_after(insert, predecessor);
                }
            }
            if (state == ChildState::Existing || state == ChildState::Either) {
                const auto link_guards = state == ChildState::Either ? with_guard(guards, child, GuardExpectation::Found)
                                                                     : guards;
                stage_link(relation.target, child, binding_to_parent(relation, parent.row), path, link_guards, std::move(link_after));
            }
            return;
        }
        case schema::RelationOwnership::JoinTable:
            stage_join(PlanOperationKind::JoinInsert, relation, parent.row, child, path, guards, after);
            return;
        }
    }

    void plan_create(const PayloadScope& parent,
                     const schema::RelationField& relation,
                     const schema::ModelDescriptor& target,
                     const CreateDirective& directive,
                     const std::vector<std::string>& path)
    {
        validate_values(target, directive.data.values, path);
        const auto child = new_row(target.name, path);
        stage_insert(target, child, directive.data.values, path, parent.guards, false, {});
        register_created(target, child, directive.data.values);
        link(parent, relation, child, ChildState::New, parent.guards, {}, path);
        plan_payload(PayloadScope{&target, child, PayloadMode::Create, path, parent.guards}, directive.data);
    }

    void plan_connect(const PayloadScope& parent,
                      const schema::RelationField& relation,
                      const schema::ModelDescriptor& target,
                      const ConnectDirective& directive,
                      const std::vector<std::string>& path)
    {
        validate_selector(target, directive.where, path);
        if (const auto created = find_created(target, directive.where)) {
            link(parent, relation, *created, ChildState::New, parent.guards, {}, path);
            return;
        }
        const auto child = new_row(target.name, path);
        const auto lookup = stage_lookup(target, child, directive.where, true, nullptr, {}, path, parent.guards, {});
        link(parent, relation, child, ChildState::Existing, parent.guards, {lookup}, path);
    }

    void plan_connect_or_create(const PayloadScope& parent,
                                const schema::RelationField& relation,
                                const schema::ModelDescriptor& target,
                                const ConnectOrCreateDirective& directive,
                                const std::vector<std::string>& path)
    {
        validate_selector(target, directive.where, path);
        validate_values(target, directive.create.values, path);
        if (const auto created = find_created(target, directive.where)) {
            link(parent, relation, *created, ChildState::New, parent.guards, {}, path);
            return;
        }

        const auto child = new_row(target.name, path);
        const auto lookup = stage_lookup(target, child, directive.where, false, nullptr, {}, path, parent.guards, {});
        const auto missing = with_guard(parent.guards, child, GuardExpectation::Missing);
        stage_insert(target, child, directive.create.values, path, missing, true, {lookup});
        link(parent, relation, child, ChildState::Either, parent.guards, {lookup}, path);
        plan_payload(PayloadScope{&target, child, PayloadMode::Create, path, missing}, directive.create);
    }

    void plan_update(const PayloadScope& parent,
                     const schema::RelationField& relation,
                     const schema::ModelDescriptor& target,
                     const UpdateDirective& directive,
                     const std::vector<std::string>& path)
    {
        if (relation.is_list() && !directive.where.has_value()) {
            fail(RelqErrc::MalformedDirective, "update on list relation '" + relation.name + "' requires a selector", path);
        }
        const auto selector = directive.where.value_or(schema::UniqueSelector{});
        if (directive.where.has_value()) {
            validate_selector(target, selector, path);
        }
        validate_values(target, directive.data.values, path);

        const auto child = new_row(target.name, path);
        const auto lookup = stage_lookup(target, child, selector, true, &relation, parent.row, path, parent.guards, {});
        if (!directive.data.values.empty()) {
            stage_update(target, child, directive.data.values, path, parent.guards, {lookup});
        }
        plan_payload(PayloadScope{&target, child, PayloadMode::Update, path, parent.guards}, directive.data);
    }

    void plan_upsert(const PayloadScope& parent,
                     const schema::RelationField& relation,
                     const schema::ModelDescriptor& target,
                     const UpsertDirective& directive,
                     const std::vector<std::string>& path)
    {
        if (relation.is_list() && !directive.where.has_value()) {
            fail(RelqErrc::MalformedDirective, "upsert on list relation '" + relation.name + "' requires a selector", path);
        }
        const auto selector = directive.where.value_or(schema::UniqueSelector{});
        if (directive.where.has_value()) {
            validate_selector(target, selector, path);
        }
        validate_values(target, directive.create.values, path);
        validate_values(target, directive.update.values, path);

        const auto child = new_row(target.name, path);
        const auto lookup = stage_lookup(target, child, selector, false, &relation, parent.row, path, parent.guards, {});
        const auto found = with_guard(parent.guards, child, GuardExpectation::Found);
        const auto missing = with_guard(parent.guards, child, GuardExpectation::Missing);

        if (!directive.update.values.empty()) {
            stage_update(target, child, directive.update.values, path, found, {lookup});
        }
        stage_insert(target, child, directive.create.values, path, missing, false, {lookup});
        link(parent, relation, child, ChildState::New, missing, {lookup}, path);

        plan_payload(PayloadScope{&target, child, PayloadMode::Update, path, found}, directive.update);
        plan_payload(PayloadScope{&target, child, PayloadMode::Create, path, missing}, directive.create);
    }

    void plan_delete(const PayloadScope& parent,
                     const schema::RelationField& relation,
                     const schema::ModelDescriptor& target,
                     const DeleteDirective& directive,
                     const std::vector<std::string>& path)
    {
        if (!relation.is_list() && !relation.optional) {
            fail(RelqErrc::CardinalityViolation,
                 "cannot delete the required related row of '" + parent.model->name + "." + relation.name + "'",
                 path);
        }
        if (relation.is_list() && !directive.where.has_value()) {
            fail(RelqErrc::MalformedDirective, "delete on list relation '" + relation.name + "' requires a selector", path);
        }
        const auto selector = directive.where.value_or(schema::UniqueSelector{});
        if (directive.where.has_value()) {
            validate_selector(target, selector, path);
        }

        const auto child = new_row(target.name, path);
        const auto lookup = stage_lookup(target, child, selector, true, &relation, parent.row, path, parent.guards, {});
        PlanOperation operation{};
        operation.kind = PlanOperationKind::Delete;
        operation.table = target.name;
        operation.row = child;
        operation.guards = parent.guards;
        operation.path = path;
        stage(std::move(operation), {lookup});
    }

    void plan_disconnect(const PayloadScope& parent,
                         const schema::RelationField& relation,
                         const schema::ModelDescriptor& target,
                         const DisconnectDirective& directive,
                         const std::vector<std::string>& path)
    {
        const auto& inverse = schema_.inverse(relation);
        bool legal = true;
        switch (relation.ownership) {
        case schema::RelationOwnership::Self:
            legal = relation.optional;
            break;
        case schema::RelationOwnership::Target:
            // The child's foreign key is nulled, so it must be optional.
            legal = inverse.optional && (relation.is_list() || relation.optional);
            break;
        case schema::RelationOwnership::JoinTable:
            legal = true;
            break;
        }
        if (!legal) {
            fail(RelqErrc::CardinalityViolation,
                 "cannot disconnect required relation '" + parent.model->name + "." + relation.name + "'",
                 path);
        }
        if (relation.is_list() && !directive.where.has_value()) {
            fail(RelqErrc::MalformedDirective, "disconnect on list relation '" + relation.name + "' requires a selector", path);
        }
        const auto selector = directive.where.value_or(schema::UniqueSelector{});
        if (directive.where.has_value()) {
            validate_selector(target, selector, path);
        }

        if (relation.ownership == schema::RelationOwnership::Self && !directive.where.has_value()) {
            PlanOperation operation{};
            operation.kind = PlanOperationKind::UnlinkForeignKey;
            operation.table = parent.model->name;
            operation.row = parent.row;
            operation.columns = relation.local_columns;
            operation.guards = parent.guards;
            operation.path = path;
            stage(std::move(operation));
            return;
        }

        // A single relation without selector may have nothing linked.
        const bool required = directive.where.has_value();
        const auto child = new_row(target.name, path);
        const auto lookup = stage_lookup(target, child, selector, required, &relation, parent.row, path, parent.guards, {});
        const auto guards = required ? parent.guards : with_guard(parent.guards, child, GuardExpectation::Found);

        if (relation.ownership == schema::RelationOwnership::JoinTable) {
            stage_join(PlanOperationKind::JoinDelete, relation, parent.row, child, path, guards, {lookup});
            return;
        }

        PlanOperation operation{};
        operation.kind = PlanOperationKind::UnlinkForeignKey;
        if (relation.ownership == schema::RelationOwnership::Self) {
            operation.table = parent.model->name;
            operation.row = parent.row;
            operation.columns = relation.local_columns;
        } else {
            operation.table = target.name;
            operation.row = child;
            operation.columns = relation.target_columns;
        }
        operation.guards = guards;
        operation.path = path;
        stage(std::move(operation), {lookup});
    }

    void plan_set(const PayloadScope& parent,
                  const schema::RelationField& relation,
                  const schema::ModelDescriptor& target,
                  const SetDirective& directive,
                  const std::vector<std::string>& path)
    {
        if (!relation.is_list()) {
            fail(RelqErrc::MalformedDirective, "set only applies to list relations", path);
        }

        std::vector<RowRef> members;
        std::vector<ChildState> states;
        std::vector<std::size_t> lookups;
        for (const auto& selector : directive.members) {
            validate_selector(target, selector, path);
            if (const auto created = find_created(target, selector)) {
                members.push_back(*created);
                states.push_back(ChildState::New);
                continue;
            }
            const auto child = new_row(target.name, path);
            lookups.push_back(stage_lookup(target, child, selector, true, nullptr, {}, path, parent.guards, {}));
            members.push_back(child);
            states.push_back(ChildState::Existing);
        }

        const auto replace = stage_replace_membership(relation, parent.row, members, path, parent.guards, lookups);
        for (std::size_t i = 0U; i < members.size(); ++i) {
            link(parent, relation, members[i], states[i], parent.guards, {replace}, path);
        }
    }

    void plan_update_many(const PayloadScope& parent,
                          const schema::RelationField& relation,
                          const schema::ModelDescriptor& target,
                          const UpdateManyDirective& directive,
                          const std::vector<std::string>& path)
    {
        if (!relation.is_list()) {
            fail(RelqErrc::MalformedDirective, "updateMany only applies to list relations", path);
        }
        if (!directive.data.relations.empty()) {
            fail(RelqErrc::MalformedDirective, "updateMany data cannot carry relation directives", path);
        }
        validate_values(target, directive.data.values, path);

        PlanOperation operation{};
        operation.kind = PlanOperationKind::UpdateMany;
        operation.table = target.name;
        operation.row = parent.row;
        operation.relation = &relation;
        operation.filter = filter::translate_relation_filters(schema_, target.name, directive.where);
        operation.values = directive.data.values;
        operation.guards = parent.guards;
        operation.path = path;
        stage(std::move(operation));
    }

    void plan_delete_many(const PayloadScope& parent,
                          const schema::RelationField& relation,
                          const schema::ModelDescriptor& target,
                          const DeleteManyDirective& directive,
                          const std::vector<std::string>& path)
    {
        if (!relation.is_list()) {
            fail(RelqErrc::MalformedDirective, "deleteMany only applies to list relations", path);
        }

        PlanOperation operation{};
        operation.kind = PlanOperationKind::DeleteMany;
        operation.table = target.name;
        operation.row = parent.row;
        operation.relation = &relation;
        operation.filter = filter::translate_relation_filters(schema_, target.name, directive.where);
        operation.guards = parent.guards;
        operation.path = path;
        stage(std::move(operation));
    }

    // Kahn's algorithm, lowest staging index first so that independent
    // operations keep the caller's directive order. A stuck graph is a foreign
    // key cycle: one nullable binding is split into a deferred link.
    std::vector<PlanOperation> order()
    {
        for (;;) {
            const auto count = staged_.size();
            std::map<std::uint32_t, std::vector<std::size_t>> producers;
            // Guards only read the outcome of a Lookup.
            std::map<std::uint32_t, std::size_t> lookups;
            for (std::size_t i = 0U; i < count; ++i) {
                const auto& operation = staged_[i].operation;
                if (operation.kind == PlanOperationKind::Lookup || operation.kind == PlanOperationKind::Insert) {
                    producers[operation.row.value].push_back(i);
                }
                if (operation.kind == PlanOperationKind::Lookup) {
                    lookups.emplace(operation.row.value, i);
                }
            }

            std::vector<std::set<std::size_t>> predecessors(count);
            for (std::size_t i = 0U; i < count; ++i) {
                for (const auto row : needed_rows(staged_[i].operation)) {
                    const auto found = producers.find(row.value);
                    if (found == producers.end()) {
                        continue;
                    }
                    for (const auto producer : found->second) {
                        if (producer != i) {
                            predecessors[i].insert(producer);
                        }
                    }
                }
                for (const auto& guard : staged_[i].operation.guards) {
                    const auto found = lookups.find(guard.row.value);
                    if (found != lookups.end() && found->second != i) {
                        predecessors[i].insert(found->second);
                    }
                }
                for (const auto predecessor : staged_[i].after) {
                    if (predecessor != i) {
                        predecessors[i].insert(predecessor);
                    }
                }
            }

            std::vector<std::vector<std::size_t>> successors(count);
            std::vector<std::size_t> pending(count, 0U);
            std::set<std::size_t> ready;
            for (std::size_t i = 0U; i < count; ++i) {
                pending[i] = predecessors[i].size();
                for (const auto predecessor : predecessors[i]) {
                    successors[predecessor].push_back(i);
                }
                if (pending[i] == 0U) {
                    ready.insert(i);
                }
            }

            std::vector<std::size_t> sequence;
            sequence.reserve(count);
            while (!ready.empty()) {
                const auto next = *ready.begin();
                ready.erase(ready.begin());
                sequence.push_back(next);
                for (const auto successor : successors[next]) {
                    if (--pending[successor] == 0U) {
                        ready.insert(successor);
                    }
                }
            }

            if (sequence.size() == count) {
                std::vector<PlanOperation> operations;
                operations.reserve(count);
                for (const auto index : sequence) {
                    operations.push_back(std::move(staged_[index].operation));
                }
                return operations;
            }

            std::vector<bool> emitted(count, false);
            for (const auto index : sequence) {
                emitted[index] = true;
            }
            if (!split_cycle(producers, emitted)) {
                for (std::size_t i = 0U; i < count; ++i) {
                    if (!emitted[i]) {
                        fail(RelqErrc::ConstraintCycle,
                             "rows written by this request require each other's keys and no foreign key in the cycle is optional",
                             staged_[i].operation.path);
                    }
                }
            }
        }
    }

    bool split_cycle(const std::map<std::uint32_t, std::vector<std::size_t>>& producers, const std::vector<bool>& emitted)
    {
        for (std::size_t i = 0U; i < emitted.size(); ++i) {
            auto& operation = staged_[i].operation;
            if (emitted[i] || operation.kind != PlanOperationKind::Insert) {
                continue;
            }
            for (auto binding = operation.bindings.begin(); binding != operation.bindings.end(); ++binding) {
                if (!binding->nullable) {
                    continue;
                }
                const auto found = producers.find(binding->referenced.value);
                if (found == producers.end()) {
                    continue;
                }
                const auto in_cycle = std::any_of(found->second.begin(), found->second.end(), [&](std::size_t producer) {
                    return !emitted[producer];
                });
                if (!in_cycle) {
                    continue;
                }

                PlanOperation patch{};
                patch.kind = PlanOperationKind::LinkForeignKey;
                patch.table = operation.table;
                patch.row = operation.row;
                patch.bindings.push_back(*binding);
                patch.guards = operation.guards;
                patch.deferred = true;
                patch.path = operation.path;
                plan_.diagnostics.push_back("deferred " + operation.table + " foreign key (" + binding->columns.front()
                                            + ") until r" + std::to_string(binding->referenced.value) + " exists");
                operation.bindings.erase(binding);
                stage(std::move(patch));
                return true;
            }
        }
        return false;
    }

    struct CreatedRow final {
        std::string model{};
        Row key{};
        RowRef row{};
    };

    const schema::SchemaModel& schema_;
    WritePlan plan_{};
    std::vector<StagedOperation> staged_{};
    std::map<std::uint32_t, std::size_t> insert_of_{};
    std::vector<CreatedRow> created_{};
};

}  // namespace

WritePlan plan_write(const schema::SchemaModel& schema, const WriteRequest& request)
{
    return WritePlanner{schema}.plan(request);
}

}  // namespace relq::write
