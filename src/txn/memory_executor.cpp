#include "relq/txn/memory_executor.hpp"

#include "relq/core/errors.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace relq::txn {

namespace {

using query::ComparisonOp;
using query::KeyTuple;
using query::PredicateKind;
using query::Row;
using query::Value;

bool keys_equal(const KeyTuple& lhs, const KeyTuple& rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0U; i < lhs.size(); ++i) {
        if (!query::values_equal(lhs[i], rhs[i])) {
            return false;
        }
    }
    return true;
}

const Value& column_value(const Row& row, const std::string& column)
{
    static const Value null_value{};
    const auto it = row.find(column);
    return it == row.end() ? null_value : it->second;
}

bool compare_term(const query::ComparisonTerm& term, const Row& row)
{
    const auto& value = column_value(row, term.column);
    switch (term.op) {
    case ComparisonOp::IsNull:
        return query::is_null(value);
    case ComparisonOp::IsNotNull:
        return !query::is_null(value);
    case ComparisonOp::In:
        return !query::is_null(value)
               && std::any_of(term.values.begin(), term.values.end(), [&](const Value& candidate) {
                      return query::values_equal(value, candidate);
                  });
    case ComparisonOp::NotIn:
        return !query::is_null(value)
               && std::none_of(term.values.begin(), term.values.end(), [&](const Value& candidate) {
                      return query::values_equal(value, candidate);
                  });
    default:
        break;
    }

    if (query::is_null(value) || query::is_null(term.value)) {
        return false;
    }
    const auto order = query::compare_values(value, term.value);
    switch (term.op) {
    case ComparisonOp::Equal:
        return order == 0;
    case ComparisonOp::NotEqual:
        return order != 0;
    case ComparisonOp::Less:
        return order < 0;
    case ComparisonOp::LessEqual:
        return order <= 0;
    case ComparisonOp::Greater:
        return order > 0;
    case ComparisonOp::GreaterEqual:
        return order >= 0;
    default:
        return false;
    }
}

}  // namespace

// Evaluates validated predicates. KeysIn subqueries are materialized once per
// evaluator so a command scans each subquery table a single time.
class MemoryExecutor::Evaluator final {
public:
    explicit Evaluator(const MemoryExecutor& executor)
        : executor_{executor}
    {
    }

    bool matches(const query::PredicatePtr& predicate, const Row& row)
    {
        if (!predicate) {
            return true;
        }
        switch (predicate->kind()) {
        case PredicateKind::True:
            return true;
        case PredicateKind::False:
            return false;
        case PredicateKind::Comparison:
            return compare_term(predicate->comparison(), row);
        case PredicateKind::And:
            for (const auto& child : predicate->children()) {
                if (!matches(child, row)) {
                    return false;
                }
            }
            return true;
        case PredicateKind::Or:
            for (const auto& child : predicate->children()) {
                if (matches(child, row)) {
                    return true;
                }
            }
            return false;
        case PredicateKind::Not:
            return predicate->children().empty() || !matches(predicate->children().front(), row);
        case PredicateKind::KeysIn: {
            const auto key = query::project(row, predicate->keys_in().columns);
            if (query::has_null(key)) {
                return false;
            }
            return subquery_keys(*predicate).count(key) != 0U;
        }
        case PredicateKind::Relation:
            break;
        }
        return false;
    }

private:
    using KeySet = std::set<KeyTuple, query::KeyTupleLess>;

    const KeySet& subquery_keys(const query::Predicate& predicate)
    {
        const auto found = cache_.find(&predicate);
        if (found != cache_.end()) {
            return found->second;
        }

        KeySet keys;
        const auto& subquery = predicate.keys_in().subquery;
        if (const auto* table = executor_.find_table(subquery.table)) {
            for (const auto& stored : table->rows) {
                if (!matches(subquery.where, stored.values)) {
                    continue;
                }
                auto key = query::project(stored.values, subquery.projected_columns);
                if (!query::has_null(key)) {
                    keys.insert(std::move(key));
                }
            }
        }
        return cache_.emplace(&predicate, std::move(keys)).first->second;
    }

    const MemoryExecutor& executor_;
    std::map<const query::Predicate*, KeySet> cache_{};
};

MemoryExecutor::MemoryExecutor(Config config)
    : config_{config}
{
    if (config_.schema == nullptr) {
        throw std::invalid_argument{"MemoryExecutor requires a schema model"};
    }
    for (const auto& model : config_.schema->tables()) {
        Table table{};
        table.model = &model;
        tables_.emplace(model.name, std::move(table));
    }
}

TransactionHandle MemoryExecutor::begin()
{
    std::lock_guard guard{mutex_};
    const TransactionHandle handle{next_handle_++};
    transactions_.emplace(handle.value, TransactionState{});
    ++counters_.begins;
    return handle;
}

std::error_code MemoryExecutor::execute(TransactionHandle handle, const StorageCommand& command, StorageResult& result)
{
    result = StorageResult{};

    CommandHook hook;
    std::size_t index = 0U;
    {
        std::lock_guard guard{mutex_};
        auto it = transactions_.find(handle.value);
        if (it == transactions_.end()) {
            return make_error_code(StorageErrc::TransactionNotActive);
        }
        index = it->second.commands++;
        ++counters_.commands;
        command_log_.push_back(describe(command));
        hook = command_hook_;
    }

    // Hooks run unlocked so that they may seed rows like a concurrent writer.
    if (hook) {
        if (auto ec = hook(index, command)) {
            return ec;
        }
    }

    std::lock_guard guard{mutex_};
    auto it = transactions_.find(handle.value);
    if (it == transactions_.end()) {
        return make_error_code(StorageErrc::TransactionNotActive);
    }

    std::vector<UndoEntry> pending;
    const auto ec = std::visit(
        [&](const auto& cmd) -> std::error_code {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, InsertRow>) {
                return insert_locked(cmd, result, pending);
            } else if constexpr (std::is_same_v<T, UpdateRows>) {
                return update_locked(cmd, result, pending);
            } else {
                return delete_locked(cmd, result, pending);
            }
        },
        command);

    if (ec) {
        undo_locked(pending);
        result = StorageResult{};
        return ec;
    }

    auto& undo = it->second.undo;
    undo.insert(undo.end(), std::make_move_iterator(pending.begin()), std::make_move_iterator(pending.end()));
    return {};
}

std::error_code MemoryExecutor::query(TransactionHandle handle, const query::Query& query, std::vector<Row>& rows)
{
    rows.clear();

    QueryHook hook;
    std::size_t index = 0U;
    {
        std::lock_guard guard{mutex_};
        auto it = transactions_.find(handle.value);
        if (it == transactions_.end()) {
            return make_error_code(StorageErrc::TransactionNotActive);
        }
        index = it->second.queries++;
        ++counters_.queries;
        query_log_.push_back(query::describe(query));
        hook = query_hook_;
    }

    if (hook) {
        hook(index, query);
    }

    std::lock_guard guard{mutex_};
    if (transactions_.find(handle.value) == transactions_.end()) {
        return make_error_code(StorageErrc::TransactionNotActive);
    }
    return query_locked(query, rows);
}

std::error_code MemoryExecutor::commit(TransactionHandle handle)
{
    std::lock_guard guard{mutex_};
    auto it = transactions_.find(handle.value);
    if (it == transactions_.end()) {
        return make_error_code(StorageErrc::TransactionNotActive);
    }
    transactions_.erase(it);
    ++counters_.commits;
    return {};
}

std::error_code MemoryExecutor::rollback(TransactionHandle handle)
{
    std::lock_guard guard{mutex_};
    auto it = transactions_.find(handle.value);
    if (it == transactions_.end()) {
        return make_error_code(StorageErrc::TransactionNotActive);
    }
    undo_locked(it->second.undo);
    transactions_.erase(it);
    ++counters_.rollbacks;
    return {};
}

std::error_code MemoryExecutor::seed(const std::string& table, Row row)
{
    std::lock_guard guard{mutex_};
    StorageResult result{};
    std::vector<UndoEntry> pending;
    auto ec = insert_locked(InsertRow{table, std::move(row)}, result, pending);
    if (ec) {
        undo_locked(pending);
    }
    return ec;
}

std::vector<Row> MemoryExecutor::rows(const std::string& table) const
{
    std::lock_guard guard{mutex_};
    std::vector<Row> values;
    if (const auto* stored = find_table(table)) {
        values.reserve(stored->rows.size());
        for (const auto& row : stored->rows) {
            values.push_back(row.values);
        }
    }
    return values;
}

std::size_t MemoryExecutor::row_count(const std::string& table) const
{
    std::lock_guard guard{mutex_};
    const auto* stored = find_table(table);
    return stored == nullptr ? 0U : stored->rows.size();
}

void MemoryExecutor::set_command_hook(CommandHook hook)
{
    std::lock_guard guard{mutex_};
    command_hook_ = std::move(hook);
}

void MemoryExecutor::set_query_hook(QueryHook hook)
{
    std::lock_guard guard{mutex_};
    query_hook_ = std::move(hook);
}

MemoryExecutor::Counters MemoryExecutor::counters() const
{
    std::lock_guard guard{mutex_};
    return counters_;
}

std::vector<std::string> MemoryExecutor::command_log() const
{
    std::lock_guard guard{mutex_};
    return command_log_;
}

std::vector<std::string> MemoryExecutor::query_log() const
{
    std::lock_guard guard{mutex_};
    return query_log_;
}

std::size_t MemoryExecutor::active_transactions() const
{
    std::lock_guard guard{mutex_};
    return transactions_.size();
}

void MemoryExecutor::clear_logs()
{
    std::lock_guard guard{mutex_};
    command_log_.clear();
    query_log_.clear();
    counters_ = Counters{};
}

std::error_code MemoryExecutor::insert_locked(const InsertRow& command, StorageResult& result, std::vector<UndoEntry>& undo)
{
    auto* table = find_table(command.table);
    if (table == nullptr) {
        return make_error_code(StorageErrc::UnknownTable);
    }

    Row row;
    for (const auto& [column, value] : command.values) {
        if (table->model->find_field(column) == nullptr) {
            return make_error_code(StorageErrc::UnknownColumn);
        }
        row[column] = value;
    }

    for (const auto& field : table->model->fields) {
        auto it = row.find(field.name);
        const bool missing = it == row.end();
        if (field.autoincrement && field.type == schema::ScalarType::Int) {
            if (missing || query::is_null(it->second)) {
                row[field.name] = Value{table->next_id++};
                continue;
            }
            if (const auto* explicit_id = std::get_if<std::int64_t>(&it->second)) {
                table->next_id = std::max(table->next_id, *explicit_id + 1);
            }
            continue;
        }
        if (missing) {
            row[field.name] = field.default_value.value_or(Value{});
        }
    }

    if (auto ec = normalize(*table, row)) {
        return ec;
    }
    if (auto ec = check_unique(*table, row, 0U)) {
        return ec;
    }
    if (auto ec = check_outgoing_keys(*table, row, nullptr)) {
        return ec;
    }

    const auto rowid = next_rowid_++;
    table->rows.push_back(StoredRow{rowid, row});
    undo.push_back(UndoEntry{UndoKind::Inserted, command.table, rowid, {}});
    result.inserted_row = std::move(row);
    result.affected_rows = 1U;
    return {};
}

std::error_code MemoryExecutor::update_locked(const UpdateRows& command, StorageResult& result, std::vector<UndoEntry>& undo)
{
    auto* table = find_table(command.table);
    if (table == nullptr) {
        return make_error_code(StorageErrc::UnknownTable);
    }
    for (const auto& [column, value] : command.values) {
        (void)value;
        if (table->model->find_field(column) == nullptr) {
            return make_error_code(StorageErrc::UnknownColumn);
        }
    }
    if (auto ec = validate_predicate(*table, command.where)) {
        return ec;
    }

    std::vector<std::uint64_t> matched;
    Evaluator evaluator{*this};
    for (const auto& stored : table->rows) {
        if (evaluator.matches(command.where, stored.values)) {
            matched.push_back(stored.rowid);
        }
    }

    for (const auto rowid : matched) {
        auto it = std::find_if(table->rows.begin(), table->rows.end(), [&](const StoredRow& r) { return r.rowid == rowid; });
        if (it == table->rows.end()) {
            continue;
        }
        const Row before = it->values;
        Row after = before;
        for (const auto& [column, value] : command.values) {
            after[column] = value;
        }
        if (auto ec = normalize(*table, after)) {
            return ec;
        }
        if (auto ec = check_unique(*table, after, rowid)) {
            return ec;
        }
        if (auto ec = check_outgoing_keys(*table, after, &before)) {
            return ec;
        }
        if (auto ec = check_incoming_keys(*table, rowid, before, &after)) {
            return ec;
        }
        it->values = std::move(after);
        undo.push_back(UndoEntry{UndoKind::Updated, command.table, rowid, before});
        ++result.affected_rows;
    }
    return {};
}

std::error_code MemoryExecutor::delete_locked(const DeleteRows& command, StorageResult& result, std::vector<UndoEntry>& undo)
{
    auto* table = find_table(command.table);
    if (table == nullptr) {
        return make_error_code(StorageErrc::UnknownTable);
    }
    if (auto ec = validate_predicate(*table, command.where)) {
        return ec;
    }

    std::vector<std::uint64_t> matched;
    Evaluator evaluator{*this};
    for (const auto& stored : table->rows) {
        if (evaluator.matches(command.where, stored.values)) {
            matched.push_back(stored.rowid);
        }
    }

    for (const auto rowid : matched) {
        auto it = std::find_if(table->rows.begin(), table->rows.end(), [&](const StoredRow& r) { return r.rowid == rowid; });
        if (it == table->rows.end()) {
            continue;
        }
        if (auto ec = check_incoming_keys(*table, rowid, it->values, nullptr)) {
            return ec;
        }
        undo.push_back(UndoEntry{UndoKind::Deleted, command.table, rowid, it->values});
        table->rows.erase(it);
        ++result.affected_rows;
    }
    return {};
}

std::error_code MemoryExecutor::query_locked(const query::Query& query, std::vector<Row>& rows) const
{
    const auto* table = find_table(query.table);
    if (table == nullptr) {
        return make_error_code(StorageErrc::UnknownTable);
    }
    if (auto ec = validate_predicate(*table, query.where)) {
        return ec;
    }
    for (const auto& term : query.order_by) {
        if (table->model->find_field(term.column) == nullptr) {
            return make_error_code(StorageErrc::UnknownColumn);
        }
    }

    std::vector<const StoredRow*> matched;
    Evaluator evaluator{*this};
    for (const auto& stored : table->rows) {
        if (evaluator.matches(query.where, stored.values)) {
            matched.push_back(&stored);
        }
    }

    if (query.order_by.empty()) {
        if (config_.reverse_scan_order) {
            std::reverse(matched.begin(), matched.end());
        }
    } else {
        std::stable_sort(matched.begin(), matched.end(), [&](const StoredRow* lhs, const StoredRow* rhs) {
            for (const auto& term : query.order_by) {
                const auto order = query::compare_values(column_value(lhs->values, term.column),
                                                         column_value(rhs->values, term.column));
                if (order != 0) {
                    return term.direction == query::SortDirection::Ascending ? order < 0 : order > 0;
                }
            }
            return false;
        });
    }

    const auto begin = std::min(query.skip, matched.size());
    auto end = matched.size();
    if (query.take.has_value()) {
        end = std::min(end, begin + *query.take);
    }
    rows.reserve(end - begin);
    for (auto i = begin; i < end; ++i) {
        rows.push_back(matched[i]->values);
    }
    return {};
}

std::error_code MemoryExecutor::normalize(const Table& table, Row& row) const
{
    for (const auto& [column, value] : row) {
        (void)value;
        if (table.model->find_field(column) == nullptr) {
            return make_error_code(StorageErrc::UnknownColumn);
        }
    }

    for (const auto& field : table.model->fields) {
        auto& value = row[field.name];
        if (query::is_null(value)) {
            if (!field.nullable) {
                return make_error_code(StorageErrc::NotNullViolation);
            }
            continue;
        }
        switch (field.type) {
        case schema::ScalarType::Int:
            if (!std::holds_alternative<std::int64_t>(value)) {
                return make_error_code(StorageErrc::TypeMismatch);
            }
            break;
        case schema::ScalarType::Float:
            if (const auto* integer = std::get_if<std::int64_t>(&value)) {
                value = static_cast<double>(*integer);
            } else if (!std::holds_alternative<double>(value)) {
                return make_error_code(StorageErrc::TypeMismatch);
            }
            break;
        case schema::ScalarType::Bool:
            if (!std::holds_alternative<bool>(value)) {
                return make_error_code(StorageErrc::TypeMismatch);
            }
            break;
        case schema::ScalarType::String:
            if (!std::holds_alternative<std::string>(value)) {
                return make_error_code(StorageErrc::TypeMismatch);
            }
            break;
        }
    }
    return {};
}

std::error_code MemoryExecutor::check_unique(const Table& table, const Row& row, std::uint64_t self_rowid) const
{
    for (const auto& constraint : table.model->unique_constraints) {
        const auto key = query::project(row, constraint);
        if (query::has_null(key)) {
            continue;
        }
        for (const auto& stored : table.rows) {
            if (stored.rowid != self_rowid && keys_equal(query::project(stored.values, constraint), key)) {
                return make_error_code(StorageErrc::UniqueViolation);
            }
        }
    }
    return {};
}

std::error_code MemoryExecutor::check_outgoing_keys(const Table& table, const Row& row, const Row* before) const
{
    for (const auto& foreign_key : config_.schema->foreign_keys()) {
        if (foreign_key.table != table.model->name) {
            continue;
        }
        const auto key = query::project(row, foreign_key.columns);
        if (query::has_null(key)) {
            continue;
        }
        if (before != nullptr && keys_equal(query::project(*before, foreign_key.columns), key)) {
            continue;
        }
        const auto* referenced = find_table(foreign_key.referenced_table);
        if (referenced == nullptr) {
            return make_error_code(StorageErrc::UnknownTable);
        }
        const auto exists = std::any_of(referenced->rows.begin(), referenced->rows.end(), [&](const StoredRow& stored) {
            return keys_equal(query::project(stored.values, foreign_key.referenced_columns), key);
        });
        if (!exists) {
            return make_error_code(StorageErrc::ForeignKeyViolation);
        }
    }
    return {};
}

std::error_code MemoryExecutor::check_incoming_keys(const Table& table,
                                                    std::uint64_t rowid,
                                                    const Row& before,
                                                    const Row* after) const
{
    for (const auto& foreign_key : config_.schema->foreign_keys()) {
        if (foreign_key.referenced_table != table.model->name) {
            continue;
        }
        const auto key = query::project(before, foreign_key.referenced_columns);
        if (query::has_null(key)) {
            continue;
        }
        if (after != nullptr && keys_equal(query::project(*after, foreign_key.referenced_columns), key)) {
            continue;
        }
        const auto* referencing = find_table(foreign_key.table);
        if (referencing == nullptr) {
            return make_error_code(StorageErrc::UnknownTable);
        }
        const bool same_table = referencing == &table;
        const auto referenced = std::any_of(referencing->rows.begin(), referencing->rows.end(), [&](const StoredRow& stored) {
            if (same_table && stored.rowid == rowid) {
                return false;
            }
            return keys_equal(query::project(stored.values, foreign_key.columns), key);
        });
        if (referenced) {
            return make_error_code(StorageErrc::ForeignKeyViolation);
        }
    }
    return {};
}

std::error_code MemoryExecutor::validate_predicate(const Table& table, const query::PredicatePtr& predicate) const
{
    if (!predicate) {
        return {};
    }
    switch (predicate->kind()) {
    case PredicateKind::True:
    case PredicateKind::False:
        return {};
    case PredicateKind::Comparison:
        if (table.model->find_field(predicate->comparison().column) == nullptr) {
            return make_error_code(StorageErrc::UnknownColumn);
        }
        return {};
    case PredicateKind::And:
    case PredicateKind::Or:
    case PredicateKind::Not:
        for (const auto& child : predicate->children()) {
            if (auto ec = validate_predicate(table, child)) {
                return ec;
            }
        }
        return {};
    case PredicateKind::Relation:
        return make_error_code(StorageErrc::UnsupportedPredicate);
    case PredicateKind::KeysIn: {
        const auto& term = predicate->keys_in();
        for (const auto& column : term.columns) {
            if (table.model->find_field(column) == nullptr) {
                return make_error_code(StorageErrc::UnknownColumn);
            }
        }
        const auto* inner = find_table(term.subquery.table);
        if (inner == nullptr) {
            return make_error_code(StorageErrc::UnknownTable);
        }
        for (const auto& column : term.subquery.projected_columns) {
            if (inner->model->find_field(column) == nullptr) {
                return make_error_code(StorageErrc::UnknownColumn);
            }
        }
        return validate_predicate(*inner, term.subquery.where);
    }
    }
    return {};
}

MemoryExecutor::Table* MemoryExecutor::find_table(const std::string& name)
{
    const auto it = tables_.find(name);
    return it == tables_.end() ? nullptr : &it->second;
}

const MemoryExecutor::Table* MemoryExecutor::find_table(const std::string& name) const
{
    const auto it = tables_.find(name);
    return it == tables_.end() ? nullptr : &it->second;
}

void MemoryExecutor::undo_locked(const std::vector<UndoEntry>& undo)
{
    for (auto entry = undo.rbegin(); entry != undo.rend(); ++entry) {
        auto* table = find_table(entry->table);
        if (table == nullptr) {
            continue;
        }
        auto& rows = table->rows;
        const auto rowid = entry->rowid;
        const auto it = std::find_if(rows.begin(), rows.end(), [&](const StoredRow& r) { return r.rowid == rowid; });
        switch (entry->kind) {
        case UndoKind::Inserted:
            if (it != rows.end()) {
                rows.erase(it);
            }
            break;
        case UndoKind::Updated:
            if (it != rows.end()) {
                it->values = entry->before;
            }
            break;
        case UndoKind::Deleted: {
            const auto position = std::lower_bound(rows.begin(), rows.end(), rowid, [](const StoredRow& r, std::uint64_t id) {
                return r.rowid < id;
            });
            rows.insert(position, StoredRow{rowid, entry->before});
            break;
        }
        }
    }
}

}  // namespace relq::txn
