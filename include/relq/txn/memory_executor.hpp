#pragma once

#include "relq/schema/schema_model.hpp"
#include "relq/txn/transaction_executor.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace relq::txn {

// Reference executor over in-memory tables. Writes apply in place and are
// undone from a per-transaction log on rollback. Enforces primary keys, unique
// constraints, NOT NULL, column types and foreign keys with RESTRICT semantics.
class MemoryExecutor final : public TransactionExecutor {
public:
    // Invoked before a command runs; a non-zero result fails the command.
    using CommandHook = std::function<std::error_code(std::size_t command_index, const StorageCommand& command)>;
    using QueryHook = std::function<void(std::size_t query_index, const query::Query& query)>;

    struct Config final {
        const schema::SchemaModel* schema = nullptr;
        // Scan tables newest-first when a query carries no order.
        bool reverse_scan_order = false;
    };

    struct Counters final {
        std::uint64_t begins = 0U;
        std::uint64_t commits = 0U;
        std::uint64_t rollbacks = 0U;
        std::uint64_t commands = 0U;
        std::uint64_t queries = 0U;
    };

    explicit MemoryExecutor(Config config);

    TransactionHandle begin() override;
    std::error_code execute(TransactionHandle handle, const StorageCommand& command, StorageResult& result) override;
    std::error_code query(TransactionHandle handle, const query::Query& query, std::vector<query::Row>& rows) override;
    std::error_code commit(TransactionHandle handle) override;
    std::error_code rollback(TransactionHandle handle) override;

    // Stores a row outside of any transaction, as a concurrent writer would.
    std::error_code seed(const std::string& table, query::Row row);

    [[nodiscard]] std::vector<query::Row> rows(const std::string& table) const;
    [[nodiscard]] std::size_t row_count(const std::string& table) const;

    void set_command_hook(CommandHook hook);
    void set_query_hook(QueryHook hook);

    [[nodiscard]] Counters counters() const;
    [[nodiscard]] std::vector<std::string> command_log() const;
    [[nodiscard]] std::vector<std::string> query_log() const;
    [[nodiscard]] std::size_t active_transactions() const;
    void clear_logs();

private:
    struct StoredRow final {
        std::uint64_t rowid = 0U;
        query::Row values{};
    };

    struct Table final {
        const schema::ModelDescriptor* model = nullptr;
        std::vector<StoredRow> rows{};
        std::int64_t next_id = 1;
    };

    enum class UndoKind {
        Inserted,
        Updated,
        Deleted
    };

    struct UndoEntry final {
        UndoKind kind = UndoKind::Inserted;
        std::string table{};
        std::uint64_t rowid = 0U;
        query::Row before{};
    };

    struct TransactionState final {
        std::vector<UndoEntry> undo{};
        std::size_t commands = 0U;
        std::size_t queries = 0U;
    };

    class Evaluator;

    std::error_code insert_locked(const InsertRow& command, StorageResult& result, std::vector<UndoEntry>& undo);
    std::error_code update_locked(const UpdateRows& command, StorageResult& result, std::vector<UndoEntry>& undo);
    std::error_code delete_locked(const DeleteRows& command, StorageResult& result, std::vector<UndoEntry>& undo);
    std::error_code query_locked(const query::Query& query, std::vector<query::Row>& rows) const;

    std::error_code normalize(const Table& table, query::Row& row) const;
    std::error_code check_unique(const Table& table, const query::Row& row, std::uint64_t self_rowid) const;
    std::error_code check_outgoing_keys(const Table& table, const query::Row& row, const query::Row* before) const;
    std::error_code check_incoming_keys(const Table& table,
                                        std::uint64_t rowid,
                                        const query::Row& before,
                                        const query::Row* after) const;
    std::error_code validate_predicate(const Table& table, const query::PredicatePtr& predicate) const;

    [[nodiscard]] Table* find_table(const std::string& name);
    [[nodiscard]] const Table* find_table(const std::string& name) const;

    void undo_locked(const std::vector<UndoEntry>& undo);

    Config config_{};
    mutable std::mutex mutex_{};
    std::unordered_map<std::string, Table> tables_{};
    std::unordered_map<std::uint64_t, TransactionState> transactions_{};
    std::uint64_t next_handle_ = 1U;
    std::uint64_t next_rowid_ = 1U;
    CommandHook command_hook_{};
    QueryHook query_hook_{};
    Counters counters_{};
    std::vector<std::string> command_log_{};
    std::vector<std::string> query_log_{};
};

}  // namespace relq::txn
