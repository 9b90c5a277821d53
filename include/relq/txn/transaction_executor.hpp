#pragma once

#include "relq/query/predicate.hpp"
#include "relq/query/query.hpp"
#include "relq/query/value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace relq::txn {

struct TransactionHandle final {
    std::uint64_t value = 0U;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0U; }
};

constexpr bool operator==(TransactionHandle lhs, TransactionHandle rhs) noexcept
{
    return lhs.value == rhs.value;
}

constexpr bool operator!=(TransactionHandle lhs, TransactionHandle rhs) noexcept
{
    return !(lhs == rhs);
}

struct InsertRow final {
    std::string table{};
    query::Row values{};
};

struct UpdateRows final {
    std::string table{};
    query::PredicatePtr where{};
    query::Row values{};
};

struct DeleteRows final {
    std::string table{};
    query::PredicatePtr where{};
};

using StorageCommand = std::variant<InsertRow, UpdateRows, DeleteRows>;

struct StorageResult final {
    // Stored row, generated ids included. Only set for InsertRow.
    std::optional<query::Row> inserted_row{};
    std::size_t affected_rows = 0U;
};

// Storage capability consumed by the planners and resolvers. Unique
// constraint conflicts must surface as StorageErrc::UniqueViolation.
class TransactionExecutor {
public:
    virtual ~TransactionExecutor() = default;

    virtual TransactionHandle begin() = 0;
    virtual std::error_code execute(TransactionHandle handle, const StorageCommand& command, StorageResult& result) = 0;
    virtual std::error_code query(TransactionHandle handle, const query::Query& query, std::vector<query::Row>& rows) = 0;
    virtual std::error_code commit(TransactionHandle handle) = 0;
    virtual std::error_code rollback(TransactionHandle handle) = 0;
};

// Rolls the transaction back unless commit() succeeded.
class TransactionScope final {
public:
    explicit TransactionScope(TransactionExecutor& executor);
    ~TransactionScope();

    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;

    [[nodiscard]] TransactionHandle handle() const noexcept { return handle_; }
    [[nodiscard]] bool completed() const noexcept { return completed_; }

    std::error_code commit();
    std::error_code rollback();

private:
    TransactionExecutor& executor_;
    TransactionHandle handle_{};
    bool completed_ = false;
};

[[nodiscard]] std::string describe(const StorageCommand& command);

}  // namespace relq::txn
