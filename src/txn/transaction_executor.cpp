#include "relq/txn/transaction_executor.hpp"

#include "relq/core/errors.hpp"

#include <type_traits>

namespace relq::txn {

TransactionScope::TransactionScope(TransactionExecutor& executor)
    : executor_{executor}
    , handle_{executor.begin()}
{
}

TransactionScope::~TransactionScope()
{
    if (!completed_) {
        (void)rollback();
    }
}

std::error_code TransactionScope::commit()
{
    if (completed_) {
        return {};
    }
    if (!handle_.is_valid()) {
        return make_error_code(StorageErrc::TransactionNotActive);
    }
    if (auto ec = executor_.commit(handle_)) {
        (void)rollback();
        return ec;
    }
    completed_ = true;
    return {};
}

std::error_code TransactionScope::rollback()
{
    if (completed_) {
        return {};
    }
    completed_ = true;
    if (!handle_.is_valid()) {
        return {};
    }
    return executor_.rollback(handle_);
}

std::string describe(const StorageCommand& command)
{
    return std::visit(
        [](const auto& cmd) -> std::string {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, InsertRow>) {
                return "insert into " + cmd.table + " " + query::to_string(cmd.values);
            } else if constexpr (std::is_same_v<T, UpdateRows>) {
                return "update " + cmd.table + " set " + query::to_string(cmd.values) + " where "
                       + query::describe(cmd.where);
            } else {
                return "delete from " + cmd.table + " where " + query::describe(cmd.where);
            }
        },
        command);
}

}  // namespace relq::txn
