#pragma once

#include "relq/core/query_context.hpp"
#include "relq/query/value.hpp"
#include "relq/write/write_directive.hpp"
#include "relq/write/write_plan.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace relq::write {

struct WriteResult final {
    // Root row as committed, when WriteOptions::return_root_row is set.
    std::optional<query::Row> row{};
    std::size_t operations_executed = 0U;
    std::size_t attempts = 0U;
    std::vector<std::string> diagnostics{};
};

// Executes plan inside one transaction, in plan order. Any failing operation
// rolls the whole transaction back and surfaces as QueryError with code
// TransactionAborted, cause() holding the original code and the operation's
// directive path.
WriteResult run_write_plan(const QueryContext& context, const WritePlan& plan);

// plan_write followed by run_write_plan.
WriteResult execute_write(const QueryContext& context, const WriteRequest& request);

}  // namespace relq::write
