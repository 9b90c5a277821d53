#pragma once

#include "relq/write/write_plan.hpp"

#include <string>

namespace relq::write {

struct WritePlanPrinterOptions final {
    bool include_paths = true;
    bool include_rows = true;
};

// One line per operation, e.g. "#1 Insert Profile r2 bind (userId)<-r1.(id)".
[[nodiscard]] std::string explain_write_plan(const WritePlan& plan, WritePlanPrinterOptions options = {});
[[nodiscard]] std::string describe_operation(const PlanOperation& operation);

}  // namespace relq::write
