#pragma once

#include "relq/chain/fluent_chain.hpp"
#include "relq/core/engine_telemetry.hpp"
#include "relq/core/errors.hpp"
#include "relq/query/value.hpp"
#include "relq/read/read_resolver.hpp"
#include "relq/write/plan_runner.hpp"

#include <string>

namespace relq::tools {

[[nodiscard]] std::string format_row_json(const query::Row& row);
[[nodiscard]] std::string format_telemetry_json(const EngineTelemetrySnapshot& snapshot);
[[nodiscard]] std::string format_write_result_json(const write::WriteResult& result);
[[nodiscard]] std::string format_read_result_json(const read::ReadResult& result);
[[nodiscard]] std::string format_chain_result_json(const chain::ChainResult& result);
[[nodiscard]] std::string format_error_json(const QueryError& error);

}  // namespace relq::tools
