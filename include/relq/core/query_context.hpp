#pragma once

namespace relq::schema {
class SchemaModel;
}

namespace relq::txn {
class TransactionExecutor;
}

namespace relq {

class EngineTelemetry;

struct WriteOptions final {
    // Replay the plan once when an insert behind connectOrCreate hits a
    // unique conflict, so the second attempt connects to the winner.
    bool retry_conflicts_as_connect = true;
    // Re-read the root row before commit and return it in WriteResult.
    bool return_root_row = true;
};

struct ReadOptions final {
    // Fetch sibling relations of one level concurrently.
    bool parallel_relations = false;
};

struct QueryContextConfig final {
    const schema::SchemaModel* schema = nullptr;
    txn::TransactionExecutor* executor = nullptr;
    EngineTelemetry* telemetry = nullptr;
    WriteOptions write_options{};
    ReadOptions read_options{};
};

// Explicit per-call context handed to the planners and resolvers.
class QueryContext final {
public:
    explicit QueryContext(QueryContextConfig config);

    [[nodiscard]] const schema::SchemaModel& schema() const noexcept { return *config_.schema; }
    [[nodiscard]] txn::TransactionExecutor& executor() const noexcept { return *config_.executor; }
    [[nodiscard]] EngineTelemetry* telemetry() const noexcept { return config_.telemetry; }
    [[nodiscard]] const WriteOptions& write_options() const noexcept { return config_.write_options; }
    [[nodiscard]] const ReadOptions& read_options() const noexcept { return config_.read_options; }

private:
    QueryContextConfig config_{};
};

}  // namespace relq
