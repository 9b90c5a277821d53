#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace relq {

struct EngineTelemetrySnapshot final {
    std::uint64_t write_plans_attempted = 0U;
    std::uint64_t write_plans_succeeded = 0U;
    std::uint64_t write_plans_failed = 0U;
    std::uint64_t operations_executed = 0U;
    std::uint64_t conflict_retries = 0U;
    std::uint64_t rollbacks = 0U;
    std::uint64_t chains_resolved = 0U;
    std::uint64_t chains_rejected = 0U;
    std::uint64_t reads_resolved = 0U;
    std::uint64_t read_levels = 0U;
    std::uint64_t batched_fetches = 0U;
};

// Shared counter block referenced from QueryContext. Safe to update from
// concurrent requests.
class EngineTelemetry final {
public:
    void record_write_attempt() noexcept;
    void record_write_success(std::size_t operations_executed) noexcept;
    void record_write_failure() noexcept;
    void record_conflict_retry() noexcept;
    void record_rollback() noexcept;

    void record_chain_resolved() noexcept;
    void record_chain_rejected() noexcept;

    void record_read(std::size_t levels, std::size_t batched_fetches) noexcept;

    [[nodiscard]] EngineTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    std::atomic<std::uint64_t> write_plans_attempted_{0U};
    std::atomic<std::uint64_t> write_plans_succeeded_{0U};
    std::atomic<std::uint64_t> write_plans_failed_{0U};
    std::atomic<std::uint64_t> operations_executed_{0U};
    std::atomic<std::uint64_t> conflict_retries_{0U};
    std::atomic<std::uint64_t> rollbacks_{0U};
    std::atomic<std::uint64_t> chains_resolved_{0U};
    std::atomic<std::uint64_t> chains_rejected_{0U};
    std::atomic<std::uint64_t> reads_resolved_{0U};
    std::atomic<std::uint64_t> read_levels_{0U};
    std::atomic<std::uint64_t> batched_fetches_{0U};
};

}  // namespace relq
