#include "relq/core/engine_telemetry.hpp"

namespace relq {

void EngineTelemetry::record_write_attempt() noexcept
{
    write_plans_attempted_.fetch_add(1U, std::memory_order_relaxed);
}

void EngineTelemetry::record_write_success(std::size_t operations_executed) noexcept
{
    write_plans_succeeded_.fetch_add(1U, std::memory_order_relaxed);
    operations_executed_.fetch_add(static_cast<std::uint64_t>(operations_executed), std::memory_order_relaxed);
}

void EngineTelemetry::record_write_failure() noexcept
{
    write_plans_failed_.fetch_add(1U, std::memory_order_relaxed);
}

void EngineTelemetry::record_conflict_retry() noexcept
{
    conflict_retries_.fetch_add(1U, std::memory_order_relaxed);
}

void EngineTelemetry::record_rollback() noexcept
{
    rollbacks_.fetch_add(1U, std::memory_order_relaxed);
}

void EngineTelemetry::record_chain_resolved() noexcept
{
    chains_resolved_.fetch_add(1U, std::memory_order_relaxed);
}

void EngineTelemetry::record_chain_rejected() noexcept
{
    chains_rejected_.fetch_add(1U, std::memory_order_relaxed);
}

void EngineTelemetry::record_read(std::size_t levels, std::size_t batched_fetches) noexcept
{
    reads_resolved_.fetch_add(1U, std::memory_order_relaxed);
    read_levels_.fetch_add(static_cast<std::uint64_t>(levels), std::memory_order_relaxed);
    batched_fetches_.fetch_add(static_cast<std::uint64_t>(batched_fetches), std::memory_order_relaxed);
}

EngineTelemetrySnapshot EngineTelemetry::snapshot() const noexcept
{
    EngineTelemetrySnapshot snapshot{};
    snapshot.write_plans_attempted = write_plans_attempted_.load(std::memory_order_relaxed);
    snapshot.write_plans_succeeded = write_plans_succeeded_.load(std::memory_order_relaxed);
    snapshot.write_plans_failed = write_plans_failed_.load(std::memory_order_relaxed);
    snapshot.operations_executed = operations_executed_.load(std::memory_order_relaxed);
    snapshot.conflict_retries = conflict_retries_.load(std::memory_order_relaxed);
    snapshot.rollbacks = rollbacks_.load(std::memory_order_relaxed);
    snapshot.chains_resolved = chains_resolved_.load(std::memory_order_relaxed);
    snapshot.chains_rejected = chains_rejected_.load(std::memory_order_relaxed);
    snapshot.reads_resolved = reads_resolved_.load(std::memory_order_relaxed);
    snapshot.read_levels = read_levels_.load(std::memory_order_relaxed);
    snapshot.batched_fetches = batched_fetches_.load(std::memory_order_relaxed);
    return snapshot;
}

void EngineTelemetry::reset() noexcept
{
    write_plans_attempted_.store(0U, std::memory_order_relaxed);
    write_plans_succeeded_.store(0U, std::memory_order_relaxed);
    write_plans_failed_.store(0U, std::memory_order_relaxed);
    operations_executed_.store(0U, std::memory_order_relaxed);
    conflict_retries_.store(0U, std::memory_order_relaxed);
    rollbacks_.store(0U, std::memory_order_relaxed);
    chains_resolved_.store(0U, std::memory_order_relaxed);
    chains_rejected_.store(0U, std::memory_order_relaxed);
    reads_resolved_.store(0U, std::memory_order_relaxed);
    read_levels_.store(0U, std::memory_order_relaxed);
    batched_fetches_.store(0U, std::memory_order_relaxed);
}

}  // namespace relq
