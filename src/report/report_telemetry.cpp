#include "iostall/report/report_telemetry.hpp"

#include "iostall/report/report_types.hpp"

namespace iostall::report {

void ReportTelemetry::add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept
{
    target.fetch_add(value, std::memory_order_relaxed);
}

void ReportTelemetry::record_request(ReportMode mode) noexcept
{
    if (mode == ReportMode::Current) {
        add_relaxed(current_requests_, 1U);
    } else {
        add_relaxed(historical_requests_, 1U);
    }
}

void ReportTelemetry::record_request_error() noexcept
{
    add_relaxed(request_errors_, 1U);
}

void ReportTelemetry::record_collaborator_error() noexcept
{
    add_relaxed(collaborator_errors_, 1U);
}

void ReportTelemetry::record_result(std::size_t snapshots_scanned,
                                    std::size_t deltas_emitted,
                                    std::size_t reset_pairs,
                                    std::size_t orphan_snapshots,
                                    std::size_t rows_emitted) noexcept
{
    add_relaxed(snapshots_scanned_, static_cast<std::uint64_t>(snapshots_scanned));
    add_relaxed(deltas_emitted_, static_cast<std::uint64_t>(deltas_emitted));
    add_relaxed(reset_pairs_, static_cast<std::uint64_t>(reset_pairs));
    add_relaxed(orphan_snapshots_, static_cast<std::uint64_t>(orphan_snapshots));
    add_relaxed(rows_emitted_, static_cast<std::uint64_t>(rows_emitted));
}

void ReportTelemetry::record_duration(std::uint64_t duration_ns) noexcept
{
    add_relaxed(total_duration_ns_, duration_ns);
    last_duration_ns_.store(duration_ns, std::memory_order_relaxed);
}

ReportTelemetrySnapshot ReportTelemetry::snapshot() const noexcept
{
    ReportTelemetrySnapshot snapshot{};
    snapshot.historical_requests = historical_requests_.load(std::memory_order_relaxed);
    snapshot.current_requests = current_requests_.load(std::memory_order_relaxed);
    snapshot.request_errors = request_errors_.load(std::memory_order_relaxed);
    snapshot.collaborator_errors = collaborator_errors_.load(std::memory_order_relaxed);
    snapshot.snapshots_scanned = snapshots_scanned_.load(std::memory_order_relaxed);
    snapshot.deltas_emitted = deltas_emitted_.load(std::memory_order_relaxed);
    snapshot.reset_pairs = reset_pairs_.load(std::memory_order_relaxed);
    snapshot.orphan_snapshots = orphan_snapshots_.load(std::memory_order_relaxed);
    snapshot.rows_emitted = rows_emitted_.load(std::memory_order_relaxed);
    snapshot.total_duration_ns = total_duration_ns_.load(std::memory_order_relaxed);
    snapshot.last_duration_ns = last_duration_ns_.load(std::memory_order_relaxed);
    return snapshot;
}

void ReportTelemetry::reset() noexcept
{
    historical_requests_.store(0U, std::memory_order_relaxed);
    current_requests_.store(0U, std::memory_order_relaxed);
    request_errors_.store(0U, std::memory_order_relaxed);
    collaborator_errors_.store(0U, std::memory_order_relaxed);
    snapshots_scanned_.store(0U, std::memory_order_relaxed);
    deltas_emitted_.store(0U, std::memory_order_relaxed);
    reset_pairs_.store(0U, std::memory_order_relaxed);
    orphan_snapshots_.store(0U, std::memory_order_relaxed);
    rows_emitted_.store(0U, std::memory_order_relaxed);
    total_duration_ns_.store(0U, std::memory_order_relaxed);
    last_duration_ns_.store(0U, std::memory_order_relaxed);
}

}  // namespace iostall::report
