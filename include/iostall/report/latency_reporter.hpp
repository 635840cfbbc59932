#pragma once

#include "iostall/report/latency_aggregator.hpp"
#include "iostall/report/report_telemetry.hpp"
#include "iostall/report/report_types.hpp"
#include "iostall/snapshot/snapshot_store.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <system_error>

namespace iostall::report {

// Dispatches a report request to the historical (snapshot delta) or current
// (cumulative counter) pipeline and returns the ordered rows.
//
// The reporter holds no per-report state; one instance may serve concurrent
// callers as long as its collaborators tolerate concurrent reads.
class LatencyReporter final {
public:
    using Clock = std::function<Timestamp()>;
    using InvocationLogger = std::function<void(const ReportInvocation&)>;

    struct Config final {
        const snapshot::SnapshotStore* store = nullptr;
        snapshot::CounterReader* counters = nullptr;
        AggregatorConfig aggregator{};
        snapshot::DatabaseScope scope{};
        Clock clock{};
        ReportTelemetry* telemetry = nullptr;
        InvocationLogger invocation_logger{};
    };

    // Throws std::invalid_argument when neither a store nor a counter
    // source is configured.
    explicit LatencyReporter(Config config);

    LatencyReporter(const LatencyReporter&) = delete;
    LatencyReporter& operator=(const LatencyReporter&) = delete;

    // On failure `result.rows` is empty and `result.error` holds the same
    // code that is returned.
    std::error_code report(const ReportRequest& request, ReportResult& result) const;

    [[nodiscard]] const Config& config() const noexcept;

private:
    [[nodiscard]] std::error_code validate(const ReportRequest& request, RoleFilter& role) const;
    std::error_code run_historical(const ReportRequest& request, RoleFilter role, ReportResult& result) const;
    std::error_code run_current(const ReportRequest& request, RoleFilter role, ReportResult& result) const;
    [[nodiscard]] Timestamp now() const;

    Config config_{};
    mutable std::atomic<std::uint64_t> next_correlation_id_{1U};
};

}  // namespace iostall::report
