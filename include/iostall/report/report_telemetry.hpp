#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace iostall::report {

enum class ReportMode : std::uint8_t;

struct ReportTelemetrySnapshot final {
    std::uint64_t historical_requests = 0U;
    std::uint64_t current_requests = 0U;
    std::uint64_t request_errors = 0U;
    std::uint64_t collaborator_errors = 0U;
    std::uint64_t snapshots_scanned = 0U;
    std::uint64_t deltas_emitted = 0U;
    std::uint64_t reset_pairs = 0U;
    std::uint64_t orphan_snapshots = 0U;
    std::uint64_t rows_emitted = 0U;
    std::uint64_t total_duration_ns = 0U;
    std::uint64_t last_duration_ns = 0U;
};

class ReportTelemetry final {
public:
    void record_request(ReportMode mode) noexcept;
    void record_request_error() noexcept;
    void record_collaborator_error() noexcept;
    void record_result(std::size_t snapshots_scanned,
                       std::size_t deltas_emitted,
                       std::size_t reset_pairs,
                       std::size_t orphan_snapshots,
                       std::size_t rows_emitted) noexcept;
    void record_duration(std::uint64_t duration_ns) noexcept;

    [[nodiscard]] ReportTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    static void add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept;

    std::atomic<std::uint64_t> historical_requests_{0U};
    std::atomic<std::uint64_t> current_requests_{0U};
    std::atomic<std::uint64_t> request_errors_{0U};
    std::atomic<std::uint64_t> collaborator_errors_{0U};
    std::atomic<std::uint64_t> snapshots_scanned_{0U};
    std::atomic<std::uint64_t> deltas_emitted_{0U};
    std::atomic<std::uint64_t> reset_pairs_{0U};
    std::atomic<std::uint64_t> orphan_snapshots_{0U};
    std::atomic<std::uint64_t> rows_emitted_{0U};
    std::atomic<std::uint64_t> total_duration_ns_{0U};
    std::atomic<std::uint64_t> last_duration_ns_{0U};
};

}  // namespace iostall::report
