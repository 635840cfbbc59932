#pragma once

#include "iostall/report/report_types.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace iostall::report {

inline constexpr std::uint64_t kBytesPerKilobyte = 1024U;
inline constexpr std::uint64_t kDefaultPageSizeBytes = 8192U;

struct AggregatorConfig final {
    // Engine page size used for the byte to page conversion.
    std::uint64_t page_size_bytes = kDefaultPageSizeBytes;
};

// value / divisor rounded half away from zero; 0 when divisor is 0.
[[nodiscard]] std::uint64_t rounded_quotient(std::uint64_t value, std::uint64_t divisor) noexcept;
[[nodiscard]] std::uint64_t average_latency_ms(std::uint64_t stall_ms, std::uint64_t operations) noexcept;

class LatencyAggregator final {
public:
    // Throws std::invalid_argument when page_size_bytes is zero.
    explicit LatencyAggregator(AggregatorConfig config = {});

    [[nodiscard]] const AggregatorConfig& config() const noexcept;

    // One metric per (interval_end, dimension) present in either input,
    // ordered by time then dimension. Discarded pairs only bump
    // discarded_files on their cell.
    [[nodiscard]] std::vector<AggregatedMetric> aggregate_intervals(std::span<const DeltaRecord> deltas,
                                                                    std::span<const DiscardedPair> discarded) const;

    // Raw cumulative counters grouped by dimension alone, stamped with `now`.
    [[nodiscard]] std::vector<AggregatedMetric> aggregate_current(std::span<const SnapshotRecord> records,
                                                                  Timestamp now) const;

    [[nodiscard]] AggregatedMetric empty_metric(Timestamp interval_end,
                                                const DimensionKey& dimension,
                                                CounterBasis basis) const;

private:
    struct Accumulator final {
        IoCounters sums{};
        std::uint64_t file_count = 0U;
        std::uint64_t discarded_files = 0U;

        void add(const IoCounters& counters) noexcept;
    };

    [[nodiscard]] AggregatedMetric finish(Timestamp interval_end,
                                          const DimensionKey& dimension,
                                          const Accumulator& accumulator,
                                          CounterBasis basis) const;

    AggregatorConfig config_{};
};

}  // namespace iostall::report
