#include "iostall/report/latency_aggregator.hpp"

#include <map>
#include <stdexcept>
#include <utility>

namespace iostall::report {

std::uint64_t rounded_quotient(std::uint64_t value, std::uint64_t divisor) noexcept
{
    if (divisor == 0U) {
        return 0U;
    }
    auto quotient = value / divisor;
    const auto remainder = value % divisor;
    if (remainder != 0U && remainder >= divisor - remainder) {
        ++quotient;
    }
    return quotient;
}

std::uint64_t average_latency_ms(std::uint64_t stall_ms, std::uint64_t operations) noexcept
{
    return rounded_quotient(stall_ms, operations);
}

void LatencyAggregator::Accumulator::add(const IoCounters& counters) noexcept
{
    sums.reads += counters.reads;
    sums.writes += counters.writes;
    sums.read_stall_ms += counters.read_stall_ms;
    sums.write_stall_ms += counters.write_stall_ms;
    sums.total_stall_ms += counters.total_stall_ms;
    sums.bytes_read += counters.bytes_read;
    sums.bytes_written += counters.bytes_written;
    ++file_count;
}

LatencyAggregator::LatencyAggregator(AggregatorConfig config)
    : config_{config}
{
    if (config_.page_size_bytes == 0U) {
        throw std::invalid_argument{"LatencyAggregator page size must be greater than zero"};
    }
}

const AggregatorConfig& LatencyAggregator::config() const noexcept
{
    return config_;
}

AggregatedMetric LatencyAggregator::finish(Timestamp interval_end,
                                           const DimensionKey& dimension,
                                           const Accumulator& accumulator,
                                           CounterBasis basis) const
{
    const auto& sums = accumulator.sums;

    AggregatedMetric metric{};
    metric.interval_end = interval_end;
    metric.dimension = dimension;
    metric.avg_read_latency_ms = average_latency_ms(sums.read_stall_ms, sums.reads);
    metric.avg_write_latency_ms = average_latency_ms(sums.write_stall_ms, sums.writes);
    metric.avg_total_latency_ms = average_latency_ms(sums.total_stall_ms, sums.reads + sums.writes);
    metric.total_reads = sums.reads;
    metric.total_writes = sums.writes;
    metric.total_read_kb = rounded_quotient(sums.bytes_read, kBytesPerKilobyte);
    metric.total_write_kb = rounded_quotient(sums.bytes_written, kBytesPerKilobyte);
    metric.total_read_pages = rounded_quotient(sums.bytes_read, config_.page_size_bytes);
    metric.total_write_pages = rounded_quotient(sums.bytes_written, config_.page_size_bytes);
    metric.file_count = accumulator.file_count;
    metric.discarded_files = accumulator.discarded_files;
    metric.basis = basis;
    return metric;
}

std::vector<AggregatedMetric> LatencyAggregator::aggregate_intervals(std::span<const DeltaRecord> deltas,
                                                                     std::span<const DiscardedPair> discarded) const
{
    std::map<std::pair<Timestamp, DimensionKey>, Accumulator> groups;
    for (const auto& delta : deltas) {
        groups[{delta.interval_end, delta.dimension}].add(delta.delta);
    }
    for (const auto& pair : discarded) {
        ++groups[{pair.interval_end, pair.dimension}].discarded_files;
    }

    std::vector<AggregatedMetric> out;
    out.reserve(groups.size());
    for (const auto& [cell, accumulator] : groups) {
        out.push_back(finish(cell.first, cell.second, accumulator, CounterBasis::Interval));
    }
    return out;
}

std::vector<AggregatedMetric> LatencyAggregator::aggregate_current(std::span<const SnapshotRecord> records,
                                                                   Timestamp now) const
{
    std::map<DimensionKey, Accumulator> groups;
    for (const auto& record : records) {
        groups[make_dimension_key(record)].add(record.counters);
    }

    std::vector<AggregatedMetric> out;
    out.reserve(groups.size());
    for (const auto& [dimension, accumulator] : groups) {
        out.push_back(finish(now, dimension, accumulator, CounterBasis::SinceEngineStart));
    }
    return out;
}

AggregatedMetric LatencyAggregator::empty_metric(Timestamp interval_end,
                                                 const DimensionKey& dimension,
                                                 CounterBasis basis) const
{
    return finish(interval_end, dimension, Accumulator{}, basis);
}

}  // namespace iostall::report
