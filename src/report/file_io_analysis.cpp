#include "iostall/report/file_io_analysis.hpp"

#include "iostall/report/latency_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>

namespace iostall::report {

namespace {

std::optional<double> ratio(std::uint64_t numerator, std::uint64_t denominator)
{
    if (denominator == 0U) {
        return std::nullopt;
    }
    return round_to_hundredths(static_cast<double>(numerator) / static_cast<double>(denominator));
}

}  // namespace

double round_to_hundredths(double value) noexcept
{
    return std::round(value * 100.0) / 100.0;
}

FileIoStatus classify_file_io(snapshot::FileRole role,
                              const std::optional<double>& read_latency_ms,
                              const std::optional<double>& write_latency_ms,
                              const FileIoThresholds& thresholds) noexcept
{
    if (role == snapshot::FileRole::Data) {
        if (read_latency_ms && *read_latency_ms > thresholds.data_read_latency_ms) {
            return FileIoStatus::HighReadLatency;
        }
        if (write_latency_ms && *write_latency_ms > thresholds.data_write_latency_ms) {
            return FileIoStatus::HighWriteLatency;
        }
    } else if (role == snapshot::FileRole::Log) {
        if (write_latency_ms && *write_latency_ms > thresholds.log_write_latency_ms) {
            return FileIoStatus::HighLogWriteLatency;
        }
    }
    return FileIoStatus::Ok;
}

std::string_view file_io_status_label(FileIoStatus status) noexcept
{
    switch (status) {
    case FileIoStatus::HighReadLatency:
        return "High Read Latency";
    case FileIoStatus::HighWriteLatency:
        return "High Write Latency";
    case FileIoStatus::HighLogWriteLatency:
        return "High Log Write Latency";
    case FileIoStatus::Ok:
    default:
        return "OK";
    }
}

std::vector<FileIoAnalysis> analyze_file_io(std::span<const snapshot::SnapshotRecord> records,
                                            std::uint64_t uptime_seconds,
                                            const FileIoThresholds& thresholds)
{
    std::vector<const snapshot::SnapshotRecord*> active;
    active.reserve(records.size());
    for (const auto& record : records) {
        if (record.counters.reads + record.counters.writes > 0U) {
            active.push_back(&record);
        }
    }
    std::sort(active.begin(), active.end(), [](const auto* lhs, const auto* rhs) {
        return std::tie(lhs->database_id, lhs->file_id) < std::tie(rhs->database_id, rhs->file_id);
    });

    std::vector<FileIoAnalysis> out;
    out.reserve(active.size());
    for (const auto* record : active) {
        const auto& counters = record->counters;
        const auto operations = counters.reads + counters.writes;

        FileIoAnalysis row{};
        row.database_name = record->database_name;
        row.physical_path = record->physical_path;
        row.file_type = record->file_type;
        row.read_gb = rounded_quotient(counters.bytes_read, kBytesPerGigabyte);
        row.write_gb = rounded_quotient(counters.bytes_written, kBytesPerGigabyte);
        row.read_percentage = rounded_quotient(counters.reads * 100U, operations);
        row.write_percentage = rounded_quotient(counters.writes * 100U, operations);
        row.read_count = counters.reads;
        row.write_count = counters.writes;
        if (counters.reads > 0U) {
            row.avg_read_size_kb = round_to_hundredths(static_cast<double>(counters.bytes_read)
                                                       / static_cast<double>(counters.reads) / 1024.0);
        }
        if (counters.writes > 0U) {
            row.avg_write_size_kb = round_to_hundredths(static_cast<double>(counters.bytes_written)
                                                        / static_cast<double>(counters.writes) / 1024.0);
        }
        row.avg_read_latency_ms = ratio(counters.read_stall_ms, counters.reads);
        row.avg_write_latency_ms = ratio(counters.write_stall_ms, counters.writes);
        row.avg_io_latency_ms = ratio(counters.total_stall_ms, operations);
        row.total_read_stall_ms = counters.read_stall_ms;
        row.total_write_stall_ms = counters.write_stall_ms;
        row.total_io_stall_ms = counters.total_stall_ms;
        if (uptime_seconds > 0U) {
            const auto per_second = static_cast<double>(operations) / static_cast<double>(uptime_seconds);
            row.avg_iops = round_to_hundredths(per_second);
            row.estimated_peak_iops = round_to_hundredths(per_second * kPeakIopsFactor);
        }
        row.status = classify_file_io(record->role(), row.avg_read_latency_ms, row.avg_write_latency_ms, thresholds);
        out.push_back(std::move(row));
    }
    return out;
}

}  // namespace iostall::report
