#pragma once

#include "iostall/snapshot/snapshot_types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace iostall::report {

enum class FileIoStatus : std::uint8_t {
    Ok = 0,
    HighReadLatency,
    HighWriteLatency,
    HighLogWriteLatency
};

// Latency limits in milliseconds; a file is flagged when its average is
// strictly above the limit.
struct FileIoThresholds final {
    double data_read_latency_ms = 20.0;
    double data_write_latency_ms = 10.0;
    double log_write_latency_ms = 5.0;
};

struct FileIoAnalysis final {
    std::string database_name{};
    std::string physical_path{};
    std::string file_type{};
    std::uint64_t read_gb = 0U;
    std::uint64_t read_percentage = 0U;
    std::uint64_t write_gb = 0U;
    std::uint64_t write_percentage = 0U;
    std::uint64_t read_count = 0U;
    std::uint64_t write_count = 0U;
    double avg_read_size_kb = 0.0;
    double avg_write_size_kb = 0.0;
    std::optional<double> avg_read_latency_ms{};
    std::optional<double> avg_write_latency_ms{};
    std::optional<double> avg_io_latency_ms{};
    std::uint64_t total_read_stall_ms = 0U;
    std::uint64_t total_write_stall_ms = 0U;
    std::uint64_t total_io_stall_ms = 0U;
    std::optional<double> avg_iops{};
    std::optional<double> estimated_peak_iops{};
    FileIoStatus status = FileIoStatus::Ok;
};

inline constexpr std::uint64_t kBytesPerGigabyte = 1024ULL * 1024ULL * 1024ULL;
inline constexpr double kPeakIopsFactor = 3.0;

// One row per file that has seen any I/O, ordered by (database_id, file_id).
// `uptime_seconds` is the time since the engine started; IOPS are absent
// when it is zero.
[[nodiscard]] std::vector<FileIoAnalysis> analyze_file_io(std::span<const snapshot::SnapshotRecord> records,
                                                          std::uint64_t uptime_seconds,
                                                          const FileIoThresholds& thresholds = {});

[[nodiscard]] FileIoStatus classify_file_io(snapshot::FileRole role,
                                            const std::optional<double>& read_latency_ms,
                                            const std::optional<double>& write_latency_ms,
                                            const FileIoThresholds& thresholds) noexcept;

[[nodiscard]] std::string_view file_io_status_label(FileIoStatus status) noexcept;

// Rounds half away from zero to two decimal places.
[[nodiscard]] double round_to_hundredths(double value) noexcept;

}  // namespace iostall::report
