#pragma once

#include "iostall/snapshot/snapshot_types.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace iostall::report {

using snapshot::FileKey;
using snapshot::FileRole;
using snapshot::IoCounters;
using snapshot::SnapshotRecord;
using snapshot::TimeWindow;
using snapshot::Timestamp;

enum class ReportMode : std::uint8_t {
    Historical = 0,
    Current
};

enum class RoleFilter : std::uint8_t {
    All = 0,
    Data,
    Log
};

// Whether a row's counters cover one capture interval or everything since
// the engine last started.
enum class CounterBasis : std::uint8_t {
    Interval = 0,
    SinceEngineStart
};

inline constexpr std::int64_t kDefaultLookbackHours = 24;
inline constexpr std::int64_t kMaxLookbackHours = 24 * 366 * 10;

// (database name, file role). Other roles keep the engine descriptor as
// their label so that distinct file types stay apart. Ordering is by
// database name then label.
struct DimensionKey final {
    std::string database_name{};
    std::string role_label{};
    FileRole role = FileRole::Data;

    friend auto operator<=>(const DimensionKey&, const DimensionKey&) = default;
};

[[nodiscard]] DimensionKey make_dimension_key(const SnapshotRecord& record);

struct DeltaRecord final {
    Timestamp interval_start{};
    Timestamp interval_end{};
    FileKey file{};
    DimensionKey dimension{};
    IoCounters delta{};
};

// A consecutive pair dropped because at least one counter went backwards.
struct DiscardedPair final {
    Timestamp interval_start{};
    Timestamp interval_end{};
    FileKey file{};
    DimensionKey dimension{};
};

struct DeltaStats final {
    std::size_t snapshots_considered = 0U;
    std::size_t deltas_emitted = 0U;
    std::size_t reset_pairs = 0U;
    std::size_t orphan_snapshots = 0U;
};

struct AggregatedMetric final {
    Timestamp interval_end{};
    DimensionKey dimension{};
    std::uint64_t avg_read_latency_ms = 0U;
    std::uint64_t avg_write_latency_ms = 0U;
    std::uint64_t avg_total_latency_ms = 0U;
    std::uint64_t total_reads = 0U;
    std::uint64_t total_writes = 0U;
    std::uint64_t total_read_kb = 0U;
    std::uint64_t total_write_kb = 0U;
    std::uint64_t total_read_pages = 0U;
    std::uint64_t total_write_pages = 0U;
    std::uint64_t file_count = 0U;
    std::uint64_t discarded_files = 0U;
    CounterBasis basis = CounterBasis::Interval;

    friend bool operator==(const AggregatedMetric&, const AggregatedMetric&) = default;
};

struct ReportRequest final {
    ReportMode mode = ReportMode::Historical;
    std::int64_t lookback_hours = kDefaultLookbackHours;
    std::optional<std::string> database_filter{};
    // Raw caller text; validated by the reporter. Absent means all roles.
    std::optional<std::string> role_filter{};
};

struct ReportDataQuality final {
    std::size_t snapshots_scanned = 0U;
    std::size_t predecessors_loaded = 0U;
    std::size_t deltas_emitted = 0U;
    std::size_t reset_pairs = 0U;
    std::size_t orphan_snapshots = 0U;
    std::size_t zero_filled_cells = 0U;
};

struct ReportResult final {
    std::uint64_t correlation_id = 0U;
    ReportMode mode = ReportMode::Historical;
    TimeWindow window{};
    Timestamp generated_at{};
    std::vector<AggregatedMetric> rows{};
    ReportDataQuality quality{};
    std::error_code error{};
    std::error_code collaborator_error{};
    std::string message{};

    [[nodiscard]] bool ok() const noexcept { return !error; }
};

struct ReportInvocation final {
    std::uint64_t correlation_id = 0U;
    ReportMode mode = ReportMode::Historical;
    std::int64_t lookback_hours = 0;
    std::optional<std::string> database_filter{};
    std::optional<std::string> role_filter{};
    TimeWindow window{};
    bool success = false;
    std::string error{};
    std::size_t row_count = 0U;
    std::size_t snapshots_scanned = 0U;
    std::size_t deltas_emitted = 0U;
    std::size_t reset_pairs = 0U;
    std::size_t orphan_snapshots = 0U;
    std::uint64_t duration_ns = 0U;
    Timestamp started_at{};
    Timestamp finished_at{};
};

// Case-insensitive, ignores surrounding whitespace.
[[nodiscard]] std::error_code parse_role_filter(std::string_view text, RoleFilter& out);
[[nodiscard]] std::error_code parse_report_mode(std::string_view text, ReportMode& out);

[[nodiscard]] bool role_filter_matches(RoleFilter filter, FileRole role) noexcept;

[[nodiscard]] std::string_view report_mode_name(ReportMode mode) noexcept;
[[nodiscard]] std::string_view role_filter_name(RoleFilter filter) noexcept;
[[nodiscard]] std::string_view counter_basis_name(CounterBasis basis) noexcept;

}  // namespace iostall::report
