#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace iostall::snapshot {

using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

enum class FileRole : std::uint8_t {
    Data = 0,
    Log,
    Other
};

struct FileKey final {
    std::int32_t database_id = 0;
    std::int32_t file_id = 0;

    friend auto operator<=>(const FileKey&, const FileKey&) = default;
};

// Cumulative per-file counters as exposed by the engine since it started.
struct IoCounters final {
    std::uint64_t reads = 0U;
    std::uint64_t writes = 0U;
    std::uint64_t read_stall_ms = 0U;
    std::uint64_t write_stall_ms = 0U;
    std::uint64_t total_stall_ms = 0U;
    std::uint64_t bytes_read = 0U;
    std::uint64_t bytes_written = 0U;

    friend bool operator==(const IoCounters&, const IoCounters&) = default;
};

struct SnapshotRecord final {
    Timestamp captured_at{};
    std::int32_t database_id = 0;
    std::string database_name{};
    std::int32_t file_id = 0;
    std::string drive{};
    std::string file_type{};
    std::string physical_path{};
    IoCounters counters{};
    std::uint64_t file_handle = 0U;

    [[nodiscard]] FileKey key() const noexcept { return FileKey{database_id, file_id}; }
    [[nodiscard]] FileRole role() const noexcept;
};

struct TimeWindow final {
    Timestamp begin{};
    Timestamp end{};

    [[nodiscard]] bool contains(Timestamp value) const noexcept { return value >= begin && value <= end; }
    [[nodiscard]] bool empty() const noexcept { return end < begin; }
};

// Databases a capture or a current-state report considers. The defaults
// skip the engine's master, model and msdb databases and keep tempdb.
struct DatabaseScope final {
    std::vector<std::int32_t> excluded_database_ids{1, 3, 4};
    bool require_database_name = true;

    [[nodiscard]] bool includes(const SnapshotRecord& record) const noexcept;
};

[[nodiscard]] FileRole classify_file_role(std::string_view file_type) noexcept;
[[nodiscard]] std::string_view file_role_name(FileRole role) noexcept;
[[nodiscard]] std::string file_role_label(FileRole role, std::string_view file_type);

[[nodiscard]] std::string drive_from_path(std::string_view physical_path);

}  // namespace iostall::snapshot
