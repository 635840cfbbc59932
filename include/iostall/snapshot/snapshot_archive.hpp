#pragma once

#include "iostall/snapshot/snapshot_store.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace iostall::snapshot {

inline constexpr std::string_view kArchiveHeader =
    "captured_at,database_id,database_name,file_id,drive,file_type,physical_name,"
    "num_of_reads,num_of_writes,io_stall_read_ms,io_stall_write_ms,io_stall_total_ms,"
    "num_of_bytes_read,num_of_bytes_written,file_handle";

struct ArchiveDiagnostic final {
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;

    [[nodiscard]] bool empty() const noexcept { return message.empty(); }
};

[[nodiscard]] std::error_code parse_snapshot_record(std::string_view line,
                                                    SnapshotRecord& out,
                                                    ArchiveDiagnostic* diagnostic = nullptr);

[[nodiscard]] std::string format_snapshot_record(const SnapshotRecord& record);

// Parses a whole archive document. Records come back in file order. A final
// line without a terminating newline is an append still in flight and is
// ignored.
[[nodiscard]] std::error_code parse_snapshot_archive(std::string_view text,
                                                     std::vector<SnapshotRecord>& out,
                                                     ArchiveDiagnostic* diagnostic = nullptr);

// Text-file snapshot store: a fixed header line followed by one
// comma-separated record per line.
class SnapshotArchive final : public SnapshotStore {
public:
    explicit SnapshotArchive(std::filesystem::path path) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept;

    // Creates the archive with its header when it does not exist yet.
    [[nodiscard]] std::error_code initialize() const;

    [[nodiscard]] std::error_code load_all(std::vector<SnapshotRecord>& out,
                                           ArchiveDiagnostic* diagnostic = nullptr) const;

    [[nodiscard]] std::error_code scan_window(const TimeWindow& window,
                                              std::vector<SnapshotRecord>& out) const override;
    [[nodiscard]] std::error_code find_predecessors(std::span<const FileKey> keys,
                                                    Timestamp before,
                                                    std::vector<SnapshotRecord>& out) const override;
    [[nodiscard]] std::error_code append(std::span<const SnapshotRecord> records) override;

    [[nodiscard]] ArchiveDiagnostic last_diagnostic() const;

private:
    std::error_code read_document(std::string& text) const;
    std::error_code load_records(std::vector<SnapshotRecord>& out) const;
    // Drops a partial record left by an interrupted append, or terminates a
    // bare header, so the next append starts on a fresh line.
    std::error_code repair_tail() const;

    std::filesystem::path path_{};
    mutable std::mutex append_mutex_{};
    mutable std::mutex diagnostic_mutex_{};
    mutable ArchiveDiagnostic last_diagnostic_{};
};

// Reads the current counters from an archive-formatted file, keeping the
// latest record per (database_id, file_id).
class ArchiveCounterReader final : public CounterReader {
public:
    explicit ArchiveCounterReader(std::filesystem::path path) noexcept;

    [[nodiscard]] std::error_code read_current(std::vector<SnapshotRecord>& out) override;

private:
    SnapshotArchive archive_;
};

}  // namespace iostall::snapshot
