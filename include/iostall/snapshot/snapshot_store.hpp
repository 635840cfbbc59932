#pragma once

#include "iostall/snapshot/snapshot_types.hpp"

#include <map>
#include <mutex>
#include <span>
#include <system_error>
#include <vector>

namespace iostall::snapshot {

// Append-only history of captures keyed by (captured_at, database_id, file_id).
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    // Every record whose captured_at lies inside the inclusive window, ordered
    // by (captured_at, database_id, file_id).
    [[nodiscard]] virtual std::error_code scan_window(const TimeWindow& window,
                                                      std::vector<SnapshotRecord>& out) const = 0;

    // For each key, the latest record strictly older than `before`. Keys with
    // no such record are absent from the output.
    [[nodiscard]] virtual std::error_code find_predecessors(std::span<const FileKey> keys,
                                                            Timestamp before,
                                                            std::vector<SnapshotRecord>& out) const = 0;

    [[nodiscard]] virtual std::error_code append(std::span<const SnapshotRecord> records) = 0;
};

// Live cumulative counters, one record per tracked file.
class CounterReader {
public:
    virtual ~CounterReader() = default;

    [[nodiscard]] virtual std::error_code read_current(std::vector<SnapshotRecord>& out) = 0;
};

class MemorySnapshotStore final : public SnapshotStore {
public:
    MemorySnapshotStore() = default;
    explicit MemorySnapshotStore(std::span<const SnapshotRecord> records);

    [[nodiscard]] std::error_code scan_window(const TimeWindow& window,
                                              std::vector<SnapshotRecord>& out) const override;
    [[nodiscard]] std::error_code find_predecessors(std::span<const FileKey> keys,
                                                    Timestamp before,
                                                    std::vector<SnapshotRecord>& out) const override;
    [[nodiscard]] std::error_code append(std::span<const SnapshotRecord> records) override;

    [[nodiscard]] std::size_t size() const;

private:
    using FileHistory = std::map<Timestamp, SnapshotRecord>;

    mutable std::mutex mutex_{};
    std::map<FileKey, FileHistory> files_{};
    std::size_t record_count_ = 0U;
};

class MemoryCounterReader final : public CounterReader {
public:
    MemoryCounterReader() = default;
    explicit MemoryCounterReader(std::vector<SnapshotRecord> records);

    void set_records(std::vector<SnapshotRecord> records);
    void set_failure(std::error_code error);

    [[nodiscard]] std::error_code read_current(std::vector<SnapshotRecord>& out) override;

private:
    mutable std::mutex mutex_{};
    std::vector<SnapshotRecord> records_{};
    std::error_code failure_{};
};

void sort_by_capture(std::vector<SnapshotRecord>& records);

}  // namespace iostall::snapshot
