#include "iostall/snapshot/snapshot_store.hpp"

#include "iostall/snapshot/snapshot_errors.hpp"

#include <algorithm>
#include <set>
#include <tuple>
#include <utility>

namespace iostall::snapshot {

void sort_by_capture(std::vector<SnapshotRecord>& records)
{
    std::sort(records.begin(), records.end(), [](const SnapshotRecord& lhs, const SnapshotRecord& rhs) {
        return std::tie(lhs.captured_at, lhs.database_id, lhs.file_id)
            < std::tie(rhs.captured_at, rhs.database_id, rhs.file_id);
    });
}

MemorySnapshotStore::MemorySnapshotStore(std::span<const SnapshotRecord> records)
{
    for (const auto& record : records) {
        auto& history = files_[record.key()];
        if (history.insert_or_assign(record.captured_at, record).second) {
            ++record_count_;
        }
    }
}

std::error_code MemorySnapshotStore::scan_window(const TimeWindow& window, std::vector<SnapshotRecord>& out) const
{
    out.clear();
    if (window.empty()) {
        return {};
    }

    {
        std::lock_guard guard(mutex_);
        for (const auto& [key, history] : files_) {
            const auto first = history.lower_bound(window.begin);
            const auto last = history.upper_bound(window.end);
            for (auto it = first; it != last; ++it) {
                out.push_back(it->second);
            }
        }
    }

    sort_by_capture(out);
    return {};
}

std::error_code MemorySnapshotStore::find_predecessors(std::span<const FileKey> keys,
                                                       Timestamp before,
                                                       std::vector<SnapshotRecord>& out) const
{
    out.clear();
    const std::set<FileKey> unique_keys(keys.begin(), keys.end());

    std::lock_guard guard(mutex_);
    for (const auto& key : unique_keys) {
        const auto file = files_.find(key);
        if (file == files_.end()) {
            continue;
        }
        const auto& history = file->second;
        auto it = history.lower_bound(before);
        if (it == history.begin()) {
            continue;
        }
        --it;
        out.push_back(it->second);
    }
    return {};
}

std::error_code MemorySnapshotStore::append(std::span<const SnapshotRecord> records)
{
    std::lock_guard guard(mutex_);

    std::set<std::pair<FileKey, Timestamp>> batch_keys;
    for (const auto& record : records) {
        if (!batch_keys.emplace(record.key(), record.captured_at).second) {
            return make_error_code(SnapshotErrc::DuplicateRecord);
        }
        const auto file = files_.find(record.key());
        if (file != files_.end() && file->second.contains(record.captured_at)) {
            return make_error_code(SnapshotErrc::DuplicateRecord);
        }
    }

    for (const auto& record : records) {
        files_[record.key()].emplace(record.captured_at, record);
        ++record_count_;
    }
    return {};
}

std::size_t MemorySnapshotStore::size() const
{
    std::lock_guard guard(mutex_);
    return record_count_;
}

MemoryCounterReader::MemoryCounterReader(std::vector<SnapshotRecord> records)
    : records_{std::move(records)}
{
}

void MemoryCounterReader::set_records(std::vector<SnapshotRecord> records)
{
    std::lock_guard guard(mutex_);
    records_ = std::move(records);
}

void MemoryCounterReader::set_failure(std::error_code error)
{
    std::lock_guard guard(mutex_);
    failure_ = error;
}

std::error_code MemoryCounterReader::read_current(std::vector<SnapshotRecord>& out)
{
    out.clear();
    std::lock_guard guard(mutex_);
    if (failure_) {
        return failure_;
    }
    out = records_;
    return {};
}

}  // namespace iostall::snapshot
