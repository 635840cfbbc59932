#include "iostall/report/delta_calculator.hpp"

#include <algorithm>
#include <tuple>

namespace iostall::report {

namespace {

struct Entry final {
    const SnapshotRecord* record = nullptr;
    bool in_window = false;
};

bool subtract(std::uint64_t later, std::uint64_t earlier, std::uint64_t& out) noexcept
{
    if (later < earlier) {
        return false;
    }
    out = later - earlier;
    return true;
}

}  // namespace

bool subtract_counters(const IoCounters& later, const IoCounters& earlier, IoCounters& delta) noexcept
{
    IoCounters result{};
    const bool ok = subtract(later.reads, earlier.reads, result.reads)
        && subtract(later.writes, earlier.writes, result.writes)
        && subtract(later.read_stall_ms, earlier.read_stall_ms, result.read_stall_ms)
        && subtract(later.write_stall_ms, earlier.write_stall_ms, result.write_stall_ms)
        && subtract(later.total_stall_ms, earlier.total_stall_ms, result.total_stall_ms)
        && subtract(later.bytes_read, earlier.bytes_read, result.bytes_read)
        && subtract(later.bytes_written, earlier.bytes_written, result.bytes_written);
    if (ok) {
        delta = result;
    }
    return ok;
}

DeltaResult compute_deltas(std::span<const SnapshotRecord> window_records,
                           std::span<const SnapshotRecord> predecessors)
{
    DeltaResult result{};
    result.stats.snapshots_considered = window_records.size();

    std::vector<Entry> entries;
    entries.reserve(window_records.size() + predecessors.size());
    for (const auto& record : predecessors) {
        entries.push_back(Entry{&record, false});
    }
    for (const auto& record : window_records) {
        entries.push_back(Entry{&record, true});
    }

    // Ties on capture time keep the predecessor first.
    std::stable_sort(entries.begin(), entries.end(), [](const Entry& lhs, const Entry& rhs) {
        return std::tie(lhs.record->database_id, lhs.record->file_id, lhs.record->captured_at)
            < std::tie(rhs.record->database_id, rhs.record->file_id, rhs.record->captured_at);
    });

    const SnapshotRecord* previous = nullptr;
    for (const auto& entry : entries) {
        const auto& current = *entry.record;
        if (previous != nullptr && previous->key() != current.key()) {
            previous = nullptr;
        }

        if (entry.in_window) {
            if (previous == nullptr || previous->captured_at == current.captured_at) {
                ++result.stats.orphan_snapshots;
            } else {
                IoCounters delta{};
                if (subtract_counters(current.counters, previous->counters, delta)) {
                    result.deltas.push_back(DeltaRecord{previous->captured_at,
                                                        current.captured_at,
                                                        current.key(),
                                                        make_dimension_key(current),
                                                        delta});
                } else {
                    result.discarded.push_back(DiscardedPair{previous->captured_at,
                                                             current.captured_at,
                                                             current.key(),
                                                             make_dimension_key(current)});
                }
            }
        }
        previous = &current;
    }

    std::sort(result.deltas.begin(), result.deltas.end(), [](const DeltaRecord& lhs, const DeltaRecord& rhs) {
        return std::tie(lhs.interval_end, lhs.file) < std::tie(rhs.interval_end, rhs.file);
    });
    result.stats.deltas_emitted = result.deltas.size();
    result.stats.reset_pairs = result.discarded.size();
    return result;
}

}  // namespace iostall::report
