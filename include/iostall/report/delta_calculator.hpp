#pragma once

#include "iostall/report/report_types.hpp"

#include <span>
#include <vector>

namespace iostall::report {

struct DeltaResult final {
    std::vector<DeltaRecord> deltas{};
    std::vector<DiscardedPair> discarded{};
    DeltaStats stats{};
};

// Pairs every in-window snapshot with the latest earlier snapshot of the same
// (database_id, file_id). `predecessors` supplies the latest record before
// the window for each key; they only ever act as the earlier half of a pair.
//
// A snapshot without an earlier one is an orphan and yields nothing. A pair
// in which any counter decreased is dropped whole and reported in
// `discarded`. Deltas come back ordered by (interval_end, database_id,
// file_id).
[[nodiscard]] DeltaResult compute_deltas(std::span<const SnapshotRecord> window_records,
                                         std::span<const SnapshotRecord> predecessors);

// Returns false when any counter of `later` is below the one in `earlier`.
[[nodiscard]] bool subtract_counters(const IoCounters& later, const IoCounters& earlier, IoCounters& delta) noexcept;

}  // namespace iostall::report
