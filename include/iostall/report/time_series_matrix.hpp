#pragma once

#include "iostall/report/report_types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace iostall::report {

struct MatrixCell final {
    Timestamp interval_end{};
    DimensionKey dimension{};
};

// Every (capture time, dimension) pairing observed in a window. A cell with
// no aggregated data is a sampled interval with no activity; a pairing
// outside the matrix was never sampled.
class TimeSeriesMatrix final {
public:
    TimeSeriesMatrix() = default;
    TimeSeriesMatrix(std::vector<Timestamp> timestamps, std::vector<DimensionKey> dimensions);

    [[nodiscard]] static TimeSeriesMatrix from_snapshots(std::span<const SnapshotRecord> records);

    [[nodiscard]] const std::vector<Timestamp>& timestamps() const noexcept;
    [[nodiscard]] const std::vector<DimensionKey>& dimensions() const noexcept;
    [[nodiscard]] std::size_t cell_count() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    // Cells ordered by time, then dimension.
    [[nodiscard]] std::vector<MatrixCell> cells() const;

private:
    std::vector<Timestamp> timestamps_{};
    std::vector<DimensionKey> dimensions_{};
};

}  // namespace iostall::report
