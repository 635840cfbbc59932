#include "iostall/report/time_series_matrix.hpp"

#include <algorithm>
#include <utility>

namespace iostall::report {

namespace {

template <typename T>
void sort_unique(std::vector<T>& values)
{
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
}

}  // namespace

TimeSeriesMatrix::TimeSeriesMatrix(std::vector<Timestamp> timestamps, std::vector<DimensionKey> dimensions)
    : timestamps_{std::move(timestamps)}
    , dimensions_{std::move(dimensions)}
{
    sort_unique(timestamps_);
    sort_unique(dimensions_);
}

TimeSeriesMatrix TimeSeriesMatrix::from_snapshots(std::span<const SnapshotRecord> records)
{
    std::vector<Timestamp> timestamps;
    std::vector<DimensionKey> dimensions;
    timestamps.reserve(records.size());
    dimensions.reserve(records.size());
    for (const auto& record : records) {
        timestamps.push_back(record.captured_at);
        dimensions.push_back(make_dimension_key(record));
    }
    return TimeSeriesMatrix{std::move(timestamps), std::move(dimensions)};
}

const std::vector<Timestamp>& TimeSeriesMatrix::timestamps() const noexcept
{
    return timestamps_;
}

const std::vector<DimensionKey>& TimeSeriesMatrix::dimensions() const noexcept
{
    return dimensions_;
}

std::size_t TimeSeriesMatrix::cell_count() const noexcept
{
    return timestamps_.size() * dimensions_.size();
}

bool TimeSeriesMatrix::empty() const noexcept
{
    return cell_count() == 0U;
}

std::vector<MatrixCell> TimeSeriesMatrix::cells() const
{
    std::vector<MatrixCell> out;
    out.reserve(cell_count());
    for (const auto timestamp : timestamps_) {
        for (const auto& dimension : dimensions_) {
            out.push_back(MatrixCell{timestamp, dimension});
        }
    }
    return out;
}

}  // namespace iostall::report
