#include "iostall/snapshot/snapshot_collector.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace iostall::snapshot {

SnapshotCollector::SnapshotCollector(Config config)
    : config_{std::move(config)}
{
    if (config_.reader == nullptr) {
        throw std::invalid_argument{"SnapshotCollector requires a counter reader"};
    }
    if (config_.store == nullptr) {
        throw std::invalid_argument{"SnapshotCollector requires a snapshot store"};
    }
}

std::error_code SnapshotCollector::collect(Timestamp captured_at, CaptureReceipt& receipt)
{
    receipt = CaptureReceipt{captured_at, 0U};

    std::vector<SnapshotRecord> live;
    if (auto ec = config_.reader->read_current(live); ec) {
        return ec;
    }

    std::vector<SnapshotRecord> capture;
    capture.reserve(live.size());
    for (auto& record : live) {
        if (!config_.scope.includes(record)) {
            continue;
        }
        record.captured_at = captured_at;
        if (record.drive.empty()) {
            record.drive = drive_from_path(record.physical_path);
        }
        capture.push_back(std::move(record));
    }

    if (auto ec = config_.store->append(capture); ec) {
        return ec;
    }

    receipt.records_inserted = capture.size();
    return {};
}

const DatabaseScope& SnapshotCollector::scope() const noexcept
{
    return config_.scope;
}

}  // namespace iostall::snapshot
