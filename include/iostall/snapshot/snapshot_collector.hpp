#pragma once

#include "iostall/snapshot/snapshot_store.hpp"

#include <cstddef>
#include <system_error>

namespace iostall::snapshot {

struct CaptureReceipt final {
    Timestamp captured_at{};
    std::size_t records_inserted = 0U;
};

// Reads the live counters once and appends them to the store as a single
// capture stamped with the caller's time.
class SnapshotCollector final {
public:
    struct Config final {
        CounterReader* reader = nullptr;
        SnapshotStore* store = nullptr;
        DatabaseScope scope{};
    };

    explicit SnapshotCollector(Config config);

    [[nodiscard]] std::error_code collect(Timestamp captured_at, CaptureReceipt& receipt);

    [[nodiscard]] const DatabaseScope& scope() const noexcept;

private:
    Config config_{};
};

}  // namespace iostall::snapshot
