#include "iostall/report/delta_calculator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

using namespace iostall::report;

namespace {

Timestamp at_minutes(int minutes)
{
    return Timestamp{std::chrono::minutes{minutes}};
}

SnapshotRecord make_record(int minutes,
                           std::int32_t file_id,
                           std::uint64_t reads,
                           std::uint64_t read_stall_ms,
                           std::string file_type = "ROWS")
{
    SnapshotRecord record{};
    record.captured_at = at_minutes(minutes);
    record.database_id = 5;
    record.database_name = "sales";
    record.file_id = file_id;
    record.file_type = std::move(file_type);
    record.counters.reads = reads;
    record.counters.read_stall_ms = read_stall_ms;
    record.counters.total_stall_ms = read_stall_ms;
    return record;
}

}  // namespace

TEST_CASE("compute_deltas subtracts consecutive snapshots of the same file")
{
    const std::vector<SnapshotRecord> window{make_record(0, 1, 100U, 500U), make_record(15, 1, 180U, 900U)};

    const auto result = compute_deltas(window, {});
    REQUIRE(result.deltas.size() == 1U);
    const auto& delta = result.deltas.front();
    CHECK(delta.interval_start == at_minutes(0));
    CHECK(delta.interval_end == at_minutes(15));
    CHECK(delta.file == FileKey{5, 1});
    CHECK(delta.dimension.database_name == "sales");
    CHECK(delta.dimension.role == FileRole::Data);
    CHECK(delta.delta.reads == 80U);
    CHECK(delta.delta.read_stall_ms == 400U);
    CHECK(result.stats.snapshots_considered == 2U);
    CHECK(result.stats.orphan_snapshots == 1U);
    CHECK(result.stats.deltas_emitted == 1U);
}

TEST_CASE("compute_deltas drops a pair whose counters went backwards")
{
    const std::vector<SnapshotRecord> window{make_record(0, 1, 100U, 500U),
                                             make_record(15, 1, 180U, 900U),
                                             make_record(30, 1, 50U, 100U),
                                             make_record(0, 3, 10U, 20U),
                                             make_record(15, 3, 20U, 40U),
                                             make_record(30, 3, 30U, 60U)};

    const auto result = compute_deltas(window, {});
    REQUIRE(result.deltas.size() == 3U);
    for (const auto& delta : result.deltas) {
        CHECK_FALSE((delta.file == FileKey{5, 1} && delta.interval_end == at_minutes(30)));
    }
    CHECK(result.deltas[2].file == FileKey{5, 3});
    CHECK(result.deltas[2].interval_end == at_minutes(30));
    CHECK(result.deltas[2].delta.reads == 10U);

    REQUIRE(result.discarded.size() == 1U);
    CHECK(result.discarded[0].file == FileKey{5, 1});
    CHECK(result.discarded[0].interval_end == at_minutes(30));
    CHECK(result.stats.reset_pairs == 1U);
}

TEST_CASE("compute_deltas treats a decrease in any counter as a reset")
{
    auto earlier = make_record(0, 1, 100U, 500U);
    auto later = make_record(15, 1, 180U, 900U);
    earlier.counters.bytes_written = 4096U;
    later.counters.bytes_written = 1024U;

    const std::vector<SnapshotRecord> window{earlier, later};
    const auto result = compute_deltas(window, {});
    CHECK(result.deltas.empty());
    CHECK(result.discarded.size() == 1U);
}

TEST_CASE("compute_deltas pairs the first in-window snapshot with a predecessor outside the window")
{
    const std::vector<SnapshotRecord> window{make_record(60, 1, 300U, 1'200U)};
    const std::vector<SnapshotRecord> predecessors{make_record(0, 1, 100U, 200U)};

    const auto result = compute_deltas(window, predecessors);
    REQUIRE(result.deltas.size() == 1U);
    CHECK(result.deltas[0].interval_start == at_minutes(0));
    CHECK(result.deltas[0].delta.reads == 200U);
    CHECK(result.deltas[0].delta.read_stall_ms == 1'000U);
    CHECK(result.stats.orphan_snapshots == 0U);
    CHECK(result.stats.snapshots_considered == 1U);
}

TEST_CASE("compute_deltas keeps other roles under their descriptor")
{
    const std::vector<SnapshotRecord> window{make_record(0, 9, 1U, 1U, "FILESTREAM"),
                                             make_record(15, 9, 2U, 2U, "FILESTREAM")};

    const auto result = compute_deltas(window, {});
    REQUIRE(result.deltas.size() == 1U);
    CHECK(result.deltas[0].dimension.role == FileRole::Other);
    CHECK(result.deltas[0].dimension.role_label == "FILESTREAM");
}

TEST_CASE("subtract_counters leaves the output untouched on a reset")
{
    IoCounters later{};
    later.reads = 10U;
    IoCounters earlier{};
    earlier.reads = 4U;
    earlier.writes = 1U;

    IoCounters delta{};
    delta.reads = 77U;
    CHECK_FALSE(subtract_counters(later, earlier, delta));
    CHECK(delta.reads == 77U);

    earlier.writes = 0U;
    CHECK(subtract_counters(later, earlier, delta));
    CHECK(delta.reads == 6U);
}
