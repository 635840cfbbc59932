#include "iostall/report/latency_reporter.hpp"
#include "iostall/report/report_errors.hpp"
#include "iostall/snapshot/snapshot_errors.hpp"
#include "iostall/snapshot/snapshot_time.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

using namespace iostall::report;
using iostall::snapshot::MemoryCounterReader;
using iostall::snapshot::MemorySnapshotStore;
using iostall::snapshot::SnapshotErrc;
using iostall::snapshot::SnapshotStore;

namespace {

Timestamp at(unsigned hour, unsigned minute)
{
    return *iostall::snapshot::make_timestamp({2025, 7, 1, hour, minute, 0, 0});
}

SnapshotRecord make_record(Timestamp captured_at,
                           std::int32_t database_id,
                           const std::string& database_name,
                           std::int32_t file_id,
                           const std::string& file_type,
                           std::uint64_t reads,
                           std::uint64_t read_stall_ms,
                           std::uint64_t writes = 0U,
                           std::uint64_t write_stall_ms = 0U)
{
    SnapshotRecord record{};
    record.captured_at = captured_at;
    record.database_id = database_id;
    record.database_name = database_name;
    record.file_id = file_id;
    record.file_type = file_type;
    record.counters.reads = reads;
    record.counters.read_stall_ms = read_stall_ms;
    record.counters.writes = writes;
    record.counters.write_stall_ms = write_stall_ms;
    record.counters.total_stall_ms = read_stall_ms + write_stall_ms;
    record.counters.bytes_read = reads * 8'192U;
    record.counters.bytes_written = writes * 8'192U;
    return record;
}

// sales (id 5) has a data file and a log; hr (id 6) has one data file that
// skips the 11:15 capture. The sales data file restarts before 11:30.
std::vector<SnapshotRecord> make_history()
{
    return {make_record(at(10, 45), 5, "sales", 1, "ROWS", 50U, 250U),
            make_record(at(11, 0), 5, "sales", 1, "ROWS", 100U, 500U),
            make_record(at(11, 0), 5, "sales", 2, "LOG", 0U, 0U, 10U, 20U),
            make_record(at(11, 0), 6, "hr", 1, "ROWS", 5U, 5U),
            make_record(at(11, 15), 5, "sales", 1, "ROWS", 180U, 900U),
            make_record(at(11, 15), 5, "sales", 2, "LOG", 0U, 0U, 10U, 20U),
            make_record(at(11, 30), 5, "sales", 1, "ROWS", 50U, 100U),
            make_record(at(11, 30), 5, "sales", 2, "LOG", 0U, 0U, 20U, 60U),
            make_record(at(11, 30), 6, "hr", 1, "ROWS", 15U, 25U)};
}

class FailingStore final : public SnapshotStore {
public:
    std::error_code scan_window(const TimeWindow&, std::vector<SnapshotRecord>& out) const override
    {
        ++calls;
        out.clear();
        return iostall::snapshot::make_error_code(SnapshotErrc::ReadFailed);
    }

    std::error_code find_predecessors(std::span<const FileKey>, Timestamp, std::vector<SnapshotRecord>& out) const override
    {
        ++calls;
        out.clear();
        return iostall::snapshot::make_error_code(SnapshotErrc::ReadFailed);
    }

    std::error_code append(std::span<const SnapshotRecord>) override
    {
        return iostall::snapshot::make_error_code(SnapshotErrc::WriteFailed);
    }

    mutable int calls = 0;
};

struct HistoryFixture final {
    HistoryFixture()
    {
        const auto history = make_history();
        if (store.append(history)) {
            throw std::runtime_error("failed to seed history");
        }
    }

    LatencyReporter::Config config()
    {
        LatencyReporter::Config settings{};
        settings.store = &store;
        settings.clock = [] { return at(12, 0); };
        return settings;
    }

    MemorySnapshotStore store;
};

ReportRequest historical(std::int64_t hours = 1)
{
    ReportRequest request{};
    request.mode = ReportMode::Historical;
    request.lookback_hours = hours;
    return request;
}

const AggregatedMetric& row_at(const ReportResult& result, std::size_t index)
{
    REQUIRE(index < result.rows.size());
    return result.rows[index];
}

}  // namespace

TEST_CASE("LatencyReporter builds a dense historical report")
{
    HistoryFixture fixture;
    const LatencyReporter reporter{fixture.config()};

    ReportResult result{};
    REQUIRE_FALSE(reporter.report(historical(), result));
    CHECK(result.ok());
    CHECK(result.window.begin == at(11, 0));
    CHECK(result.window.end == at(12, 0));
    REQUIRE(result.rows.size() == 9U);

    const auto& hr_first = row_at(result, 0);
    CHECK(hr_first.interval_end == at(11, 0));
    CHECK(hr_first.dimension.database_name == "hr");
    CHECK(hr_first.file_count == 0U);
    CHECK(hr_first.total_reads == 0U);

    const auto& sales_first = row_at(result, 1);
    CHECK(sales_first.dimension.database_name == "sales");
    CHECK(sales_first.dimension.role_label == "Data File");
    CHECK(sales_first.total_reads == 50U);
    CHECK(sales_first.avg_read_latency_ms == 5U);
    CHECK(sales_first.total_read_kb == 400U);
    CHECK(sales_first.total_read_pages == 50U);

    const auto& log_first = row_at(result, 2);
    CHECK(log_first.dimension.role_label == "Transaction Log");
    CHECK(log_first.file_count == 0U);

    const auto& sales_second = row_at(result, 4);
    CHECK(sales_second.interval_end == at(11, 15));
    CHECK(sales_second.total_reads == 80U);
    CHECK(sales_second.avg_read_latency_ms == 5U);

    const auto& log_idle = row_at(result, 5);
    CHECK(log_idle.file_count == 1U);
    CHECK(log_idle.total_writes == 0U);
    CHECK(log_idle.avg_write_latency_ms == 0U);

    const auto& hr_last = row_at(result, 6);
    CHECK(hr_last.interval_end == at(11, 30));
    CHECK(hr_last.total_reads == 10U);
    CHECK(hr_last.avg_read_latency_ms == 2U);

    const auto& sales_reset = row_at(result, 7);
    CHECK(sales_reset.total_reads == 0U);
    CHECK(sales_reset.file_count == 0U);
    CHECK(sales_reset.discarded_files == 1U);

    const auto& log_last = row_at(result, 8);
    CHECK(log_last.total_writes == 10U);
    CHECK(log_last.avg_write_latency_ms == 4U);

    CHECK(result.quality.snapshots_scanned == 8U);
    CHECK(result.quality.predecessors_loaded == 1U);
    CHECK(result.quality.deltas_emitted == 5U);
    CHECK(result.quality.reset_pairs == 1U);
    CHECK(result.quality.orphan_snapshots == 2U);
    CHECK(result.quality.zero_filled_cells == 3U);

    for (const auto& row : result.rows) {
        CHECK(row.basis == CounterBasis::Interval);
    }
}

TEST_CASE("LatencyReporter applies database and role filters")
{
    HistoryFixture fixture;
    const LatencyReporter reporter{fixture.config()};

    auto request = historical();
    request.database_filter = "sales";
    ReportResult result{};
    REQUIRE_FALSE(reporter.report(request, result));
    CHECK(result.rows.size() == 6U);
    for (const auto& row : result.rows) {
        CHECK(row.dimension.database_name == "sales");
    }

    request = historical();
    request.role_filter = "log";
    REQUIRE_FALSE(reporter.report(request, result));
    CHECK(result.rows.size() == 3U);
    for (const auto& row : result.rows) {
        CHECK(row.dimension.role == FileRole::Log);
    }

    request.role_filter = "  DATA ";
    REQUIRE_FALSE(reporter.report(request, result));
    CHECK(result.rows.size() == 6U);

    request.role_filter = "All";
    REQUIRE_FALSE(reporter.report(request, result));
    CHECK(result.rows.size() == 9U);

    request.role_filter.reset();
    request.database_filter = "missing";
    REQUIRE_FALSE(reporter.report(request, result));
    CHECK(result.rows.empty());
}

TEST_CASE("LatencyReporter is idempotent over unchanged history")
{
    HistoryFixture fixture;
    const LatencyReporter reporter{fixture.config()};

    ReportResult first{};
    ReportResult second{};
    REQUIRE_FALSE(reporter.report(historical(), first));
    REQUIRE_FALSE(reporter.report(historical(), second));
    CHECK(first.rows == second.rows);
    CHECK(first.correlation_id != second.correlation_id);
}

TEST_CASE("LatencyReporter returns no rows for an empty window")
{
    HistoryFixture fixture;
    auto config = fixture.config();
    config.clock = [] { return at(20, 0); };
    const LatencyReporter reporter{std::move(config)};

    ReportResult result{};
    REQUIRE_FALSE(reporter.report(historical(), result));
    CHECK(result.rows.empty());
}

TEST_CASE("LatencyReporter rejects invalid requests before touching the store")
{
    FailingStore store;
    LatencyReporter::Config config{};
    config.store = &store;
    const LatencyReporter reporter{std::move(config)};

    auto request = historical();
    request.role_filter = "tempdb";
    ReportResult result{};
    CHECK(reporter.report(request, result) == make_error_code(ReportErrc::InvalidRoleFilter));
    CHECK(result.error == make_error_code(ReportErrc::InvalidRoleFilter));
    CHECK(result.rows.empty());
    CHECK_FALSE(result.message.empty());

    CHECK(reporter.report(historical(0), result) == make_error_code(ReportErrc::InvalidLookback));
    CHECK(reporter.report(historical(-3), result) == make_error_code(ReportErrc::InvalidLookback));
    CHECK(reporter.report(historical(kMaxLookbackHours + 1), result) == make_error_code(ReportErrc::InvalidLookback));
    CHECK(result.message == "lookback hours must be between 1 and " + std::to_string(kMaxLookbackHours));
    CHECK(is_configuration_error(result.error));
    CHECK(store.calls == 0);
}

TEST_CASE("LatencyReporter reports missing collaborators and page size")
{
    MemorySnapshotStore store;
    MemoryCounterReader counters;

    LatencyReporter::Config history_only{};
    history_only.store = &store;
    const LatencyReporter history_reporter{std::move(history_only)};

    ReportRequest current{};
    current.mode = ReportMode::Current;
    ReportResult result{};
    CHECK(history_reporter.report(current, result) == make_error_code(ReportErrc::MissingCounterSource));

    LatencyReporter::Config counters_only{};
    counters_only.counters = &counters;
    const LatencyReporter counter_reporter{std::move(counters_only)};
    CHECK(counter_reporter.report(historical(), result) == make_error_code(ReportErrc::MissingSnapshotStore));

    LatencyReporter::Config zero_pages{};
    zero_pages.store = &store;
    zero_pages.aggregator.page_size_bytes = 0U;
    const LatencyReporter zero_page_reporter{std::move(zero_pages)};
    CHECK(zero_page_reporter.report(historical(), result) == make_error_code(ReportErrc::InvalidPageSize));

    CHECK_THROWS_AS(LatencyReporter{LatencyReporter::Config{}}, std::invalid_argument);
}

TEST_CASE("LatencyReporter wraps collaborator failures")
{
    FailingStore store;
    LatencyReporter::Config config{};
    config.store = &store;
    const LatencyReporter reporter{std::move(config)};

    ReportResult result{};
    CHECK(reporter.report(historical(), result) == make_error_code(ReportErrc::SnapshotStoreUnavailable));
    CHECK(result.collaborator_error == iostall::snapshot::make_error_code(SnapshotErrc::ReadFailed));
    CHECK(result.rows.empty());
    CHECK_FALSE(is_configuration_error(result.error));

    MemoryCounterReader counters;
    counters.set_failure(iostall::snapshot::make_error_code(SnapshotErrc::ReadFailed));
    LatencyReporter::Config current_config{};
    current_config.counters = &counters;
    const LatencyReporter current_reporter{std::move(current_config)};

    ReportRequest current{};
    current.mode = ReportMode::Current;
    CHECK(current_reporter.report(current, result) == make_error_code(ReportErrc::CounterSourceUnavailable));
    CHECK(result.collaborator_error == iostall::snapshot::make_error_code(SnapshotErrc::ReadFailed));
}

TEST_CASE("LatencyReporter current mode aggregates cumulative counters")
{
    MemoryCounterReader counters{std::vector<SnapshotRecord>{
        make_record(Timestamp{}, 1, "master", 1, "ROWS", 1'000U, 1'000U),
        make_record(Timestamp{}, 7, "sales", 2, "LOG", 0U, 0U, 40U, 100U),
        make_record(Timestamp{}, 7, "sales", 1, "ROWS", 100U, 700U),
        make_record(Timestamp{}, 6, "hr", 1, "ROWS", 3U, 3U)}};

    LatencyReporter::Config config{};
    config.counters = &counters;
    config.clock = [] { return at(12, 0); };
    const LatencyReporter reporter{std::move(config)};

    ReportRequest request{};
    request.mode = ReportMode::Current;
    request.lookback_hours = -1;
    ReportResult result{};
    REQUIRE_FALSE(reporter.report(request, result));
    REQUIRE(result.rows.size() == 3U);

    CHECK(result.rows[0].dimension.database_name == "hr");
    CHECK(result.rows[1].dimension.role_label == "Data File");
    CHECK(result.rows[1].avg_read_latency_ms == 7U);
    CHECK(result.rows[2].dimension.role_label == "Transaction Log");
    CHECK(result.rows[2].avg_write_latency_ms == 3U);
    for (const auto& row : result.rows) {
        CHECK(row.interval_end == at(12, 0));
        CHECK(row.basis == CounterBasis::SinceEngineStart);
    }

    request.role_filter = "log";
    REQUIRE_FALSE(reporter.report(request, result));
    REQUIRE(result.rows.size() == 1U);
    CHECK(result.rows[0].dimension.database_name == "sales");
}

TEST_CASE("LatencyReporter records telemetry and invocation logs")
{
    HistoryFixture fixture;
    ReportTelemetry telemetry;
    std::vector<ReportInvocation> invocations;

    auto config = fixture.config();
    config.telemetry = &telemetry;
    config.invocation_logger = [&invocations](const ReportInvocation& invocation) {
        invocations.push_back(invocation);
    };
    const LatencyReporter reporter{std::move(config)};

    ReportResult result{};
    REQUIRE_FALSE(reporter.report(historical(), result));
    auto bad = historical();
    bad.role_filter = "index";
    CHECK(reporter.report(bad, result));

    const auto snapshot = telemetry.snapshot();
    CHECK(snapshot.historical_requests == 2U);
    CHECK(snapshot.request_errors == 1U);
    CHECK(snapshot.collaborator_errors == 0U);
    CHECK(snapshot.snapshots_scanned == 8U);
    CHECK(snapshot.deltas_emitted == 5U);
    CHECK(snapshot.reset_pairs == 1U);
    CHECK(snapshot.rows_emitted == 9U);

    REQUIRE(invocations.size() == 2U);
    CHECK(invocations[0].success);
    CHECK(invocations[0].row_count == 9U);
    CHECK(invocations[0].lookback_hours == 1);
    CHECK(invocations[0].window.begin == at(11, 0));
    CHECK_FALSE(invocations[1].success);
    CHECK(invocations[1].role_filter == std::optional<std::string>{"index"});
    CHECK_FALSE(invocations[1].error.empty());
}

TEST_CASE("LatencyReporter stays dense while captures are appended concurrently")
{
    constexpr std::uint64_t kCaptures = 200U;
    constexpr std::size_t kFilesPerCapture = 3U;

    auto capture = [](std::uint64_t index) {
        const Timestamp captured_at = at(0, 0) + std::chrono::minutes{static_cast<std::int64_t>(index)};
        const auto reads = 10U * (index + 1U);
        return std::vector<SnapshotRecord>{make_record(captured_at, 5, "sales", 1, "ROWS", reads, reads * 2U),
                                           make_record(captured_at, 5, "sales", 2, "LOG", 0U, 0U, reads, reads),
                                           make_record(captured_at, 6, "hr", 1, "ROWS", reads, reads)};
    };

    MemorySnapshotStore store;
    REQUIRE_FALSE(store.append(capture(0U)));
    ReportTelemetry telemetry;

    std::atomic<bool> writer_done{false};
    std::atomic<int> append_failures{0};
    std::atomic<int> report_failures{0};
    std::atomic<int> sparse_results{0};
    std::atomic<int> reports_run{0};

    std::thread writer([&]() {
        for (std::uint64_t index = 1U; index < kCaptures; ++index) {
            if (store.append(capture(index))) {
                ++append_failures;
            }
        }
        writer_done.store(true);
    });

    auto read_reports = [&]() {
        LatencyReporter::Config settings{};
        settings.store = &store;
        settings.clock = [] { return at(12, 0); };
        settings.telemetry = &telemetry;
        const LatencyReporter reporter{std::move(settings)};

        int iterations = 0;
        while (!writer_done.load() || iterations < 5) {
            ReportResult result{};
            if (reporter.report(historical(24), result)) {
                ++report_failures;
            } else if (result.rows.size() != result.quality.snapshots_scanned
                       || result.rows.size() % kFilesPerCapture != 0U) {
                ++sparse_results;
            }
            ++reports_run;
            ++iterations;
        }
    };

    std::thread first_reader(read_reports);
    std::thread second_reader(read_reports);
    writer.join();
    first_reader.join();
    second_reader.join();

    CHECK(append_failures.load() == 0);
    CHECK(report_failures.load() == 0);
    CHECK(sparse_results.load() == 0);
    CHECK(store.size() == kCaptures * kFilesPerCapture);

    const auto counters = telemetry.snapshot();
    CHECK(counters.historical_requests == static_cast<std::uint64_t>(reports_run.load()));
    CHECK(counters.request_errors == 0U);
    CHECK(counters.collaborator_errors == 0U);
}
