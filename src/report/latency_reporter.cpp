#include "iostall/report/latency_reporter.hpp"

#include "iostall/report/delta_calculator.hpp"
#include "iostall/report/report_errors.hpp"
#include "iostall/report/time_series_matrix.hpp"
#include "iostall/snapshot/snapshot_time.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

namespace iostall::report {

namespace {

bool passes_filters(const DimensionKey& dimension, const ReportRequest& request, RoleFilter role) noexcept
{
    if (request.database_filter && dimension.database_name != *request.database_filter) {
        return false;
    }
    return role_filter_matches(role, dimension.role);
}

void sort_historical(std::vector<AggregatedMetric>& rows)
{
    std::sort(rows.begin(), rows.end(), [](const AggregatedMetric& lhs, const AggregatedMetric& rhs) {
        return std::tie(lhs.interval_end, lhs.dimension.database_name, lhs.dimension.role_label)
            < std::tie(rhs.interval_end, rhs.dimension.database_name, rhs.dimension.role_label);
    });
}

void sort_current(std::vector<AggregatedMetric>& rows)
{
    std::sort(rows.begin(), rows.end(), [](const AggregatedMetric& lhs, const AggregatedMetric& rhs) {
        return std::tie(lhs.dimension.database_name, lhs.dimension.role_label)
            < std::tie(rhs.dimension.database_name, rhs.dimension.role_label);
    });
}

std::string describe_failure(std::error_code error, std::error_code collaborator)
{
    auto text = error.message();
    if (collaborator) {
        text.append(": ");
        text.append(collaborator.message());
    }
    return text;
}

}  // namespace

LatencyReporter::LatencyReporter(Config config)
    : config_{std::move(config)}
{
    if (config_.store == nullptr && config_.counters == nullptr) {
        throw std::invalid_argument{"LatencyReporter requires a snapshot store or a counter source"};
    }
}

const LatencyReporter::Config& LatencyReporter::config() const noexcept
{
    return config_;
}

Timestamp LatencyReporter::now() const
{
    if (config_.clock) {
        return config_.clock();
    }
    return snapshot::current_timestamp();
}

std::error_code LatencyReporter::validate(const ReportRequest& request, RoleFilter& role) const
{
    role = RoleFilter::All;
    if (request.role_filter) {
        if (auto ec = parse_role_filter(*request.role_filter, role); ec) {
            return ec;
        }
    }

    if (config_.aggregator.page_size_bytes == 0U) {
        return make_error_code(ReportErrc::InvalidPageSize);
    }

    switch (request.mode) {
    case ReportMode::Historical:
        if (request.lookback_hours <= 0 || request.lookback_hours > kMaxLookbackHours) {
            return make_error_code(ReportErrc::InvalidLookback);
        }
        if (config_.store == nullptr) {
            return make_error_code(ReportErrc::MissingSnapshotStore);
        }
        return {};
    case ReportMode::Current:
        if (config_.counters == nullptr) {
            return make_error_code(ReportErrc::MissingCounterSource);
        }
        return {};
    default:
        return make_error_code(ReportErrc::InvalidReportMode);
    }
}

std::error_code LatencyReporter::report(const ReportRequest& request, ReportResult& result) const
{
    const auto started_wall = now();
    const auto started = std::chrono::steady_clock::now();

    result = ReportResult{};
    result.correlation_id = next_correlation_id_.fetch_add(1U, std::memory_order_relaxed);
    result.mode = request.mode;
    result.generated_at = started_wall;

    if (config_.telemetry != nullptr) {
        config_.telemetry->record_request(request.mode);
    }

    RoleFilter role = RoleFilter::All;
    auto ec = validate(request, role);
    if (ec) {
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_request_error();
        }
    } else if (request.mode == ReportMode::Historical) {
        ec = run_historical(request, role, result);
    } else {
        ec = run_current(request, role, result);
    }

    if (ec) {
        result.rows.clear();
        result.error = ec;
        result.message = describe_failure(ec, result.collaborator_error);
        if (result.collaborator_error && config_.telemetry != nullptr) {
            config_.telemetry->record_collaborator_error();
        }
    }

    const auto finished = std::chrono::steady_clock::now();
    const auto duration_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(finished - started).count());

    const auto& quality = result.quality;
    if (config_.telemetry != nullptr) {
        if (!ec) {
            config_.telemetry->record_result(quality.snapshots_scanned,
                                             quality.deltas_emitted,
                                             quality.reset_pairs,
                                             quality.orphan_snapshots,
                                             result.rows.size());
        }
        config_.telemetry->record_duration(duration_ns);
    }

    if (config_.invocation_logger) {
        ReportInvocation invocation{};
        invocation.correlation_id = result.correlation_id;
        invocation.mode = request.mode;
        invocation.lookback_hours = request.mode == ReportMode::Historical ? request.lookback_hours : 0;
        invocation.database_filter = request.database_filter;
        invocation.role_filter = request.role_filter;
        invocation.window = result.window;
        invocation.success = !ec;
        invocation.error = result.message;
        invocation.row_count = result.rows.size();
        invocation.snapshots_scanned = quality.snapshots_scanned;
        invocation.deltas_emitted = quality.deltas_emitted;
        invocation.reset_pairs = quality.reset_pairs;
        invocation.orphan_snapshots = quality.orphan_snapshots;
        invocation.duration_ns = duration_ns;
        invocation.started_at = started_wall;
        invocation.finished_at = started_wall
            + std::chrono::duration_cast<std::chrono::milliseconds>(finished - started);
        config_.invocation_logger(invocation);
    }

    return ec;
}

std::error_code LatencyReporter::run_historical(const ReportRequest& request,
                                                RoleFilter role,
                                                ReportResult& result) const
{
    const auto end = result.generated_at;
    result.window = TimeWindow{end - std::chrono::hours{request.lookback_hours}, end};

    std::vector<SnapshotRecord> window_records;
    if (auto ec = config_.store->scan_window(result.window, window_records); ec) {
        result.collaborator_error = ec;
        return make_error_code(ReportErrc::SnapshotStoreUnavailable);
    }

    std::vector<FileKey> keys;
    keys.reserve(window_records.size());
    for (const auto& record : window_records) {
        keys.push_back(record.key());
    }
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

    std::vector<SnapshotRecord> predecessors;
    if (auto ec = config_.store->find_predecessors(keys, result.window.begin, predecessors); ec) {
        result.collaborator_error = ec;
        return make_error_code(ReportErrc::SnapshotStoreUnavailable);
    }

    const auto deltas = compute_deltas(window_records, predecessors);
    const auto matrix = TimeSeriesMatrix::from_snapshots(window_records);

    const LatencyAggregator aggregator{config_.aggregator};
    auto aggregated = aggregator.aggregate_intervals(deltas.deltas, deltas.discarded);

    std::map<std::pair<Timestamp, DimensionKey>, AggregatedMetric> by_cell;
    for (auto& metric : aggregated) {
        auto cell = std::make_pair(metric.interval_end, metric.dimension);
        by_cell.emplace(std::move(cell), std::move(metric));
    }

    auto& quality = result.quality;
    quality.snapshots_scanned = window_records.size();
    quality.predecessors_loaded = predecessors.size();
    quality.deltas_emitted = deltas.stats.deltas_emitted;
    quality.reset_pairs = deltas.stats.reset_pairs;
    quality.orphan_snapshots = deltas.stats.orphan_snapshots;

    result.rows.reserve(matrix.cell_count());
    for (auto& cell : matrix.cells()) {
        if (!passes_filters(cell.dimension, request, role)) {
            continue;
        }
        const auto found = by_cell.find({cell.interval_end, cell.dimension});
        if (found != by_cell.end()) {
            result.rows.push_back(found->second);
            continue;
        }
        ++quality.zero_filled_cells;
        result.rows.push_back(aggregator.empty_metric(cell.interval_end, cell.dimension, CounterBasis::Interval));
    }

    sort_historical(result.rows);
    return {};
}

std::error_code LatencyReporter::run_current(const ReportRequest& request,
                                             RoleFilter role,
                                             ReportResult& result) const
{
    const auto now_value = result.generated_at;
    result.window = TimeWindow{now_value, now_value};

    std::vector<SnapshotRecord> live;
    if (auto ec = config_.counters->read_current(live); ec) {
        result.collaborator_error = ec;
        return make_error_code(ReportErrc::CounterSourceUnavailable);
    }

    std::vector<SnapshotRecord> scoped;
    scoped.reserve(live.size());
    for (auto& record : live) {
        if (config_.scope.includes(record)) {
            scoped.push_back(std::move(record));
        }
    }
    result.quality.snapshots_scanned = scoped.size();

    const LatencyAggregator aggregator{config_.aggregator};
    for (auto& metric : aggregator.aggregate_current(scoped, now_value)) {
        if (passes_filters(metric.dimension, request, role)) {
            result.rows.push_back(std::move(metric));
        }
    }

    sort_current(result.rows);
    return {};
}

}  // namespace iostall::report
