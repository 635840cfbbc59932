#include "iostall/report/report_metrics.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace iostall::report {
namespace {

constexpr double kNsPerSecond = 1'000'000'000.0;

[[nodiscard]] double to_seconds(std::uint64_t ns) noexcept
{
    return static_cast<double>(ns) / kNsPerSecond;
}

[[nodiscard]] std::string format_double(double value)
{
    if (!std::isfinite(value)) {
        return "0";
    }
    std::ostringstream stream;
    stream << std::setprecision(17) << value;
    return stream.str();
}

void append_counter(std::ostringstream& out, const char* name, const char* help, std::uint64_t value)
{
    out << "# HELP " << name << ' ' << help << '\n';
    out << "# TYPE " << name << " counter\n";
    out << name << ' ' << value << '\n';
}

}  // namespace

std::string report_telemetry_to_openmetrics(const ReportTelemetrySnapshot& snapshot,
                                            std::chrono::system_clock::time_point wall_now)
{
    const auto wall_seconds = std::chrono::duration_cast<std::chrono::nanoseconds>(wall_now.time_since_epoch()).count()
        / kNsPerSecond;

    std::ostringstream out;
    out << "# HELP iostall_report_requests_total Report requests by mode.\n";
    out << "# TYPE iostall_report_requests_total counter\n";
    out << "iostall_report_requests_total{mode=\"historical\"} " << snapshot.historical_requests << '\n';
    out << "iostall_report_requests_total{mode=\"current\"} " << snapshot.current_requests << '\n';

    append_counter(out,
                   "iostall_report_request_errors_total",
                   "Requests rejected before any collaborator was read.",
                   snapshot.request_errors);
    append_counter(out,
                   "iostall_report_collaborator_errors_total",
                   "Requests failed by the snapshot store or counter source.",
                   snapshot.collaborator_errors);
    append_counter(out,
                   "iostall_report_snapshots_scanned_total",
                   "Snapshot records read by reports.",
                   snapshot.snapshots_scanned);
    append_counter(out,
                   "iostall_report_deltas_emitted_total",
                   "Interval deltas reconstructed from consecutive snapshots.",
                   snapshot.deltas_emitted);
    append_counter(out,
                   "iostall_report_reset_pairs_total",
                   "Snapshot pairs dropped because a counter went backwards.",
                   snapshot.reset_pairs);
    append_counter(out,
                   "iostall_report_orphan_snapshots_total",
                   "Snapshots without an earlier capture of the same file.",
                   snapshot.orphan_snapshots);
    append_counter(out, "iostall_report_rows_emitted_total", "Report rows returned to callers.", snapshot.rows_emitted);

    out << "# HELP iostall_report_duration_seconds Summary of report latency.\n";
    out << "# TYPE iostall_report_duration_seconds summary\n";
    out << "iostall_report_duration_seconds_sum " << format_double(to_seconds(snapshot.total_duration_ns)) << '\n';
    out << "iostall_report_duration_seconds_count " << (snapshot.historical_requests + snapshot.current_requests)
        << '\n';

    out << "# HELP iostall_report_last_duration_seconds Latest report latency sample.\n";
    out << "# TYPE iostall_report_last_duration_seconds gauge\n";
    out << "iostall_report_last_duration_seconds " << format_double(to_seconds(snapshot.last_duration_ns)) << '\n';

    out << "# HELP iostall_metrics_scrape_timestamp_seconds Wall clock time when the metrics snapshot was generated.\n";
    out << "# TYPE iostall_metrics_scrape_timestamp_seconds gauge\n";
    out << "iostall_metrics_scrape_timestamp_seconds " << format_double(wall_seconds) << '\n';
    out << "# EOF\n";

    return out.str();
}

}  // namespace iostall::report
