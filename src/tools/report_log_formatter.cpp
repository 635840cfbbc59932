#include "iostall/tools/report_log_formatter.hpp"

#include "iostall/report/json_text.hpp"
#include "iostall/snapshot/snapshot_time.hpp"

#include <optional>
#include <string_view>

namespace {

[[nodiscard]] std::string format_timestamp(iostall::snapshot::Timestamp value)
{
    if (value.time_since_epoch().count() == 0) {
        return {};
    }
    return iostall::snapshot::format_timestamp_iso(value);
}

}  // namespace

namespace iostall::tools {

std::string format_report_invocation_json(const iostall::report::ReportInvocation& invocation)
{
    std::string json;
    json.reserve(384U);
    json.push_back('{');
    bool first = true;

    auto append_field = [&](const char* name) {
        if (!first) {
            json.push_back(',');
        }
        first = false;
        json.push_back('"');
        json.append(name);
        json.push_back('"');
        json.push_back(':');
    };

    auto append_string_field = [&](const char* name, std::string_view value) {
        append_field(name);
        report::append_json_string(json, value);
    };

    auto append_optional_string_field = [&](const char* name, const std::optional<std::string>& value) {
        append_field(name);
        if (value) {
            report::append_json_string(json, *value);
        } else {
            json.append("null");
        }
    };

    auto append_number_field = [&](const char* name, auto value) {
        append_field(name);
        json.append(std::to_string(value));
    };

    auto append_timestamp_field = [&](const char* name, iostall::snapshot::Timestamp value) {
        const auto text = format_timestamp(value);
        append_field(name);
        if (text.empty()) {
            json.append("null");
        } else {
            report::append_json_string(json, text);
        }
    };

    append_number_field("correlation_id", invocation.correlation_id);
    append_string_field("mode", iostall::report::report_mode_name(invocation.mode));
    if (invocation.mode == iostall::report::ReportMode::Historical) {
        append_number_field("lookback_hours", invocation.lookback_hours);
    }
    append_optional_string_field("database_filter", invocation.database_filter);
    append_optional_string_field("role_filter", invocation.role_filter);
    append_timestamp_field("window_begin", invocation.window.begin);
    append_timestamp_field("window_end", invocation.window.end);

    append_field("success");
    json.append(invocation.success ? "true" : "false");
    if (!invocation.success) {
        append_string_field("error", invocation.error);
    }

    append_number_field("row_count", invocation.row_count);
    append_number_field("snapshots_scanned", invocation.snapshots_scanned);
    append_number_field("deltas_emitted", invocation.deltas_emitted);
    append_number_field("reset_pairs", invocation.reset_pairs);
    append_number_field("orphan_snapshots", invocation.orphan_snapshots);
    append_number_field("duration_ns", invocation.duration_ns);
    append_timestamp_field("started_at", invocation.started_at);
    append_timestamp_field("finished_at", invocation.finished_at);

    json.push_back('}');
    return json;
}

}  // namespace iostall::tools
