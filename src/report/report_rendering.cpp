#include "iostall/report/report_rendering.hpp"

#include "iostall/report/json_text.hpp"
#include "iostall/snapshot/snapshot_time.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <vector>

namespace iostall::report {
namespace {

void append_key(std::string& out, const char* name, bool& first)
{
    if (!first) {
        out.push_back(',');
    }
    first = false;
    out.push_back('"');
    out.append(name);
    out.append("\":");
}

void append_field(std::string& out, const char* name, std::uint64_t value, bool& first)
{
    append_key(out, name, first);
    out.append(std::to_string(value));
}

void append_string_field(std::string& out, const char* name, std::string_view value, bool& first)
{
    append_key(out, name, first);
    append_json_string(out, value);
}

std::string format_fixed(double value)
{
    std::array<char, 32> buffer{};
    std::snprintf(buffer.data(), buffer.size(), "%.2f", value);
    return std::string{buffer.data()};
}

void append_optional_field(std::string& out, const char* name, const std::optional<double>& value, bool& first)
{
    append_key(out, name, first);
    out.append(value ? format_fixed(*value) : std::string{"null"});
}

std::string csv_escape(std::string_view value)
{
    if (value.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string{value};
    }
    std::string quoted{"\""};
    for (const char ch : value) {
        if (ch == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

using TableRow = std::vector<std::string>;

std::string render_table(const TableRow& header, const std::vector<TableRow>& rows, std::size_t left_aligned)
{
    std::vector<std::size_t> widths(header.size(), 0U);
    auto measure = [&](const TableRow& row) {
        for (std::size_t index = 0U; index < row.size() && index < widths.size(); ++index) {
            widths[index] = std::max(widths[index], row[index].size());
        }
    };
    measure(header);
    for (const auto& row : rows) {
        measure(row);
    }

    std::string out;
    auto emit = [&](const TableRow& row) {
        for (std::size_t index = 0U; index < row.size(); ++index) {
            if (index > 0U) {
                out.append("  ");
            }
            const auto padding = std::string(widths[index] - row[index].size(), ' ');
            if (index < left_aligned) {
                out.append(row[index]);
                if (index + 1U < row.size()) {
                    out.append(padding);
                }
            } else {
                out.append(padding);
                out.append(row[index]);
            }
        }
        out.push_back('\n');
    };

    emit(header);
    TableRow rule;
    rule.reserve(widths.size());
    for (const auto width : widths) {
        rule.emplace_back(width, '-');
    }
    emit(rule);
    for (const auto& row : rows) {
        emit(row);
    }
    return out;
}

std::string render_failure_text(const ReportResult& result)
{
    return "error: " + result.message + '\n';
}

}  // namespace

std::string render_report_text(const ReportResult& result)
{
    if (!result.ok()) {
        return render_failure_text(result);
    }

    const TableRow header{"Time",
                          "Database",
                          "File Type",
                          "Avg Read ms",
                          "Avg Write ms",
                          "Avg Total ms",
                          "Reads",
                          "Writes",
                          "Read KB",
                          "Write KB",
                          "Read Pages",
                          "Write Pages",
                          "Files"};

    std::vector<TableRow> rows;
    rows.reserve(result.rows.size());
    for (const auto& metric : result.rows) {
        rows.push_back(TableRow{snapshot::format_timestamp_minutes(metric.interval_end),
                                metric.dimension.database_name,
                                metric.dimension.role_label,
                                std::to_string(metric.avg_read_latency_ms),
                                std::to_string(metric.avg_write_latency_ms),
                                std::to_string(metric.avg_total_latency_ms),
                                std::to_string(metric.total_reads),
                                std::to_string(metric.total_writes),
                                std::to_string(metric.total_read_kb),
                                std::to_string(metric.total_write_kb),
                                std::to_string(metric.total_read_pages),
                                std::to_string(metric.total_write_pages),
                                std::to_string(metric.file_count)});
    }

    auto out = render_table(header, rows, 3U);
    const auto basis = result.mode == ReportMode::Current ? CounterBasis::SinceEngineStart : CounterBasis::Interval;
    out.append("(");
    out.append(std::to_string(result.rows.size()));
    out.append(result.rows.size() == 1U ? " row" : " rows");
    out.append(", basis: ");
    out.append(counter_basis_name(basis));
    if (result.quality.reset_pairs > 0U) {
        out.append(", ");
        out.append(std::to_string(result.quality.reset_pairs));
        out.append(" counter resets skipped");
    }
    out.append(")\n");
    return out;
}

std::string render_report_csv(const ReportResult& result)
{
    std::string out;
    out.append("time,database,file_type,avg_read_latency_ms,avg_write_latency_ms,avg_total_latency_ms,"
               "total_reads,total_writes,total_read_kb,total_write_kb,total_read_pages,total_write_pages,"
               "file_count,discarded_files,basis\n");
    for (const auto& metric : result.rows) {
        out.append(snapshot::format_timestamp_minutes(metric.interval_end));
        out.push_back(',');
        out.append(csv_escape(metric.dimension.database_name));
        out.push_back(',');
        out.append(csv_escape(metric.dimension.role_label));
        for (const auto value : {metric.avg_read_latency_ms,
                                 metric.avg_write_latency_ms,
                                 metric.avg_total_latency_ms,
                                 metric.total_reads,
                                 metric.total_writes,
                                 metric.total_read_kb,
                                 metric.total_write_kb,
                                 metric.total_read_pages,
                                 metric.total_write_pages,
                                 metric.file_count,
                                 metric.discarded_files}) {
            out.push_back(',');
            out.append(std::to_string(value));
        }
        out.push_back(',');
        out.append(counter_basis_name(metric.basis));
        out.push_back('\n');
    }
    return out;
}

std::string render_report_json(const ReportResult& result)
{
    std::string json;
    json.reserve(256U + result.rows.size() * 320U);
    json.push_back('{');
    bool first = true;

    append_field(json, "correlation_id", result.correlation_id, first);
    append_string_field(json, "mode", report_mode_name(result.mode), first);
    append_key(json, "success", first);
    json.append(result.ok() ? "true" : "false");
    if (!result.ok()) {
        append_string_field(json, "error", result.message, first);
    }
    append_string_field(json, "generated_at", snapshot::format_timestamp_iso(result.generated_at), first);

    append_key(json, "window", first);
    json.push_back('{');
    bool window_first = true;
    append_string_field(json, "begin", snapshot::format_timestamp_iso(result.window.begin), window_first);
    append_string_field(json, "end", snapshot::format_timestamp_iso(result.window.end), window_first);
    json.push_back('}');

    append_key(json, "data_quality", first);
    json.push_back('{');
    bool quality_first = true;
    const auto& quality = result.quality;
    append_field(json, "snapshots_scanned", quality.snapshots_scanned, quality_first);
    append_field(json, "predecessors_loaded", quality.predecessors_loaded, quality_first);
    append_field(json, "deltas_emitted", quality.deltas_emitted, quality_first);
    append_field(json, "reset_pairs", quality.reset_pairs, quality_first);
    append_field(json, "orphan_snapshots", quality.orphan_snapshots, quality_first);
    append_field(json, "zero_filled_cells", quality.zero_filled_cells, quality_first);
    json.push_back('}');

    append_key(json, "rows", first);
    json.push_back('[');
    for (std::size_t index = 0U; index < result.rows.size(); ++index) {
        if (index > 0U) {
            json.push_back(',');
        }
        const auto& metric = result.rows[index];
        json.push_back('{');
        bool row_first = true;
        append_string_field(json, "time", snapshot::format_timestamp_iso(metric.interval_end), row_first);
        append_string_field(json, "database", metric.dimension.database_name, row_first);
        append_string_field(json, "role", snapshot::file_role_name(metric.dimension.role), row_first);
        append_string_field(json, "file_type", metric.dimension.role_label, row_first);
        append_field(json, "avg_read_latency_ms", metric.avg_read_latency_ms, row_first);
        append_field(json, "avg_write_latency_ms", metric.avg_write_latency_ms, row_first);
        append_field(json, "avg_total_latency_ms", metric.avg_total_latency_ms, row_first);
        append_field(json, "total_reads", metric.total_reads, row_first);
        append_field(json, "total_writes", metric.total_writes, row_first);
        append_field(json, "total_read_kb", metric.total_read_kb, row_first);
        append_field(json, "total_write_kb", metric.total_write_kb, row_first);
        append_field(json, "total_read_pages", metric.total_read_pages, row_first);
        append_field(json, "total_write_pages", metric.total_write_pages, row_first);
        append_field(json, "file_count", metric.file_count, row_first);
        append_field(json, "discarded_files", metric.discarded_files, row_first);
        append_string_field(json, "basis", counter_basis_name(metric.basis), row_first);
        json.push_back('}');
    }
    json.push_back(']');
    json.push_back('}');
    return json;
}

std::string render_file_io_text(std::span<const FileIoAnalysis> rows)
{
    const TableRow header{"Database",
                          "Physical File",
                          "Type",
                          "Read GB",
                          "Read %",
                          "Write GB",
                          "Write %",
                          "Reads",
                          "Writes",
                          "Avg Read KB",
                          "Avg Write KB",
                          "Read ms",
                          "Write ms",
                          "IO ms",
                          "Avg IOPS",
                          "Peak IOPS",
                          "Status"};

    auto optional_text = [](const std::optional<double>& value) {
        return value ? format_fixed(*value) : std::string{"-"};
    };

    std::vector<TableRow> table;
    table.reserve(rows.size());
    for (const auto& row : rows) {
        table.push_back(TableRow{row.database_name,
                                 row.physical_path,
                                 row.file_type,
                                 std::to_string(row.read_gb),
                                 std::to_string(row.read_percentage),
                                 std::to_string(row.write_gb),
                                 std::to_string(row.write_percentage),
                                 std::to_string(row.read_count),
                                 std::to_string(row.write_count),
                                 format_fixed(row.avg_read_size_kb),
                                 format_fixed(row.avg_write_size_kb),
                                 optional_text(row.avg_read_latency_ms),
                                 optional_text(row.avg_write_latency_ms),
                                 optional_text(row.avg_io_latency_ms),
                                 optional_text(row.avg_iops),
                                 optional_text(row.estimated_peak_iops),
                                 std::string{file_io_status_label(row.status)}});
    }
    return render_table(header, table, 3U);
}

std::string render_file_io_json(std::span<const FileIoAnalysis> rows)
{
    std::string json;
    json.push_back('[');
    for (std::size_t index = 0U; index < rows.size(); ++index) {
        if (index > 0U) {
            json.push_back(',');
        }
        const auto& row = rows[index];
        json.push_back('{');
        bool first = true;
        append_string_field(json, "database", row.database_name, first);
        append_string_field(json, "physical_name", row.physical_path, first);
        append_string_field(json, "file_type", row.file_type, first);
        append_field(json, "read_gb", row.read_gb, first);
        append_field(json, "read_percentage", row.read_percentage, first);
        append_field(json, "write_gb", row.write_gb, first);
        append_field(json, "write_percentage", row.write_percentage, first);
        append_field(json, "read_count", row.read_count, first);
        append_field(json, "write_count", row.write_count, first);
        append_key(json, "avg_read_size_kb", first);
        json.append(format_fixed(row.avg_read_size_kb));
        append_key(json, "avg_write_size_kb", first);
        json.append(format_fixed(row.avg_write_size_kb));
        append_optional_field(json, "avg_read_latency_ms", row.avg_read_latency_ms, first);
        append_optional_field(json, "avg_write_latency_ms", row.avg_write_latency_ms, first);
        append_optional_field(json, "avg_io_latency_ms", row.avg_io_latency_ms, first);
        append_field(json, "total_read_stall_ms", row.total_read_stall_ms, first);
        append_field(json, "total_write_stall_ms", row.total_write_stall_ms, first);
        append_field(json, "total_io_stall_ms", row.total_io_stall_ms, first);
        append_optional_field(json, "avg_iops", row.avg_iops, first);
        append_optional_field(json, "estimated_peak_iops", row.estimated_peak_iops, first);
        append_string_field(json, "status", file_io_status_label(row.status), first);
        json.push_back('}');
    }
    json.push_back(']');
    return json;
}

}  // namespace iostall::report
