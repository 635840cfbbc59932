#include "iostall/tools/report_command_line.hpp"

#include <utility>

namespace iostall::tools {

void add_source_options(CLI::App* command, SourceOptions& sources)
{
    command->add_option("--archive", sources.archive_path, "Snapshot archive file");
    command->add_option("--counters", sources.counters_path, "Current counter file in archive format");
    command->add_option("--now", sources.now_text, "Override the current time (ISO-8601 UTC)");
}

void add_report_options(CLI::App* command, ReportOptions& options)
{
    command->add_option("--hours", options.hours, "Lookback window in hours (historical only)")
        ->capture_default_str();
    command->add_option("--database", options.database, "Only report this database");
    command->add_option("--role", options.role, "File role filter: data, log or all");
    command->add_option("--page-size", options.page_size, "Engine page size in bytes")->capture_default_str();
    command->add_option("-f,--format", options.format, "Output format (text, csv or json)")
        ->transform(CLI::CheckedTransformer({{"text", "text"}, {"csv", "csv"}, {"json", "json"}}));
    command->add_option("--log-json",
                        options.log_json,
                        "Append report invocations as JSON Lines to a file ('-' for stdout)");
}

CLI::App* add_report_command(CLI::App& app, SourceOptions& sources, ReportOptions& options, ReportRunner runner)
{
    auto* report_command = app.add_subcommand("report", "Run a storage latency report");
    report_command->require_subcommand(1);

    auto add_mode = [&](const char* name, const char* description, report::ReportMode mode) {
        auto* command = report_command->add_subcommand(name, description);
        add_source_options(command, sources);
        add_report_options(command, options);
        command->add_option("-o,--output", options.output_path, "Write output to a file instead of stdout");
        command->callback([runner, mode]() { runner(mode); });
    };
    add_mode("historical", "Interval latency from archived snapshots", report::ReportMode::Historical);
    add_mode("current", "Cumulative latency since engine start", report::ReportMode::Current);

    return report_command;
}

}  // namespace iostall::tools
