#include "iostall/report/file_io_analysis.hpp"
#include "iostall/report/latency_reporter.hpp"
#include "iostall/report/report_metrics.hpp"
#include "iostall/report/report_rendering.hpp"
#include "iostall/report/report_telemetry.hpp"
#include "iostall/snapshot/snapshot_archive.hpp"
#include "iostall/snapshot/snapshot_collector.hpp"
#include "iostall/snapshot/snapshot_time.hpp"
#include "iostall/tools/report_command_line.hpp"
#include "iostall/tools/report_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cctype>
#include <chrono>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace report = iostall::report;
namespace snapshot = iostall::snapshot;

namespace {

using iostall::tools::ReportOptions;
using iostall::tools::SourceOptions;

struct FilesOptions final {
    std::uint64_t uptime_seconds = 0U;
    std::string format = "text";
    report::FileIoThresholds thresholds{};
};

// JSON Lines sink for report invocations; "-" writes to stdout.
class InvocationLog final {
public:
    explicit InvocationLog(const std::string& target)
    {
        if (target.empty()) {
            return;
        }
        if (target == "-") {
            stream_ = &std::cout;
            return;
        }
        file_.open(target, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            throw std::runtime_error("failed to open log file: " + target);
        }
        stream_ = &file_;
    }

    [[nodiscard]] bool enabled() const noexcept { return stream_ != nullptr; }

    void write(const report::ReportInvocation& invocation)
    {
        if (stream_ == nullptr) {
            return;
        }
        const auto line = iostall::tools::format_report_invocation_json(invocation);
        std::lock_guard guard(mutex_);
        *stream_ << line << '\n';
        stream_->flush();
    }

private:
    std::mutex mutex_{};
    std::ofstream file_{};
    std::ostream* stream_ = nullptr;
};

std::string trim(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }
    return std::string{text.substr(start, end - start)};
}

std::vector<std::string> split_tokens(std::string_view text)
{
    std::vector<std::string> tokens;
    std::size_t index = 0U;
    while (index < text.size()) {
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
            ++index;
        }
        if (index >= text.size()) {
            break;
        }
        const std::size_t begin = index;
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) == 0) {
            ++index;
        }
        tokens.emplace_back(text.substr(begin, index - begin));
    }
    return tokens;
}

template <typename T>
T parse_number(const std::string& text, const char* option)
{
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::runtime_error(std::string{"invalid value for "} + option + ": " + text);
    }
    return value;
}

snapshot::Timestamp resolve_now(const SourceOptions& sources)
{
    if (sources.now_text.empty()) {
        return snapshot::current_timestamp();
    }
    const auto parsed = snapshot::parse_timestamp_iso(sources.now_text);
    if (!parsed) {
        throw std::runtime_error("invalid --now timestamp: " + sources.now_text);
    }
    return *parsed;
}

void write_output(const std::string& text, const std::string& output_path)
{
    if (output_path.empty()) {
        std::cout << text;
        return;
    }
    std::ofstream file{output_path, std::ios::out | std::ios::trunc};
    if (!file.is_open()) {
        throw std::runtime_error("failed to open output file: " + output_path);
    }
    file << text;
}

void run_report(report::ReportMode mode,
                const SourceOptions& sources,
                const ReportOptions& options,
                report::ReportTelemetry& telemetry,
                InvocationLog& log)
{
    std::unique_ptr<snapshot::SnapshotArchive> archive;
    if (!sources.archive_path.empty()) {
        archive = std::make_unique<snapshot::SnapshotArchive>(sources.archive_path);
    }
    std::unique_ptr<snapshot::ArchiveCounterReader> counters;
    if (!sources.counters_path.empty()) {
        counters = std::make_unique<snapshot::ArchiveCounterReader>(sources.counters_path);
    }
    if (!archive && !counters) {
        throw std::runtime_error("report requires --archive or --counters");
    }

    const auto now = resolve_now(sources);

    report::LatencyReporter::Config config{};
    config.store = archive.get();
    config.counters = counters.get();
    config.aggregator.page_size_bytes = options.page_size;
    config.clock = [now]() { return now; };
    config.telemetry = &telemetry;
    if (log.enabled()) {
        config.invocation_logger = [&log](const report::ReportInvocation& invocation) { log.write(invocation); };
    }
    const report::LatencyReporter reporter{std::move(config)};

    report::ReportRequest request{};
    request.mode = mode;
    request.lookback_hours = options.hours;
    if (!options.database.empty()) {
        request.database_filter = options.database;
    }
    if (!options.role.empty()) {
        request.role_filter = options.role;
    }

    report::ReportResult result{};
    if (auto ec = reporter.report(request, result); ec) {
        if (archive && !archive->last_diagnostic().empty()) {
            const auto diagnostic = archive->last_diagnostic();
            throw std::runtime_error(result.message + " (line " + std::to_string(diagnostic.line) + ", column "
                                     + std::to_string(diagnostic.column) + ": " + diagnostic.message + ")");
        }
        throw std::runtime_error(result.message);
    }

    if (options.format == "json") {
        write_output(report::render_report_json(result) + '\n', options.output_path);
    } else if (options.format == "csv") {
        write_output(report::render_report_csv(result), options.output_path);
    } else if (options.format == "text") {
        write_output(report::render_report_text(result), options.output_path);
    } else {
        throw std::runtime_error("unsupported format: " + options.format);
    }
}

void run_collect(const SourceOptions& sources)
{
    if (sources.counters_path.empty() || sources.archive_path.empty()) {
        throw std::runtime_error("collect requires --counters and --archive");
    }

    snapshot::ArchiveCounterReader reader{sources.counters_path};
    snapshot::SnapshotArchive archive{sources.archive_path};
    snapshot::SnapshotCollector collector{{&reader, &archive, snapshot::DatabaseScope{}}};

    snapshot::CaptureReceipt receipt{};
    if (auto ec = collector.collect(resolve_now(sources), receipt); ec) {
        throw std::runtime_error("collect failed: " + ec.message());
    }
    std::cout << "captured " << receipt.records_inserted << " file snapshots at "
              << snapshot::format_timestamp_iso(receipt.captured_at) << " into " << sources.archive_path << '\n';
}

void run_files(const SourceOptions& sources, const FilesOptions& options)
{
    if (sources.counters_path.empty()) {
        throw std::runtime_error("files requires --counters");
    }

    snapshot::ArchiveCounterReader reader{sources.counters_path};
    std::vector<snapshot::SnapshotRecord> records;
    if (auto ec = reader.read_current(records); ec) {
        throw std::runtime_error("failed to read counters: " + ec.message());
    }

    const snapshot::DatabaseScope scope{};
    std::erase_if(records, [&scope](const snapshot::SnapshotRecord& record) { return !scope.includes(record); });

    const auto rows = report::analyze_file_io(records, options.uptime_seconds, options.thresholds);
    if (options.format == "json") {
        std::cout << report::render_file_io_json(rows) << '\n';
    } else {
        std::cout << report::render_file_io_text(rows);
    }
}

void print_metrics(const report::ReportTelemetry& telemetry)
{
    std::cout << report::report_telemetry_to_openmetrics(telemetry.snapshot(), std::chrono::system_clock::now());
}

void print_repl_help()
{
    std::cout << "Commands:" << '\n';
    std::cout << "  report historical|current [--hours N] [--database NAME] [--role data|log|all]" << '\n';
    std::cout << "         [--page-size BYTES] [--format text|csv|json]   Run a latency report" << '\n';
    std::cout << "  collect                                              Append a capture to the archive" << '\n';
    std::cout << "  files [--uptime-seconds N] [--format text|json]      Per-file I/O analysis" << '\n';
    std::cout << "  metrics                                              Report telemetry (OpenMetrics)" << '\n';
    std::cout << "  help                                                 Show this help" << '\n';
    std::cout << "  quit | exit                                          Leave the shell" << '\n';
}

void handle_repl_report(const std::vector<std::string>& tokens,
                        const SourceOptions& sources,
                        const ReportOptions& defaults,
                        report::ReportTelemetry& telemetry,
                        InvocationLog& log)
{
    if (tokens.size() < 2U) {
        std::cout << "usage: report historical|current [options]" << '\n';
        return;
    }

    report::ReportMode mode{};
    if (report::parse_report_mode(tokens[1], mode)) {
        std::cout << "unknown report mode: " << tokens[1] << '\n';
        return;
    }

    auto options = defaults;
    options.output_path.clear();
    for (std::size_t index = 2U; index < tokens.size(); ++index) {
        const auto& token = tokens[index];
        if (index + 1U >= tokens.size()) {
            std::cout << "missing value for " << token << '\n';
            return;
        }
        const auto& value = tokens[++index];
        if (token == "--hours") {
            options.hours = parse_number<std::int64_t>(value, "--hours");
        } else if (token == "--database") {
            options.database = value;
        } else if (token == "--role") {
            options.role = value;
        } else if (token == "--page-size") {
            options.page_size = parse_number<std::uint64_t>(value, "--page-size");
        } else if (token == "--format") {
            options.format = value;
        } else {
            std::cout << "unknown report option: " << token << '\n';
            return;
        }
    }

    run_report(mode, sources, options, telemetry, log);
}

void handle_repl_files(const std::vector<std::string>& tokens, const SourceOptions& sources)
{
    FilesOptions options{};
    for (std::size_t index = 1U; index < tokens.size(); ++index) {
        const auto& token = tokens[index];
        if (index + 1U >= tokens.size()) {
            std::cout << "missing value for " << token << '\n';
            return;
        }
        const auto& value = tokens[++index];
        if (token == "--uptime-seconds") {
            options.uptime_seconds = parse_number<std::uint64_t>(value, "--uptime-seconds");
        } else if (token == "--format") {
            options.format = value;
        } else {
            std::cout << "unknown files option: " << token << '\n';
            return;
        }
    }
    run_files(sources, options);
}

void run_repl(const SourceOptions& sources, const ReportOptions& defaults, InvocationLog& log)
{
    report::ReportTelemetry telemetry;
    replxx::Replxx repl;
    while (true) {
        const char* line = repl.input("iostall> ");
        if (line == nullptr) {
            std::cout << '\n';
            break;
        }

        std::string command = trim(line);
        if (command.empty()) {
            continue;
        }

        repl.history_add(command);
        auto tokens = split_tokens(command);
        if (tokens.empty()) {
            continue;
        }

        const auto& verb = tokens.front();
        if (verb == "quit" || verb == "exit") {
            break;
        }
        if (verb == "help") {
            print_repl_help();
            continue;
        }

        try {
            if (verb == "report") {
                handle_repl_report(tokens, sources, defaults, telemetry, log);
            } else if (verb == "collect") {
                run_collect(sources);
            } else if (verb == "files") {
                handle_repl_files(tokens, sources);
            } else if (verb == "metrics") {
                print_metrics(telemetry);
            } else {
                std::cout << "unrecognised command. Type 'help' for assistance." << '\n';
            }
        } catch (const std::exception& error) {
            std::cout << "error: " << error.what() << '\n';
        }
    }
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Storage latency snapshots and reports"};
    app.set_config("--config", "", "Read option defaults from an INI or TOML file");
    app.require_subcommand(1);

    SourceOptions sources{};
    ReportOptions report_options{};
    report::ReportTelemetry telemetry;

    iostall::tools::add_report_command(app, sources, report_options, [&](report::ReportMode mode) {
        InvocationLog log{report_options.log_json};
        run_report(mode, sources, report_options, telemetry, log);
    });

    auto* collect = app.add_subcommand("collect", "Append one capture of the current counters to the archive");
    iostall::tools::add_source_options(collect, sources);
    collect->callback([&]() { run_collect(sources); });

    FilesOptions files_options{};
    auto* files = app.add_subcommand("files", "Per-file I/O analysis of the current counters");
    iostall::tools::add_source_options(files, sources);
    files->add_option("--uptime-seconds", files_options.uptime_seconds, "Seconds since the engine started");
    files->add_option("-f,--format", files_options.format, "Output format (text or json)")
        ->transform(CLI::CheckedTransformer({{"text", "text"}, {"json", "json"}}));
    files->add_option("--read-threshold-ms", files_options.thresholds.data_read_latency_ms, "Data file read latency limit")
        ->capture_default_str();
    files->add_option("--write-threshold-ms",
                      files_options.thresholds.data_write_latency_ms,
                      "Data file write latency limit")
        ->capture_default_str();
    files->add_option("--log-write-threshold-ms",
                      files_options.thresholds.log_write_latency_ms,
                      "Log file write latency limit")
        ->capture_default_str();
    files->callback([&]() { run_files(sources, files_options); });

    auto* shell = app.add_subcommand("shell", "Start an interactive report shell");
    iostall::tools::add_source_options(shell, sources);
    iostall::tools::add_report_options(shell, report_options);
    shell->callback([&]() {
        InvocationLog log{report_options.log_json};
        run_repl(sources, report_options, log);
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
