#pragma once

#include "iostall/report/latency_aggregator.hpp"
#include "iostall/report/report_types.hpp"

#include <CLI/CLI.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace iostall::tools {

struct SourceOptions final {
    std::string archive_path{};
    std::string counters_path{};
    std::string now_text{};
};

struct ReportOptions final {
    std::int64_t hours = report::kDefaultLookbackHours;
    std::string database{};
    std::string role{};
    std::uint64_t page_size = report::kDefaultPageSizeBytes;
    std::string format = "text";
    std::string output_path{};
    std::string log_json{};
};

using ReportRunner = std::function<void(report::ReportMode)>;

void add_source_options(CLI::App* command, SourceOptions& sources);
void add_report_options(CLI::App* command, ReportOptions& options);

// Registers `report historical|current`. Source and report options are
// owned by each mode subcommand, so they follow the mode on the command
// line. `runner` is invoked with the selected mode after parsing.
CLI::App* add_report_command(CLI::App& app, SourceOptions& sources, ReportOptions& options, ReportRunner runner);

}  // namespace iostall::tools
