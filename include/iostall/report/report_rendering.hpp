#pragma once

#include "iostall/report/file_io_analysis.hpp"
#include "iostall/report/report_types.hpp"

#include <span>
#include <string>

namespace iostall::report {

// Aligned text table. Times are printed as "YYYY-MM-DD HH:MM" in UTC.
[[nodiscard]] std::string render_report_text(const ReportResult& result);
[[nodiscard]] std::string render_report_csv(const ReportResult& result);
// Single JSON document; times are ISO-8601 UTC.
[[nodiscard]] std::string render_report_json(const ReportResult& result);

[[nodiscard]] std::string render_file_io_text(std::span<const FileIoAnalysis> rows);
[[nodiscard]] std::string render_file_io_json(std::span<const FileIoAnalysis> rows);

}  // namespace iostall::report
