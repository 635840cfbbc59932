#pragma once

#include "iostall/report/report_telemetry.hpp"

#include <chrono>
#include <string>

namespace iostall::report {

[[nodiscard]] std::string report_telemetry_to_openmetrics(const ReportTelemetrySnapshot& snapshot,
                                                          std::chrono::system_clock::time_point wall_now);

}  // namespace iostall::report
