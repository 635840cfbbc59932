#pragma once

#include "iostall/report/report_types.hpp"

#include <string>

namespace iostall::tools {

// One JSON object, no trailing newline, for JSON Lines invocation logs.
[[nodiscard]] std::string format_report_invocation_json(const iostall::report::ReportInvocation& invocation);

}  // namespace iostall::tools
