#pragma once

#include <system_error>

namespace iostall::report {

enum class ReportErrc {
    Success = 0,
    InvalidRoleFilter,
    InvalidLookback,
    InvalidReportMode,
    MissingSnapshotStore,
    MissingCounterSource,
    InvalidPageSize,
    SnapshotStoreUnavailable,
    CounterSourceUnavailable
};

const std::error_category& report_error_category() noexcept;
std::error_code make_error_code(ReportErrc value) noexcept;

// True for errors raised by validating the request or the reporter
// configuration, before any collaborator is touched.
[[nodiscard]] bool is_configuration_error(std::error_code ec) noexcept;

}  // namespace iostall::report

namespace std {

template <>
struct is_error_code_enum<iostall::report::ReportErrc> : true_type {
};

}  // namespace std
