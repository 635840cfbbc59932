#include "iostall/report/report_errors.hpp"

#include "iostall/report/report_types.hpp"

#include <string>

namespace iostall::report {

namespace {

class ReportErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "iostall.report";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<ReportErrc>(condition)) {
        case ReportErrc::Success:
            return "success";
        case ReportErrc::InvalidRoleFilter:
            return "role filter must be one of data, log or all";
        case ReportErrc::InvalidLookback:
            return "lookback hours must be between 1 and " + std::to_string(kMaxLookbackHours);
        case ReportErrc::InvalidReportMode:
            return "report mode must be historical or current";
        case ReportErrc::MissingSnapshotStore:
            return "historical report requires a snapshot store";
        case ReportErrc::MissingCounterSource:
            return "current report requires a counter source";
        case ReportErrc::InvalidPageSize:
            return "page size must be greater than zero";
        case ReportErrc::SnapshotStoreUnavailable:
            return "snapshot store unavailable";
        case ReportErrc::CounterSourceUnavailable:
            return "counter source unavailable";
        default:
            return "unknown report error";
        }
    }
};

const ReportErrorCategory kCategory{};

}  // namespace

const std::error_category& report_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(ReportErrc value) noexcept
{
    return {static_cast<int>(value), report_error_category()};
}

bool is_configuration_error(std::error_code ec) noexcept
{
    if (ec.category() != report_error_category()) {
        return false;
    }
    switch (static_cast<ReportErrc>(ec.value())) {
    case ReportErrc::InvalidRoleFilter:
    case ReportErrc::InvalidLookback:
    case ReportErrc::InvalidReportMode:
    case ReportErrc::MissingSnapshotStore:
    case ReportErrc::MissingCounterSource:
    case ReportErrc::InvalidPageSize:
        return true;
    default:
        return false;
    }
}

}  // namespace iostall::report
