#include "iostall/report/report_types.hpp"

#include "iostall/report/report_errors.hpp"

#include <cctype>

namespace iostall::report {

namespace {

std::string normalise(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1U);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1U);
    }

    std::string lowered;
    lowered.reserve(text.size());
    for (const char ch : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return lowered;
}

}  // namespace

DimensionKey make_dimension_key(const SnapshotRecord& record)
{
    const auto role = record.role();
    return DimensionKey{record.database_name, snapshot::file_role_label(role, record.file_type), role};
}

std::error_code parse_role_filter(std::string_view text, RoleFilter& out)
{
    const auto value = normalise(text);
    if (value == "all") {
        out = RoleFilter::All;
    } else if (value == "data") {
        out = RoleFilter::Data;
    } else if (value == "log") {
        out = RoleFilter::Log;
    } else {
        return make_error_code(ReportErrc::InvalidRoleFilter);
    }
    return {};
}

std::error_code parse_report_mode(std::string_view text, ReportMode& out)
{
    const auto value = normalise(text);
    if (value == "historical") {
        out = ReportMode::Historical;
    } else if (value == "current") {
        out = ReportMode::Current;
    } else {
        return make_error_code(ReportErrc::InvalidReportMode);
    }
    return {};
}

bool role_filter_matches(RoleFilter filter, FileRole role) noexcept
{
    switch (filter) {
    case RoleFilter::Data:
        return role == FileRole::Data;
    case RoleFilter::Log:
        return role == FileRole::Log;
    case RoleFilter::All:
    default:
        return true;
    }
}

std::string_view report_mode_name(ReportMode mode) noexcept
{
    switch (mode) {
    case ReportMode::Current:
        return "current";
    case ReportMode::Historical:
    default:
        return "historical";
    }
}

std::string_view role_filter_name(RoleFilter filter) noexcept
{
    switch (filter) {
    case RoleFilter::Data:
        return "data";
    case RoleFilter::Log:
        return "log";
    case RoleFilter::All:
    default:
        return "all";
    }
}

std::string_view counter_basis_name(CounterBasis basis) noexcept
{
    switch (basis) {
    case CounterBasis::SinceEngineStart:
        return "since_engine_start";
    case CounterBasis::Interval:
    default:
        return "interval";
    }
}

}  // namespace iostall::report
