#include "iostall/snapshot/snapshot_types.hpp"

#include <algorithm>
#include <cctype>

namespace iostall::snapshot {

namespace {

bool equals_ci(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t index = 0U; index < lhs.size(); ++index) {
        const auto left = std::toupper(static_cast<unsigned char>(lhs[index]));
        const auto right = std::toupper(static_cast<unsigned char>(rhs[index]));
        if (left != right) {
            return false;
        }
    }
    return true;
}

}  // namespace

FileRole SnapshotRecord::role() const noexcept
{
    return classify_file_role(file_type);
}

bool DatabaseScope::includes(const SnapshotRecord& record) const noexcept
{
    if (require_database_name && record.database_name.empty()) {
        return false;
    }
    return std::find(excluded_database_ids.begin(), excluded_database_ids.end(), record.database_id)
        == excluded_database_ids.end();
}

FileRole classify_file_role(std::string_view file_type) noexcept
{
    if (equals_ci(file_type, "ROWS")) {
        return FileRole::Data;
    }
    if (equals_ci(file_type, "LOG")) {
        return FileRole::Log;
    }
    return FileRole::Other;
}

std::string_view file_role_name(FileRole role) noexcept
{
    switch (role) {
    case FileRole::Data:
        return "data";
    case FileRole::Log:
        return "log";
    case FileRole::Other:
    default:
        return "other";
    }
}

std::string file_role_label(FileRole role, std::string_view file_type)
{
    switch (role) {
    case FileRole::Data:
        return "Data File";
    case FileRole::Log:
        return "Transaction Log";
    case FileRole::Other:
    default:
        return std::string{file_type};
    }
}

std::string drive_from_path(std::string_view physical_path)
{
    return std::string{physical_path.substr(0U, std::min<std::size_t>(2U, physical_path.size()))};
}

}  // namespace iostall::snapshot
