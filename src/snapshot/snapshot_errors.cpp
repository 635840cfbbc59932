#include "iostall/snapshot/snapshot_errors.hpp"

#include <string>

namespace iostall::snapshot {

namespace {

class SnapshotErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "iostall.snapshot";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<SnapshotErrc>(condition)) {
        case SnapshotErrc::Success:
            return "success";
        case SnapshotErrc::ArchiveMissing:
            return "snapshot archive does not exist";
        case SnapshotErrc::ArchiveHeaderMismatch:
            return "snapshot archive header does not match the expected schema";
        case SnapshotErrc::MalformedRecord:
            return "malformed snapshot record";
        case SnapshotErrc::InvalidTimestamp:
            return "invalid snapshot timestamp";
        case SnapshotErrc::DuplicateRecord:
            return "duplicate snapshot record";
        case SnapshotErrc::ReadFailed:
            return "failed to read snapshot archive";
        case SnapshotErrc::WriteFailed:
            return "failed to write snapshot archive";
        default:
            return "unknown snapshot error";
        }
    }
};

const SnapshotErrorCategory kCategory{};

}  // namespace

const std::error_category& snapshot_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(SnapshotErrc value) noexcept
{
    return {static_cast<int>(value), snapshot_error_category()};
}

}  // namespace iostall::snapshot
