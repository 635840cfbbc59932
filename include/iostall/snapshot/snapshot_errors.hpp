#pragma once

#include <system_error>

namespace iostall::snapshot {

enum class SnapshotErrc {
    Success = 0,
    ArchiveMissing,
    ArchiveHeaderMismatch,
    MalformedRecord,
    InvalidTimestamp,
    DuplicateRecord,
    ReadFailed,
    WriteFailed
};

const std::error_category& snapshot_error_category() noexcept;
std::error_code make_error_code(SnapshotErrc value) noexcept;

}  // namespace iostall::snapshot

namespace std {

template <>
struct is_error_code_enum<iostall::snapshot::SnapshotErrc> : true_type {
};

}  // namespace std
