#pragma once

#include "iostall/snapshot/snapshot_types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace iostall::snapshot {

struct TimestampParts final {
    int year = 0;
    unsigned month = 0U;
    unsigned day = 0U;
    unsigned hour = 0U;
    unsigned minute = 0U;
    unsigned second = 0U;
    unsigned millisecond = 0U;
};

[[nodiscard]] std::optional<Timestamp> make_timestamp(const TimestampParts& parts) noexcept;

[[nodiscard]] Timestamp current_timestamp() noexcept;

/// ISO-8601 UTC with millisecond precision, e.g. 2025-07-01T10:00:00.000Z.
[[nodiscard]] std::string format_timestamp_iso(Timestamp value);

/// Minute resolution used by report tables, e.g. 2025-07-01 10:00.
[[nodiscard]] std::string format_timestamp_minutes(Timestamp value);

/// Accepts the archive timestamp form; the 'T' may be a space and the
/// fractional part and trailing 'Z' are optional.
[[nodiscard]] std::optional<Timestamp> parse_timestamp_iso(std::string_view text);

}  // namespace iostall::snapshot
