#include "iostall/snapshot/snapshot_time.hpp"

#include "iostall/snapshot/archive_grammar.hpp"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace iostall::snapshot {

namespace {

namespace pegtl = tao::pegtl;

template <typename T>
T to_number(std::string_view digits) noexcept
{
    T value{};
    (void)std::from_chars(digits.data(), digits.data() + digits.size(), value);
    return value;
}

template <typename Rule>
struct timestamp_action : pegtl::nothing<Rule> {
};

template <>
struct timestamp_action<grammar::year_part> {
    template <typename Input>
    static void apply(const Input& in, TimestampParts& parts)
    {
        parts.year = to_number<int>(in.string_view());
    }
};

template <>
struct timestamp_action<grammar::month_part> {
    template <typename Input>
    static void apply(const Input& in, TimestampParts& parts)
    {
        parts.month = to_number<unsigned>(in.string_view());
    }
};

template <>
struct timestamp_action<grammar::day_part> {
    template <typename Input>
    static void apply(const Input& in, TimestampParts& parts)
    {
        parts.day = to_number<unsigned>(in.string_view());
    }
};

template <>
struct timestamp_action<grammar::hour_part> {
    template <typename Input>
    static void apply(const Input& in, TimestampParts& parts)
    {
        parts.hour = to_number<unsigned>(in.string_view());
    }
};

template <>
struct timestamp_action<grammar::minute_part> {
    template <typename Input>
    static void apply(const Input& in, TimestampParts& parts)
    {
        parts.minute = to_number<unsigned>(in.string_view());
    }
};

template <>
struct timestamp_action<grammar::second_part> {
    template <typename Input>
    static void apply(const Input& in, TimestampParts& parts)
    {
        parts.second = to_number<unsigned>(in.string_view());
    }
};

template <>
struct timestamp_action<grammar::millisecond_part> {
    template <typename Input>
    static void apply(const Input& in, TimestampParts& parts)
    {
        parts.millisecond = to_number<unsigned>(in.string_view());
    }
};

std::tm to_utc_tm(Timestamp value)
{
    const auto seconds = std::chrono::floor<std::chrono::seconds>(value);
    const auto time_value = std::chrono::system_clock::to_time_t(seconds);
    std::tm buffer{};
#if defined(_WIN32)
    gmtime_s(&buffer, &time_value);
#else
    gmtime_r(&time_value, &buffer);
#endif
    return buffer;
}

}  // namespace

std::optional<Timestamp> make_timestamp(const TimestampParts& parts) noexcept
{
    const std::chrono::year_month_day date{std::chrono::year{parts.year},
                                           std::chrono::month{parts.month},
                                           std::chrono::day{parts.day}};
    if (!date.ok()) {
        return std::nullopt;
    }
    if (parts.hour > 23U || parts.minute > 59U || parts.second > 59U || parts.millisecond > 999U) {
        return std::nullopt;
    }

    const auto day_start = std::chrono::sys_days{date};
    return Timestamp{day_start} + std::chrono::hours{parts.hour} + std::chrono::minutes{parts.minute}
        + std::chrono::seconds{parts.second} + std::chrono::milliseconds{parts.millisecond};
}

Timestamp current_timestamp() noexcept
{
    return std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

std::string format_timestamp_iso(Timestamp value)
{
    const auto buffer = to_utc_tm(value);
    const auto seconds = std::chrono::floor<std::chrono::seconds>(value);
    const auto millis = (value - seconds).count();

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    stream << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return stream.str();
}

std::string format_timestamp_minutes(Timestamp value)
{
    const auto buffer = to_utc_tm(value);
    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%d %H:%M");
    return stream.str();
}

std::optional<Timestamp> parse_timestamp_iso(std::string_view text)
{
    TimestampParts parts{};
    pegtl::memory_input in(text.data(), text.size(), "timestamp");
    try {
        if (!pegtl::parse<grammar::timestamp_grammar, timestamp_action>(in, parts)) {
            return std::nullopt;
        }
    } catch (const pegtl::parse_error&) {
        return std::nullopt;
    }
    return make_timestamp(parts);
}

}  // namespace iostall::snapshot
