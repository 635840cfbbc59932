#include "iostall/snapshot/snapshot_archive.hpp"

#include "iostall/snapshot/archive_grammar.hpp"
#include "iostall/snapshot/snapshot_errors.hpp"
#include "iostall/snapshot/snapshot_time.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace iostall::snapshot {

namespace {

namespace pegtl = tao::pegtl;

struct RecordParseState final {
    SnapshotRecord record{};
    bool invalid_timestamp = false;
    bool out_of_range = false;
};

std::string unquote(std::string_view quoted)
{
    std::string text;
    if (quoted.size() < 2U) {
        return text;
    }
    const auto body = quoted.substr(1U, quoted.size() - 2U);
    text.reserve(body.size());
    for (std::size_t index = 0U; index < body.size(); ++index) {
        text.push_back(body[index]);
        if (body[index] == '"' && index + 1U < body.size() && body[index + 1U] == '"') {
            ++index;
        }
    }
    return text;
}

void append_quoted(std::string& out, std::string_view text)
{
    out.push_back('"');
    for (const char ch : text) {
        if (ch == '"') {
            out.push_back('"');
        }
        if (ch == '\r' || ch == '\n') {
            out.push_back(' ');
            continue;
        }
        out.push_back(ch);
    }
    out.push_back('"');
}

template <typename T>
void assign_number(std::string_view digits, T& target, RecordParseState& state, int base = 10)
{
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), target, base);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        state.out_of_range = true;
    }
}

template <typename Rule>
struct record_action : pegtl::nothing<Rule> {
};

template <>
struct record_action<grammar::captured_at_field> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        const auto value = parse_timestamp_iso(in.string_view());
        if (!value) {
            state.invalid_timestamp = true;
            return;
        }
        state.record.captured_at = *value;
    }
};

template <>
struct record_action<grammar::database_id_field> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        assign_number(in.string_view(), state.record.database_id, state);
    }
};

template <>
struct record_action<grammar::database_name_field> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        state.record.database_name = unquote(in.string_view());
    }
};

template <>
struct record_action<grammar::file_id_field> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        assign_number(in.string_view(), state.record.file_id, state);
    }
};

template <>
struct record_action<grammar::drive_field> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        state.record.drive = unquote(in.string_view());
    }
};

template <>
struct record_action<grammar::file_type_field> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        state.record.file_type = unquote(in.string_view());
    }
};

template <>
struct record_action<grammar::physical_name_field> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        state.record.physical_path = unquote(in.string_view());
    }
};

template <>
struct record_action<grammar::reads_field> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        assign_number(in.string_view(), state.record.counters.reads, state);
    }
};

template <>
struct record_action<grammar::writes_field> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        assign_number(in.string_view(), state.record.counters.writes, state);
    }
};

template <>
struct record_action<grammar::read_stall_field> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        assign_number(in.string_view(), state.record.counters.read_stall_ms, state);
    }
};

template <>
struct record_action<grammar::write_stall_field> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        assign_number(in.string_view(), state.record.counters.write_stall_ms, state);
    }
};

template <>
struct record_action<grammar::total_stall_field> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        assign_number(in.string_view(), state.record.counters.total_stall_ms, state);
    }
};

template <>
struct record_action<grammar::bytes_read_field> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        assign_number(in.string_view(), state.record.counters.bytes_read, state);
    }
};

template <>
struct record_action<grammar::bytes_written_field> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        assign_number(in.string_view(), state.record.counters.bytes_written, state);
    }
};

template <>
struct record_action<grammar::hex_digits> {
    template <typename Input>
    static void apply(const Input& in, RecordParseState& state)
    {
        assign_number(in.string_view(), state.record.file_handle, state, 16);
    }
};

std::string_view trim_view(std::string_view text) noexcept
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1U);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1U);
    }
    return text;
}

void set_diagnostic(ArchiveDiagnostic* diagnostic, std::string message, std::size_t line, std::size_t column)
{
    if (diagnostic == nullptr) {
        return;
    }
    diagnostic->message = std::move(message);
    diagnostic->line = line;
    diagnostic->column = column;
}

}  // namespace

std::error_code parse_snapshot_record(std::string_view line, SnapshotRecord& out, ArchiveDiagnostic* diagnostic)
{
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1U);
    }

    RecordParseState state{};
    pegtl::memory_input in(line.data(), line.size(), "snapshot_record");
    try {
        if (!pegtl::parse<grammar::record, record_action>(in, state)) {
            set_diagnostic(diagnostic, "input did not match the snapshot record layout", 0U, 1U);
            return make_error_code(SnapshotErrc::MalformedRecord);
        }
    } catch (const pegtl::parse_error& error) {
        std::size_t column = 0U;
        if (!error.positions().empty()) {
            column = static_cast<std::size_t>(error.positions().front().column);
        }
        set_diagnostic(diagnostic, std::string{error.message()}, 0U, column);
        return make_error_code(SnapshotErrc::MalformedRecord);
    }

    if (state.invalid_timestamp) {
        set_diagnostic(diagnostic, "captured_at is not a valid calendar time", 0U, 1U);
        return make_error_code(SnapshotErrc::InvalidTimestamp);
    }
    if (state.out_of_range) {
        set_diagnostic(diagnostic, "numeric field out of range", 0U, 0U);
        return make_error_code(SnapshotErrc::MalformedRecord);
    }

    out = std::move(state.record);
    return {};
}

std::string format_snapshot_record(const SnapshotRecord& record)
{
    std::string line;
    line.reserve(192U);
    line.append(format_timestamp_iso(record.captured_at));
    line.push_back(',');
    line.append(std::to_string(record.database_id));
    line.push_back(',');
    append_quoted(line, record.database_name);
    line.push_back(',');
    line.append(std::to_string(record.file_id));
    line.push_back(',');
    append_quoted(line, record.drive);
    line.push_back(',');
    append_quoted(line, record.file_type);
    line.push_back(',');
    append_quoted(line, record.physical_path);

    const auto& counters = record.counters;
    for (const auto value : {counters.reads,
                             counters.writes,
                             counters.read_stall_ms,
                             counters.write_stall_ms,
                             counters.total_stall_ms,
                             counters.bytes_read,
                             counters.bytes_written}) {
        line.push_back(',');
        line.append(std::to_string(value));
    }

    char handle[19] = {};
    std::snprintf(handle, sizeof(handle), "0x%016llX", static_cast<unsigned long long>(record.file_handle));
    line.push_back(',');
    line.append(handle);
    return line;
}

std::error_code parse_snapshot_archive(std::string_view text,
                                       std::vector<SnapshotRecord>& out,
                                       ArchiveDiagnostic* diagnostic)
{
    out.clear();

    bool header_seen = false;
    std::size_t line_number = 0U;
    std::size_t offset = 0U;
    while (offset < text.size()) {
        const auto newline = text.find('\n', offset);
        if (newline == std::string_view::npos) {
            break;
        }
        const auto raw_line = text.substr(offset, newline - offset);
        offset = newline + 1U;
        ++line_number;

        const auto line = trim_view(raw_line);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        if (!header_seen) {
            if (line != kArchiveHeader) {
                set_diagnostic(diagnostic, "unexpected archive header", line_number, 1U);
                return make_error_code(SnapshotErrc::ArchiveHeaderMismatch);
            }
            header_seen = true;
            continue;
        }

        SnapshotRecord record{};
        ArchiveDiagnostic line_diagnostic{};
        if (auto ec = parse_snapshot_record(line, record, &line_diagnostic); ec) {
            set_diagnostic(diagnostic, std::move(line_diagnostic.message), line_number, line_diagnostic.column);
            return ec;
        }
        out.push_back(std::move(record));
    }

    return {};
}

SnapshotArchive::SnapshotArchive(std::filesystem::path path) noexcept
    : path_{std::move(path)}
{
}

const std::filesystem::path& SnapshotArchive::path() const noexcept
{
    return path_;
}

std::error_code SnapshotArchive::initialize() const
{
    std::error_code ec;
    if (std::filesystem::exists(path_, ec)) {
        std::ifstream stream{path_, std::ios::binary};
        if (!stream) {
            return make_error_code(SnapshotErrc::ReadFailed);
        }
        std::string first_line;
        std::getline(stream, first_line);
        if (trim_view(first_line).empty() && stream.eof()) {
            stream.close();
            std::ofstream writer{path_, std::ios::binary | std::ios::trunc};
            writer << kArchiveHeader << '\n';
            writer.flush();
            return writer ? std::error_code{} : make_error_code(SnapshotErrc::WriteFailed);
        }
        if (trim_view(first_line) != kArchiveHeader) {
            return make_error_code(SnapshotErrc::ArchiveHeaderMismatch);
        }
        return {};
    }
    if (ec) {
        return ec;
    }

    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return ec;
        }
    }

    std::ofstream writer{path_, std::ios::binary | std::ios::trunc};
    if (!writer) {
        return make_error_code(SnapshotErrc::WriteFailed);
    }
    writer << kArchiveHeader << '\n';
    writer.flush();
    if (!writer) {
        return make_error_code(SnapshotErrc::WriteFailed);
    }
    return {};
}

std::error_code SnapshotArchive::read_document(std::string& text) const
{
    text.clear();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return ec ? ec : make_error_code(SnapshotErrc::ArchiveMissing);
    }

    std::ifstream stream{path_, std::ios::binary};
    if (!stream) {
        return make_error_code(SnapshotErrc::ReadFailed);
    }
    text.assign(std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{});
    if (stream.bad()) {
        return make_error_code(SnapshotErrc::ReadFailed);
    }
    return {};
}

std::error_code SnapshotArchive::load_records(std::vector<SnapshotRecord>& out) const
{
    ArchiveDiagnostic diagnostic{};
    const auto ec = load_all(out, &diagnostic);
    {
        std::lock_guard guard(diagnostic_mutex_);
        last_diagnostic_ = std::move(diagnostic);
    }
    return ec;
}

std::error_code SnapshotArchive::repair_tail() const
{
    std::string text;
    if (auto ec = read_document(text); ec) {
        return ec;
    }
    if (text.empty() || text.back() == '\n') {
        return {};
    }

    const auto last_newline = text.rfind('\n');
    if (last_newline == std::string::npos) {
        std::ofstream writer{path_, std::ios::binary | std::ios::app};
        writer.put('\n');
        writer.flush();
        return writer ? std::error_code{} : make_error_code(SnapshotErrc::WriteFailed);
    }

    std::error_code ec;
    std::filesystem::resize_file(path_, last_newline + 1U, ec);
    if (ec) {
        return make_error_code(SnapshotErrc::WriteFailed);
    }
    return {};
}

std::error_code SnapshotArchive::load_all(std::vector<SnapshotRecord>& out, ArchiveDiagnostic* diagnostic) const
{
    out.clear();

    std::string text;
    if (auto ec = read_document(text); ec) {
        return ec;
    }
    return parse_snapshot_archive(text, out, diagnostic);
}

std::error_code SnapshotArchive::scan_window(const TimeWindow& window, std::vector<SnapshotRecord>& out) const
{
    out.clear();

    std::vector<SnapshotRecord> records;
    if (auto ec = load_records(records); ec) {
        return ec;
    }

    for (auto& record : records) {
        if (window.contains(record.captured_at)) {
            out.push_back(std::move(record));
        }
    }
    sort_by_capture(out);
    return {};
}

std::error_code SnapshotArchive::find_predecessors(std::span<const FileKey> keys,
                                                   Timestamp before,
                                                   std::vector<SnapshotRecord>& out) const
{
    out.clear();

    std::vector<SnapshotRecord> records;
    if (auto ec = load_records(records); ec) {
        return ec;
    }

    const std::set<FileKey> wanted(keys.begin(), keys.end());
    std::map<FileKey, SnapshotRecord> latest;
    for (auto& record : records) {
        if (record.captured_at >= before || !wanted.contains(record.key())) {
            continue;
        }
        auto it = latest.find(record.key());
        if (it == latest.end()) {
            latest.emplace(record.key(), std::move(record));
        } else if (it->second.captured_at < record.captured_at) {
            it->second = std::move(record);
        }
    }

    out.reserve(latest.size());
    for (auto& [key, record] : latest) {
        out.push_back(std::move(record));
    }
    return {};
}

std::error_code SnapshotArchive::append(std::span<const SnapshotRecord> records)
{
    std::lock_guard guard(append_mutex_);

    if (auto ec = initialize(); ec) {
        return ec;
    }
    if (records.empty()) {
        return {};
    }
    if (auto ec = repair_tail(); ec) {
        return ec;
    }

    std::set<std::pair<FileKey, Timestamp>> incoming;
    for (const auto& record : records) {
        if (!incoming.emplace(record.key(), record.captured_at).second) {
            return make_error_code(SnapshotErrc::DuplicateRecord);
        }
    }

    std::vector<SnapshotRecord> existing;
    if (auto ec = load_records(existing); ec) {
        return ec;
    }
    for (const auto& record : existing) {
        if (incoming.contains({record.key(), record.captured_at})) {
            return make_error_code(SnapshotErrc::DuplicateRecord);
        }
    }

    std::string payload;
    for (const auto& record : records) {
        payload.append(format_snapshot_record(record));
        payload.push_back('\n');
    }

    std::ofstream writer{path_, std::ios::binary | std::ios::app};
    if (!writer) {
        return make_error_code(SnapshotErrc::WriteFailed);
    }
    writer.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    writer.flush();
    if (!writer) {
        return make_error_code(SnapshotErrc::WriteFailed);
    }
    return {};
}

ArchiveDiagnostic SnapshotArchive::last_diagnostic() const
{
    std::lock_guard guard(diagnostic_mutex_);
    return last_diagnostic_;
}

ArchiveCounterReader::ArchiveCounterReader(std::filesystem::path path) noexcept
    : archive_{std::move(path)}
{
}

std::error_code ArchiveCounterReader::read_current(std::vector<SnapshotRecord>& out)
{
    out.clear();

    std::vector<SnapshotRecord> records;
    if (auto ec = archive_.load_all(records); ec) {
        return ec;
    }

    std::map<FileKey, SnapshotRecord> latest;
    for (auto& record : records) {
        auto it = latest.find(record.key());
        if (it == latest.end()) {
            latest.emplace(record.key(), std::move(record));
        } else if (it->second.captured_at <= record.captured_at) {
            it->second = std::move(record);
        }
    }

    out.reserve(latest.size());
    for (auto& [key, record] : latest) {
        out.push_back(std::move(record));
    }
    return {};
}

}  // namespace iostall::snapshot
