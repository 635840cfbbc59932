#include "iostall/snapshot/snapshot_archive.hpp"
#include "iostall/snapshot/snapshot_errors.hpp"
#include "iostall/snapshot/snapshot_time.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace iostall::snapshot;

namespace {

std::filesystem::path make_temp_directory(const std::string& prefix)
{
    auto root = std::filesystem::temp_directory_path();
    auto dir = root / (prefix + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

struct TempArchiveDirectory final {
    TempArchiveDirectory()
        : path{make_temp_directory("iostall_archive_")}
    {
    }

    ~TempArchiveDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path path;
};

Timestamp at(unsigned hour, unsigned minute)
{
    return *make_timestamp({2025, 7, 1, hour, minute, 0, 0});
}

SnapshotRecord make_record(Timestamp captured_at, std::int32_t file_id, std::uint64_t reads)
{
    SnapshotRecord record{};
    record.captured_at = captured_at;
    record.database_id = 5;
    record.database_name = "sales";
    record.file_id = file_id;
    record.drive = "D:";
    record.file_type = file_id == 2 ? "LOG" : "ROWS";
    record.physical_path = "D:\\data\\sales_" + std::to_string(file_id) + ".mdf";
    record.counters.reads = reads;
    record.counters.writes = 50U;
    record.counters.read_stall_ms = reads * 5U;
    record.counters.write_stall_ms = 250U;
    record.counters.total_stall_ms = reads * 5U + 250U;
    record.counters.bytes_read = reads * 8192U;
    record.counters.bytes_written = 409'600U;
    record.file_handle = 0xABU;
    return record;
}

void write_text(const std::filesystem::path& path, const std::string& text)
{
    std::ofstream stream{path, std::ios::binary | std::ios::trunc};
    stream << text;
}

}  // namespace

TEST_CASE("format_snapshot_record writes quoted strings and a hex handle")
{
    auto record = make_record(at(10, 0), 1, 100U);
    record.database_name = "O\"Brien";

    const auto line = format_snapshot_record(record);
    CHECK(line
          == "2025-07-01T10:00:00.000Z,5,\"O\"\"Brien\",1,\"D:\",\"ROWS\",\"D:\\data\\sales_1.mdf\","
             "100,50,500,250,750,819200,409600,0x00000000000000AB");

    SnapshotRecord parsed{};
    REQUIRE_FALSE(parse_snapshot_record(line, parsed));
    CHECK(parsed.captured_at == record.captured_at);
    CHECK(parsed.database_name == "O\"Brien");
    CHECK(parsed.physical_path == record.physical_path);
    CHECK(parsed.counters == record.counters);
    CHECK(parsed.file_handle == 0xABU);
}

TEST_CASE("parse_snapshot_record reports the failing column")
{
    const std::string line
        = "2025-07-01T10:00:00.000Z,abc,\"sales\",1,\"D:\",\"ROWS\",\"D:\\s.mdf\",1,1,1,1,2,8192,8192,0x1";

    SnapshotRecord parsed{};
    ArchiveDiagnostic diagnostic{};
    CHECK(parse_snapshot_record(line, parsed, &diagnostic) == make_error_code(SnapshotErrc::MalformedRecord));
    CHECK_FALSE(diagnostic.empty());
    CHECK(diagnostic.column == 26U);
}

TEST_CASE("parse_snapshot_record rejects impossible capture times")
{
    const std::string line
        = "2025-02-30T10:00:00.000Z,5,\"sales\",1,\"D:\",\"ROWS\",\"D:\\s.mdf\",1,1,1,1,2,8192,8192,0x1";

    SnapshotRecord parsed{};
    CHECK(parse_snapshot_record(line, parsed) == make_error_code(SnapshotErrc::InvalidTimestamp));
}

TEST_CASE("parse_snapshot_record rejects counters that overflow")
{
    const std::string line = "2025-07-01T10:00:00.000Z,5,\"sales\",1,\"D:\",\"ROWS\",\"D:\\s.mdf\","
                             "99999999999999999999999,1,1,1,2,8192,8192,0x1";

    SnapshotRecord parsed{};
    CHECK(parse_snapshot_record(line, parsed) == make_error_code(SnapshotErrc::MalformedRecord));
}

TEST_CASE("parse_snapshot_archive skips comments and ignores an unterminated last line")
{
    std::string text{kArchiveHeader};
    text.append("\n# capture 1\n\n");
    text.append(format_snapshot_record(make_record(at(10, 0), 1, 100U)));
    text.append("\r\n");
    text.append(format_snapshot_record(make_record(at(10, 15), 1, 180U)));

    std::vector<SnapshotRecord> records;
    REQUIRE_FALSE(parse_snapshot_archive(text, records));
    REQUIRE(records.size() == 1U);
    CHECK(records[0].counters.reads == 100U);
}

TEST_CASE("parse_snapshot_archive reports the failing line")
{
    std::string text{kArchiveHeader};
    text.append("\n");
    text.append(format_snapshot_record(make_record(at(10, 0), 1, 100U)));
    text.append("\nnot a record\n");

    std::vector<SnapshotRecord> records;
    ArchiveDiagnostic diagnostic{};
    CHECK(parse_snapshot_archive(text, records, &diagnostic) == make_error_code(SnapshotErrc::MalformedRecord));
    CHECK(diagnostic.line == 3U);
    CHECK(diagnostic.column == 1U);
}

TEST_CASE("parse_snapshot_archive rejects a foreign header")
{
    std::vector<SnapshotRecord> records;
    CHECK(parse_snapshot_archive("time,database,reads\n", records)
          == make_error_code(SnapshotErrc::ArchiveHeaderMismatch));
}

TEST_CASE("SnapshotArchive appends captures and scans them back")
{
    TempArchiveDirectory temp;
    SnapshotArchive archive{temp.path / "history" / "snapshots.csv"};

    const std::vector<SnapshotRecord> first{make_record(at(10, 0), 1, 100U), make_record(at(10, 0), 2, 10U)};
    const std::vector<SnapshotRecord> second{make_record(at(10, 15), 1, 180U), make_record(at(10, 15), 2, 12U)};
    REQUIRE_FALSE(archive.append(first));
    REQUIRE_FALSE(archive.append(second));

    std::vector<SnapshotRecord> window;
    REQUIRE_FALSE(archive.scan_window(TimeWindow{at(10, 10), at(10, 15)}, window));
    REQUIRE(window.size() == 2U);
    CHECK(window[0].file_id == 1);
    CHECK(window[0].counters.reads == 180U);
    CHECK(window[1].file_id == 2);

    const std::vector<FileKey> keys{{5, 1}, {5, 2}};
    std::vector<SnapshotRecord> predecessors;
    REQUIRE_FALSE(archive.find_predecessors(keys, at(10, 10), predecessors));
    REQUIRE(predecessors.size() == 2U);
    CHECK(predecessors[0].captured_at == at(10, 0));
    CHECK(predecessors[0].counters.reads == 100U);

    CHECK(archive.append(first) == make_error_code(SnapshotErrc::DuplicateRecord));

    std::vector<SnapshotRecord> all;
    REQUIRE_FALSE(archive.load_all(all));
    CHECK(all.size() == 4U);
}

TEST_CASE("SnapshotArchive append drops a partial record left by an interrupted write")
{
    TempArchiveDirectory temp;
    const auto path = temp.path / "snapshots.csv";
    const auto partial = format_snapshot_record(make_record(at(10, 0), 2, 10U));
    write_text(path,
               std::string{kArchiveHeader} + '\n' + format_snapshot_record(make_record(at(10, 0), 1, 100U)) + '\n'
                   + partial.substr(0U, partial.size() / 2U));

    SnapshotArchive archive{path};
    const std::vector<SnapshotRecord> capture{make_record(at(10, 15), 1, 180U), make_record(at(10, 15), 2, 12U)};
    REQUIRE_FALSE(archive.append(capture));

    std::vector<SnapshotRecord> window;
    REQUIRE_FALSE(archive.scan_window(TimeWindow{at(9, 0), at(11, 0)}, window));
    REQUIRE(window.size() == 3U);
    CHECK(window[0].captured_at == at(10, 0));
    CHECK(window[0].file_id == 1);
    CHECK(window[1].captured_at == at(10, 15));
    CHECK(window[2].captured_at == at(10, 15));
    CHECK(window[2].counters.reads == 12U);
}

TEST_CASE("SnapshotArchive append terminates a header written without a newline")
{
    TempArchiveDirectory temp;
    const auto path = temp.path / "snapshots.csv";
    write_text(path, std::string{kArchiveHeader});

    SnapshotArchive archive{path};
    const std::vector<SnapshotRecord> capture{make_record(at(10, 0), 1, 100U)};
    REQUIRE_FALSE(archive.append(capture));

    std::vector<SnapshotRecord> records;
    REQUIRE_FALSE(archive.load_all(records));
    REQUIRE(records.size() == 1U);
    CHECK(records[0].counters.reads == 100U);
}

TEST_CASE("SnapshotArchive serialises captures appended from several threads")
{
    TempArchiveDirectory temp;
    SnapshotArchive archive{temp.path / "snapshots.csv"};
    REQUIRE_FALSE(archive.initialize());

    std::atomic<int> failures{0};
    auto append_captures = [&](std::int32_t file_id) {
        for (unsigned minute = 0U; minute < 20U; ++minute) {
            const std::vector<SnapshotRecord> capture{make_record(at(10, minute), file_id, 100U + minute)};
            if (archive.append(capture)) {
                ++failures;
            }
        }
    };

    std::thread first(append_captures, 1);
    std::thread second(append_captures, 2);
    first.join();
    second.join();

    CHECK(failures.load() == 0);
    std::vector<SnapshotRecord> window;
    REQUIRE_FALSE(archive.scan_window(TimeWindow{at(10, 0), at(10, 19)}, window));
    CHECK(window.size() == 40U);
}

TEST_CASE("SnapshotArchive reports a missing file and a foreign header")
{
    TempArchiveDirectory temp;

    SnapshotArchive missing{temp.path / "absent.csv"};
    std::vector<SnapshotRecord> out;
    CHECK(missing.scan_window(TimeWindow{at(0, 0), at(23, 0)}, out) == make_error_code(SnapshotErrc::ArchiveMissing));

    const auto foreign_path = temp.path / "foreign.csv";
    write_text(foreign_path, "a,b,c\n");
    SnapshotArchive foreign{foreign_path};
    CHECK(foreign.initialize() == make_error_code(SnapshotErrc::ArchiveHeaderMismatch));
    CHECK(foreign.scan_window(TimeWindow{at(0, 0), at(23, 0)}, out)
          == make_error_code(SnapshotErrc::ArchiveHeaderMismatch));
    CHECK_FALSE(foreign.last_diagnostic().empty());
}

TEST_CASE("SnapshotArchive initialize writes the header once")
{
    TempArchiveDirectory temp;
    SnapshotArchive archive{temp.path / "snapshots.csv"};
    REQUIRE_FALSE(archive.initialize());
    REQUIRE_FALSE(archive.initialize());

    std::vector<SnapshotRecord> records;
    REQUIRE_FALSE(archive.load_all(records));
    CHECK(records.empty());
}

TEST_CASE("ArchiveCounterReader keeps the latest record per file")
{
    TempArchiveDirectory temp;
    const auto path = temp.path / "counters.csv";
    {
        SnapshotArchive archive{path};
        const std::vector<SnapshotRecord> records{make_record(at(10, 0), 1, 100U),
                                                  make_record(at(10, 15), 1, 180U),
                                                  make_record(at(10, 0), 2, 10U)};
        REQUIRE_FALSE(archive.append(records));
    }

    ArchiveCounterReader reader{path};
    std::vector<SnapshotRecord> current;
    REQUIRE_FALSE(reader.read_current(current));
    REQUIRE(current.size() == 2U);
    CHECK(current[0].file_id == 1);
    CHECK(current[0].counters.reads == 180U);
    CHECK(current[1].file_id == 2);
}
