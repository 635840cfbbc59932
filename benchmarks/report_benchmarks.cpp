#include "iostall/report/delta_calculator.hpp"
#include "iostall/report/latency_aggregator.hpp"
#include "iostall/report/latency_reporter.hpp"
#include "iostall/snapshot/snapshot_store.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using Clock = std::chrono::steady_clock;
using SnapshotRecord = iostall::snapshot::SnapshotRecord;
using Timestamp = iostall::snapshot::Timestamp;

struct BenchmarkOptions final {
    std::string scenario = "all";
    std::size_t samples = 5U;
    std::size_t warmups = 1U;
    std::size_t databases = 20U;
    std::size_t files_per_database = 4U;
    std::size_t captures = 96U;
    double reset_rate = 0.01;
    bool json_output = false;
};

constexpr std::string_view kUsage =
    "usage: iostall_report_benchmarks [--scenario=all|deltas|historical|current] [--samples=N]\n"
    "                                 [--warmups=N] [--databases=N] [--files-per-db=N] [--captures=N]\n"
    "                                 [--reset-rate=X] [--json]\n";

// Returns the text after `prefix` when `argument` starts with it.
std::optional<std::string_view> option_value(std::string_view argument, std::string_view prefix)
{
    if (argument.substr(0U, prefix.size()) != prefix) {
        return std::nullopt;
    }
    return argument.substr(prefix.size());
}

template <typename T>
T parse_value(std::string_view text, std::string_view option)
{
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::invalid_argument("invalid value for " + std::string{option} + ": " + std::string{text});
    }
    return value;
}

BenchmarkOptions parse_options(int argc, char** argv)
{
    BenchmarkOptions options{};
    const std::vector<std::pair<std::string_view, std::size_t*>> sizes{{"--samples=", &options.samples},
                                                                       {"--warmups=", &options.warmups},
                                                                       {"--databases=", &options.databases},
                                                                       {"--files-per-db=", &options.files_per_database},
                                                                       {"--captures=", &options.captures}};

    for (int index = 1; index < argc; ++index) {
        const std::string_view argument{argv[index]};
        if (argument == "--json") {
            options.json_output = true;
            continue;
        }
        if (const auto value = option_value(argument, "--scenario=")) {
            options.scenario = std::string{*value};
            continue;
        }
        if (const auto value = option_value(argument, "--reset-rate=")) {
            options.reset_rate = std::clamp(parse_value<double>(*value, "--reset-rate"), 0.0, 1.0);
            continue;
        }

        bool matched = false;
        for (const auto& [prefix, target] : sizes) {
            if (const auto value = option_value(argument, prefix)) {
                *target = parse_value<std::size_t>(*value, prefix);
                matched = true;
                break;
            }
        }
        if (!matched) {
            std::cerr << kUsage;
            std::exit(argument == "--help" ? EXIT_SUCCESS : EXIT_FAILURE);
        }
    }

    options.samples = std::max<std::size_t>(options.samples, 1U);
    options.databases = std::max<std::size_t>(options.databases, 1U);
    options.files_per_database = std::max<std::size_t>(options.files_per_database, 1U);
    options.captures = std::max<std::size_t>(options.captures, 2U);
    return options;
}

// Fifteen-minute captures ending at `end`, counters growing by a random
// amount per capture and occasionally dropping back to simulate a restart.
std::vector<SnapshotRecord> build_history(const BenchmarkOptions& options, Timestamp end)
{
    std::mt19937_64 rng{0x10571A11ULL};
    std::uniform_int_distribution<std::uint64_t> ops{0U, 5000U};
    std::uniform_int_distribution<std::uint64_t> stall_per_op{0U, 40U};
    std::bernoulli_distribution reset{options.reset_rate};

    const auto interval = std::chrono::minutes{15};
    const auto start = end - interval * static_cast<std::int64_t>(options.captures - 1U);

    std::vector<SnapshotRecord> history;
    history.reserve(options.databases * options.files_per_database * options.captures);
    for (std::size_t db = 0U; db < options.databases; ++db) {
        for (std::size_t file = 0U; file < options.files_per_database; ++file) {
            SnapshotRecord record{};
            record.database_id = static_cast<std::int32_t>(db + 5U);
            record.database_name = "bench_db_" + std::to_string(db);
            record.file_id = static_cast<std::int32_t>(file + 1U);
            record.file_type = file == 1U ? "LOG" : "ROWS";
            record.physical_path = "D:\\data\\" + record.database_name + "_" + std::to_string(file) + ".mdf";
            record.drive = "D:";
            record.file_handle = (static_cast<std::uint64_t>(db) << 32U) | file;

            for (std::size_t capture = 0U; capture < options.captures; ++capture) {
                record.captured_at = start + interval * static_cast<std::int64_t>(capture);
                if (reset(rng)) {
                    record.counters = {};
                }
                const auto reads = ops(rng);
                const auto writes = ops(rng);
                auto& counters = record.counters;
                counters.reads += reads;
                counters.writes += writes;
                counters.read_stall_ms += reads * stall_per_op(rng);
                counters.write_stall_ms += writes * stall_per_op(rng);
                counters.total_stall_ms = counters.read_stall_ms + counters.write_stall_ms;
                counters.bytes_read += reads * 8192U;
                counters.bytes_written += writes * 8192U;
                history.push_back(record);
            }
        }
    }
    return history;
}

struct Fixture final {
    Timestamp now{};
    std::vector<SnapshotRecord> history{};
    iostall::snapshot::MemorySnapshotStore store{};
    iostall::snapshot::MemoryCounterReader counters{};
};

// Work done by one iteration; must be identical across iterations.
struct IterationWork final {
    std::size_t snapshots = 0U;
    std::size_t deltas = 0U;
    std::size_t resets = 0U;
    std::size_t rows = 0U;

    friend bool operator==(const IterationWork&, const IterationWork&) = default;
};

struct ScenarioDefinition final {
    std::string name;
    std::function<IterationWork(Fixture&)> run;
};

IterationWork run_deltas(Fixture& fixture)
{
    const auto result = iostall::report::compute_deltas(fixture.history, {});
    return IterationWork{fixture.history.size(), result.stats.deltas_emitted, result.stats.reset_pairs, 0U};
}

IterationWork run_report(Fixture& fixture, iostall::report::ReportMode mode)
{
    iostall::report::LatencyReporter::Config config{};
    config.store = &fixture.store;
    config.counters = &fixture.counters;
    config.clock = [&fixture]() { return fixture.now; };
    const iostall::report::LatencyReporter reporter{std::move(config)};

    iostall::report::ReportRequest request{};
    request.mode = mode;
    request.lookback_hours = 24 * 7;

    iostall::report::ReportResult result{};
    if (auto ec = reporter.report(request, result); ec) {
        throw std::runtime_error("report failed: " + result.message);
    }
    const auto& quality = result.quality;
    return IterationWork{quality.snapshots_scanned, quality.deltas_emitted, quality.reset_pairs, result.rows.size()};
}

const std::vector<ScenarioDefinition> kScenarios{
    {"deltas", run_deltas},
    {"historical", [](Fixture& fixture) { return run_report(fixture, iostall::report::ReportMode::Historical); }},
    {"current", [](Fixture& fixture) { return run_report(fixture, iostall::report::ReportMode::Current); }},
};

struct ScenarioTiming final {
    std::string name;
    IterationWork work{};
    double median_ms = 0.0;
    double best_ms = 0.0;
    double worst_ms = 0.0;
    // Snapshots consumed per second at the median sample.
    double snapshots_per_second = 0.0;
};

ScenarioTiming time_scenario(const ScenarioDefinition& scenario, const BenchmarkOptions& options, Fixture& fixture)
{
    for (std::size_t warmup = 0U; warmup < options.warmups; ++warmup) {
        static_cast<void>(scenario.run(fixture));
    }

    ScenarioTiming timing{};
    timing.name = scenario.name;
    std::vector<double> samples_ms;
    samples_ms.reserve(options.samples);
    for (std::size_t sample = 0U; sample < options.samples; ++sample) {
        const auto start = Clock::now();
        const auto work = scenario.run(fixture);
        samples_ms.push_back(std::chrono::duration<double, std::milli>(Clock::now() - start).count());
        if (sample == 0U) {
            timing.work = work;
        } else if (!(work == timing.work)) {
            throw std::runtime_error("scenario " + scenario.name + " did different work between samples");
        }
    }

    std::sort(samples_ms.begin(), samples_ms.end());
    timing.best_ms = samples_ms.front();
    timing.worst_ms = samples_ms.back();
    timing.median_ms = samples_ms[samples_ms.size() / 2U];
    if (timing.median_ms > 0.0) {
        timing.snapshots_per_second = static_cast<double>(timing.work.snapshots) * 1000.0 / timing.median_ms;
    }
    return timing;
}

void print_timings(const std::vector<ScenarioTiming>& timings, bool json)
{
    std::cout << std::fixed << std::setprecision(3);
    if (json) {
        std::cout << '[';
        for (std::size_t index = 0U; index < timings.size(); ++index) {
            const auto& timing = timings[index];
            std::cout << (index == 0U ? "" : ",") << "{\"scenario\":\"" << timing.name << '"'
                      << ",\"snapshots\":" << timing.work.snapshots << ",\"deltas\":" << timing.work.deltas
                      << ",\"reset_pairs\":" << timing.work.resets << ",\"rows\":" << timing.work.rows
                      << ",\"median_ms\":" << timing.median_ms << ",\"best_ms\":" << timing.best_ms
                      << ",\"worst_ms\":" << timing.worst_ms
                      << ",\"snapshots_per_second\":" << timing.snapshots_per_second << '}';
        }
        std::cout << "]\n";
        return;
    }

    std::cout << std::left << std::setw(12) << "scenario" << std::right << std::setw(11) << "snapshots"
              << std::setw(10) << "deltas" << std::setw(8) << "resets" << std::setw(8) << "rows"
              << std::setw(12) << "median ms" << std::setw(10) << "best ms" << std::setw(10) << "worst ms"
              << std::setw(14) << "snapshots/s" << '\n';
    for (const auto& timing : timings) {
        std::cout << std::left << std::setw(12) << timing.name << std::right << std::setw(11)
                  << timing.work.snapshots << std::setw(10) << timing.work.deltas << std::setw(8)
                  << timing.work.resets << std::setw(8) << timing.work.rows << std::setw(12) << timing.median_ms
                  << std::setw(10) << timing.best_ms << std::setw(10) << timing.worst_ms << std::setw(14)
                  << std::setprecision(0) << timing.snapshots_per_second << std::setprecision(3) << '\n';
    }
}

}  // namespace

int main(int argc, char** argv)
{
    try {
        const auto options = parse_options(argc, argv);

        Fixture fixture{};
        fixture.now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        fixture.history = build_history(options, fixture.now);
        if (auto ec = fixture.store.append(fixture.history); ec) {
            throw std::runtime_error("failed to load synthetic history: " + ec.message());
        }

        std::vector<SnapshotRecord> latest;
        for (const auto& record : fixture.history) {
            if (record.captured_at == fixture.now) {
                latest.push_back(record);
            }
        }
        fixture.counters.set_records(std::move(latest));

        std::vector<ScenarioTiming> timings;
        for (const auto& scenario : kScenarios) {
            if (options.scenario == "all" || scenario.name == options.scenario) {
                timings.push_back(time_scenario(scenario, options, fixture));
            }
        }
        if (timings.empty()) {
            throw std::runtime_error("unknown scenario: " + options.scenario);
        }
        print_timings(timings, options.json_output);

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "report benchmark failed: " << ex.what() << '\n';
        return 1;
    }
}
