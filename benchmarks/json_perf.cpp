#include "accessor.h"
#include "document.h"
#include "json.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <numeric>
#include <string>
#include <vector>

#ifndef JDOC_SOURCE_DIR
#error "JDOC_SOURCE_DIR must be defined"
#endif

namespace bench
{

using Clock = std::chrono::high_resolution_clock;

struct Stats
{
    double min_ns;
    double max_ns;
    double mean_ns;
    double median_ns;
    double stddev_ns;
};

struct BenchConfig
{
    std::size_t warmup_runs = 1;
    std::size_t measure_runs = 5;
    double scale = 1.0;
    std::string filter;
    bool list_only = false;
};

struct BenchCase
{
    std::string name;
    std::size_t inner_iterations;
    std::size_t bytes_per_iteration;
    std::function<void()> body;
};

static volatile std::uint64_t g_sink = 0;

template <class T>
inline void DoNotOptimize(const T& value)
{
#if defined(__GNUC__) || defined(__clang__)
    asm volatile("" : : "g"(&value) : "memory");
#else
    std::atomic_signal_fence(std::memory_order_acq_rel);
#endif
}

inline void Ensure(bool condition, const std::string& message)
{
    if (!condition) {
        std::fprintf(stderr, "error: %s\n", message.c_str());
        std::exit(1);
    }
}

inline Stats
ComputeStats(std::vector<double> samples)
{
    Ensure(!samples.empty(), "ComputeStats called with empty samples");
    Stats stats;
    stats.min_ns = *std::min_element(samples.begin(), samples.end());
    stats.max_ns = *std::max_element(samples.begin(), samples.end());
    const double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
    stats.mean_ns = sum / samples.size();
    double variance = 0.0;
    for (std::size_t i = 0; i < samples.size(); ++i) {
        const double diff = samples[i] - stats.mean_ns;
        variance += diff * diff;
    }
    stats.stddev_ns = std::sqrt(variance / samples.size());
    std::sort(samples.begin(), samples.end());
    std::size_t mid = samples.size() / 2;
    stats.median_ns = samples.size() % 2 ? samples[mid]
                                         : (samples[mid - 1] + samples[mid]) * 0.5;
    return stats;
}

inline std::size_t
ClampIterations(std::size_t base, double scale)
{
    double scaled = base * scale;
    if (scaled < 1.0) {
        return 1;
    }
    return static_cast<std::size_t>(scaled);
}

class Runner
{
  public:
    explicit Runner(const BenchConfig& cfg) : config_(cfg)
    {
    }

    void run(const BenchCase& bench_case)
    {
        if (!config_.filter.empty() &&
            bench_case.name.find(config_.filter) == std::string::npos) {
            return;
        }
        if (config_.list_only) {
            std::printf("%s\n", bench_case.name.c_str());
            return;
        }

        const std::size_t inner = ClampIterations(bench_case.inner_iterations, config_.scale);
        for (std::size_t w = 0; w < config_.warmup_runs; ++w) {
            for (std::size_t i = 0; i < inner; ++i) {
                bench_case.body();
            }
        }

        std::vector<double> samples;
        samples.reserve(config_.measure_runs);
        for (std::size_t run = 0; run < config_.measure_runs; ++run) {
            Clock::time_point start = Clock::now();
            for (std::size_t i = 0; i < inner; ++i) {
                bench_case.body();
            }
            Clock::time_point end = Clock::now();
            double total_ns = static_cast<double>(
              std::chrono::duration_cast<std::chrono::nanoseconds>(end - start)
                .count());
            samples.push_back(total_ns / inner);
        }

        Stats stats = ComputeStats(samples);
        std::printf("%-28s %10.2f ns/op  (median %.2f | min %.2f | max %.2f | stddev %.2f)  inner=%-6zu",
                    bench_case.name.c_str(),
                    stats.mean_ns,
                    stats.median_ns,
                    stats.min_ns,
                    stats.max_ns,
                    stats.stddev_ns,
                    inner);
        if (bench_case.bytes_per_iteration > 0 && stats.median_ns > 0.0) {
            std::printf("  throughput=%.2f MB/s",
                        (bench_case.bytes_per_iteration * 1e3) / stats.median_ns);
        }
        std::printf("\n");
    }

  private:
    BenchConfig config_;
};

inline bool
HasPrefix(const std::string& s, const std::string& prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

inline BenchConfig
ParseArgs(int argc, char** argv)
{
    BenchConfig config;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            std::printf("json_perf options:\n");
            std::printf("  --warmup N       Number of warmup runs (default 1)\n");
            std::printf("  --runs N         Number of measured runs (default 5)\n");
            std::printf("  --scale X        Scale inner iteration counts by X\n");
            std::printf("  --filter STR     Only run benchmarks containing STR\n");
            std::printf("  --list           List benchmark names\n");
            std::exit(0);
        } else if (HasPrefix(arg, "--warmup=")) {
            config.warmup_runs = static_cast<std::size_t>(std::strtoul(arg.c_str() + 9, NULL, 10));
        } else if (HasPrefix(arg, "--runs=")) {
            config.measure_runs = static_cast<std::size_t>(std::strtoul(arg.c_str() + 7, NULL, 10));
        } else if (HasPrefix(arg, "--scale=")) {
            config.scale = std::atof(arg.c_str() + 8);
        } else if (HasPrefix(arg, "--filter=")) {
            config.filter = arg.substr(9);
        } else if (arg == "--warmup") {
            Ensure(i + 1 < argc, "--warmup requires an argument");
            config.warmup_runs = static_cast<std::size_t>(std::strtoul(argv[++i], NULL, 10));
        } else if (arg == "--runs") {
            Ensure(i + 1 < argc, "--runs requires an argument");
            config.measure_runs = static_cast<std::size_t>(std::strtoul(argv[++i], NULL, 10));
        } else if (arg == "--scale") {
            Ensure(i + 1 < argc, "--scale requires an argument");
            config.scale = std::atof(argv[++i]);
        } else if (arg == "--filter") {
            Ensure(i + 1 < argc, "--filter requires an argument");
            config.filter = argv[++i];
        } else if (arg == "--list") {
            config.list_only = true;
        } else {
            Ensure(false, std::string("unknown argument: ") + arg);
        }
    }
    if (config.measure_runs == 0) {
        config.measure_runs = 1;
    }
    return config;
}

// A level file with `n` enemy records.
inline std::string
MakeLevel(std::size_t n)
{
    std::string s = "{\"name\": \"generated\", \"enemies\": [";
    for (std::size_t i = 0; i < n; ++i) {
        if (i) {
            s += ',';
        }
        s += "\n  {\"kind\": \"slime" + std::to_string(i % 7) +
             "\", \"hp\": " + std::to_string(10 + i % 90) +
             ", \"speed\": 1.25, \"tags\": [\"ground\", \"weak\"]}";
    }
    s += "\n]}";
    return s;
}

// An object with `n` members, as in a large string table.
inline std::string
MakeWideObject(std::size_t n)
{
    std::string s = "{";
    for (std::size_t i = 0; i < n; ++i) {
        if (i) {
            s += ',';
        }
        s += "\"key" + std::to_string(i) + "\": \"value" + std::to_string(i) + "\"";
    }
    s += "}";
    return s;
}

} // namespace bench

static const char kGameSettings[] =
  R"({
  "gameTitle": "My New Game",
  "fullScreenMode": false,
  "numPlayers": 1,
  "screenSize": {"width": 800, "height": 600},
  "levels": ["level1", "level2", "level3"]
})";

int
main(int argc, char** argv)
{
    using namespace bench;

    BenchConfig config = ParseArgs(argc, argv);

    const std::string settings_path =
      std::string(JDOC_SOURCE_DIR) + "/example/settings.json";
    const std::string level = MakeLevel(2000);
    const std::string wide = MakeWideObject(1000);

    jdoc::Document settings_doc = jdoc::Document::loadFromText(kGameSettings);
    jdoc::Document level_doc = jdoc::Document::loadFromText(level);
    jdoc::Document wide_doc = jdoc::Document::loadFromText(wide);

    std::vector<BenchCase> cases;

    cases.push_back({ "parse.settings_literal",
                      4000,
                      sizeof(kGameSettings) - 1,
                      [&]() {
                          std::pair<jdoc::Json::Status, jdoc::Json> parsed =
                            jdoc::Json::parse(kGameSettings);
                          Ensure(parsed.first == jdoc::Json::success,
                                 "parse.settings_literal failed");
                          g_sink += parsed.second.isObject();
                      } });

    cases.push_back({ "parse.generated_level",
                      10,
                      level.size(),
                      [&]() {
                          std::pair<jdoc::Json::Status, jdoc::Json> parsed =
                            jdoc::Json::parse(level);
                          Ensure(parsed.first == jdoc::Json::success,
                                 "parse.generated_level failed");
                          g_sink += parsed.second.getObject().size();
                      } });

    cases.push_back({ "load.file_settings",
                      200,
                      0,
                      [&]() {
                          jdoc::Document doc = jdoc::Document::loadFromFile(settings_path);
                          g_sink += doc.root().isObject();
                      } });

    cases.push_back({ "read.scalars",
                      20000,
                      0,
                      [&]() {
                          const jdoc::Node& root = settings_doc.root();
                          std::string title = jdoc::readString(root, "gameTitle");
                          g_sink += title.size();
                          g_sink += jdoc::readNumberAsInt(root, "numPlayers");
                          g_sink += jdoc::readBool(root, "fullScreenMode");
                      } });

    cases.push_back({ "read.nested_object",
                      20000,
                      0,
                      [&]() {
                          jdoc::Node screen =
                            jdoc::readObject(settings_doc.root(), "screenSize");
                          g_sink += jdoc::readNumberAsInt(screen, "width");
                          g_sink += jdoc::readNumberAsInt(screen, "height");
                      } });

    cases.push_back({ "read.array_of_string",
                      20000,
                      0,
                      [&]() {
                          std::vector<std::string> levels =
                            jdoc::readArrayOfString(settings_doc.root(), "levels");
                          DoNotOptimize(levels);
                          g_sink += levels.size();
                      } });

    cases.push_back({ "read.array_of_object",
                      20,
                      0,
                      [&]() {
                          std::vector<jdoc::Node> enemies =
                            jdoc::readArrayOfObject(level_doc.root(), "enemies");
                          for (const jdoc::Node& enemy : enemies) {
                              g_sink += jdoc::readNumberAsInt(enemy, "hp");
                          }
                      } });

    cases.push_back({ "lookup.wide_object",
                      20,
                      0,
                      [&]() {
                          for (std::size_t i = 0; i < 1000; i += 10) {
                              g_sink += jdoc::readString(wide_doc.root(),
                                                         "key" + std::to_string(i))
                                          .size();
                          }
                      } });

    if (!config.list_only) {
        std::printf("json_perf: warmup=%zu runs=%zu scale=%.2f\n",
                    config.warmup_runs,
                    config.measure_runs,
                    config.scale);
    }

    Runner runner(config);
    for (std::size_t i = 0; i < cases.size(); ++i) {
        runner.run(cases[i]);
    }

    if (!config.list_only) {
        std::printf("sink=%llu\n", static_cast<unsigned long long>(g_sink));
    }
    return 0;
}
