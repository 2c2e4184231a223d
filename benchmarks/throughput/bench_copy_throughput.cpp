/**
 * @file bench_copy_throughput.cpp
 * @brief Benchmarks for batch copy throughput
 *
 * Measures end-to-end batch upload/download throughput against a
 * directory store for different worker counts, and the raw hand-off rate of
 * the work queue.
 */

#include <benchmark/benchmark.h>

#include <kcenon/bulk_copy/bulk_copy.h>
#include <kcenon/bulk_copy/engine/work_queue.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::bulk_copy::benchmark {

namespace {

constexpr std::size_t file_count = 32;

/**
 * @brief Temporary workspace holding local files and a store root
 */
class bench_workspace {
public:
    explicit bench_workspace(std::size_t file_size) {
        std::random_device rd;
        base_ = std::filesystem::temp_directory_path() /
                ("bulk_copy_bench_" + std::to_string(rd()));
        std::filesystem::create_directories(base_ / "local");
        std::filesystem::create_directories(base_ / "out");

        std::mt19937 gen(42);
        std::uniform_int_distribution<int> dist(0, 255);
        std::vector<char> data(file_size);
        for (auto& c : data) {
            c = static_cast<char>(dist(gen));
        }

        for (std::size_t i = 0; i < file_count; ++i) {
            auto path = base_ / "local" / ("file_" + std::to_string(i) + ".bin");
            std::ofstream out(path, std::ios::binary);
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
            files_.push_back(path.string());
        }
    }

    ~bench_workspace() {
        std::error_code ec;
        std::filesystem::remove_all(base_, ec);
    }

    bench_workspace(const bench_workspace&) = delete;
    auto operator=(const bench_workspace&) -> bench_workspace& = delete;

    [[nodiscard]] auto base() const -> const std::filesystem::path& { return base_; }
    [[nodiscard]] auto files() const -> const std::vector<std::string>& { return files_; }

private:
    std::filesystem::path base_;
    std::vector<std::string> files_;
};

auto make_engine(const std::filesystem::path& root, std::ostream& sink) -> result<copy_engine> {
    auto store = directory_store::create(root);
    if (!store.has_value()) {
        return unexpected{store.error()};
    }
    return copy_engine::builder()
        .with_store(std::move(store.value()))
        .with_fatal_policy(fatal_policy::stop_and_report)
        .with_output(sink)
        .with_error_output(sink)
        .build();
}

}  // namespace

/**
 * @brief Upload a batch of files into a remote directory
 */
static void BM_Batch_Upload(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto workers = static_cast<std::size_t>(state.range(1));

    get_logger().set_level(log_level::error);
    bench_workspace workspace(file_size);
    std::ostringstream sink;
    auto engine = make_engine(workspace.base() / "store", sink);
    if (!engine.has_value()) {
        state.SkipWithError(engine.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        sink.str({});
        auto report = engine.value().run(workspace.files(), "data://bench", workers);
        if (!report.ok()) {
            state.SkipWithError(report.failure->err.message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(report.succeeded);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size * file_count) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["workers"] = static_cast<double>(workers);
}

/**
 * @brief Download a batch of objects into a local directory
 */
static void BM_Batch_Download(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto workers = static_cast<std::size_t>(state.range(1));

    get_logger().set_level(log_level::error);
    bench_workspace workspace(file_size);
    std::ostringstream sink;
    auto engine = make_engine(workspace.base() / "store", sink);
    if (!engine.has_value()) {
        state.SkipWithError(engine.error().message.c_str());
        return;
    }

    auto seeded = engine.value().run(workspace.files(), "data://bench", workers);
    if (!seeded.ok()) {
        state.SkipWithError("failed to seed store");
        return;
    }

    std::vector<std::string> remote;
    for (std::size_t i = 0; i < file_count; ++i) {
        remote.push_back("data://bench/file_" + std::to_string(i) + ".bin");
    }
    auto out_dir = (workspace.base() / "out").string();

    for (auto _ : state) {
        sink.str({});
        auto report = engine.value().run(remote, out_dir, workers);
        if (!report.ok()) {
            state.SkipWithError(report.failure->err.message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(report.bytes_transferred);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size * file_count) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["workers"] = static_cast<double>(workers);
}

/**
 * @brief Item hand-off rate through the bounded queue
 */
static void BM_WorkQueue_Handoff(::benchmark::State& state) {
    const auto consumers = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t items = 10000;

    for (auto _ : state) {
        work_queue<std::size_t> queue(consumers);
        std::vector<std::thread> threads;
        for (std::size_t i = 0; i < consumers; ++i) {
            threads.emplace_back([&queue]() {
                while (auto item = queue.pop()) {
                    ::benchmark::DoNotOptimize(*item);
                }
            });
        }
        for (std::size_t i = 0; i < items; ++i) {
            queue.push(i);
        }
        queue.close();
        for (auto& t : threads) {
            t.join();
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(items) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Batch_Upload)
    ->ArgsProduct({{4 * 1024, 256 * 1024}, {1, 4, 8}})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Batch_Download)
    ->ArgsProduct({{4 * 1024, 256 * 1024}, {1, 4, 8}})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_WorkQueue_Handoff)->Arg(1)->Arg(4)->Arg(8);

}  // namespace kcenon::bulk_copy::benchmark

BENCHMARK_MAIN();
