/**
 * @file bench_scheduler.cpp
 * @brief Benchmarks for route resolution and scheduler throughput
 */

#include <benchmark/benchmark.h>

#include <kcenon/transfer_orchestrator/transfer_orchestrator.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::transfer_orchestrator::benchmark {

namespace {

/**
 * @brief Local primitive that completes every call immediately
 */
class instant_local_backend : public local_filesystem_operations {
public:
    auto copy(const execution_context& ctx) -> execution_outcome override {
        progress_event progress;
        progress.files_total = static_cast<uint32_t>(ctx.sources.size());
        progress.files_done = progress.files_total;
        progress.bytes_total = 4096 * ctx.sources.size();
        progress.bytes_done = progress.bytes_total;
        ctx.report(progress);
        return transfer_completed{};
    }

    auto move(const execution_context& ctx) -> execution_outcome override { return copy(ctx); }

    auto remove(const transfer_id&, const std::vector<std::string>&)
        -> execution_outcome override {
        return transfer_completed{};
    }

    void cancel(const transfer_id&) override {}
    void request_pause(const transfer_id&) override {}
};

auto make_request(std::size_t index) -> transfer_request {
    transfer_request req;
    req.sources = {"/bench/src/" + std::to_string(index)};
    req.destination = "/bench/dst";
    return req;
}

}  // namespace

/**
 * @brief Routing table lookup across every kind and backend pair
 */
static void BM_ResolveRoute(::benchmark::State& state) {
    const backend_tag tags[] = {backend_tag::local, backend_tag::object_storage,
                                backend_tag::secure_remote, backend_tag::archive};
    const transfer_kind kinds[] = {transfer_kind::copy, transfer_kind::move,
                                   transfer_kind::extract};

    for (auto _ : state) {
        for (auto kind : kinds) {
            for (auto src : tags) {
                for (auto dst : tags) {
                    ::benchmark::DoNotOptimize(resolve_route(kind, src, dst));
                }
            }
        }
    }
    state.SetItemsProcessed(48 * static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Enqueue a batch and wait for every transfer to complete
 *
 * range(0) is the batch size, range(1) the concurrency limit.
 */
static void BM_Scheduler_DrainBatch(::benchmark::State& state) {
    const auto batch = static_cast<std::size_t>(state.range(0));
    const auto limit = static_cast<std::size_t>(state.range(1));

    backend_set backends;
    backends.local = std::make_shared<instant_local_backend>();
    auto built = transfer_scheduler::builder()
                     .with_dispatcher(std::make_shared<backend_dispatcher>(backends))
                     .with_settings(std::make_shared<transfer_settings>(0, limit))
                     .with_thread_pool(adapters::transfer_pool_factory::create())
                     .build();
    if (!built) {
        state.SkipWithError("Failed to build scheduler");
        return;
    }
    auto scheduler = std::move(built).value();

    std::vector<transfer_id> ids;
    ids.reserve(batch);
    for (auto _ : state) {
        ids.clear();
        for (std::size_t i = 0; i < batch; ++i) {
            auto id = scheduler.enqueue(make_request(i));
            if (!id) {
                state.SkipWithError("Enqueue rejected");
                return;
            }
            ids.push_back(id.value());
        }
        for (const auto& id : ids) {
            auto status = scheduler.wait_for(id, std::chrono::seconds(30));
            if (!status || status.value() != transfer_status::completed) {
                state.SkipWithError("Transfer did not complete");
                return;
            }
        }

        state.PauseTiming();
        scheduler.dismiss_completed();
        state.ResumeTiming();
    }

    state.SetItemsProcessed(static_cast<int64_t>(batch) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Snapshot cost with many queued records
 */
static void BM_Scheduler_Aggregate(::benchmark::State& state) {
    const auto queued = static_cast<std::size_t>(state.range(0));

    backend_set backends;
    backends.local = std::make_shared<instant_local_backend>();
    auto built = transfer_scheduler::builder()
                     .with_dispatcher(std::make_shared<backend_dispatcher>(backends))
                     .with_settings(std::make_shared<transfer_settings>(0, 1))
                     .with_thread_pool(adapters::transfer_pool_factory::create())
                     .build();
    if (!built) {
        state.SkipWithError("Failed to build scheduler");
        return;
    }
    auto scheduler = std::move(built).value();

    for (std::size_t i = 0; i < queued; ++i) {
        auto id = scheduler.enqueue(make_request(i));
        if (!id) {
            state.SkipWithError("Enqueue rejected");
            return;
        }
    }

    for (auto _ : state) {
        ::benchmark::DoNotOptimize(scheduler.aggregate());
    }
}

BENCHMARK(BM_ResolveRoute);

BENCHMARK(BM_Scheduler_DrainBatch)
    ->Args({64, 1})
    ->Args({64, 4})
    ->Args({512, 4})
    ->Args({512, 16})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Scheduler_Aggregate)
    ->Arg(16)
    ->Arg(256)
    ->Arg(1024)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::transfer_orchestrator::benchmark
