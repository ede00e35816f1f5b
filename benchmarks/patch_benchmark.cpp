// jsonpatch-cpp benchmarks — measures throughput of apply and diff.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <benchmark/benchmark.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

using namespace jsonpatch_cpp;
using json = nlohmann::json;

static auto make_object(std::size_t n) -> json {
    auto doc = json::object();
    for (std::size_t i = 0; i < n; ++i) {
        doc["key" + std::to_string(i)] = {{"id", i}, {"tags", json::array({"a", "b"})}};
    }
    return doc;
}

static auto make_array(std::size_t n, std::size_t stride) -> json {
    auto arr = json::array();
    for (std::size_t i = 0; i < n; ++i) {
        arr.push_back((i * stride) % (n / 2 + 1));
    }
    return arr;
}

// =============================================================================
// Apply
// =============================================================================

static void bm_apply_add_remove(benchmark::State& state) {
    const auto doc = make_object(static_cast<std::size_t>(state.range(0)));
    const auto patch = PatchBuilder{}
        .add("/extra", json::array({1, 2, 3}))
        .add("/extra/-", 4)
        .remove("/key0")
        .to_patch();
    for (auto _ : state) {
        auto result = patch.apply(doc);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_add_remove)->Range(8, 4096);

static void bm_apply_move_copy_test(benchmark::State& state) {
    const auto doc = make_object(static_cast<std::size_t>(state.range(0)));
    const auto patch = PatchBuilder{}
        .copy("/copied", "/key1")
        .move("/moved", "/key2")
        .test("/copied/id", 1)
        .to_patch();
    for (auto _ : state) {
        auto result = patch.apply(doc);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_move_copy_test)->Range(8, 4096);

// =============================================================================
// Diff
// =============================================================================

static void bm_diff_object(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto source = make_object(n);
    auto target = source;
    target.erase("key0");
    target["key1"]["id"] = -1;
    target["added"] = true;
    for (auto _ : state) {
        auto patch = diff(source, target);
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_object)->Range(8, 4096);

static void bm_diff_array(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto source = make_array(n, 3);
    const auto target = make_array(n, 5);
    for (auto _ : state) {
        auto patch = diff(source, target);
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_array)->Range(8, 512);

static void bm_diff_round_trip(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto source = json{{"items", make_array(n, 3)}, {"meta", make_object(8)}};
    const auto target = json{{"items", make_array(n, 7)}, {"meta", make_object(9)}};
    for (auto _ : state) {
        auto result = Patch{diff(source, target)}.apply(source);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_diff_round_trip)->Range(8, 256);
