// SPDX-License-Identifier: MIT
#include <benchmark/benchmark.h>
#include "src/flythrough/flythrough.hpp"
#include "src/grid/functionalize.hpp"
#include <cmath>
#include <random>
#include <span>
#include <vector>

namespace gridfn {

static std::vector<double> linspace(double a, double b, size_t n) {
    std::vector<double> v(n);
    for (size_t i = 0; i < n; ++i) {
        v[i] = a + (b - a) * static_cast<double>(i) / static_cast<double>(n - 1);
    }
    return v;
}

// Smooth (time, lon, lat) test field
static FunctionRegistry make_registry(size_t n, InterpolationMethod method) {
    auto time = linspace(0.0, 86400.0, n);
    auto lon = linspace(-180.0, 180.0, n);
    auto lat = linspace(-90.0, 90.0, n);

    std::vector<double> values;
    values.reserve(n * n * n);
    for (double t : time)
        for (double x : lon)
            for (double y : lat)
                values.push_back(std::sin(t / 8000.0) + std::cos(x / 40.0) * std::sin(y / 30.0));

    FunctionalizeOptions options;
    options.interpolation.method = method;
    auto registry = functionalize(
        {{"time", "s", NdArray::vector(time)},
         {"lon", "deg", NdArray::vector(lon)},
         {"lat", "deg", NdArray::vector(lat)}},
        {{"f", "1", NdArray{{n, n, n}, values}}},
        options);
    return registry.has_value() ? std::move(registry.value()) : FunctionRegistry{};
}

static void run_eval(benchmark::State& state, InterpolationMethod method) {
    const auto n = static_cast<size_t>(state.range(0));
    auto registry = make_registry(n, method);
    auto fn = registry.get("f");
    if (!fn) {
        state.SkipWithError("Failed to build function");
        return;
    }

    std::mt19937 gen(42);
    std::uniform_real_distribution<> t_dist(0.0, 86400.0);
    std::uniform_real_distribution<> lon_dist(-180.0, 180.0);
    std::uniform_real_distribution<> lat_dist(-90.0, 90.0);
    std::vector<double> queries(3 * 1000);
    for (size_t i = 0; i < 1000; ++i) {
        queries[3 * i] = t_dist(gen);
        queries[3 * i + 1] = lon_dist(gen);
        queries[3 * i + 2] = lat_dist(gen);
    }

    size_t idx = 0;
    for (auto _ : state) {
        auto result = fn->eval(std::span<const double>(queries.data() + 3 * idx, 3));
        benchmark::DoNotOptimize(result);
        idx = (idx + 1) % 1000;
    }

    state.SetItemsProcessed(state.iterations());
    state.counters["grid_size"] = static_cast<double>(n * n * n);
}

static void BM_EvalLinear(benchmark::State& state) {
    run_eval(state, InterpolationMethod::LINEAR);
}

static void BM_EvalCubicSpline(benchmark::State& state) {
    run_eval(state, InterpolationMethod::CUBIC_SPLINE);
}

// Cost of building the spline operators and registering
static void BM_Functionalize(benchmark::State& state) {
    const auto n = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        auto registry = make_registry(n, InterpolationMethod::CUBIC_SPLINE);
        benchmark::DoNotOptimize(registry);
    }
    state.SetComplexityN(state.range(0));
}

static void BM_FlyThrough(benchmark::State& state) {
    auto registry = make_registry(24, InterpolationMethod::LINEAR);
    SampleTrajectoryConfig config;
    config.cadence = static_cast<double>(state.range(0));
    auto traj = sample_trajectory(config);
    if (!traj) {
        state.SkipWithError("Failed to build trajectory");
        return;
    }

    AxisBindings bindings = {
        {"time", TrajectoryComponent::TIME},
        {"lon", TrajectoryComponent::C1},
        {"lat", TrajectoryComponent::C2},
    };
    for (auto _ : state) {
        auto result = fly_through(registry, {"f"}, *traj, bindings);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(traj->size()));
}

BENCHMARK(BM_EvalLinear)->Arg(8)->Arg(32)->Arg(64)->Unit(benchmark::kNanosecond);
BENCHMARK(BM_EvalCubicSpline)->Arg(8)->Arg(32)->Arg(64)->Unit(benchmark::kNanosecond);
BENCHMARK(BM_Functionalize)->Arg(8)->Arg(16)->Arg(32)->Unit(benchmark::kMillisecond)->Complexity();
BENCHMARK(BM_FlyThrough)->Arg(60)->Arg(10)->Unit(benchmark::kMillisecond);

}  // namespace gridfn

BENCHMARK_MAIN();
