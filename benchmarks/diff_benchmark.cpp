// shapediff-cpp benchmarks: compile, diff, apply and JSON Patch lowering.

#include <shapediff-cpp/shapediff.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

using namespace shapediff_cpp;
namespace s = shapediff_cpp::shapes;

static auto row_shape() -> ShapePtr {
    return s::struct_of({
        s::prop("id", s::integer()),
        s::prop("name", s::string()),
        s::prop("score", s::number()),
        s::optional_prop("tags", s::array_of(s::string())),
    });
}

static auto tree_shape() -> ShapePtr {
    return s::recursive([](const ShapePtr& self) {
        return s::struct_of({
            s::prop("label", s::string()),
            s::prop("children", s::array_of(self)),
        });
    });
}

static auto make_rows(std::int64_t n, std::int64_t changed_every) -> Value {
    auto rows = Array{};
    rows.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) {
        const auto changed = changed_every > 0 && i % changed_every == 0;
        rows.push_back(Object{
            {"id", Value{i}},
            {"name", "row" + std::to_string(i)},
            {"score", changed ? 1.5 : 0.5},
        });
    }
    return rows;
}

static auto make_tree(int depth, int fanout, const std::string& leaf_label) -> Value {
    auto children = Array{};
    if (depth > 0) {
        for (int i = 0; i < fanout; ++i) {
            children.push_back(make_tree(depth - 1, fanout, leaf_label));
        }
    }
    return Object{
        {"label", depth == 0 ? leaf_label : std::string{"node"}},
        {"children", std::move(children)},
    };
}

// =============================================================================
// Compilation
// =============================================================================

static void bm_compile_struct(benchmark::State& state) {
    const auto shape = row_shape();
    for (auto _ : state) {
        benchmark::DoNotOptimize(compile(shape));
    }
}
BENCHMARK(bm_compile_struct);

static void bm_compile_recursive(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(compile(tree_shape()));
    }
}
BENCHMARK(bm_compile_recursive);

// =============================================================================
// Diffing
// =============================================================================

static void bm_diff_identical_rows(benchmark::State& state) {
    const auto differ = compile(s::array_of(row_shape()));
    const auto from = make_rows(state.range(0), 0);
    const auto to = make_rows(state.range(0), 0);
    for (auto _ : state) {
        benchmark::DoNotOptimize(differ(from, to));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_identical_rows)->Range(10, 10000);

static void bm_diff_sparse_changes(benchmark::State& state) {
    const auto differ = compile(s::array_of(row_shape()));
    const auto from = make_rows(state.range(0), 0);
    const auto to = make_rows(state.range(0), 10);
    for (auto _ : state) {
        benchmark::DoNotOptimize(differ(from, to));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_sparse_changes)->Range(10, 10000);

static void bm_diff_shared_storage(benchmark::State& state) {
    const auto differ = compile(s::array_of(row_shape()));
    const auto from = make_rows(state.range(0), 0);
    for (auto _ : state) {
        benchmark::DoNotOptimize(differ(from, from));
    }
}
BENCHMARK(bm_diff_shared_storage)->Range(10, 10000);

static void bm_diff_record(benchmark::State& state) {
    const auto differ = compile(s::record(KeyKind::string, s::integer()));
    const auto n = state.range(0);
    auto from = Object{};
    auto to = Object{};
    for (std::int64_t i = 0; i < n; ++i) {
        from.set(std::to_string(i), Value{i});
        to.set(std::to_string(i), Value{i == n / 2 ? -1 : i});
    }
    const auto a = Value{std::move(from)};
    const auto b = Value{std::move(to)};
    for (auto _ : state) {
        benchmark::DoNotOptimize(differ(a, b));
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_diff_record)->Range(1000, 100000);

static void bm_diff_tree(benchmark::State& state) {
    const auto differ = compile(tree_shape());
    const auto depth = static_cast<int>(state.range(0));
    const auto from = make_tree(depth, 3, "a");
    const auto to = make_tree(depth, 3, "b");
    for (auto _ : state) {
        benchmark::DoNotOptimize(differ(from, to));
    }
}
BENCHMARK(bm_diff_tree)->DenseRange(2, 6, 2);

// =============================================================================
// Apply and lowering
// =============================================================================

static void bm_apply_sparse_changes(benchmark::State& state) {
    const auto differ = compile(s::array_of(row_shape()));
    const auto from = make_rows(state.range(0), 0);
    const auto patch = differ(from, make_rows(state.range(0), 10));
    for (auto _ : state) {
        benchmark::DoNotOptimize(apply_patch(patch, from));
    }
}
BENCHMARK(bm_apply_sparse_changes)->Range(10, 10000);

static void bm_lower_to_json_patch(benchmark::State& state) {
    const auto differ = compile(tree_shape());
    const auto patch = differ(make_tree(4, 3, "a"), make_tree(4, 3, "b"));
    for (auto _ : state) {
        benchmark::DoNotOptimize(to_json_patch(patch));
    }
}
BENCHMARK(bm_lower_to_json_patch);
