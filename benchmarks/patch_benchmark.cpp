// jsonpatch-cpp benchmarks: measures throughput of pointer resolution and
// patch application.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace jsonpatch_cpp;

// An object of @p width members "k0".."kN", each holding an array of
// @p width integers.
static auto make_doc(std::int64_t width) -> Value {
    auto doc = Value::object();
    for (std::int64_t i = 0; i < width; ++i) {
        auto arr = Value::array();
        for (std::int64_t j = 0; j < width; ++j) arr.push_back(j);
        doc["k" + std::to_string(i)] = std::move(arr);
    }
    return doc;
}

static auto make_op(std::string op, std::string path, Value value) -> Operation {
    auto o = Operation{};
    o.op = std::move(op);
    o.path = std::move(path);
    o.value = std::move(value);
    return o;
}

// =============================================================================
// Pointer
// =============================================================================

static void bm_pointer_segments(benchmark::State& state) {
    const auto p = Pointer{"/a~1b/c~0d/0/-/e/f/g/h"};
    for (auto _ : state) {
        auto segments = p.segments();
        benchmark::DoNotOptimize(segments);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_pointer_segments);

static void bm_parse_array_index(benchmark::State& state) {
    const auto patch = Patch{PatchOptions{.support_negative_array_index = true}};
    for (auto _ : state) {
        auto a = patch.parse_array_index(1000, "517");
        auto b = patch.parse_array_index(1000, "-12");
        benchmark::DoNotOptimize(a);
        benchmark::DoNotOptimize(b);
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(bm_parse_array_index);

static void bm_visit_path(benchmark::State& state) {
    auto doc = Value::parse(R"({"a": {"b": {"c": [0, 1, {"d": {"e": true}}]}}})");
    const auto patch = Patch{};
    const auto segments = Pointer{"/a/b/c/2/d/e"}.segments();
    for (auto _ : state) {
        auto found = patch.visit_path(doc, segments);
        benchmark::DoNotOptimize(found.node);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_visit_path);

// =============================================================================
// Operations
// =============================================================================

static void bm_add_remove_array(benchmark::State& state) {
    const auto width = state.range(0);
    auto doc = make_doc(width);
    const auto patch = Patch{};
    const auto ops = std::vector<Operation>{
        make_op("add", "/k0/0", Value("x")),
        make_op("remove", "/k0/0", Value{}),
    };
    for (auto _ : state) {
        patch.apply(doc, ops);
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(bm_add_remove_array)->Range(8, 512);

static void bm_replace_members(benchmark::State& state) {
    const auto width = state.range(0);
    auto doc = make_doc(width);
    const auto patch = Patch{};
    auto ops = std::vector<Operation>{};
    for (std::int64_t i = 0; i < width; ++i) {
        ops.push_back(make_op("replace", "/k" + std::to_string(i) + "/0", Value(i)));
    }
    for (auto _ : state) {
        patch.apply(doc, ops);
    }
    state.SetItemsProcessed(state.iterations() * width);
}
BENCHMARK(bm_replace_members)->Range(8, 512);

static void bm_copy_subtree(benchmark::State& state) {
    const auto width = state.range(0);
    auto doc = make_doc(width);
    const auto patch = Patch{};
    auto copy = Operation{};
    copy.op = "copy";
    copy.from = "/k0";
    copy.path = "/copied";
    const auto ops = std::vector<Operation>{copy};
    for (auto _ : state) {
        patch.apply(doc, ops);
    }
    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * width * static_cast<std::int64_t>(sizeof(Value)));
}
BENCHMARK(bm_copy_subtree)->Range(8, 4096);

static void bm_test_deep_equal(benchmark::State& state) {
    const auto width = state.range(0);
    auto doc = make_doc(width);
    const auto patch = Patch{};
    const auto ops = std::vector<Operation>{make_op("test", "", doc)};
    for (auto _ : state) {
        patch.apply(doc, ops);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_test_deep_equal)->Range(8, 256);

// =============================================================================
// Text round trip
// =============================================================================

static void bm_apply_text(benchmark::State& state) {
    const auto doc_text = make_doc(state.range(0)).dump();
    const auto patch = Patch{};
    const auto ops = parse_operations(R"([
        {"op": "add", "path": "/new", "value": {"a": [1, 2, 3]}},
        {"op": "move", "from": "/new/a/0", "path": "/new/a/-"},
        {"op": "remove", "path": "/k0"}
    ])");
    for (auto _ : state) {
        auto out = patch.apply(doc_text, ops);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(doc_text.size()));
}
BENCHMARK(bm_apply_text)->Range(8, 256);

static void bm_encode_indented(benchmark::State& state) {
    const auto doc = make_doc(state.range(0));
    const auto format = OutputFormat{.indent = "  "};
    for (auto _ : state) {
        auto out = encode(doc, format);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_encode_indented)->Range(8, 256);
