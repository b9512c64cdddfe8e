// cos-cpp benchmarks: measures throughput of parsing and resolution.

#include <cos-cpp/cos.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <string>

using namespace cos_cpp;

namespace {

auto make_page_dict(std::int64_t i) -> std::string {
    return "<< /Type /Page /Parent 1 0 R /MediaBox [0 0 612 792] /Rotate " + std::to_string(i % 4)
         + " /Contents " + std::to_string(i + 2) + " 0 R /Title (Page \\(" + std::to_string(i)
         + "\\)) /Lang <FEFF0065006E> >>";
}

auto make_nested(std::int64_t depth) -> std::string {
    auto text = std::string{};
    for (std::int64_t i = 0; i < depth; ++i) text += "<< /Kid ";
    text += "null";
    for (std::int64_t i = 0; i < depth; ++i) text += " >>";
    return text;
}

}  // namespace

// =============================================================================
// Parsing
// =============================================================================

static void bm_parse_number(benchmark::State& state) {
    for (auto _ : state) {
        auto r = parse_value("-1234.5678");
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_number);

static void bm_parse_reference(benchmark::State& state) {
    for (auto _ : state) {
        auto r = parse_value("12 0 R");
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_reference);

static void bm_parse_page_dict(benchmark::State& state) {
    const auto text = make_page_dict(7);
    for (auto _ : state) {
        auto r = parse_object(text);
        benchmark::DoNotOptimize(r);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_parse_page_dict);

static void bm_parse_nested_dicts(benchmark::State& state) {
    const auto text = make_nested(state.range(0));
    for (auto _ : state) {
        auto r = parse_object(text);
        benchmark::DoNotOptimize(r);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_parse_nested_dicts)->Range(8, 128);

static void bm_parse_stream(benchmark::State& state) {
    const auto payload = std::string(static_cast<std::size_t>(state.range(0)), 'x');
    const auto text = "<< /Length " + std::to_string(payload.size()) + " >>\nstream\n" + payload
                    + "\nendstream";
    for (auto _ : state) {
        auto r = parse_object(text);
        benchmark::DoNotOptimize(r);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_parse_stream)->Range(64, 1 << 16);

// =============================================================================
// Resolution
// =============================================================================

static void bm_resolve_table(benchmark::State& state) {
    const auto n = state.range(0);
    auto parsed = ObjectTable{};
    parsed[{1, 0}] = std::make_shared<Value>(*parse_object("<< /Type /Pages /Count 0 >>"));
    for (std::int64_t i = 0; i < n; ++i) {
        auto id = ObjectId{static_cast<std::uint64_t>(i + 2), 0};
        parsed[id] = std::make_shared<Value>(*parse_object(make_page_dict(i)));
    }
    for (std::int64_t i = 0; i < n; ++i) {
        auto id = ObjectId{static_cast<std::uint64_t>(i + n + 2), 0};
        parsed[id] = std::make_shared<Value>(*parse_object("<< /Length 0 >>"));
    }

    for (auto _ : state) {
        state.PauseTiming();
        // Resolution rewrites values in place, so each round starts from copies.
        auto table = ObjectTable{};
        for (const auto& [id, value] : parsed) table[id] = std::make_shared<Value>(*value);
        state.ResumeTiming();

        auto resolved = resolve_table(std::move(table));
        benchmark::DoNotOptimize(resolved);
    }
    state.SetItemsProcessed(state.iterations() * (2 * n + 1));
}
BENCHMARK(bm_resolve_table)->Range(16, 4096);

// =============================================================================
// Writing
// =============================================================================

static void bm_write_page_dict(benchmark::State& state) {
    auto value = *parse_object(make_page_dict(3));
    for (auto _ : state) {
        auto text = to_cos_string(value);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_write_page_dict);
