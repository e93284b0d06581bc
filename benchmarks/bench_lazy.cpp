/// @file bench_lazy.cpp
/// @brief Performance benchmarks for lazyjson.
///
/// Measured operations:
///   - Navigation: one member out of a large document, lazy vs full decode
///   - Serialization: untouched bytes() vs decode + encode
///   - Overlays: value() and bytes() of a document with a few writes
///   - Validation and classification

#include <lazyjson/lazyjson.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace lazyjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

/// Small document (~100 bytes).
static std::string generate_small_json() {
    return R"({"name":"John","age":30,"active":true,"score":95.5})";
}

/// Large document (~100KB): an item list with a trailing "meta" member.
static std::string generate_large_json() {
    std::string s = R"({"data":[)";
    for (int i = 0; i < 1000; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"title":"Item )" + std::to_string(i) +
             R"( with some longer title text for realism")" +
             R"(,"price":)" + std::to_string(9.99 + i * 0.1) +
             R"(,"tags":["tag)" + std::to_string(i % 10) +
             R"(","common"],"active":)" + (i % 3 == 0 ? "false" : "true") + "}";
    }
    s += R"(],"meta":{"total":1000,"generated":true}})";
    return s;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Navigation
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_LazyPathLarge(benchmark::State& state) {
    const auto input = generate_large_json();
    auto doc = Value::from_bytes(input);
    for (auto _ : state) {
        auto total = doc->path("meta")->path("total")->value();
        benchmark::DoNotOptimize(total);
    }
}
BENCHMARK(BM_LazyPathLarge);

static void BM_FullDecodePathLarge(benchmark::State& state) {
    const auto input = generate_large_json();
    for (auto _ : state) {
        auto v = decode(input);
        double total = v.at("meta").at("total").as_number();
        benchmark::DoNotOptimize(total);
    }
}
BENCHMARK(BM_FullDecodePathLarge);

static void BM_LazyIndexLarge(benchmark::State& state) {
    const auto input = generate_large_json();
    auto doc = Value::from_bytes(input);
    const auto pos = static_cast<int>(state.range(0));
    for (auto _ : state) {
        auto item = doc->path("data")->index(pos)->path("id");
        benchmark::DoNotOptimize(item);
    }
}
BENCHMARK(BM_LazyIndexLarge)->Arg(0)->Arg(500)->Arg(999);

static void BM_AtPointerLarge(benchmark::State& state) {
    const auto input = generate_large_json();
    auto doc = Value::from_bytes(input);
    const Pointer ptr("/data/999/tags/1");
    for (auto _ : state) {
        auto tag = doc->at_pointer(ptr);
        benchmark::DoNotOptimize(tag);
    }
}
BENCHMARK(BM_AtPointerLarge);

// ═══════════════════════════════════════════════════════════════════════════════
// Serialization
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_BytesUntouched(benchmark::State& state) {
    const auto input = generate_large_json();
    auto doc = Value::from_bytes(input);
    for (auto _ : state) {
        auto s = doc->bytes();
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_BytesUntouched);

static void BM_DecodeEncode(benchmark::State& state) {
    const auto input = generate_large_json();
    for (auto _ : state) {
        auto s = encode(decode(input));
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeEncode);

// ═══════════════════════════════════════════════════════════════════════════════
// Overlays
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_OverlayValue(benchmark::State& state) {
    const auto input = generate_large_json();
    auto doc = Value::from_bytes(input);
    doc->set_path("meta", Value::make_object({{"total", 0}}));
    doc->set_path("owner", "bench");
    for (auto _ : state) {
        auto v = doc->value();
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_OverlayValue);

static void BM_OverlayBytes(benchmark::State& state) {
    const auto input = generate_large_json();
    auto doc = Value::from_bytes(input);
    doc->set_path("meta", Value::make_object({{"total", 0}}));
    for (auto _ : state) {
        auto s = doc->bytes();
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_OverlayBytes);

static void BM_SetPathSmall(benchmark::State& state) {
    const auto input = generate_small_json();
    for (auto _ : state) {
        auto doc = Value::from_bytes(input);
        doc->set_path("age", 31);
        auto s = doc->bytes();
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SetPathSmall);

// ═══════════════════════════════════════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ValidateLarge(benchmark::State& state) {
    const auto input = generate_large_json();
    for (auto _ : state) {
        auto ec = validate(input);
        benchmark::DoNotOptimize(ec);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_ValidateLarge);

static void BM_FromBytesSmall(benchmark::State& state) {
    const auto input = generate_small_json();
    for (auto _ : state) {
        auto doc = Value::from_bytes(input);
        benchmark::DoNotOptimize(doc);
    }
}
BENCHMARK(BM_FromBytesSmall);
