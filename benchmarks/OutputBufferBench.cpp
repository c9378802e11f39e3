#include <benchmark/benchmark.h>
#include "hb/OutputBuffer.hpp"
#include <string>

static void BM_OutputBufferPush(benchmark::State& state) {
    hb::OutputBuffer buf(static_cast<std::size_t>(state.range(0)));
    const std::string line = "[12:00:00.000] ← OUTPUT: {\"ok\":true,\"result\":{}}";
    for (auto _ : state) {
        buf.push(line);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_OutputBufferPush)->Arg(100)->Arg(1000)->Unit(benchmark::kNanosecond);

static void BM_OutputBufferTail(benchmark::State& state) {
    hb::OutputBuffer buf(1000);
    for (int i = 0; i < 1000; ++i) buf.push("line " + std::to_string(i));
    const auto n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        auto tail = buf.tail(n);
        benchmark::DoNotOptimize(tail);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_OutputBufferTail)->Arg(10)->Arg(100)->Arg(1000)->Unit(benchmark::kMicrosecond);
