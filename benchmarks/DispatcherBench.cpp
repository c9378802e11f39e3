#include <benchmark/benchmark.h>
#include "hb/CommandDispatcher.hpp"
#include "hb/OutputBuffer.hpp"
#include "hb/OutputChannel.hpp"
#include "hb/SubscriberRegistry.hpp"
#include "hb/server/RequestReader.hpp"
#include "hb/util/Logger.hpp"
#include <rapidjson/document.h>
#include <algorithm>
#include <memory>
#include <string>

namespace {

class NullHost final : public hb::IHost {
public:
    rapidjson::Document evalContext(const std::string&, const hb::EvalContext&) override {
        rapidjson::Document d;
        d.SetInt(1);
        return d;
    }
    hb::StatusSnapshot queryStatus() override {
        hb::StatusSnapshot s;
        for (int i = 0; i < 4; ++i) {
            hb::TerminalInfo t;
            t.name = "term-" + std::to_string(i);
            t.processId = 1000 + i;
            s.terminals.push_back(t);
        }
        s.activeTerminal = "term-0";
        return s;
    }
    void restart() override {}
};

struct Bench {
    NullHost host;
    std::shared_ptr<hb::SubscriberRegistry> subscribers = std::make_shared<hb::SubscriberRegistry>();
    std::shared_ptr<hb::OutputChannel> output =
        std::make_shared<hb::OutputChannel>(std::make_shared<hb::OutputBuffer>());
    std::unique_ptr<hb::CommandDispatcher> dispatcher;

    Bench() {
        hb::util::logger().setLevel(hb::util::LogLevel::Error);
        hb::Collaborators c;
        c.host = &host;
        dispatcher = std::make_unique<hb::CommandDispatcher>(c, subscribers, output, nullptr, hb::ServerInfo{});
        for (int i = 0; i < 500; ++i) output->appendLine("line " + std::to_string(i));
        for (int i = 0; i < 8; ++i) subscribers->add("http://127.0.0.1:" + std::to_string(9000 + i) + "/hook");
    }
};

rapidjson::Document params(const char* json) {
    rapidjson::Document d;
    d.Parse(json);
    return d;
}

} // namespace

static void BM_DispatchGetOutput(benchmark::State& state) {
    Bench b;
    auto p = params(R"({"lines":100})");
    for (auto _ : state) {
        auto r = b.dispatcher->dispatch("getOutput", p);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DispatchGetOutput)->Unit(benchmark::kMicrosecond);

static void BM_DispatchListSubscribers(benchmark::State& state) {
    Bench b;
    auto p = params("{}");
    for (auto _ : state) {
        auto r = b.dispatcher->dispatch("listSubscribers", p);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DispatchListSubscribers)->Unit(benchmark::kMicrosecond);

static void BM_DispatchStatusSerialized(benchmark::State& state) {
    Bench b;
    auto p = params("{}");
    for (auto _ : state) {
        auto text = b.dispatcher->dispatch("status", p).serialize();
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DispatchStatusSerialized)->Unit(benchmark::kMicrosecond);

static void BM_ReaderChunked(benchmark::State& state) {
    const std::string request =
        R"({"method":"eval","params":{"code":")" + std::string(2048, 'x') + R"("}})";
    const auto chunk = static_cast<std::size_t>(state.range(0));

    for (auto _ : state) {
        hb::server::RequestReader reader(1024 * 1024);
        for (std::size_t off = 0; off < request.size(); off += chunk) {
            const auto n = std::min(chunk, request.size() - off);
            if (reader.feed(request.data() + off, n) != hb::server::RequestReader::State::Incomplete) break;
        }
        benchmark::DoNotOptimize(reader.state());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(request.size()));
}
BENCHMARK(BM_ReaderChunked)->Arg(64)->Arg(512)->Arg(8192)->Unit(benchmark::kMicrosecond);
