#include <benchmark/benchmark.h>
#include "mcpsrv/codec.hpp"
#include "mcpsrv/engine.hpp"
#include "mcpsrv/router.hpp"
#include "mcpsrv/tools/builtin_tools.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace mcpsrv;

static const char* kInitialize =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"bench","version":"1"}}})";

// An engine with the built-in tools that has completed the handshake
static std::unique_ptr<Engine> make_ready_engine() {
    auto registry = std::make_shared<ToolRegistry>();
    register_builtin_tools(*registry);
    auto engine = std::make_unique<Engine>(Engine::Options{}, registry);
    auto init = engine->handle(nlohmann::json::parse(kInitialize));
    benchmark::DoNotOptimize(init);
    return engine;
}

static void BM_RouterKnownMethod(benchmark::State& state) {
    Router router;
    router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"pong", true}};
    });
    JsonRpcMessage msg = JsonRpcRequest{RequestId{int64_t{1}}, "ping", std::nullopt};

    for (auto _ : state) {
        auto d = router.dispatch(msg);
        benchmark::DoNotOptimize(d);
    }
}
BENCHMARK(BM_RouterKnownMethod);

static void BM_Router100Methods(benchmark::State& state) {
    Router router;
    std::vector<JsonRpcMessage> requests;
    for (int i = 0; i < 100; ++i) {
        std::string method = "method_" + std::to_string(i);
        router.on_request(method, [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json::object();
        });
        requests.push_back(JsonRpcRequest{RequestId{int64_t{i}}, method, std::nullopt});
    }

    size_t i = 0;
    for (auto _ : state) {
        auto d = router.dispatch(requests[i % requests.size()]);
        benchmark::DoNotOptimize(d);
        ++i;
    }
}
BENCHMARK(BM_Router100Methods);

static void BM_EnginePing(benchmark::State& state) {
    auto engine = make_ready_engine();
    auto ping = nlohmann::json::parse(R"({"jsonrpc":"2.0","id":2,"method":"ping"})");

    for (auto _ : state) {
        auto resp = engine->handle(ping);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_EnginePing);

static void BM_EngineToolsList(benchmark::State& state) {
    auto engine = make_ready_engine();
    auto list = nlohmann::json::parse(R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})");

    for (auto _ : state) {
        auto resp = engine->handle(list);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_EngineToolsList);

// Frame in, frame out: parse, handle and serialize one echo call
static void BM_EngineEchoFrame(benchmark::State& state) {
    auto engine = make_ready_engine();
    const std::string frame =
        R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})";

    for (auto _ : state) {
        auto resp = engine->handle(Codec::parse_json(frame));
        std::string out = Codec::serialize(*resp);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_EngineEchoFrame);

static void BM_EngineUnknownMethod(benchmark::State& state) {
    auto engine = make_ready_engine();
    auto req = nlohmann::json::parse(R"({"jsonrpc":"2.0","id":5,"method":"nope"})");

    for (auto _ : state) {
        auto resp = engine->handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_EngineUnknownMethod);
