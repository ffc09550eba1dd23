#include <benchmark/benchmark.h>
#include "mcpsrv/codec.hpp"
#include "mcpsrv/json_rpc.hpp"
#include <string>

using namespace mcpsrv;

static const std::string kPingRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping"})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hello from the benchmark"}}})";

// A tools/list style response carrying n tool definitions
static std::string make_large_response(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Reads something from the host, variant " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"path", {{"type", "string"}, {"description", "Path to read"}}},
                    {"max_size", {{"type", "integer"}, {"default", 1048576}}}
                }},
                {"required", nlohmann::json::array({"path"})}
            }}
        });
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"tools", tools}}}
    };
    return resp.dump();
}

static const std::string kLargeResponse = make_large_response(100);

static void BM_ParseJsonPing(benchmark::State& state) {
    for (auto _ : state) {
        auto j = Codec::parse_json(kPingRequest);
        benchmark::DoNotOptimize(j);
    }
    state.SetBytesProcessed(state.iterations() * kPingRequest.size());
}
BENCHMARK(BM_ParseJsonPing);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCall);

static void BM_ParseLargeResponse(benchmark::State& state) {
    for (auto _ : state) {
        auto j = Codec::parse_json(kLargeResponse);
        benchmark::DoNotOptimize(j);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_ParseLargeResponse);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto j = Codec::parse_json(bad);
            benchmark::DoNotOptimize(j);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson);

static void BM_DecodeToolCall(benchmark::State& state) {
    auto j = Codec::parse_json(kToolCallRequest);
    for (auto _ : state) {
        auto msg = Codec::decode(j);
        benchmark::DoNotOptimize(msg);
    }
}
BENCHMARK(BM_DecodeToolCall);

static void BM_SerializeErrorResponse(benchmark::State& state) {
    JsonRpcMessage msg = make_error_response(RequestId{int64_t{5}}, error::MethodNotFound,
                                             "Method not found: nope");
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeErrorResponse);

static void BM_SerializeLargeResponse(benchmark::State& state) {
    auto msg = Codec::parse(kLargeResponse);
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_SerializeLargeResponse);
