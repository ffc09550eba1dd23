#include <gtest/gtest.h>
#include "mcpsrv/codec.hpp"
#include "mcpsrv/error.hpp"

using namespace mcpsrv;

// ---- parse_json ----

TEST(CodecParseJson, ValidObject) {
    auto j = Codec::parse_json(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    ASSERT_TRUE(j.is_object());
    EXPECT_EQ(j["method"], "ping");
    EXPECT_EQ(j["id"], 1);
}

TEST(CodecParseJson, InvalidJson) {
    EXPECT_THROW(Codec::parse_json("{invalid json"), McpParseError);
}

TEST(CodecParseJson, EmptyInput) {
    EXPECT_THROW(Codec::parse_json(""), McpParseError);
}

TEST(CodecParseJson, ArrayIsRejected) {
    EXPECT_THROW(Codec::parse_json(R"([{"jsonrpc":"2.0","id":1,"method":"ping"}])"), McpParseError);
}

TEST(CodecParseJson, ScalarIsRejected) {
    EXPECT_THROW(Codec::parse_json("42"), McpParseError);
    EXPECT_THROW(Codec::parse_json(R"("hello")"), McpParseError);
}

TEST(CodecParseJson, TrailingGarbage) {
    EXPECT_THROW(Codec::parse_json(R"({"a":1} x)"), McpParseError);
}

TEST(CodecParseJson, NestedValues) {
    auto j = Codec::parse_json(
        R"({"a":[1,2.5,"s",true,null],"b":{"c":-7}})");
    EXPECT_EQ(j["a"][0], 1);
    EXPECT_DOUBLE_EQ(j["a"][1].get<double>(), 2.5);
    EXPECT_EQ(j["a"][2], "s");
    EXPECT_EQ(j["a"][3], true);
    EXPECT_TRUE(j["a"][4].is_null());
    EXPECT_EQ(j["b"]["c"], -7);
}

TEST(CodecParseJson, EscapedStrings) {
    auto j = Codec::parse_json(R"({"text":"line\nbreak \"quoted\" é"})");
    EXPECT_EQ(j["text"], "line\nbreak \"quoted\" \xc3\xa9");
}

// ---- decode ----

TEST(CodecDecode, ValidRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "ping");
    ASSERT_TRUE(req.params.has_value());
}

TEST(CodecDecode, ValidRequestStringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"abc-123","method":"tools/list"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<std::string>(req.id), "abc-123");
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecDecode, NullIdIsStillARequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"ping"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(std::get<JsonRpcRequest>(msg).id));
}

TEST(CodecDecode, ValidNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    EXPECT_EQ(std::get<JsonRpcNotification>(msg).method, "notifications/initialized");
}

TEST(CodecDecode, ValidResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":42,"result":{"tools":[]}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    EXPECT_EQ(std::get<int64_t>(resp.id), 42);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->contains("tools"));
}

TEST(CodecDecode, ValidErrorResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found"}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32601);
}

namespace {

int decode_error_code(const nlohmann::json& j) {
    try {
        (void)Codec::decode(j);
    } catch (const McpProtocolError& e) {
        return e.code;
    }
    return 0;
}

} // anonymous namespace

TEST(CodecDecode, MissingJsonrpc) {
    EXPECT_EQ(decode_error_code({{"id", 1}, {"method", "ping"}}), error::InvalidRequest);
}

TEST(CodecDecode, WrongJsonrpcVersion) {
    EXPECT_EQ(decode_error_code({{"jsonrpc", "1.0"}, {"id", 1}, {"method", "ping"}}),
              error::InvalidRequest);
    EXPECT_EQ(decode_error_code({{"jsonrpc", 2}, {"id", 1}, {"method", "ping"}}),
              error::InvalidRequest);
}

TEST(CodecDecode, MissingMethod) {
    EXPECT_EQ(decode_error_code({{"jsonrpc", "2.0"}, {"id", 1}}), error::InvalidRequest);
}

TEST(CodecDecode, EmptyMethod) {
    EXPECT_EQ(decode_error_code({{"jsonrpc", "2.0"}, {"id", 1}, {"method", ""}}),
              error::InvalidRequest);
}

TEST(CodecDecode, NonStringMethod) {
    EXPECT_EQ(decode_error_code({{"jsonrpc", "2.0"}, {"id", 1}, {"method", 5}}),
              error::InvalidRequest);
}

TEST(CodecDecode, ScalarParams) {
    EXPECT_EQ(decode_error_code({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}, {"params", 3}}),
              error::InvalidRequest);
}

TEST(CodecDecode, ArrayParamsAccepted) {
    auto msg = Codec::decode({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"},
                              {"params", nlohmann::json::array({1, 2})}});
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_TRUE(std::get<JsonRpcRequest>(msg).params->is_array());
}

TEST(CodecDecode, InvalidIdType) {
    EXPECT_EQ(decode_error_code({{"jsonrpc", "2.0"}, {"id", true}, {"method", "ping"}}),
              error::InvalidRequest);
    EXPECT_EQ(decode_error_code({{"jsonrpc", "2.0"}, {"id", {{"x", 1}}}, {"method", "ping"}}),
              error::InvalidRequest);
    EXPECT_EQ(decode_error_code({{"jsonrpc", "2.0"}, {"id", 1.5}, {"method", "ping"}}),
              error::InvalidRequest);
}

// ---- peek_id ----

TEST(CodecPeekId, AbsentId) {
    EXPECT_FALSE(Codec::peek_id({{"jsonrpc", "2.0"}, {"method", "x"}}).has_value());
}

TEST(CodecPeekId, IntegerAndStringIds) {
    auto a = Codec::peek_id({{"id", 7}});
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(std::get<int64_t>(*a), 7);

    auto b = Codec::peek_id({{"id", "req-1"}});
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(std::get<std::string>(*b), "req-1");
}

TEST(CodecPeekId, UnusableIdBecomesNull) {
    auto id = Codec::peek_id({{"id", {1, 2}}});
    ASSERT_TRUE(id.has_value());
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(*id));
}

// ---- serialize ----

TEST(CodecSerialize, SingleLine) {
    JsonRpcResponse resp = make_result_response(RequestId{int64_t{1}},
                                                nlohmann::json{{"text", "a\nb"}});
    std::string out = Codec::serialize(resp);
    EXPECT_EQ(out.find('\n'), std::string::npos);
}

TEST(CodecSerialize, RoundTrip) {
    const std::string original =
        R"({"jsonrpc":"2.0","id":"x","method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})";
    auto msg = Codec::parse(original);
    auto reparsed = Codec::parse(Codec::serialize(msg));
    EXPECT_EQ(msg, reparsed);
    EXPECT_EQ(nlohmann::json::parse(Codec::serialize(msg)), nlohmann::json::parse(original));
}

TEST(CodecSerialize, ResponseNeverHasBoth) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{3}};
    resp.result = nlohmann::json::object();
    resp.error = JsonRpcError{error::InternalError, "boom", std::nullopt};
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_TRUE(j.contains("error"));
    EXPECT_FALSE(j.contains("result"));
}

TEST(CodecSerialize, InvalidUtf8IsReplaced) {
    JsonRpcResponse resp = make_result_response(RequestId{int64_t{1}},
                                                nlohmann::json{{"text", std::string("bad \xff byte")}});
    std::string out;
    EXPECT_NO_THROW(out = Codec::serialize(resp));
    EXPECT_NE(out.find("bad "), std::string::npos);
}

TEST(CodecSerialize, NullIdIsEmitted) {
    auto resp = make_error_response(RequestId{nullptr}, error::ParseError, "Parse error");
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    ASSERT_TRUE(j.contains("id"));
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["error"]["code"], -32700);
}

// ---- Large message test ----

TEST(CodecParse, LargeMessage) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < 100; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Description for tool " + std::to_string(i)},
            {"inputSchema", {{"type", "object"}, {"properties", nlohmann::json::object()}}}
        });
    }
    nlohmann::json response = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"tools", tools}}}
    };
    auto msg = Codec::parse(response.dump());
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    EXPECT_EQ(std::get<JsonRpcResponse>(msg).result->at("tools").size(), 100u);
}
