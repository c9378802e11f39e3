#include "hb/Broadcaster.hpp"
#include "hb/CommandDispatcher.hpp"
#include "hb/Errors.hpp"
#include "hb/Json.hpp"
#include "hb/OutputBuffer.hpp"
#include "hb/OutputChannel.hpp"
#include "hb/SubscriberRegistry.hpp"
#include "support/FakeCollaborators.hpp"
#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace hb;
using hbtest::parse;

struct DispatchFixture : public ::testing::Test {
    boost::asio::io_context ioc;
    std::shared_ptr<SubscriberRegistry> subscribers = std::make_shared<SubscriberRegistry>();
    std::shared_ptr<OutputBuffer> buffer = std::make_shared<OutputBuffer>();
    std::shared_ptr<OutputChannel> output = std::make_shared<OutputChannel>(buffer);
    std::shared_ptr<Broadcaster> broadcaster = std::make_shared<Broadcaster>(ioc, subscribers, output);

    hbtest::FakeHost host;
    hbtest::FakeWebview webview;
    hbtest::FakeConfigHost config;
    std::vector<ProgressEvent> events;

    std::unique_ptr<CommandDispatcher> make(Collaborators c) {
        ServerInfo info;
        info.port = 4242;
        return std::make_unique<CommandDispatcher>(c, subscribers, output, broadcaster, info,
                                                   [this](const ProgressEvent& e) { events.push_back(e); });
    }

    Collaborators all() {
        Collaborators c;
        c.host = &host;
        c.webview = &webview;
        c.config = &config;
        return c;
    }

    Response call(CommandDispatcher& d, const std::string& method, const std::string& params = "{}") {
        return d.dispatch(method, parse(params));
    }

    bool outputContains(const std::string& needle) const {
        for (const auto& line : buffer->tail(1000).lines) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

TEST_F(DispatchFixture, EmitsExecutingEventWithMethod) {
    auto d = make(all());
    call(*d, "listSubscribers");
    ASSERT_EQ(events.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<ExecutingEvent>(events[0]));
    EXPECT_EQ(std::get<ExecutingEvent>(events[0]).method, "listSubscribers");
}

TEST_F(DispatchFixture, UnknownMethodIsAResponseNotAThrow) {
    auto d = make(all());
    Response r = call(*d, "nope");
    ASSERT_FALSE(r.ok());
    EXPECT_NE(r.error().find("Unknown method: nope"), std::string::npos);
    for (const auto& name : methodNames()) {
        EXPECT_NE(r.error().find(name), std::string::npos) << name;
    }
}

// ---------------------- status ----------------------

TEST_F(DispatchFixture, StatusReportsHostAndServer) {
    TerminalInfo t;
    t.name = "build";
    t.processId = 77;
    t.startTime = BroadcastEvent::nowMs() - 5000;
    host.snapshot.terminals.push_back(t);
    host.snapshot.activeTerminal = "build";
    host.snapshot.folders.push_back({"ws", "/srv/ws"});
    host.snapshot.openFiles = 3;

    auto d = make(all());
    Response r = call(*d, "status");
    ASSERT_TRUE(r.ok()) << r.error();
    const auto& res = r.result();

    EXPECT_TRUE(res["timestamp"].IsInt64());
    EXPECT_EQ(std::string(res["datetime"].GetString()).back(), 'Z');

    EXPECT_EQ(res["terminals"]["count"].GetUint64(), 1u);
    EXPECT_STREQ(res["terminals"]["active"].GetString(), "build");
    const auto& term = res["terminals"]["list"][0];
    EXPECT_STREQ(term["name"].GetString(), "build");
    EXPECT_EQ(term["processId"].GetInt(), 77);
    EXPECT_GE(term["uptime"].GetInt64(), 4);

    EXPECT_TRUE(res["editor"].IsNull());
    EXPECT_STREQ(res["workspace"]["folders"][0]["path"].GetString(), "/srv/ws");
    EXPECT_EQ(res["workspace"]["openFiles"].GetInt(), 3);

    EXPECT_STREQ(res["server"]["name"].GetString(), "hostbridge");
    EXPECT_EQ(res["server"]["port"].GetUint(), 4242u);
    EXPECT_TRUE(res["server"]["features"].IsArray());
    EXPECT_TRUE(res["metrics"].IsObject());
}

TEST_F(DispatchFixture, StatusWithEditor) {
    EditorInfo e;
    e.file = "/srv/ws/main.cpp";
    e.language = "cpp";
    e.lines = 120;
    e.cursorLine = 10;
    e.cursorColumn = 4;
    host.snapshot.editor = e;

    auto d = make(all());
    Response r = call(*d, "status");
    ASSERT_TRUE(r.ok());
    EXPECT_STREQ(r.result()["editor"]["language"].GetString(), "cpp");
    EXPECT_EQ(r.result()["editor"]["cursor"]["line"].GetInt(), 10);
}

TEST_F(DispatchFixture, StatusWithoutHostFails) {
    auto d = make(Collaborators{});
    Response r = call(*d, "status");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), "host not initialized");
}

// ---------------------- eval ----------------------

TEST_F(DispatchFixture, EvalWrapsSingleExpression) {
    host.onEval = [](const std::string& code, const EvalContext&) {
        rapidjson::Document d;
        if (code == "return (40 + 2)") d.SetInt(42);
        return d;
    };
    auto d = make(all());
    Response r = call(*d, "eval", R"({"code":"40 + 2"})");
    ASSERT_TRUE(r.ok()) << r.error();
    EXPECT_EQ(r.serialize(), R"({"ok":true,"result":42})");
    EXPECT_EQ(host.evaluated(), std::vector<std::string>{"return (40 + 2)"});
}

TEST_F(DispatchFixture, EvalRunsMultiLineVerbatim) {
    auto d = make(all());
    call(*d, "eval", R"({"code":"x = 1\nreturn x"})");
    EXPECT_EQ(host.evaluated(), std::vector<std::string>{"x = 1\nreturn x"});
}

TEST_F(DispatchFixture, EvalLogSinkWritesToOutput) {
    host.onEval = [](const std::string&, const EvalContext& ctx) {
        ctx.log("hello");
        ctx.warn("careful");
        ctx.error("bad");
        return rapidjson::Document();
    };
    auto d = make(all());
    ASSERT_TRUE(call(*d, "eval", R"({"code":"1"})").ok());
    EXPECT_TRUE(outputContains("[eval] hello"));
    EXPECT_TRUE(outputContains("[eval:warn] careful"));
    EXPECT_TRUE(outputContains("[eval:error] bad"));
}

TEST_F(DispatchFixture, EvalContextStatusCallback) {
    host.onEval = [](const std::string&, const EvalContext& ctx) {
        auto status = ctx.status();
        rapidjson::Document d;
        d.SetUint(status["server"]["port"].GetUint());
        return d;
    };
    auto d = make(all());
    Response r = call(*d, "eval", R"({"code":"bridge.status()"})");
    ASSERT_TRUE(r.ok()) << r.error();
    EXPECT_EQ(r.result().GetUint(), 4242u);
}

TEST_F(DispatchFixture, EvalErrorsBecomeFailures) {
    host.onEval = [](const std::string&, const EvalContext&) -> rapidjson::Document {
        throw ExecutionError("ZeroDivisionError: division by zero");
    };
    auto d = make(all());
    Response r = call(*d, "eval", R"({"code":"1/0"})");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), "ZeroDivisionError: division by zero");
}

TEST_F(DispatchFixture, EvalForeignExceptionsAreContained) {
    host.onEval = [](const std::string&, const EvalContext&) -> rapidjson::Document {
        throw std::runtime_error("host crashed");
    };
    auto d = make(all());
    Response r = call(*d, "eval", R"({"code":"1"})");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), "host crashed");

    host.onEval = [](const std::string&, const EvalContext&) -> rapidjson::Document { throw 7; };
    Response r2 = call(*d, "eval", R"({"code":"1"})");
    ASSERT_FALSE(r2.ok());
    EXPECT_NE(r2.error().find("eval"), std::string::npos);
}

TEST_F(DispatchFixture, EvalRequiresCode) {
    auto d = make(all());
    Response r = call(*d, "eval");
    EXPECT_EQ(r.serialize(), R"({"ok":false,"error":"code parameter required"})");
    EXPECT_TRUE(host.evaluated().empty());
}

// ---------------------- webview ----------------------

TEST_F(DispatchFixture, WebviewWithoutRendererReportsNotInitialized) {
    Collaborators c = all();
    c.webview = nullptr;
    auto d = make(c);
    EXPECT_EQ(call(*d, "webview").error(), "webview host not initialized");
    EXPECT_EQ(call(*d, "webview", R"({"viewName":"x"})").error(), "webview host not initialized");
}

TEST_F(DispatchFixture, WebviewRequiresViewName) {
    auto d = make(all());
    EXPECT_EQ(call(*d, "webview").error(), "viewName parameter required");
}

TEST_F(DispatchFixture, WebviewOpensWithDefaultTitle) {
    auto d = make(all());
    Response r = call(*d, "webview", R"({"viewName":"dash"})");
    ASSERT_TRUE(r.ok()) << r.error();
    EXPECT_EQ(json::toString(r.result()), R"({"success":true,"webview":"dash"})");
    ASSERT_EQ(webview.opened.size(), 1u);
    EXPECT_EQ(webview.opened[0].title, "dash");
    EXPECT_FALSE(webview.opened[0].customPath.has_value());
}

TEST_F(DispatchFixture, WebviewFailureIsReported) {
    webview.fail = true;
    auto d = make(all());
    Response r = call(*d, "webview", R"({"viewName":"dash"})");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), "View not found: dash");
}

// ---------------------- configs ----------------------

TEST_F(DispatchFixture, ConfigLifecycle) {
    auto d = make(all());
    Response reg = call(*d, "registerConfig", R"({"name":"bar","filePath":"/cfg/bar.py"})");
    ASSERT_TRUE(reg.ok());
    EXPECT_EQ(json::toString(reg.result()), R"({"success":true,"message":"Config 'bar' registered"})");

    Response list = call(*d, "listConfigs");
    ASSERT_TRUE(list.ok());
    EXPECT_STREQ(list.result()["configs"][0]["filePath"].GetString(), "/cfg/bar.py");

    EXPECT_TRUE(call(*d, "unregisterConfig", R"({"name":"bar"})").ok());
    Response missing = call(*d, "unregisterConfig", R"({"name":"bar"})");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error(), "Config 'bar' not found");
}

TEST_F(DispatchFixture, ConfigValidation) {
    auto d = make(all());
    EXPECT_EQ(call(*d, "registerConfig", R"({"name":"bar"})").error(), "name and filePath required");
    EXPECT_EQ(call(*d, "unregisterConfig").error(), "name required");
    EXPECT_TRUE(config.configs.empty());
}

TEST_F(DispatchFixture, ConfigWithoutRegistryFails) {
    Collaborators c = all();
    c.config = nullptr;
    auto d = make(c);
    EXPECT_FALSE(call(*d, "listConfigs").ok());
}

// ---------------------- subscribers ----------------------

TEST_F(DispatchFixture, SubscribeIsIdempotent) {
    auto d = make(all());
    Response first = call(*d, "subscribe", R"({"url":"http://127.0.0.1:9/hook"})");
    Response second = call(*d, "subscribe", R"({"url":"http://127.0.0.1:9/hook"})");
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(json::toString(second.result()),
              R"({"success":true,"message":"Subscribed to http://127.0.0.1:9/hook","subscribers":["http://127.0.0.1:9/hook"]})");
    EXPECT_EQ(subscribers->size(), 1u);
    EXPECT_TRUE(outputContains("✓ Subscribed: http://127.0.0.1:9/hook"));
}

TEST_F(DispatchFixture, SubscribeWithoutUrl) {
    auto d = make(all());
    EXPECT_EQ(call(*d, "subscribe").serialize(), R"({"ok":false,"error":"url parameter required"})");
    EXPECT_EQ(subscribers->size(), 0u);
}

TEST_F(DispatchFixture, UnsubscribeAbsentIsOk) {
    auto d = make(all());
    Response r = call(*d, "unsubscribe", R"({"url":"http://never"})");
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.result()["subscribers"].Empty());
    EXPECT_TRUE(outputContains("✓ Unsubscribed: http://never"));
}

TEST_F(DispatchFixture, ListSubscribersCounts) {
    auto d = make(all());
    call(*d, "subscribe", R"({"url":"http://a"})");
    call(*d, "subscribe", R"({"url":"http://b"})");
    Response r = call(*d, "listSubscribers");
    ASSERT_TRUE(r.ok());
    EXPECT_STREQ(r.result()["message"].GetString(), "2 subscriber(s)");
    EXPECT_EQ(r.result()["subscribers"].Size(), 2u);
}

// ---------------------- output ----------------------

TEST_F(DispatchFixture, GetOutputReturnsTail) {
    for (int i = 0; i < 5; ++i) buffer->push("line " + std::to_string(i));
    auto d = make(all());
    Response r = call(*d, "getOutput", R"({"lines":2})");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(json::toString(r.result()), R"({"output":["line 3","line 4"],"total":5})");
}

TEST_F(DispatchFixture, GetOutputDefaultsToHundred) {
    for (int i = 0; i < 150; ++i) buffer->push(std::to_string(i));
    auto d = make(all());
    Response r = call(*d, "getOutput", R"({"lines":0})");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.result()["output"].Size(), 100u);
    EXPECT_EQ(r.result()["total"].GetUint64(), 150u);
}

// ---------------------- restart ----------------------

TEST_F(DispatchFixture, RestartIsDeferredUntilAfterSend) {
    auto d = make(all());
    Response r = call(*d, "restartExtension");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(json::toString(r.result()), R"({"success":true,"message":"Host will restart"})");
    EXPECT_EQ(host.restarts.load(), 0);
    ASSERT_TRUE(static_cast<bool>(r.afterSend()));
    r.afterSend()();
    EXPECT_EQ(host.restarts.load(), 1);
}
