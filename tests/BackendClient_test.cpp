#include "Backend/BackendClient.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using json = nlohmann::json;

typedef websocketpp::server<websocketpp::config::asio> WsServer;

namespace {

// Loopback backend on the test's io_context; the test decides how each request is answered
class ScriptedServer {
public:
    using Responder = std::function<void(websocketpp::connection_hdl, const json&)>;

    explicit ScriptedServer(boost::asio::io_context& io) {
        _server.clear_access_channels(websocketpp::log::alevel::all);
        _server.clear_error_channels(websocketpp::log::elevel::all);
        _server.init_asio(&io);
        _server.set_reuse_addr(true);

        _server.set_open_handler([this](websocketpp::connection_hdl hdl) { _connections.insert(hdl); });
        _server.set_close_handler([this](websocketpp::connection_hdl hdl) { _connections.erase(hdl); });
        _server.set_message_handler([this](websocketpp::connection_hdl hdl, WsServer::message_ptr msg) {
            const json request = json::parse(msg->get_payload());
            requests.push_back(request);
            if (responder) {
                responder(hdl, request);
            }
        });

        _server.listen(websocketpp::lib::asio::ip::tcp::v4(), 0);
        websocketpp::lib::asio::error_code ec;
        _port = _server.get_local_endpoint(ec).port();
        _server.start_accept();
    }

    void Send(websocketpp::connection_hdl hdl, const json& message) {
        websocketpp::lib::error_code ec;
        _server.send(hdl, message.dump(), websocketpp::frame::opcode::text, ec);
    }

    void Shutdown() {
        websocketpp::lib::error_code ec;
        _server.stop_listening(ec);
        for (auto& hdl : _connections) {
            _server.close(hdl, websocketpp::close::status::going_away, "", ec);
        }
    }

    std::string GetUrl() const { return "ws://127.0.0.1:" + std::to_string(_port) + "/ws"; }

    Responder responder;
    std::vector<json> requests;

private:
    WsServer _server;
    std::set<websocketpp::connection_hdl, std::owner_less<websocketpp::connection_hdl>> _connections;
    uint16_t _port = 0;
};

json Reply(const json& request, json fields) {
    fields["type"] = request["type"];
    fields["request_id"] = request["request_id"];
    if (!fields.contains("ok")) {
        fields["ok"] = true;
    }
    return fields;
}

class BackendClientTest : public ::testing::Test {
protected:
    void TearDown() override {
        client.reset();
        server.Shutdown();
        io.restart();
        io.run_for(500ms);
    }

    void MakeClient(std::chrono::milliseconds timeout = 5s) {
        client = std::make_unique<BackendClient>(io, server.GetUrl(), timeout);
    }

    template <typename Predicate>
    bool RunUntil(Predicate done, std::chrono::milliseconds limit = 3s) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!done() && std::chrono::steady_clock::now() < deadline) {
            io.restart();
            io.run_for(10ms);
        }
        return done();
    }

    boost::asio::io_context io;
    ScriptedServer server{io};
    std::unique_ptr<BackendClient> client;
};

} // namespace

TEST_F(BackendClientTest, RequestIsQueuedUntilConnectedAndAnswered) {
    server.responder = [this](websocketpp::connection_hdl hdl, const json& request) {
        server.Send(hdl, Reply(request, {{"name", "trainer"}, {"version", "2.1"}}));
    };
    MakeClient();

    std::vector<RemoteResult<HealthStatus>> results;
    client->CheckHealth([&results](RemoteResult<HealthStatus> result) { results.push_back(result); });
    EXPECT_TRUE(results.empty()) << "Completion never runs inside the call";

    ASSERT_TRUE(RunUntil([&results]() { return !results.empty(); }));
    ASSERT_TRUE(results[0].Ok()) << results[0].error;
    EXPECT_EQ(results[0].value->name, "trainer");
    EXPECT_EQ(results[0].value->version, "2.1");

    ASSERT_EQ(server.requests.size(), 1u);
    EXPECT_EQ(server.requests[0]["type"], "health");
    EXPECT_EQ(server.requests[0]["request_id"].get<std::string>().size(), 16u);
    EXPECT_EQ(client->GetPendingCount(), 0u);
}

TEST_F(BackendClientTest, DuplicateAndUnknownResponsesAreDiscarded) {
    server.responder = [this](websocketpp::connection_hdl hdl, const json& request) {
        json response = Reply(request, {{"question_id", "q2"}, {"question", "Why?"}});
        server.Send(hdl, response);
        server.Send(hdl, response);
        json stranger = response;
        stranger["request_id"] = "NOBODYASKEDTHIS0";
        server.Send(hdl, stranger);
    };
    MakeClient();

    int calls = 0;
    client->NextQuestion("s1", [&calls](RemoteResult<QuestionInfo> result) {
        ++calls;
        EXPECT_TRUE(result.Ok());
    });
    ASSERT_TRUE(RunUntil([&calls]() { return calls > 0; }));

    io.restart();
    io.run_for(100ms);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(server.requests[0]["session_id"], "s1");
}

TEST_F(BackendClientTest, OutOfOrderResponsesReachTheirOwnCallers) {
    std::vector<std::pair<websocketpp::connection_hdl, json>> held;
    server.responder = [this, &held](websocketpp::connection_hdl hdl, const json& request) {
        held.emplace_back(hdl, request);
        if (held.size() == 2) {
            server.Send(held[1].first, Reply(held[1].second, {{"session_id", "s1"}, {"overall_avg", 2}}));
            server.Send(held[0].first, Reply(held[0].second, {{"session_id", "s1"}, {"overall_avg", 1}}));
        }
    };
    MakeClient();

    int first = -1;
    int second = -1;
    client->FetchReport("s1", [&first](RemoteResult<SessionReport> r) { first = r ? r.value->overallAverage : 0; });
    client->FetchReport("s1", [&second](RemoteResult<SessionReport> r) { second = r ? r.value->overallAverage : 0; });

    ASSERT_TRUE(RunUntil([&]() { return first >= 0 && second >= 0; }));
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 2);
}

TEST_F(BackendClientTest, ServerErrorBecomesFailedResult) {
    server.responder = [this](websocketpp::connection_hdl hdl, const json& request) {
        server.Send(hdl, Reply(request, {{"ok", false}, {"error", "unknown session"}}));
    };
    MakeClient();

    std::optional<RemoteResult<ScoreResult>> result;
    client->ScoreAnswer("s1", "q1", [&result](RemoteResult<ScoreResult> r) { result = r; });
    ASSERT_TRUE(RunUntil([&result]() { return result.has_value(); }));
    EXPECT_FALSE(result->Ok());
    EXPECT_NE(result->error.find("unknown session"), std::string::npos);
}

TEST_F(BackendClientTest, UnansweredRequestTimesOut) {
    MakeClient(100ms);

    std::optional<RemoteResult<QuestionInfo>> result;
    client->NextQuestion("s1", [&result](RemoteResult<QuestionInfo> r) { result = r; });
    ASSERT_TRUE(RunUntil([&result]() { return result.has_value(); }));
    EXPECT_FALSE(result->Ok());
    EXPECT_NE(result->error.find("timed out"), std::string::npos);
    EXPECT_EQ(client->GetPendingCount(), 0u);
}

TEST_F(BackendClientTest, UnreachableBackendFailsPendingRequests) {
    client = std::make_unique<BackendClient>(io, "ws://127.0.0.1:1/ws", 5s);

    std::optional<RemoteResult<SessionStarted>> result;
    client->StartSession(SessionContext{}, [&result](RemoteResult<SessionStarted> r) { result = r; });
    ASSERT_TRUE(RunUntil([&result]() { return result.has_value(); }));
    EXPECT_FALSE(result->Ok());
    EXPECT_FALSE(client->IsConnected());
}
