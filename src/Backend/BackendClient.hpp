#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "IBackendClient.hpp"

typedef websocketpp::client<websocketpp::config::asio_client> WsClient;

// Backend over one websocket connection driven by the shared io_context. Requests are correlated
// with responses by request_id; a response nobody is waiting for is dropped.
class BackendClient : public IBackendClient {
public:
    using ResponseHandler = std::function<void(const nlohmann::json& response)>;

    BackendClient(boost::asio::io_context& io, std::string serverUrl,
                  std::chrono::milliseconds requestTimeout = std::chrono::seconds(30));
    ~BackendClient() override;

    BackendClient(const BackendClient&) = delete;
    BackendClient& operator=(const BackendClient&) = delete;

    // Opens the connection; requests made before it is open are queued
    bool Connect();
    void Disconnect();
    bool IsConnected() const { return _connected; }
    size_t GetPendingCount() const { return _pending.size(); }

    void StartSession(const SessionContext& context, RemoteCallback<SessionStarted> callback) override;
    void NextQuestion(const std::string& sessionId, RemoteCallback<QuestionInfo> callback) override;
    void SubmitAnswerAudio(const AnswerAudioRequest& request, RemoteCallback<Transcript> callback) override;
    void SubmitAnswerText(const AnswerTextRequest& request, RemoteCallback<Empty> callback) override;
    void SynthesizeReply(const ReplyRequest& request, RemoteCallback<SynthesizedAudio> callback) override;
    void ScoreAnswer(const std::string& sessionId, const std::string& questionId,
                     RemoteCallback<ScoreResult> callback) override;
    void FetchReport(const std::string& sessionId, RemoteCallback<SessionReport> callback) override;
    void WarmUp() override;
    void CheckHealth(RemoteCallback<HealthStatus> callback) override;

    // Sends a raw request; the handler sees the response or a synthesized {"ok": false} failure
    void Send(nlohmann::json request, ResponseHandler handler);

private:
    struct PendingRequest {
        std::string type;
        ResponseHandler handler;
        std::shared_ptr<boost::asio::steady_timer> timer;
    };

    void OnOpen(websocketpp::connection_hdl hdl);
    void OnClose(websocketpp::connection_hdl hdl);
    void OnFail(websocketpp::connection_hdl hdl);
    void OnMessage(websocketpp::connection_hdl hdl, WsClient::message_ptr msg);

    void Transmit(const std::string& requestId, const std::string& payload);
    void Complete(const std::string& requestId, const nlohmann::json& response);
    void Fail(const std::string& requestId, const std::string& reason);
    void FailAll(const std::string& reason);

    boost::asio::io_context& _io;
    WsClient _endpoint;
    websocketpp::connection_hdl _hdl;
    std::string _serverUrl;
    std::chrono::milliseconds _requestTimeout;
    bool _connected = false;
    bool _connecting = false;

    std::map<std::string, PendingRequest> _pending;
    // (request_id, payload) waiting for the connection to open
    std::vector<std::pair<std::string, std::string>> _outbox;

    std::shared_ptr<bool> _alive;
};
