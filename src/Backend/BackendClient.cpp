#include "BackendClient.hpp"

#include <boost/asio/post.hpp>

#include "Messages.hpp"
#include "../common/RandomId.hpp"
#include "../common/debug_log.hpp"

using json = nlohmann::json;

namespace {

template <typename T, typename Parser>
BackendClient::ResponseHandler Adapt(RemoteCallback<T> callback, Parser parse) {
    return [callback = std::move(callback), parse](const json& response) {
        RemoteResult<T> result;
        try {
            result = RemoteResult<T>::Success(parse(response));
        } catch (const RemoteCallFailed& e) {
            result = RemoteResult<T>::Failure(e.what());
        }
        if (callback) {
            callback(std::move(result));
        }
    };
}

json MakeFailure(const std::string& type, const std::string& reason) {
    return json{{"type", type}, {"ok", false}, {"error", reason}};
}

} // namespace

BackendClient::BackendClient(boost::asio::io_context& io, std::string serverUrl,
                             std::chrono::milliseconds requestTimeout)
    : _io(io),
      _serverUrl(std::move(serverUrl)),
      _requestTimeout(requestTimeout),
      _alive(std::make_shared<bool>(true)) {

    _endpoint.clear_access_channels(websocketpp::log::alevel::all);
    _endpoint.clear_error_channels(websocketpp::log::elevel::all);

    _endpoint.init_asio(&_io);

    std::weak_ptr<bool> alive = _alive;
    _endpoint.set_open_handler([this, alive](websocketpp::connection_hdl hdl) {
        if (!alive.expired()) OnOpen(hdl);
    });
    _endpoint.set_close_handler([this, alive](websocketpp::connection_hdl hdl) {
        if (!alive.expired()) OnClose(hdl);
    });
    _endpoint.set_fail_handler([this, alive](websocketpp::connection_hdl hdl) {
        if (!alive.expired()) OnFail(hdl);
    });
    _endpoint.set_message_handler([this, alive](websocketpp::connection_hdl hdl, WsClient::message_ptr msg) {
        if (!alive.expired()) OnMessage(hdl, msg);
    });
}

BackendClient::~BackendClient() {
    _alive.reset();
    for (auto& entry : _pending) {
        entry.second.timer->cancel();
    }
    _pending.clear();
    Disconnect();
}

bool BackendClient::Connect() {
    if (_connected || _connecting) return true;

    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = _endpoint.get_connection(_serverUrl, ec);
    if (ec) {
        ERROR_LOG("Could not create connection to " << _serverUrl << ": " << ec.message());
        return false;
    }

    _hdl = con->get_handle();
    _connecting = true;
    _endpoint.connect(con);
    DEBUG_LOG("Connecting to backend " << _serverUrl << DEBUG_LOG_ENDL);
    return true;
}

void BackendClient::Disconnect() {
    if (!_connected && !_connecting) return;

    websocketpp::lib::error_code ec;
    _endpoint.close(_hdl, websocketpp::close::status::normal, "", ec);
    if (ec) {
        ERROR_LOG("Error closing backend connection: " << ec.message());
    }
    _connected = false;
    _connecting = false;
}

void BackendClient::Send(json request, ResponseHandler handler) {
    const std::string requestId = GenerateRandomId();
    request["request_id"] = requestId;
    const std::string type = request.value("type", std::string());

    PendingRequest pending{type, std::move(handler), std::make_shared<boost::asio::steady_timer>(_io)};
    pending.timer->expires_after(_requestTimeout);
    std::weak_ptr<bool> alive = _alive;
    pending.timer->async_wait([this, alive, requestId](const boost::system::error_code& ec) {
        if (ec || alive.expired()) return;
        Fail(requestId, "Request timed out");
    });
    _pending.emplace(requestId, std::move(pending));

    const std::string payload = request.dump();
    if (_connected) {
        Transmit(requestId, payload);
        return;
    }

    _outbox.emplace_back(requestId, payload);
    if (!Connect()) {
        // Completions never run inside the call that issued them
        _outbox.clear();
        boost::asio::post(_io, [this, alive]() {
            if (!alive.expired()) FailAll("Backend is unreachable");
        });
    }
}

void BackendClient::Transmit(const std::string& requestId, const std::string& payload) {
    websocketpp::lib::error_code ec;
    _endpoint.send(_hdl, payload, websocketpp::frame::opcode::text, ec);
    if (ec) {
        ERROR_LOG("Error sending request: " << ec.message());
        std::weak_ptr<bool> alive = _alive;
        const std::string reason = ec.message();
        boost::asio::post(_io, [this, alive, requestId, reason]() {
            if (!alive.expired()) Fail(requestId, reason);
        });
    }
}

void BackendClient::Complete(const std::string& requestId, const json& response) {
    auto it = _pending.find(requestId);
    if (it == _pending.end()) {
        DEBUG_LOG("Dropping response for unknown request " << requestId << DEBUG_LOG_ENDL);
        return;
    }

    PendingRequest pending = std::move(it->second);
    _pending.erase(it);
    pending.timer->cancel();
    if (pending.handler) {
        pending.handler(response);
    }
}

void BackendClient::Fail(const std::string& requestId, const std::string& reason) {
    auto it = _pending.find(requestId);
    if (it == _pending.end()) return;
    Complete(requestId, MakeFailure(it->second.type, reason));
}

void BackendClient::FailAll(const std::string& reason) {
    std::vector<std::string> ids;
    ids.reserve(_pending.size());
    for (const auto& entry : _pending) {
        ids.push_back(entry.first);
    }
    for (const auto& id : ids) {
        Fail(id, reason);
    }
}

void BackendClient::OnOpen(websocketpp::connection_hdl hdl) {
    _hdl = hdl;
    _connected = true;
    _connecting = false;
    DEBUG_LOG("Connected to backend " << _serverUrl << DEBUG_LOG_ENDL);

    auto outbox = std::move(_outbox);
    _outbox.clear();
    for (const auto& entry : outbox) {
        Transmit(entry.first, entry.second);
    }
}

void BackendClient::OnClose(websocketpp::connection_hdl) {
    _connected = false;
    _connecting = false;
    _outbox.clear();
    DEBUG_LOG("Disconnected from backend" << DEBUG_LOG_ENDL);
    FailAll("Connection closed");
}

void BackendClient::OnFail(websocketpp::connection_hdl) {
    _connected = false;
    _connecting = false;
    _outbox.clear();
    ERROR_LOG("Backend connection failed: " << _serverUrl);
    FailAll("Connection failed");
}

void BackendClient::OnMessage(websocketpp::connection_hdl, WsClient::message_ptr msg) {
    json response;
    try {
        response = json::parse(msg->get_payload());
    } catch (const json::parse_error& e) {
        ERROR_LOG("Error parsing backend message: " << e.what());
        return;
    }

    if (!response.is_object() || !response.contains("request_id") || !response["request_id"].is_string()) {
        DEBUG_LOG("Dropping backend message without request_id" << DEBUG_LOG_ENDL);
        return;
    }

    const std::string requestId = response["request_id"].get<std::string>();
    auto it = _pending.find(requestId);
    if (it != _pending.end() && response.contains("type") && response["type"] != it->second.type) {
        DEBUG_LOG("Dropping response of type " << response["type"] << " for " << it->second.type << DEBUG_LOG_ENDL);
        return;
    }
    Complete(requestId, response);
}

void BackendClient::StartSession(const SessionContext& context, RemoteCallback<SessionStarted> callback) {
    Send(messages::MakeStartSession(context), Adapt<SessionStarted>(std::move(callback), &messages::ParseSessionStarted));
}

void BackendClient::NextQuestion(const std::string& sessionId, RemoteCallback<QuestionInfo> callback) {
    Send(messages::MakeNextQuestion(sessionId), Adapt<QuestionInfo>(std::move(callback), &messages::ParseQuestion));
}

void BackendClient::SubmitAnswerAudio(const AnswerAudioRequest& request, RemoteCallback<Transcript> callback) {
    Send(messages::MakeAnswerAudio(request), Adapt<Transcript>(std::move(callback), &messages::ParseTranscript));
}

void BackendClient::SubmitAnswerText(const AnswerTextRequest& request, RemoteCallback<Empty> callback) {
    Send(messages::MakeAnswerText(request), Adapt<Empty>(std::move(callback), [](const json& response) {
        messages::CheckResponse(response);
        return Empty{};
    }));
}

void BackendClient::SynthesizeReply(const ReplyRequest& request, RemoteCallback<SynthesizedAudio> callback) {
    Send(messages::MakeSynthesize(request),
         Adapt<SynthesizedAudio>(std::move(callback), &messages::ParseSynthesizedAudio));
}

void BackendClient::ScoreAnswer(const std::string& sessionId, const std::string& questionId,
                                RemoteCallback<ScoreResult> callback) {
    Send(messages::MakeScore(sessionId, questionId), Adapt<ScoreResult>(std::move(callback), &messages::ParseScore));
}

void BackendClient::FetchReport(const std::string& sessionId, RemoteCallback<SessionReport> callback) {
    Send(messages::MakeReport(sessionId), Adapt<SessionReport>(std::move(callback), &messages::ParseReport));
}

void BackendClient::WarmUp() {
    Send(messages::MakeWarm(), [](const json& response) {
        try {
            messages::CheckResponse(response);
            DEBUG_LOG("Speech synthesis warmed up" << DEBUG_LOG_ENDL);
        } catch (const RemoteCallFailed& e) {
            ERROR_LOG("Warm-up failed: " << e.what());
        }
    });
}

void BackendClient::CheckHealth(RemoteCallback<HealthStatus> callback) {
    Send(messages::MakeHealth(), Adapt<HealthStatus>(std::move(callback), &messages::ParseHealth));
}
