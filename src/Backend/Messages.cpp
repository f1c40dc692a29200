#include "Messages.hpp"

#include <websocketpp/base64/base64.hpp>

#include <cmath>

using json = nlohmann::json;

namespace messages {

namespace {

json MakeRequest(const char* type) {
    return json{{"type", type}};
}

void AddContext(json& message, const SessionContext& context) {
    message["role"] = context.role;
    message["level"] = context.level;
    message["mode"] = context.mode;
}

std::string RequireString(const json& response, const char* field) {
    if (!response.contains(field) || !response[field].is_string()) {
        throw RemoteCallFailed(std::string("Response is missing \"") + field + "\"");
    }
    return response[field].get<std::string>();
}

ScoreBreakdown ParseBreakdown(const json& scores) {
    if (!scores.is_object()) {
        throw RemoteCallFailed("Score breakdown is not an object");
    }
    ScoreBreakdown breakdown;
    breakdown.content = scores.value("content", 0);
    breakdown.pronunciation = scores.value("pronunciation", 0);
    breakdown.fluency = scores.value("fluency", 0);
    breakdown.overall = scores.value("overall", 0);
    return breakdown;
}

// nlohmann reports type mismatches as json::exception; callers only ever see RemoteCallFailed
template <typename Parser>
auto Guarded(const json& response, Parser parse) -> decltype(parse()) {
    CheckResponse(response);
    try {
        return parse();
    } catch (const json::exception& e) {
        throw RemoteCallFailed(std::string("Malformed response: ") + e.what());
    }
}

} // namespace

json MakeStartSession(const SessionContext& context) {
    json message = MakeRequest(kStartSession);
    AddContext(message, context);
    return message;
}

json MakeNextQuestion(const std::string& sessionId) {
    json message = MakeRequest(kNextQuestion);
    message["session_id"] = sessionId;
    return message;
}

json MakeAnswerAudio(const AnswerAudioRequest& request) {
    json message = MakeRequest(kAnswerAudio);
    message["session_id"] = request.sessionId;
    message["question_id"] = request.questionId;
    message["turn_id"] = request.turnId;
    message["audio_format"] = request.audioFormat;
    message["audio"] = EncodeBase64(request.audio);
    return message;
}

json MakeAnswerText(const AnswerTextRequest& request) {
    json message = MakeRequest(kAnswerText);
    message["session_id"] = request.sessionId;
    message["question_id"] = request.questionId;
    message["text"] = request.text;
    return message;
}

json MakeSynthesize(const ReplyRequest& request) {
    json message = MakeRequest(kSynthesize);
    message["use_llm"] = request.useLlm;
    if (!request.sessionId.empty()) {
        message["session_id"] = request.sessionId;
    }
    if (!request.questionId.empty()) {
        message["question_id"] = request.questionId;
    }
    if (!request.turnId.empty()) {
        message["turn_id"] = request.turnId;
    }
    if (request.text) {
        message["text"] = *request.text;
    }
    AddContext(message, request.context);
    return message;
}

json MakeScore(const std::string& sessionId, const std::string& questionId) {
    json message = MakeRequest(kScore);
    message["session_id"] = sessionId;
    message["question_id"] = questionId;
    return message;
}

json MakeReport(const std::string& sessionId) {
    json message = MakeRequest(kReport);
    message["session_id"] = sessionId;
    return message;
}

json MakeWarm() {
    return MakeRequest(kWarm);
}

json MakeHealth() {
    return MakeRequest(kHealth);
}

void CheckResponse(const json& response) {
    if (!response.is_object()) {
        throw RemoteCallFailed("Response is not a JSON object");
    }
    const bool ok = response.value("ok", false);
    if (!ok) {
        std::string detail = "request failed";
        if (response.contains("error") && response["error"].is_string()) {
            detail = response["error"].get<std::string>();
        }
        throw RemoteCallFailed(response.value("type", std::string("unknown")) + ": " + detail);
    }
}

SessionStarted ParseSessionStarted(const json& response) {
    return Guarded(response, [&response]() {
        SessionStarted started;
        started.sessionId = RequireString(response, "session_id");
        started.questionId = response.value("question_id", "");
        started.questionText = response.value("question", "");
        return started;
    });
}

QuestionInfo ParseQuestion(const json& response) {
    return Guarded(response, [&response]() {
        QuestionInfo question;
        question.questionId = RequireString(response, "question_id");
        question.questionText = RequireString(response, "question");
        return question;
    });
}

Transcript ParseTranscript(const json& response) {
    return Guarded(response, [&response]() {
        Transcript transcript;
        transcript.text = response.value("asr_text", "");
        if (response.contains("confidence") && response["confidence"].is_number()) {
            transcript.confidence = response["confidence"].get<double>();
        }
        return transcript;
    });
}

SynthesizedAudio ParseSynthesizedAudio(const json& response) {
    return Guarded(response, [&response]() {
        SynthesizedAudio audio;
        audio.audio = DecodeBase64(RequireString(response, "audio"));
        audio.format = response.value("audio_format", "audio/wav");
        if (audio.audio.empty()) {
            throw RemoteCallFailed("Synthesized audio is empty");
        }
        return audio;
    });
}

ScoreResult ParseScore(const json& response) {
    return Guarded(response, [&response]() {
        if (!response.contains("scores")) {
            throw RemoteCallFailed("Response is missing \"scores\"");
        }
        ScoreResult result;
        result.scores = ParseBreakdown(response["scores"]);
        if (response.contains("tips") && response["tips"].is_array()) {
            result.tips = response["tips"].get<std::vector<std::string>>();
        }
        return result;
    });
}

SessionReport ParseReport(const json& response) {
    return Guarded(response, [&response]() {
        SessionReport report;
        report.sessionId = RequireString(response, "session_id");
        report.overallAverage = response.value("overall_avg", 0);
        for (const auto& turn : response.value("turns", json::array())) {
            ReportTurn entry;
            entry.questionId = turn.value("qid", "");
            entry.questionText = turn.value("q", "");
            entry.answerText = turn.value("answer_text", "");
            if (turn.contains("scores")) {
                entry.scores = ParseBreakdown(turn["scores"]);
            }
            report.turns.push_back(std::move(entry));
        }
        return report;
    });
}

HealthStatus ParseHealth(const json& response) {
    return Guarded(response, [&response]() {
        HealthStatus health;
        health.name = response.value("name", "");
        health.version = response.value("version", "");
        return health;
    });
}

std::string EncodeBase64(const std::vector<uint8_t>& data) {
    return websocketpp::base64_encode(data.data(), data.size());
}

std::vector<uint8_t> DecodeBase64(const std::string& text) {
    const std::string decoded = websocketpp::base64_decode(text);
    return std::vector<uint8_t>(decoded.begin(), decoded.end());
}

} // namespace messages
