#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "BackendTypes.hpp"

// JSON wire format of the practice backend. Every request carries "type" and "request_id"; the
// response echoes both with "ok" and, on failure, "error".
namespace messages {

inline const char* const kStartSession = "sim.start";
inline const char* const kNextQuestion = "sim.next";
inline const char* const kAnswerAudio = "sim.answer.audio";
inline const char* const kAnswerText = "sim.answer.text";
inline const char* const kSynthesize = "tts.say";
inline const char* const kScore = "sim.score";
inline const char* const kReport = "sim.report";
inline const char* const kWarm = "tts.warm";
inline const char* const kHealth = "health";

nlohmann::json MakeStartSession(const SessionContext& context);
nlohmann::json MakeNextQuestion(const std::string& sessionId);
nlohmann::json MakeAnswerAudio(const AnswerAudioRequest& request);
nlohmann::json MakeAnswerText(const AnswerTextRequest& request);
nlohmann::json MakeSynthesize(const ReplyRequest& request);
nlohmann::json MakeScore(const std::string& sessionId, const std::string& questionId);
nlohmann::json MakeReport(const std::string& sessionId);
nlohmann::json MakeWarm();
nlohmann::json MakeHealth();

// Throws RemoteCallFailed when the response reports a failure
void CheckResponse(const nlohmann::json& response);

// All parsers throw RemoteCallFailed on a failed or malformed response
SessionStarted ParseSessionStarted(const nlohmann::json& response);
QuestionInfo ParseQuestion(const nlohmann::json& response);
Transcript ParseTranscript(const nlohmann::json& response);
SynthesizedAudio ParseSynthesizedAudio(const nlohmann::json& response);
ScoreResult ParseScore(const nlohmann::json& response);
SessionReport ParseReport(const nlohmann::json& response);
HealthStatus ParseHealth(const nlohmann::json& response);

std::string EncodeBase64(const std::vector<uint8_t>& data);
std::vector<uint8_t> DecodeBase64(const std::string& text);

} // namespace messages
