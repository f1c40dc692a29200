#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class RemoteCallFailed : public std::runtime_error {
public:
    explicit RemoteCallFailed(const std::string& message) : std::runtime_error(message) {}
};

// Outcome of one remote operation, delivered to the completion callback
template <typename T>
struct RemoteResult {
    std::optional<T> value;
    std::string error;

    static RemoteResult Success(T v) {
        RemoteResult result;
        result.value = std::move(v);
        return result;
    }
    static RemoteResult Failure(std::string message) {
        RemoteResult result;
        result.error = std::move(message);
        return result;
    }

    bool Ok() const { return value.has_value(); }
    explicit operator bool() const { return Ok(); }
};

template <typename T>
using RemoteCallback = std::function<void(RemoteResult<T>)>;

struct Empty {};

// Opaque practice context chosen by the user
struct SessionContext {
    std::string role = "developer";
    std::string level = "senior";
    std::string mode = "interview";
};

struct SessionStarted {
    std::string sessionId;
    std::string questionId;
    std::string questionText;
};

struct QuestionInfo {
    std::string questionId;
    std::string questionText;
};

struct AnswerAudioRequest {
    std::string sessionId;
    std::string questionId;
    std::string turnId;
    std::vector<uint8_t> audio;
    std::string audioFormat;
};

struct Transcript {
    std::string text;
    std::optional<double> confidence;

    // The backend reports no recognisable speech with an empty transcript
    bool IsEmptySpeech() const { return text.find_first_not_of(" \t\r\n") == std::string::npos; }
};

struct AnswerTextRequest {
    std::string sessionId;
    std::string questionId;
    std::string text;
};

// Either a tutor reply for the stored answer (session/question) or plain speech for raw text
struct ReplyRequest {
    bool useLlm = true;
    std::string sessionId;
    std::string questionId;
    std::string turnId;
    std::optional<std::string> text;
    SessionContext context;
};

struct SynthesizedAudio {
    std::vector<uint8_t> audio;
    std::string format;
};

struct ScoreBreakdown {
    int content = 0;
    int pronunciation = 0;
    int fluency = 0;
    int overall = 0;
};

struct ScoreResult {
    ScoreBreakdown scores;
    std::vector<std::string> tips;
};

struct ReportTurn {
    std::string questionId;
    std::string questionText;
    std::string answerText;
    ScoreBreakdown scores;
};

struct SessionReport {
    std::string sessionId;
    std::vector<ReportTurn> turns;
    int overallAverage = 0;
};

struct HealthStatus {
    std::string name;
    std::string version;
};
