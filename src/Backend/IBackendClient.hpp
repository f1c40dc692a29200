#pragma once

#include "BackendTypes.hpp"

// Remote practice-session operations. Every call returns immediately; the callback runs later on
// the scheduler thread exactly once, with either a value or an error message.
class IBackendClient {
public:
    virtual ~IBackendClient() = default;

    virtual void StartSession(const SessionContext& context, RemoteCallback<SessionStarted> callback) = 0;
    virtual void NextQuestion(const std::string& sessionId, RemoteCallback<QuestionInfo> callback) = 0;
    virtual void SubmitAnswerAudio(const AnswerAudioRequest& request, RemoteCallback<Transcript> callback) = 0;
    virtual void SubmitAnswerText(const AnswerTextRequest& request, RemoteCallback<Empty> callback) = 0;
    virtual void SynthesizeReply(const ReplyRequest& request, RemoteCallback<SynthesizedAudio> callback) = 0;
    virtual void ScoreAnswer(const std::string& sessionId, const std::string& questionId,
                             RemoteCallback<ScoreResult> callback) = 0;
    virtual void FetchReport(const std::string& sessionId, RemoteCallback<SessionReport> callback) = 0;

    // Best effort; failures are only logged
    virtual void WarmUp() = 0;
    virtual void CheckHealth(RemoteCallback<HealthStatus> callback) = 0;
};
