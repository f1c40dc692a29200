#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "ConversationState.hpp"
#include "../AudioPlayer/PlaybackSink.hpp"
#include "../AudioRecorder/RecordData.hpp"
#include "../Backend/IBackendClient.hpp"
#include "../Pipeline/PipelineGuard.hpp"

// Drives the practice session:
// NoSession -> QuestionPosed -> AnswerSubmitted -> Scored -> QuestionPosed -> ...
//
// Runs on the scheduler thread. Every remote result is checked against the session and question
// it was issued for and dropped when they are no longer current. Utterances go through the
// PipelineGuard, so one submit -> reply -> playback chain runs at a time.
class ConversationOrchestrator {
public:
    using StatusCallback = std::function<void(StatusKind, const std::string&)>;
    using StateCallback = std::function<void(ConversationState)>;

    // playback may be null, in which case replies are synthesized but not played
    ConversationOrchestrator(IBackendClient& backend, IPlaybackSink* playback, SessionContext context = {});
    ~ConversationOrchestrator();

    ConversationOrchestrator(const ConversationOrchestrator&) = delete;
    ConversationOrchestrator& operator=(const ConversationOrchestrator&) = delete;

    // All return false when the request was rejected without calling the backend
    bool StartSession(const SessionContext& context);
    bool HandleUtterance(const Utterance& utterance);
    bool NextQuestion();
    bool ScoreAnswer();
    bool AnswerText(const std::string& text);
    bool SpeakText(const std::string& text);
    bool FetchReport(RemoteCallback<SessionReport> callback);
    void WarmUp();

    ConversationState GetState() const { return _state; }
    const ConversationSession& GetSession() const { return _session; }
    const SessionContext& GetContext() const { return _context; }
    ConversationSnapshot GetSnapshot() const;
    const PipelineGuard& GetPipelineGuard() const { return _guard; }

    void SetOnStatusCallback(StatusCallback cb) { _onStatus = std::move(cb); }
    void SetOnStateCallback(StateCallback cb) { _onState = std::move(cb); }

private:
    using Continuation = std::function<void()>;

    bool HasSession() const { return _state != ConversationState::NoSession; }
    bool AcceptsAnswer() const;
    bool IsCurrent(const std::string& sessionId, const std::string& questionId) const;

    void BeginSession(const SessionContext& context, Continuation onStarted);
    void SubmitAudio(PipelineGuard::LeasePtr lease, std::shared_ptr<const Utterance> utterance);
    void SubmitText(const std::string& text);
    void RequestReply(PipelineGuard::LeasePtr lease, const std::string& sessionId,
                      const std::string& questionId);
    void PlayReply(std::vector<uint8_t> audio, PipelineGuard::LeasePtr lease);

    void RecordAnswer(const std::string& text);
    void AddHistory(ChatMessage::Author author, std::string text);
    void ChangeState(ConversationState newState);
    void Status(StatusKind kind, const std::string& message);

    IBackendClient& _backend;
    IPlaybackSink* _playback;
    SessionContext _context;
    PipelineGuard _guard;

    ConversationState _state = ConversationState::NoSession;
    ConversationSession _session;
    std::vector<ChatMessage> _history;

    bool _startPending = false;
    bool _nextPending = false;
    bool _scorePending = false;
    bool _answerPending = false;
    // Bumped for every accepted answer; a score belongs to the answer it was requested for
    uint64_t _answerGeneration = 0;

    StatusCallback _onStatus;
    StateCallback _onState;

    std::shared_ptr<bool> _alive;
};
