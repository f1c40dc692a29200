#include "ConversationOrchestrator.hpp"
#include "../common/debug_log.hpp"

#include <sstream>
#include <utility>

namespace {

std::string Trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::string();
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string FormatScore(const ScoreResult& result) {
    std::ostringstream out;
    out << "Overall: " << result.scores.overall
        << " (content " << result.scores.content
        << ", pronunciation " << result.scores.pronunciation
        << ", fluency " << result.scores.fluency << ")";
    if (!result.tips.empty()) {
        out << " Tips:";
        for (size_t i = 0; i < result.tips.size(); ++i) {
            out << (i == 0 ? " " : " | ") << result.tips[i];
        }
    }
    return out.str();
}

} // namespace

ConversationOrchestrator::ConversationOrchestrator(IBackendClient& backend, IPlaybackSink* playback,
                                                   SessionContext context)
    : _backend(backend),
      _playback(playback),
      _context(std::move(context)),
      _alive(std::make_shared<bool>(true)) {}

ConversationOrchestrator::~ConversationOrchestrator() {
    _alive.reset();
}

ConversationSnapshot ConversationOrchestrator::GetSnapshot() const {
    ConversationSnapshot snapshot;
    snapshot.state = _state;
    snapshot.session = _session;
    snapshot.history = _history;
    snapshot.pipelineBusy = _guard.IsBusy();
    snapshot.startPending = _startPending;
    snapshot.nextPending = _nextPending;
    snapshot.scorePending = _scorePending;
    return snapshot;
}

bool ConversationOrchestrator::AcceptsAnswer() const {
    return _state == ConversationState::NoSession ||
           _state == ConversationState::QuestionPosed ||
           _state == ConversationState::AnswerSubmitted;
}

bool ConversationOrchestrator::IsCurrent(const std::string& sessionId, const std::string& questionId) const {
    return HasSession() && _session.sessionId == sessionId && _session.questionId == questionId;
}

bool ConversationOrchestrator::StartSession(const SessionContext& context) {
    if (_startPending) {
        DEBUG_LOG("Orchestrator: session start already in flight" << DEBUG_LOG_ENDL);
        return false;
    }
    BeginSession(context, nullptr);
    return true;
}

void ConversationOrchestrator::BeginSession(const SessionContext& context, Continuation onStarted) {
    _startPending = true;
    Status(StatusKind::Busy, "Starting session...");

    std::weak_ptr<bool> alive = _alive;
    _backend.StartSession(context, [this, alive, context, onStarted = std::move(onStarted)](RemoteResult<SessionStarted> result) {
        if (alive.expired()) return;
        _startPending = false;

        if (!result) {
            // A failed reset keeps whatever session was there before
            ERROR_LOG("Orchestrator: start session failed: " << result.error);
            Status(StatusKind::Error, "Start failed: " + result.error);
            return;
        }

        const SessionStarted& started = *result.value;
        _context = context;
        _session = ConversationSession{};
        _session.sessionId = started.sessionId;
        _session.questionId = started.questionId;
        _session.questionText = started.questionText;
        _history.clear();
        if (!started.questionText.empty()) {
            AddHistory(ChatMessage::Author::Bot, started.questionText);
        }
        DEBUG_LOG("Orchestrator: session " << started.sessionId << " started" << DEBUG_LOG_ENDL);

        ChangeState(started.questionId.empty() ? ConversationState::Active : ConversationState::QuestionPosed);
        Status(StatusKind::Info, "Session ready");

        if (onStarted) {
            onStarted();
        }
    });
}

bool ConversationOrchestrator::HandleUtterance(const Utterance& utterance) {
    if (utterance.IsEmpty()) {
        DEBUG_LOG("Orchestrator: empty utterance " << utterance.token << " ignored" << DEBUG_LOG_ENDL);
        Status(StatusKind::Info, "No speech captured");
        return false;
    }
    if (!AcceptsAnswer()) {
        Status(StatusKind::Warn, _state == ConversationState::Scored
                                     ? "Answer already scored, ask for the next question"
                                     : "No question to answer yet");
        return false;
    }
    if (_startPending) {
        Status(StatusKind::Warn, "Session is still starting");
        return false;
    }

    PipelineGuard::LeasePtr lease = _guard.TryEnter(utterance.token);
    if (!lease) {
        DEBUG_LOG("Orchestrator: pipeline busy, utterance " << utterance.token << " dropped" << DEBUG_LOG_ENDL);
        Status(StatusKind::Warn, "Still processing the previous answer");
        return false;
    }

    auto shared = std::make_shared<const Utterance>(utterance);
    if (!HasSession()) {
        BeginSession(_context, [this, lease, shared]() {
            if (_state != ConversationState::QuestionPosed) {
                Status(StatusKind::Warn, "Session has no question yet, answer discarded");
                return;
            }
            SubmitAudio(lease, shared);
        });
        return true;
    }

    SubmitAudio(std::move(lease), std::move(shared));
    return true;
}

void ConversationOrchestrator::SubmitAudio(PipelineGuard::LeasePtr lease, std::shared_ptr<const Utterance> utterance) {
    AnswerAudioRequest request;
    request.sessionId = _session.sessionId;
    request.questionId = _session.questionId;
    request.turnId = lease->GetCorrelationId();
    request.audio = utterance->data;
    request.audioFormat = utterance->encoding.mimeType;

    Status(StatusKind::Busy, "Transcribing...");
    DEBUG_LOG("Orchestrator: submitting " << utterance->data.size() << " bytes for turn "
              << request.turnId << DEBUG_LOG_ENDL);

    std::weak_ptr<bool> alive = _alive;
    const std::string sessionId = request.sessionId;
    const std::string questionId = request.questionId;
    _backend.SubmitAnswerAudio(request, [this, alive, lease, sessionId, questionId](RemoteResult<Transcript> result) {
        if (alive.expired()) return;
        if (!IsCurrent(sessionId, questionId)) {
            DEBUG_LOG("Orchestrator: stale transcript for " << questionId << " dropped" << DEBUG_LOG_ENDL);
            return;
        }
        if (!result) {
            ERROR_LOG("Orchestrator: answer submission failed: " << result.error);
            Status(StatusKind::Error, "Upload failed: " + result.error);
            return;
        }
        if (result.value->IsEmptySpeech()) {
            Status(StatusKind::Warn, "No speech recognized, try again");
            return;
        }

        RecordAnswer(result.value->text);
        RequestReply(lease, sessionId, questionId);
    });
}

void ConversationOrchestrator::RequestReply(PipelineGuard::LeasePtr lease, const std::string& sessionId,
                                            const std::string& questionId) {
    ReplyRequest request;
    request.useLlm = true;
    request.sessionId = sessionId;
    request.questionId = questionId;
    request.turnId = lease->GetCorrelationId();
    request.context = _context;

    Status(StatusKind::Busy, "Asking tutor...");

    std::weak_ptr<bool> alive = _alive;
    _backend.SynthesizeReply(request, [this, alive, lease, sessionId, questionId](RemoteResult<SynthesizedAudio> result) {
        if (alive.expired()) return;
        if (!IsCurrent(sessionId, questionId)) {
            DEBUG_LOG("Orchestrator: stale reply for " << questionId << " dropped" << DEBUG_LOG_ENDL);
            return;
        }
        if (!result) {
            ERROR_LOG("Orchestrator: reply synthesis failed: " << result.error);
            Status(StatusKind::Error, "Reply failed: " + result.error);
            return;
        }
        PlayReply(std::move(result.value->audio), lease);
    });
}

void ConversationOrchestrator::PlayReply(std::vector<uint8_t> audio, PipelineGuard::LeasePtr lease) {
    if (!_playback) {
        Status(StatusKind::Info, "Ready");
        return;
    }

    std::weak_ptr<bool> alive = _alive;
    _playback->Play(std::move(audio), [this, alive, lease](const std::string& error) {
        if (alive.expired()) return;
        if (!error.empty()) {
            Status(StatusKind::Warn, "Playback failed: " + error);
            return;
        }
        Status(StatusKind::Info, "Playing reply");
    });
}

bool ConversationOrchestrator::AnswerText(const std::string& text) {
    const std::string answer = Trim(text);
    if (answer.empty()) {
        Status(StatusKind::Info, "Nothing to submit");
        return false;
    }
    if (!AcceptsAnswer()) {
        Status(StatusKind::Warn, "No question to answer right now");
        return false;
    }
    if (_startPending || _answerPending) {
        Status(StatusKind::Warn, "Previous request still in flight");
        return false;
    }

    if (!HasSession()) {
        BeginSession(_context, [this, answer]() {
            if (_state != ConversationState::QuestionPosed) {
                Status(StatusKind::Warn, "Session has no question yet, answer discarded");
                return;
            }
            SubmitText(answer);
        });
        return true;
    }

    SubmitText(answer);
    return true;
}

void ConversationOrchestrator::SubmitText(const std::string& text) {
    AnswerTextRequest request;
    request.sessionId = _session.sessionId;
    request.questionId = _session.questionId;
    request.text = text;

    _answerPending = true;
    Status(StatusKind::Busy, "Submitting answer...");

    std::weak_ptr<bool> alive = _alive;
    const std::string sessionId = request.sessionId;
    const std::string questionId = request.questionId;
    _backend.SubmitAnswerText(request, [this, alive, sessionId, questionId, text](RemoteResult<Empty> result) {
        if (alive.expired()) return;
        _answerPending = false;
        if (!IsCurrent(sessionId, questionId)) {
            DEBUG_LOG("Orchestrator: stale text answer for " << questionId << " dropped" << DEBUG_LOG_ENDL);
            return;
        }
        if (!result) {
            Status(StatusKind::Error, "Submit failed: " + result.error);
            return;
        }

        RecordAnswer(text);
        Status(StatusKind::Info, "Answer submitted");
    });
}

bool ConversationOrchestrator::NextQuestion() {
    if (!HasSession()) {
        Status(StatusKind::Warn, "Start a session first");
        return false;
    }
    if (_nextPending) {
        return false;
    }

    _nextPending = true;
    Status(StatusKind::Busy, "Getting next question...");

    std::weak_ptr<bool> alive = _alive;
    const std::string sessionId = _session.sessionId;
    _backend.NextQuestion(sessionId, [this, alive, sessionId](RemoteResult<QuestionInfo> result) {
        if (alive.expired()) return;
        _nextPending = false;
        if (!HasSession() || _session.sessionId != sessionId) {
            DEBUG_LOG("Orchestrator: question for old session " << sessionId << " dropped" << DEBUG_LOG_ENDL);
            return;
        }
        if (!result) {
            ERROR_LOG("Orchestrator: next question failed: " << result.error);
            Status(StatusKind::Error, "Next failed: " + result.error);
            return;
        }

        _session.questionId = result.value->questionId;
        _session.questionText = result.value->questionText;
        _session.lastTranscript.clear();
        _session.lastScore.reset();
        AddHistory(ChatMessage::Author::Bot, _session.questionText);
        ChangeState(ConversationState::QuestionPosed);
        Status(StatusKind::Info, "Next question");
    });
    return true;
}

bool ConversationOrchestrator::ScoreAnswer() {
    if (_state != ConversationState::AnswerSubmitted) {
        Status(StatusKind::Warn, "Answer the question before scoring");
        return false;
    }
    if (_scorePending) {
        return false;
    }

    _scorePending = true;
    Status(StatusKind::Busy, "Scoring...");

    std::weak_ptr<bool> alive = _alive;
    const std::string sessionId = _session.sessionId;
    const std::string questionId = _session.questionId;
    const uint64_t answerGeneration = _answerGeneration;
    _backend.ScoreAnswer(sessionId, questionId,
                         [this, alive, sessionId, questionId, answerGeneration](RemoteResult<ScoreResult> result) {
        if (alive.expired()) return;
        _scorePending = false;
        if (!IsCurrent(sessionId, questionId)) {
            DEBUG_LOG("Orchestrator: stale score for " << questionId << " dropped" << DEBUG_LOG_ENDL);
            return;
        }
        if (answerGeneration != _answerGeneration) {
            DEBUG_LOG("Orchestrator: score for a replaced answer to " << questionId << " dropped" << DEBUG_LOG_ENDL);
            Status(StatusKind::Warn, "Answer changed while scoring, score again");
            return;
        }
        if (!result) {
            ERROR_LOG("Orchestrator: scoring failed: " << result.error);
            Status(StatusKind::Error, "Score failed: " + result.error);
            return;
        }

        _session.lastScore = *result.value;
        AddHistory(ChatMessage::Author::Tutor, FormatScore(*result.value));
        ChangeState(ConversationState::Scored);
        Status(StatusKind::Info, "Scored");
    });
    return true;
}

bool ConversationOrchestrator::SpeakText(const std::string& text) {
    const std::string phrase = Trim(text);
    if (phrase.empty()) {
        return false;
    }

    ReplyRequest request;
    request.useLlm = false;
    request.text = phrase;
    request.context = _context;

    Status(StatusKind::Busy, "Synthesizing...");

    std::weak_ptr<bool> alive = _alive;
    _backend.SynthesizeReply(request, [this, alive](RemoteResult<SynthesizedAudio> result) {
        if (alive.expired()) return;
        if (!result) {
            Status(StatusKind::Error, "Speech failed: " + result.error);
            return;
        }
        PlayReply(std::move(result.value->audio), nullptr);
    });
    return true;
}

bool ConversationOrchestrator::FetchReport(RemoteCallback<SessionReport> callback) {
    if (!HasSession()) {
        Status(StatusKind::Warn, "Start a session first");
        return false;
    }

    std::weak_ptr<bool> alive = _alive;
    _backend.FetchReport(_session.sessionId, [this, alive, callback = std::move(callback)](RemoteResult<SessionReport> result) {
        if (alive.expired()) return;
        if (!result) {
            Status(StatusKind::Error, "Report failed: " + result.error);
        }
        if (callback) {
            callback(std::move(result));
        }
    });
    return true;
}

void ConversationOrchestrator::WarmUp() {
    _backend.WarmUp();
    _backend.CheckHealth([](RemoteResult<HealthStatus> result) {
        if (!result) {
            DEBUG_LOG("Orchestrator: health check failed: " << result.error << DEBUG_LOG_ENDL);
            return;
        }
        DEBUG_LOG("Orchestrator: backend " << result.value->name << " " << result.value->version << DEBUG_LOG_ENDL);
    });
}

void ConversationOrchestrator::RecordAnswer(const std::string& text) {
    ++_answerGeneration;
    _session.lastTranscript = text;
    _session.lastScore.reset();
    AddHistory(ChatMessage::Author::User, text);
    ChangeState(ConversationState::AnswerSubmitted);
}

void ConversationOrchestrator::AddHistory(ChatMessage::Author author, std::string text) {
    _history.push_back(ChatMessage{author, std::move(text)});
}

void ConversationOrchestrator::ChangeState(ConversationState newState) {
    if (_state == newState) return;
    DEBUG_LOG("Orchestrator: " << GetConversationStateName(_state) << " -> "
              << GetConversationStateName(newState) << DEBUG_LOG_ENDL);
    _state = newState;
    if (_onState) {
        _onState(newState);
    }
}

void ConversationOrchestrator::Status(StatusKind kind, const std::string& message) {
    if (_onStatus) {
        _onStatus(kind, message);
    }
}
