#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../Backend/BackendTypes.hpp"

enum class ConversationState {
    NoSession,
    Active,          // session exists, no question posed
    QuestionPosed,
    AnswerSubmitted,
    Scored
};

inline const char* GetConversationStateName(ConversationState state) {
    switch (state) {
        case ConversationState::NoSession:       return "NoSession";
        case ConversationState::Active:          return "Active";
        case ConversationState::QuestionPosed:   return "QuestionPosed";
        case ConversationState::AnswerSubmitted: return "AnswerSubmitted";
        case ConversationState::Scored:          return "Scored";
    }
    return "Invalid";
}

enum class StatusKind {
    Info,
    Busy,
    Warn,
    Error
};

inline const char* GetStatusKindName(StatusKind kind) {
    switch (kind) {
        case StatusKind::Info:  return "info";
        case StatusKind::Busy:  return "busy";
        case StatusKind::Warn:  return "warn";
        case StatusKind::Error: return "error";
    }
    return "invalid";
}

struct ChatMessage {
    enum class Author {
        Bot,    // question text
        User,   // transcript or typed answer
        Tutor   // score summary
    };

    Author author;
    std::string text;
};

// Server-correlated practice state
struct ConversationSession {
    std::string sessionId;
    std::string questionId;
    std::string questionText;
    std::string lastTranscript;
    std::optional<ScoreResult> lastScore;
};

struct ConversationSnapshot {
    ConversationState state = ConversationState::NoSession;
    ConversationSession session;
    std::vector<ChatMessage> history;
    bool pipelineBusy = false;
    bool startPending = false;
    bool nextPending = false;
    bool scorePending = false;
};
