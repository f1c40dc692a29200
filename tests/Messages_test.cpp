#include "Backend/Messages.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST(MessagesTest, AnswerAudioCarriesTurnAndBase64Audio) {
    AnswerAudioRequest request;
    request.sessionId = "s1";
    request.questionId = "q1";
    request.turnId = "TURN0000TURN0000";
    request.audio = {0x00, 0xff, 0x10, 0x00, 0x7f};
    request.audioFormat = "audio/wav";

    const json message = messages::MakeAnswerAudio(request);
    EXPECT_EQ(message["type"], "sim.answer.audio");
    EXPECT_EQ(message["session_id"], "s1");
    EXPECT_EQ(message["question_id"], "q1");
    EXPECT_EQ(message["turn_id"], "TURN0000TURN0000");
    EXPECT_EQ(message["audio_format"], "audio/wav");
    EXPECT_EQ(messages::DecodeBase64(message["audio"].get<std::string>()), request.audio);
}

TEST(MessagesTest, StartCarriesOpaqueContext) {
    SessionContext context;
    context.role = "devops";
    const json message = messages::MakeStartSession(context);
    EXPECT_EQ(message["type"], "sim.start");
    EXPECT_EQ(message["role"], "devops");
    EXPECT_EQ(message["level"], "senior");
    EXPECT_EQ(message["mode"], "interview");
}

TEST(MessagesTest, PlainSpeechOmitsSessionFields) {
    ReplyRequest request;
    request.useLlm = false;
    request.text = "Good morning";

    const json message = messages::MakeSynthesize(request);
    EXPECT_EQ(message["type"], "tts.say");
    EXPECT_EQ(message["use_llm"], false);
    EXPECT_EQ(message["text"], "Good morning");
    EXPECT_FALSE(message.contains("session_id"));
    EXPECT_FALSE(message.contains("turn_id"));
}

TEST(MessagesTest, FailedResponseThrowsWithServerError) {
    const json response = {{"type", "sim.next"}, {"ok", false}, {"error", "session expired"}};
    try {
        messages::ParseQuestion(response);
        FAIL() << "Expected RemoteCallFailed";
    } catch (const RemoteCallFailed& e) {
        EXPECT_NE(std::string(e.what()).find("session expired"), std::string::npos);
    }
}

TEST(MessagesTest, ResponseWithoutOkIsAFailure) {
    EXPECT_THROW(messages::CheckResponse(json{{"type", "health"}}), RemoteCallFailed);
    EXPECT_THROW(messages::CheckResponse(json::array()), RemoteCallFailed);
}

TEST(MessagesTest, MalformedFieldsBecomeRemoteCallFailed) {
    EXPECT_THROW(messages::ParseSessionStarted(json{{"ok", true}, {"question", "Hi"}}), RemoteCallFailed);
    EXPECT_THROW(messages::ParseScore(json{{"ok", true}, {"scores", {{"overall", "high"}}}}), RemoteCallFailed);
    EXPECT_THROW(messages::ParseSynthesizedAudio(json{{"ok", true}, {"audio", ""}}), RemoteCallFailed);
}

TEST(MessagesTest, ParsesStartAndTranscript) {
    const SessionStarted started = messages::ParseSessionStarted(
        json{{"ok", true}, {"session_id", "abc"}, {"question_id", "q1"}, {"question", "Why C++?"}});
    EXPECT_EQ(started.sessionId, "abc");
    EXPECT_EQ(started.questionId, "q1");
    EXPECT_EQ(started.questionText, "Why C++?");

    const Transcript transcript = messages::ParseTranscript(json{{"ok", true}, {"asr_text", ""}});
    EXPECT_TRUE(transcript.IsEmptySpeech());
    EXPECT_FALSE(transcript.confidence.has_value());

    const Transcript spoken = messages::ParseTranscript(json{{"ok", true}, {"asr_text", "hello"}, {"confidence", 0.9}});
    EXPECT_FALSE(spoken.IsEmptySpeech());
    ASSERT_TRUE(spoken.confidence.has_value());
    EXPECT_DOUBLE_EQ(*spoken.confidence, 0.9);
}

TEST(MessagesTest, ParsesScoreAndReport) {
    const ScoreResult score = messages::ParseScore(json::parse(R"({
        "ok": true,
        "scores": {"content": 80, "pronunciation": 70, "fluency": 60, "overall": 72},
        "tips": ["Pause less", "Stress key words"]
    })"));
    EXPECT_EQ(score.scores.content, 80);
    EXPECT_EQ(score.scores.overall, 72);
    ASSERT_EQ(score.tips.size(), 2u);
    EXPECT_EQ(score.tips[1], "Stress key words");

    const SessionReport report = messages::ParseReport(json::parse(R"({
        "ok": true,
        "session_id": "s1",
        "overall_avg": 75,
        "turns": [
            {"qid": "q1", "q": "First?", "answer_text": "Yes", "scores": {"overall": 70}},
            {"qid": "q2", "q": "Second?", "answer_text": "No", "scores": {"overall": 80}}
        ]
    })"));
    EXPECT_EQ(report.sessionId, "s1");
    EXPECT_EQ(report.overallAverage, 75);
    ASSERT_EQ(report.turns.size(), 2u);
    EXPECT_EQ(report.turns[1].questionId, "q2");
    EXPECT_EQ(report.turns[1].scores.overall, 80);
    EXPECT_EQ(report.turns[0].scores.content, 0);
}

TEST(MessagesTest, ParsesSynthesizedAudio) {
    const std::vector<uint8_t> wav = {'R', 'I', 'F', 'F', 0, 1, 2};
    const SynthesizedAudio audio = messages::ParseSynthesizedAudio(
        json{{"ok", true}, {"audio", messages::EncodeBase64(wav)}});
    EXPECT_EQ(audio.audio, wav);
    EXPECT_EQ(audio.format, "audio/wav");
}
