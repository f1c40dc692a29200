#include "AudioPlayer/AudioPlayer.hpp"
#include "AudioRecorder/AudioRecorder.hpp"
#include "AudioRecorder/RtAudioDevice.hpp"
#include "Backend/BackendClient.hpp"
#include "Config/TrainerConfig.hpp"
#include "Conversation/ConversationOrchestrator.hpp"
#include "Encoding/WavEncoder.hpp"
#include "common/debug_log.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

class TrainerApplication {
public:
    explicit TrainerApplication(TrainerConfig config)
        : _config(std::move(config)),
          _work(boost::asio::make_work_guard(_io)),
          _running(true) {
    }

    bool Run() {
        _devices = std::make_unique<RtAudioDeviceProvider>(_io, _config.device);
        _recorder = std::make_unique<AudioRecorder>(_io, *_devices, std::make_unique<WavEncoder>(),
                                                    _config.recorder, MakeCaptureContext(_config));
        _backend = std::make_unique<BackendClient>(_io, _config.backendUrl,
                                                   std::chrono::milliseconds(_config.requestTimeoutMs));
        if (_config.playbackEnabled) {
            _player = std::make_unique<AudioPlayer>(_io);
        }
        _orchestrator = std::make_unique<ConversationOrchestrator>(*_backend, _player.get(), _config.session);

        _recorder->SetOnStateCallback([](RecorderState state) {
            std::cout << "[REC] " << GetRecorderStateName(state) << std::endl;
        });
        _recorder->SetOnErrorCallback([](CaptureErrorKind kind, const std::string& message) {
            std::cout << "[STATUS] error: " << GetCaptureErrorName(kind) << ": " << message << std::endl;
        });
        _recorder->SetOnSilenceCallback([](uint64_t) {
            std::cout << "[STATUS] info: Silence detected, stopping" << std::endl;
        });
        _recorder->SetOnUtteranceCallback([this](const Utterance& utterance) {
            std::cout << "[STATUS] info: Captured " << utterance.durationSeconds << " s" << std::endl;
            _orchestrator->HandleUtterance(utterance);
        });

        _orchestrator->SetOnStateCallback([](ConversationState state) {
            std::cout << "[STATE] " << GetConversationStateName(state) << std::endl;
        });
        _orchestrator->SetOnStatusCallback([](StatusKind kind, const std::string& message) {
            std::cout << "[STATUS] " << GetStatusKindName(kind) << ": " << message << std::endl;
        });

        if (!_backend->Connect()) {
            std::cerr << "Failed to connect to backend " << _config.backendUrl << std::endl;
            return false;
        }
        if (_config.warmUp) {
            _orchestrator->WarmUp();
        }

        PrintHelp();

        std::thread input([this]() { ReadCommands(); });
        _io.run();

        if (input.joinable()) {
            input.join();
        }
        return true;
    }

private:
    // Runs on its own thread; every command executes on the scheduler
    void ReadCommands() {
        std::string line;
        while (_running && std::getline(std::cin, line)) {
            boost::asio::post(_io, [this, line]() { ProcessCommand(line); });
            if (line == "quit" || line == "exit") {
                return;
            }
        }
        boost::asio::post(_io, [this]() { Shutdown(); });
    }

    void ProcessCommand(const std::string& line) {
        std::istringstream in(line);
        std::string command;
        in >> command;
        std::string argument;
        std::getline(in, argument);

        if (command.empty()) {
            return;
        }
        else if (command == "start") {
            _orchestrator->StartSession(_config.session);
        }
        else if (command == "rec") {
            if (_player) {
                _player->Stop();
            }
            _recorder->StartRecording();
        }
        else if (command == "stop") {
            _recorder->StopRecording();
        }
        else if (command == "cancel") {
            _recorder->CancelRecording();
        }
        else if (command == "next") {
            _orchestrator->NextQuestion();
        }
        else if (command == "score") {
            _orchestrator->ScoreAnswer();
        }
        else if (command == "report") {
            _orchestrator->FetchReport([](RemoteResult<SessionReport> result) {
                if (result) {
                    PrintReport(*result.value);
                }
            });
        }
        else if (command == "say") {
            _orchestrator->SpeakText(argument);
        }
        else if (command == "answer") {
            _orchestrator->AnswerText(argument);
        }
        else if (command == "status") {
            PrintStatus();
        }
        else if (command == "quit" || command == "exit") {
            Shutdown();
        }
        else if (command == "help") {
            PrintHelp();
        }
        else {
            std::cout << "Unknown command: " << command << std::endl;
            PrintHelp();
        }
    }

    void Shutdown() {
        if (!_running) return;
        _running = false;
        _recorder->CancelRecording();
        if (_player) {
            _player->Stop();
        }
        _backend->Disconnect();
        _work.reset();
        _io.stop();
    }

    void PrintStatus() const {
        const ConversationSnapshot snapshot = _orchestrator->GetSnapshot();
        std::cout << "State:      " << GetConversationStateName(snapshot.state) << std::endl;
        std::cout << "Recorder:   " << GetRecorderStateName(_recorder->GetState())
                  << (_recorder->IsVadActive() ? " (VAD on)" : " (VAD off)") << std::endl;
        const SessionContext& context = _orchestrator->GetContext();
        std::cout << "Session:    " << (snapshot.session.sessionId.empty() ? "-" : snapshot.session.sessionId)
                  << " (" << context.role << ", " << context.level << ", " << context.mode << ")" << std::endl;
        std::cout << "Question:   " << snapshot.session.questionText << std::endl;
        if (!snapshot.session.lastTranscript.empty()) {
            std::cout << "You said:   " << snapshot.session.lastTranscript << std::endl;
        }
        if (snapshot.session.lastScore) {
            std::cout << "Last score: " << snapshot.session.lastScore->scores.overall << std::endl;
        }
        if (_recorder->GetLastDurationSeconds() > 0.0) {
            std::cout << "Last take:  " << _recorder->GetLastDurationSeconds() << " s" << std::endl;
        }
        std::cout << "Pipeline:   " << (snapshot.pipelineBusy ? "busy" : "idle") << std::endl;
        for (const auto& message : snapshot.history) {
            const char* who = message.author == ChatMessage::Author::User ? "you" :
                              message.author == ChatMessage::Author::Tutor ? "tutor" : "bot";
            std::cout << "  " << who << ": " << message.text << std::endl;
        }
    }

    static void PrintReport(const SessionReport& report) {
        std::cout << "\n=== Session " << report.sessionId << " ===" << std::endl;
        for (const auto& turn : report.turns) {
            std::cout << "Q: " << turn.questionText << std::endl;
            std::cout << "A: " << turn.answerText << std::endl;
            std::cout << "   overall " << turn.scores.overall << ", content " << turn.scores.content
                      << ", pronunciation " << turn.scores.pronunciation
                      << ", fluency " << turn.scores.fluency << std::endl;
        }
        std::cout << "Average: " << report.overallAverage << "\n" << std::endl;
    }

    void PrintHelp() {
        std::cout << "\n=== SpeakTrainer ===" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  start         - Start a practice session" << std::endl;
        std::cout << "  rec           - Start recording an answer" << std::endl;
        std::cout << "  stop          - Stop recording and submit" << std::endl;
        std::cout << "  cancel        - Discard the current recording" << std::endl;
        std::cout << "  next          - Next question" << std::endl;
        std::cout << "  score         - Score the last answer" << std::endl;
        std::cout << "  report        - Show the session report" << std::endl;
        std::cout << "  say <text>    - Speak text aloud" << std::endl;
        std::cout << "  answer <text> - Submit a typed answer" << std::endl;
        std::cout << "  status        - Show the current session" << std::endl;
        std::cout << "  help          - Show this help" << std::endl;
        std::cout << "  quit          - Exit application" << std::endl;
        std::cout << "====================\n" << std::endl;
    }

    TrainerConfig _config;
    boost::asio::io_context _io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> _work;
    std::atomic<bool> _running;

    std::unique_ptr<RtAudioDeviceProvider> _devices;
    std::unique_ptr<AudioRecorder> _recorder;
    std::unique_ptr<BackendClient> _backend;
    std::unique_ptr<AudioPlayer> _player;
    std::unique_ptr<ConversationOrchestrator> _orchestrator;
};

int main(int argc, char* argv[]) {
    TrainerConfig config;
    std::string backendUrl;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config = LoadTrainerConfig(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [--config <file.json>] [backend_url]" << std::endl;
                std::cout << "Example: " << argv[0] << " ws://localhost:8000/ws" << std::endl;
                return 0;
            } else {
                backendUrl = arg;
            }
        }

        ApplyEnvironment(config);
        if (!backendUrl.empty()) {
            config.backendUrl = backendUrl;
        }
        ValidateConfig(config);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    TrainerApplication app(std::move(config));
    return app.Run() ? 0 : 1;
}
