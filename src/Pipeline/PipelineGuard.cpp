#include "PipelineGuard.hpp"
#include "../common/RandomId.hpp"
#include "../common/debug_log.hpp"

#include <utility>

struct PipelineGuard::Lease::State {
    bool busy = false;
    uint64_t generation = 0;
    uint64_t recordingToken = 0;
};

PipelineGuard::Lease::Lease(std::shared_ptr<State> state, uint64_t generation, uint64_t recordingToken,
                            std::string correlationId)
    : _state(std::move(state))
    , _generation(generation)
    , _recordingToken(recordingToken)
    , _correlationId(std::move(correlationId)) {}

PipelineGuard::Lease::~Lease() {
    if (_state && _state->busy && _state->generation == _generation) {
        _state->busy = false;
        DEBUG_LOG("PipelineGuard: released generation " << _generation << DEBUG_LOG_ENDL);
    }
}

PipelineGuard::PipelineGuard() : _state(std::make_shared<Lease::State>()) {}

PipelineGuard::LeasePtr PipelineGuard::TryEnter(uint64_t recordingToken) {
    if (_state->busy) {
        DEBUG_LOG("PipelineGuard: busy with recording " << _state->recordingToken
                  << ", dropping recording " << recordingToken << DEBUG_LOG_ENDL);
        return nullptr;
    }

    _state->busy = true;
    _state->recordingToken = recordingToken;
    const uint64_t generation = ++_state->generation;

    // Lease has a private constructor, so make_shared is not available here
    return LeasePtr(new Lease(_state, generation, recordingToken, GenerateRandomId()));
}

bool PipelineGuard::IsBusy() const {
    return _state->busy;
}

uint64_t PipelineGuard::GetGeneration() const {
    return _state->generation;
}

uint64_t PipelineGuard::GetActiveRecordingToken() const {
    return _state->busy ? _state->recordingToken : 0;
}
