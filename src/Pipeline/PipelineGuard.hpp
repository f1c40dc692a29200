#pragma once

#include <cstdint>
#include <memory>
#include <string>

// Admits at most one utterance pipeline (submit -> reply -> playback) at a time.
//
// TryEnter() hands out a Lease that stays valid until the last copy of it is destroyed, so the
// busy flag is cleared on every exit path of an asynchronous chain: success, failure, a thrown
// exception unwinding a handler, or a completion that is simply never called. Each lease carries
// the generation it was issued under; releasing a stale generation is a no-op.
class PipelineGuard {
public:
    class Lease {
    public:
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        uint64_t GetGeneration() const { return _generation; }
        uint64_t GetRecordingToken() const { return _recordingToken; }
        // Shared by every remote call of this turn so the receiver can spot duplicates
        const std::string& GetCorrelationId() const { return _correlationId; }

    private:
        friend class PipelineGuard;
        struct State;

        Lease(std::shared_ptr<State> state, uint64_t generation, uint64_t recordingToken,
              std::string correlationId);

        std::shared_ptr<State> _state;
        uint64_t _generation;
        uint64_t _recordingToken;
        std::string _correlationId;
    };

    using LeasePtr = std::shared_ptr<Lease>;

    PipelineGuard();

    // Returns nullptr when a pipeline is already in flight
    LeasePtr TryEnter(uint64_t recordingToken);

    bool IsBusy() const;
    uint64_t GetGeneration() const;
    uint64_t GetActiveRecordingToken() const;

private:
    std::shared_ptr<Lease::State> _state;
};
