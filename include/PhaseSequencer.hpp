#pragma once

#include "Network.hpp"
#include "SignalGuardian.hpp"

namespace signalnet
{
    // Two-phase light state machine: GREEN -> YELLOW -> (other pair) GREEN.
    // Every light change is validated by the guardian before it is applied.
    class PhaseSequencer
    {
    public:
        explicit PhaseSequencer(const SignalGuardian &guardian);

        // Starts the yellow clearance towards target. The new green lasts
        // green_duration and the next phase is scheduled at next_phase_time.
        // Returns false when target is already the current phase or a change
        // is already in flight.
        bool beginTransition(SignalState &signal, Phase target, double green_duration, double next_phase_time) const;

        // Advance time by dt_seconds. Returns true when the pending phase
        // turned green during this call.
        bool tick(SignalState &signal, double dt_seconds) const;

        // NS green, EW red
        static void reset(SignalState &signal, double phase_seconds);

    private:
        static void applyPhasePattern(Phase green_phase, SignalState &signal);

        const SignalGuardian &guardian;
    };

} // namespace signalnet
