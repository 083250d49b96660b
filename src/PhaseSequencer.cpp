#include "PhaseSequencer.hpp"

#include <algorithm>

namespace signalnet
{
    PhaseSequencer::PhaseSequencer(const SignalGuardian &guardian)
        : guardian(guardian)
    {
    }

    void PhaseSequencer::reset(SignalState &signal, double phase_seconds)
    {
        signal = SignalState{};
        signal.current_phase = Phase::NorthSouth;
        applyPhasePattern(Phase::NorthSouth, signal);
        signal.phase_time_remaining = phase_seconds;
        signal.next_phase_time = phase_seconds;
    }

    void PhaseSequencer::applyPhasePattern(Phase green_phase, SignalState &signal)
    {
        signal.north_south = green_phase == Phase::NorthSouth ? LightColor::Green : LightColor::Red;
        signal.east_west = green_phase == Phase::EastWest ? LightColor::Green : LightColor::Red;
    }

    bool PhaseSequencer::beginTransition(SignalState &signal, Phase target, double green_duration, double next_phase_time) const
    {
        if (signal.transition_pending || signal.current_phase == target)
        {
            return false;
        }

        SignalState next_state = signal;
        if (signal.current_phase == Phase::NorthSouth)
        {
            next_state.north_south = LightColor::Yellow;
        }
        else
        {
            next_state.east_west = LightColor::Yellow;
        }

        if (!guardian.isValidTransition(signal, next_state, 0.0))
        {
            return false;
        }

        next_state.transition_pending = true;
        next_state.pending_phase = target;
        next_state.yellow_time_remaining = guardian.getYellowDuration();
        next_state.pending_duration = std::max(0.0, green_duration);
        next_state.pending_next_phase_time = std::max(next_state.pending_duration, next_phase_time);
        signal = next_state;
        return true;
    }

    bool PhaseSequencer::tick(SignalState &signal, double dt_seconds) const
    {
        signal.phase_time_remaining = std::max(0.0, signal.phase_time_remaining - dt_seconds);
        signal.next_phase_time = std::max(0.0, signal.next_phase_time - dt_seconds);

        if (!signal.transition_pending)
        {
            return false;
        }

        signal.yellow_time_remaining -= dt_seconds;
        if (signal.yellow_time_remaining > 0.0)
        {
            return false;
        }

        SignalState next_state = signal;
        next_state.current_phase = signal.pending_phase;
        applyPhasePattern(signal.pending_phase, next_state);

        // Validate transition with the guardian
        if (!guardian.isValidTransition(signal, next_state, guardian.getYellowDuration()))
        {
            return false;
        }

        next_state.transition_pending = false;
        next_state.yellow_time_remaining = 0.0;
        next_state.phase_time_remaining = signal.pending_duration;
        next_state.next_phase_time = signal.pending_next_phase_time;
        signal = next_state;
        return true;
    }

} // namespace signalnet
