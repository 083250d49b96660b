#include "SignalGuardian.hpp"

#include <algorithm>

namespace signalnet
{
    SignalGuardian::SignalGuardian(double min_green_seconds, double max_green_seconds, double yellow_seconds)
        : min_green(std::max(0.0, min_green_seconds)),
          max_green(std::max(min_green_seconds, max_green_seconds)),
          yellow_duration(std::max(0.0, yellow_seconds))
    {
    }

    GuardianChecks SignalGuardian::validate(PhaseAction proposed, const SignalState &signal, double now, bool system_healthy) const
    {
        GuardianChecks checks;
        checks.min_green_time = timeInPhase(now) >= min_green || maxGreenElapsed(now);

        // Staying put is always safe; a change is not while a clearance runs.
        const bool is_change = proposed != PhaseAction::Hold && !actionMatchesPhase(proposed, signal.current_phase);
        checks.safe_transition = !is_change || (!signal.anyYellow() && !signal.transition_pending);

        checks.system_health = system_healthy;
        return checks;
    }

    void SignalGuardian::recordPhaseChange(double now)
    {
        last_change_time = now;
    }

    double SignalGuardian::timeInPhase(double now) const
    {
        return std::max(0.0, now - last_change_time);
    }

    bool SignalGuardian::maxGreenElapsed(double now) const
    {
        return timeInPhase(now) >= max_green;
    }

    bool SignalGuardian::isSafe(const SignalState &state) const
    {
        return hasConflictingGreens(state) && checkPhaseMatchesLights(state);
    }

    bool SignalGuardian::hasConflictingGreens(const SignalState &state) const
    {
        return !(state.north_south == LightColor::Green && state.east_west == LightColor::Green);
    }

    bool SignalGuardian::checkPhaseMatchesLights(const SignalState &state) const
    {
        // Only the pair owning the phase may show green
        const Phase other = oppositePhase(state.current_phase);
        return state.colorFor(other) != LightColor::Green;
    }

    bool SignalGuardian::isValidTransition(const SignalState &prev, const SignalState &next, double yellow_elapsed) const
    {
        return checkPerPairTransitions(prev, next) &&
               checkYellowTiming(prev, next, yellow_elapsed) &&
               isSafe(next) &&
               checkCrossingSafety(prev, next);
    }

    bool SignalGuardian::checkPerPairTransitions(const SignalState &prev, const SignalState &next) const
    {
        auto valid_for_pair = [](LightColor p, LightColor n)
        {
            if (p == n)
                return true;
            if (p == LightColor::Green && n == LightColor::Yellow)
                return true;
            if (p == LightColor::Yellow && n == LightColor::Red)
                return true;
            if (p == LightColor::Red && n == LightColor::Green)
                return true;
            return false;
        };

        return valid_for_pair(prev.north_south, next.north_south) &&
               valid_for_pair(prev.east_west, next.east_west);
    }

    bool SignalGuardian::checkYellowTiming(const SignalState &prev, const SignalState &next, double yellow_elapsed) const
    {
        auto check_yellow_duration = [this, yellow_elapsed](LightColor p, LightColor n)
        {
            return !((p == LightColor::Yellow && n == LightColor::Red) && yellow_elapsed < yellow_duration);
        };

        return check_yellow_duration(prev.north_south, next.north_south) &&
               check_yellow_duration(prev.east_west, next.east_west);
    }

    bool SignalGuardian::checkCrossingSafety(const SignalState &prev, const SignalState &next) const
    {
        auto is_active = [](LightColor c)
        { return c == LightColor::Green || c == LightColor::Yellow; };

        bool ns_going_green = prev.north_south != LightColor::Green && next.north_south == LightColor::Green;
        bool ew_going_green = prev.east_west != LightColor::Green && next.east_west == LightColor::Green;

        // A pair may only turn green once the crossing pair is fully red
        if (ns_going_green && is_active(next.east_west))
            return false;
        if (ew_going_green && is_active(next.north_south))
            return false;

        return true;
    }

} // namespace signalnet
