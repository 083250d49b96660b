#pragma once

#include "Network.hpp"

namespace signalnet
{
    // Safety gate for phase changes at one intersection. Times are simulation
    // seconds.
    class SignalGuardian
    {
    public:
        SignalGuardian(double min_green_seconds = 5.0, double max_green_seconds = 45.0, double yellow_seconds = 2.0);

        // Evaluates the three checks for a proposed action. Does not record
        // anything; see recordPhaseChange().
        GuardianChecks validate(PhaseAction proposed, const SignalState &signal, double now, bool system_healthy) const;

        void recordPhaseChange(double now);
        double timeInPhase(double now) const;
        bool maxGreenElapsed(double now) const;

        // Public validation methods
        bool isSafe(const SignalState &state) const;
        bool isValidTransition(const SignalState &prev, const SignalState &next, double yellow_elapsed) const;

        double getMinGreen() const { return min_green; }
        double getMaxGreen() const { return max_green; }
        double getYellowDuration() const { return yellow_duration; }
        double getLastChangeTime() const { return last_change_time; }

    private:
        // Helper methods for isSafe()
        bool hasConflictingGreens(const SignalState &state) const;
        bool checkPhaseMatchesLights(const SignalState &state) const;

        // Helper methods for isValidTransition()
        bool checkPerPairTransitions(const SignalState &prev, const SignalState &next) const;
        bool checkYellowTiming(const SignalState &prev, const SignalState &next, double yellow_elapsed) const;
        bool checkCrossingSafety(const SignalState &prev, const SignalState &next) const;

        double min_green;
        double max_green;
        double yellow_duration;
        double last_change_time = 0.0;
    };

} // namespace signalnet
