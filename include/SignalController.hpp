#pragma once

#include "Network.hpp"
#include "NetworkConfig.hpp"
#include "PhaseSequencer.hpp"
#include "SignalGuardian.hpp"
#include "SignalPredictor.hpp"

#include <random>
#include <vector>

namespace signalnet
{
    // Per-intersection signal control: predictor proposal, guardian gate,
    // timing plan and the phase state machine.
    class SignalController
    {
    public:
        SignalController(const SimulationConfig &config, std::mt19937 &rng);

        SignalController(const SignalController &) = delete;
        SignalController &operator=(const SignalController &) = delete;

        AIDecision decide(const std::vector<Platoon> &platoons, const SignalState &signal, double now, bool system_healthy);

        // Green duration and window for the given action. HOLD plans for the
        // phase currently shown.
        TimingPlan planTiming(PhaseAction action, Phase current_phase, const std::vector<Platoon> &platoons) const;

        // Starts a phase change when the (possibly coordinated) decision asks
        // for one, the current green has run out or reached max green, and the
        // guardian approves. Once max green has elapsed the opposite axis is
        // taken whenever the decision's pressure analysis shows demand on it.
        // Returns true when a change was started.
        bool applyDecision(SignalState &signal, const AIDecision &decision, double now, bool system_healthy);

        // Runs the light timers. Returns true when a new green started.
        bool advance(SignalState &signal, double dt_seconds);

        SignalGuardian &getGuardian() { return guardian; }
        const SignalGuardian &getGuardian() const { return guardian; }

    private:
        const SimulationConfig &config;
        SignalPredictor predictor;
        SignalGuardian guardian;
        PhaseSequencer sequencer;
    };

    // One platoon per direction of vehicles queued at, or travelling towards,
    // the intersection, keyed by the direction of the road they will leave on.
    // Vehicles ending their trip there are not included.
    std::vector<Platoon> collectIncomingPlatoons(const NetworkState &state, const Intersection &intersection);

} // namespace signalnet
