#include "SignalController.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace signalnet
{
    SignalController::SignalController(const SimulationConfig &config, std::mt19937 &rng)
        : config(config),
          predictor(rng, config.exploration_rate, config.learning_rate),
          guardian(config.min_green_seconds, config.max_green_seconds, config.yellow_seconds),
          sequencer(guardian)
    {
    }

    AIDecision SignalController::decide(const std::vector<Platoon> &platoons, const SignalState &signal, double now, bool system_healthy)
    {
        AIDecision decision;
        decision.pressure_analysis = SignalPredictor::calculatePressure(platoons);
        decision.q_values = predictor.predict(decision.pressure_analysis);

        PhaseAction action = SignalPredictor::recommend(decision.q_values);
        decision.guardian_checks = guardian.validate(action, signal, now, system_healthy);
        if (!decision.guardian_checks.allPassed())
        {
            action = PhaseAction::Hold;
        }
        decision.recommended_action = action;
        decision.timing_plan = planTiming(action, signal.current_phase, platoons);
        return decision;
    }

    TimingPlan SignalController::planTiming(PhaseAction action, Phase current_phase, const std::vector<Platoon> &platoons) const
    {
        const Phase phase = action == PhaseAction::Hold
                                ? current_phase
                                : (action == PhaseAction::NorthSouth ? Phase::NorthSouth : Phase::EastWest);

        std::size_t load = 0;
        double earliest_eta = std::numeric_limits<double>::infinity();
        for (const auto &platoon : platoons)
        {
            if (phaseForDirection(platoon.direction) != phase)
            {
                continue;
            }
            load += platoon.vehicle_count;
            earliest_eta = std::min(earliest_eta, platoon.eta);
        }

        const double flow = config.saturation_flow_rate > 0.0 ? config.saturation_flow_rate : 1.0;
        const double green = std::clamp(static_cast<double>(load) / flow, config.min_plan_duration, config.max_plan_duration);

        TimingPlan plan;
        plan.duration = std::round(green + config.plan_buffer_seconds);
        plan.start_time = std::isfinite(earliest_eta) ? std::max(0.0, earliest_eta - config.plan_lead_seconds) : 0.0;
        plan.end_time = plan.start_time + plan.duration;
        return plan;
    }

    bool SignalController::applyDecision(SignalState &signal, const AIDecision &decision, double now, bool system_healthy)
    {
        PhaseAction action = decision.recommended_action;
        const Phase waiting = oppositePhase(signal.current_phase);
        if (!signal.transition_pending && guardian.maxGreenElapsed(now) &&
            decision.pressure_analysis.forPhase(waiting) > 0.0)
        {
            // Past max green a waiting axis gets the green whatever was proposed
            action = actionForPhase(waiting);
        }
        if (action == PhaseAction::Hold || actionMatchesPhase(action, signal.current_phase) || signal.transition_pending)
        {
            return false;
        }
        if (signal.phase_time_remaining > 0.0 && !guardian.maxGreenElapsed(now))
        {
            return false;
        }
        if (!guardian.validate(action, signal, now, system_healthy).allPassed())
        {
            return false;
        }

        const Phase target = action == PhaseAction::NorthSouth ? Phase::NorthSouth : Phase::EastWest;
        if (!sequencer.beginTransition(signal, target, decision.timing_plan.duration, decision.timing_plan.end_time))
        {
            return false;
        }
        guardian.recordPhaseChange(now);
        return true;
    }

    bool SignalController::advance(SignalState &signal, double dt_seconds)
    {
        return sequencer.tick(signal, dt_seconds);
    }

    std::vector<Platoon> collectIncomingPlatoons(const NetworkState &state, const Intersection &intersection)
    {
        struct Accumulator
        {
            std::size_t count = 0;
            double distance = 0.0;
            double speed = 0.0;
        };
        std::array<Accumulator, 4> by_direction{};

        for (const auto &entry : state.vehicles)
        {
            const Vehicle &vehicle = entry.second;

            double distance = 0.0;
            if (vehicle.current_intersection_id == intersection.id)
            {
                distance = 0.0;
            }
            else if (vehicle.isOnRoad() && !vehicle.route.empty() &&
                     vehicle.route.front().to_intersection_id == intersection.id)
            {
                distance = std::max(0.0, vehicle.route.front().distance_remaining);
            }
            else
            {
                continue;
            }

            const RouteSegment *next = departingSegment(vehicle, intersection.id);
            const Road *road = next ? findRoad(state, next->road_id) : nullptr;
            if (!road)
            {
                continue;
            }

            Accumulator &acc = by_direction[directionIndex(road->direction)];
            acc.count++;
            acc.distance += distance;
            acc.speed += vehicle.speed;
        }

        std::vector<Platoon> platoons;
        for (CompassDirection direction : kAllDirections)
        {
            const Accumulator &acc = by_direction[directionIndex(direction)];
            if (acc.count == 0)
            {
                continue;
            }

            Platoon platoon;
            platoon.direction = direction;
            platoon.vehicle_count = acc.count;
            platoon.speed = acc.speed / static_cast<double>(acc.count);
            const double mean_distance = acc.distance / static_cast<double>(acc.count);
            platoon.eta = platoon.speed > 0.0 ? mean_distance / (platoon.speed / 3.6) : 0.0;
            platoons.push_back(platoon);
        }
        return platoons;
    }

} // namespace signalnet
