#pragma once

#include "Network.hpp"

#include <array>
#include <random>
#include <vector>

namespace signalnet
{
    enum class PressureBucket : uint8_t
    {
        LowTraffic,
        HighEastWest,
        HighNorthSouth,
        Balanced,
        VeryHighEastWest,
        VeryHighNorthSouth
    };

    const char *toString(PressureBucket bucket);

    // Heuristic phase scorer. Each traffic bucket keeps a pair of baseline
    // scores that drift towards the scores it produces.
    class SignalPredictor
    {
    public:
        SignalPredictor(std::mt19937 &rng, double exploration_rate = 0.2, double learning_rate = 0.1);

        // Sum of count / max(eta, 1) per phase.
        static PressurePair calculatePressure(const std::vector<Platoon> &platoons);
        static PressureBucket classify(const PressurePair &pressure);

        // Scores both phases for the given pressure and updates the bucket.
        PressurePair predict(const PressurePair &pressure);

        // EW only wins when it scores strictly higher.
        static PhaseAction recommend(const PressurePair &scores);

        const PressurePair &getBaseline(PressureBucket bucket) const;
        void resetBaselines();

        static constexpr double PRESSURE_WEIGHT = 20.0;

    private:
        std::mt19937 &rng;
        double exploration_rate;
        double learning_rate;
        std::array<PressurePair, 6> q_table;
    };

} // namespace signalnet
