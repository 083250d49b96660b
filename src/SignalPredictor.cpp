#include "SignalPredictor.hpp"

#include <algorithm>

namespace signalnet
{
    namespace
    {
        std::size_t bucketIndex(PressureBucket bucket)
        {
            return static_cast<std::size_t>(static_cast<uint8_t>(bucket));
        }

        std::array<PressurePair, 6> initialBaselines()
        {
            std::array<PressurePair, 6> table{};
            table[bucketIndex(PressureBucket::LowTraffic)] = {120.0, 125.0};
            table[bucketIndex(PressureBucket::HighEastWest)] = {85.1, 340.9};
            table[bucketIndex(PressureBucket::HighNorthSouth)] = {280.5, 120.3};
            table[bucketIndex(PressureBucket::Balanced)] = {150.2, 148.7};
            table[bucketIndex(PressureBucket::VeryHighEastWest)] = {45.2, 450.8};
            table[bucketIndex(PressureBucket::VeryHighNorthSouth)] = {380.6, 85.4};
            return table;
        }
    }

    const char *toString(PressureBucket bucket)
    {
        switch (bucket)
        {
        case PressureBucket::LowTraffic:
            return "low_traffic";
        case PressureBucket::HighEastWest:
            return "high_ew";
        case PressureBucket::HighNorthSouth:
            return "high_ns";
        case PressureBucket::Balanced:
            return "balanced";
        case PressureBucket::VeryHighEastWest:
            return "very_high_ew";
        case PressureBucket::VeryHighNorthSouth:
            return "very_high_ns";
        }
        return "balanced";
    }

    SignalPredictor::SignalPredictor(std::mt19937 &rng, double exploration_rate, double learning_rate)
        : rng(rng),
          exploration_rate(std::max(0.0, exploration_rate)),
          learning_rate(std::clamp(learning_rate, 0.0, 1.0)),
          q_table(initialBaselines())
    {
    }

    PressurePair SignalPredictor::calculatePressure(const std::vector<Platoon> &platoons)
    {
        PressurePair pressure;
        for (const auto &platoon : platoons)
        {
            const double contribution = static_cast<double>(platoon.vehicle_count) / std::max(platoon.eta, 1.0);
            if (phaseForDirection(platoon.direction) == Phase::NorthSouth)
            {
                pressure.north_south += contribution;
            }
            else
            {
                pressure.east_west += contribution;
            }
        }
        return pressure;
    }

    PressureBucket SignalPredictor::classify(const PressurePair &pressure)
    {
        const double total = pressure.north_south + pressure.east_west;
        if (total < 1.0)
        {
            return PressureBucket::LowTraffic;
        }

        const double ratio = pressure.east_west / (pressure.north_south + 0.1);
        if (ratio > 3.0)
            return PressureBucket::VeryHighEastWest;
        if (ratio > 2.0)
            return PressureBucket::HighEastWest;
        if (ratio < 0.33)
            return PressureBucket::VeryHighNorthSouth;
        if (ratio < 0.5)
            return PressureBucket::HighNorthSouth;
        return PressureBucket::Balanced;
    }

    PressurePair SignalPredictor::predict(const PressurePair &pressure)
    {
        PressurePair &baseline = q_table[bucketIndex(classify(pressure))];

        const double amplitude = exploration_rate * PRESSURE_WEIGHT / 2.0;
        auto noise = [this, amplitude]()
        {
            if (amplitude <= 0.0)
            {
                return 0.0;
            }
            std::uniform_real_distribution<double> dist(-amplitude, amplitude);
            return dist(rng);
        };

        PressurePair scores;
        scores.north_south = baseline.north_south + pressure.north_south * PRESSURE_WEIGHT + noise();
        scores.east_west = baseline.east_west + pressure.east_west * PRESSURE_WEIGHT + noise();

        baseline.north_south += learning_rate * (scores.north_south - baseline.north_south);
        baseline.east_west += learning_rate * (scores.east_west - baseline.east_west);
        return scores;
    }

    PhaseAction SignalPredictor::recommend(const PressurePair &scores)
    {
        return scores.east_west > scores.north_south ? PhaseAction::EastWest : PhaseAction::NorthSouth;
    }

    const PressurePair &SignalPredictor::getBaseline(PressureBucket bucket) const
    {
        return q_table[bucketIndex(bucket)];
    }

    void SignalPredictor::resetBaselines()
    {
        q_table = initialBaselines();
    }

} // namespace signalnet
