#pragma once

#include "RoadNetwork.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <utility>

namespace greenwave
{

    class SafetyChecker
    {
    public:
        explicit SafetyChecker(double safety_radius = SAFETY_RADIUS);

        // True as soon as any vehicle on a non-empty road comes closer than the
        // safety radius to a vehicle on a conflicting non-empty road.
        bool detectCollision(const RoadNetwork &network, const std::set<RoadId> &non_empty) const;

        // Ids of the first offending pair found, if any.
        std::optional<std::pair<uint32_t, uint32_t>> findCollision(const RoadNetwork &network,
                                                                   const std::set<RoadId> &non_empty) const;

        double radius() const { return safety_radius; }

        static constexpr double SAFETY_RADIUS = 3.0;

    private:
        double safety_radius;
    };

} // namespace greenwave
