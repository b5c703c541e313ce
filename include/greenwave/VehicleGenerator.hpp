#pragma once

#include "RoadNetwork.hpp"
#include "Vehicle.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <set>
#include <vector>

namespace greenwave
{
    using RoadPath = std::vector<RoadId>;

    struct WeightedPath
    {
        double weight = 1.0;
        RoadPath path;
    };

    // Route table entry as written in scenarios: one weight shared by one or
    // more alternative paths.
    struct RouteOption
    {
        double weight = 1.0;
        std::vector<RoadPath> alternatives;
    };

    // Flattens nested alternatives into one (weight, path) pair each. Empty
    // paths are dropped.
    std::vector<WeightedPath> normalizeRoutes(const std::vector<RouteOption> &routes);

    struct GenerationSpec
    {
        double vehicles_per_minute = 0.0;
        std::vector<WeightedPath> paths;
    };

    class VehicleGenerator
    {
    public:
        // Throws std::invalid_argument on an empty path.
        VehicleGenerator(GenerationSpec spec, uint32_t seed, DriverProfile driver = DriverProfile{});

        // Places at most one vehicle. Returns the road it was placed on.
        std::optional<RoadId> update(double now, std::size_t generated_so_far, RoadNetwork &network);

        const std::set<RoadId> &inboundRoads() const { return inbound_roads; }
        const std::set<RoadId> &outboundRoads() const { return outbound_roads; }
        const GenerationSpec &spec() const { return generation_spec; }

        // Seconds between two placements; infinite for a non-positive rate.
        double spawnInterval() const;

    private:
        void drawUpcomingPath();

        GenerationSpec generation_spec;
        DriverProfile driver_profile;
        std::mt19937 rng;
        std::discrete_distribution<std::size_t> path_choice;
        std::set<RoadId> inbound_roads;
        std::set<RoadId> outbound_roads;

        double last_added_time = 0.0;
        std::optional<std::size_t> upcoming_path;
    };

} // namespace greenwave
