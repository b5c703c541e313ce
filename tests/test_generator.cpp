#include <catch2/catch.hpp>
#include <cmath>
#include "greenwave/VehicleGenerator.hpp"

using namespace greenwave;

namespace
{
    RoadNetwork straightRoads(std::size_t count)
    {
        RoadNetwork network;
        for (std::size_t i = 0; i < count; ++i)
        {
            network.addRoad({0.0, 10.0 * static_cast<double>(i)}, {100.0, 10.0 * static_cast<double>(i)});
        }
        return network;
    }

    void clearRoads(RoadNetwork &network)
    {
        for (auto &road : network.roads())
        {
            road.vehicles().clear();
        }
    }
}

TEST_CASE("Nested route alternatives are flattened per weight", "[generator]")
{
    std::vector<RouteOption> routes = {
        {2.0, {{0, 1}, {}, {3}}},
        {0.5, {{4}}},
    };

    std::vector<WeightedPath> flat = normalizeRoutes(routes);
    REQUIRE(flat.size() == 3);
    REQUIRE(flat[0].weight == 2.0);
    REQUIRE(flat[0].path == RoadPath{0, 1});
    REQUIRE(flat[1].weight == 2.0);
    REQUIRE(flat[1].path == RoadPath{3});
    REQUIRE(flat[2].weight == 0.5);
}

TEST_CASE("Inbound and outbound roads are derived from the paths", "[generator]")
{
    GenerationSpec spec{30.0, {{1.0, {0, 2}}, {1.0, {1}}}};
    VehicleGenerator generator(spec, 7);

    REQUIRE(generator.inboundRoads() == std::set<RoadId>{0, 1});
    REQUIRE(generator.outboundRoads() == std::set<RoadId>{2});
    REQUIRE(generator.spawnInterval() == Catch::Detail::Approx(2.0));
}

TEST_CASE("Generator waits for the interval and for room on the entry road", "[generator]")
{
    RoadNetwork network = straightRoads(1);
    VehicleGenerator generator({60.0, {{1.0, {0}}}}, 1);

    REQUIRE_FALSE(generator.update(0.5, 0, network).has_value());

    auto placed = generator.update(1.0, 0, network);
    REQUIRE(placed.has_value());
    REQUIRE(*placed == 0);
    REQUIRE(network.road(0).vehicles().size() == 1);
    REQUIRE(network.road(0).vehicles().back().id == 0);

    REQUIRE_FALSE(generator.update(1.5, 1, network).has_value());

    // Interval elapsed but the last vehicle still blocks the entry.
    REQUIRE_FALSE(generator.update(2.0, 1, network).has_value());

    network.road(0).vehicles().back().x = 9.0;
    placed = generator.update(2.0, 1, network);
    REQUIRE(placed.has_value());
    REQUIRE(network.road(0).vehicles().size() == 2);
    REQUIRE(network.road(0).vehicles().back().id == 1);
}

TEST_CASE("Zero-weight paths are never chosen", "[generator]")
{
    RoadNetwork network = straightRoads(2);
    VehicleGenerator generator({60.0, {{0.0, {0}}, {1.0, {1}}}}, 11);

    for (int t = 1; t <= 30; ++t)
    {
        auto placed = generator.update(static_cast<double>(t), 0, network);
        REQUIRE(placed.has_value());
        REQUIRE(*placed == 1);
        clearRoads(network);
    }
}

TEST_CASE("Route choice is reproducible for a given seed", "[generator]")
{
    GenerationSpec spec{60.0, {{1.0, {0}}, {1.0, {1}}, {2.0, {2}}}};

    auto draw = [&spec](uint32_t seed)
    {
        RoadNetwork network = straightRoads(3);
        VehicleGenerator generator(spec, seed);
        std::vector<RoadId> sequence;
        for (int t = 1; t <= 40; ++t)
        {
            auto placed = generator.update(static_cast<double>(t), 0, network);
            if (placed.has_value())
            {
                sequence.push_back(*placed);
            }
            clearRoads(network);
        }
        return sequence;
    };

    std::vector<RoadId> first = draw(5);
    REQUIRE(first.size() == 40);
    REQUIRE(first == draw(5));
}

TEST_CASE("Non-positive rates never generate", "[generator]")
{
    RoadNetwork network = straightRoads(1);
    VehicleGenerator idle({0.0, {{1.0, {0}}}}, 3);
    REQUIRE(std::isinf(idle.spawnInterval()));
    REQUIRE_FALSE(idle.update(1000.0, 0, network).has_value());

    VehicleGenerator no_paths({60.0, {}}, 3);
    REQUIRE_FALSE(no_paths.update(1000.0, 0, network).has_value());
}
