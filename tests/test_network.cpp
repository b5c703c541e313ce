#include <catch2/catch.hpp>
#include <stdexcept>
#include "greenwave/RoadNetwork.hpp"
#include "greenwave/SafetyChecker.hpp"
#include "greenwave/VehicleKinematics.hpp"

using namespace greenwave;

namespace
{
    RoadNetwork crossingNetwork()
    {
        RoadNetwork network;
        network.addRoads({{{0, 0}, {20, 0}},
                          {{10, -10}, {10, 10}},
                          {{0, 50}, {20, 50}}});
        return network;
    }

    Vehicle vehicleAt(uint32_t id, RoadId road, double x)
    {
        Vehicle vehicle(id, {road});
        vehicle.x = x;
        return vehicle;
    }
}

TEST_CASE("Roads get sequential ids and their geometric length", "[network]")
{
    RoadNetwork network;
    REQUIRE(network.addRoad({0, 0}, {3, 4}) == 0);
    REQUIRE(network.addRoad({0, 0}, {10, 0}) == 1);
    REQUIRE(network.size() == 2);
    REQUIRE(network.road(0).length() == Catch::Detail::Approx(5.0));
    REQUIRE(network.road(1).id() == 1);
}

TEST_CASE("Conflict graph is symmetrized at registration", "[network]")
{
    RoadNetwork network = crossingNetwork();
    network.addIntersections({{0, {1, 0}}});

    REQUIRE(network.conflicts().at(0) == std::set<RoadId>{1});
    REQUIRE(network.conflicts().at(1) == std::set<RoadId>{0});
    REQUIRE(network.conflicts().count(2) == 0);
}

TEST_CASE("Active conflicts only keep non-empty partners", "[network]")
{
    RoadNetwork network = crossingNetwork();
    network.addIntersections({{0, {1, 2}}});

    ConflictGraph active = network.activeConflicts({0, 2});
    REQUIRE(active.size() == 2);
    REQUIRE(active.at(0) == std::set<RoadId>{2});
    REQUIRE(active.at(2) == std::set<RoadId>{0});

    REQUIRE(network.activeConflicts({1}).empty());
    REQUIRE(network.activeConflicts({}).empty());
}

TEST_CASE("Out-of-range road references throw", "[network]")
{
    RoadNetwork network = crossingNetwork();
    REQUIRE_THROWS_AS(network.addIntersections({{0, {3}}}), std::out_of_range);
    REQUIRE_THROWS_AS(network.addIntersections({{9, {0}}}), std::out_of_range);
    REQUIRE_THROWS_AS(network.road(3), std::out_of_range);

    // A rejected table leaves the graph untouched.
    REQUIRE(network.conflicts().empty());
}

TEST_CASE("Vehicles on conflicting roads closer than the radius collide", "[network]")
{
    RoadNetwork network = crossingNetwork();
    network.addIntersections({{0, {1}}});
    network.road(0).enqueue(vehicleAt(1, 0, 10.0));
    network.road(1).enqueue(vehicleAt(2, 1, 9.0));

    SafetyChecker checker;
    REQUIRE(checker.radius() == SafetyChecker::SAFETY_RADIUS);
    REQUIRE(checker.detectCollision(network, {0, 1}));

    auto pair = checker.findCollision(network, {0, 1});
    REQUIRE(pair.has_value());
    REQUIRE(((pair->first == 1 && pair->second == 2) || (pair->first == 2 && pair->second == 1)));
}

TEST_CASE("Distant or non-conflicting vehicles do not collide", "[network]")
{
    RoadNetwork network = crossingNetwork();
    network.addIntersections({{0, {1}}});
    network.road(0).enqueue(vehicleAt(1, 0, 2.0));
    network.road(1).enqueue(vehicleAt(2, 1, 18.0));
    // Road 2 has no conflicts; overlap with road 0 would not count anyway.
    network.road(2).enqueue(vehicleAt(3, 2, 2.0));

    SafetyChecker checker;
    REQUIRE_FALSE(checker.detectCollision(network, {0, 1, 2}));
}

TEST_CASE("Vehicles sharing a road are not checked against each other", "[network]")
{
    RoadNetwork network = crossingNetwork();
    network.addIntersections({{0, {1}}});
    network.road(0).enqueue(vehicleAt(1, 0, 5.0));
    network.road(0).enqueue(vehicleAt(2, 0, 4.0));

    SafetyChecker checker;
    REQUIRE_FALSE(checker.detectCollision(network, {0}));
}

TEST_CASE("Red signal stops the lead vehicle in the stop zone", "[network]")
{
    RoadNetwork network;
    network.addRoad({0, 0}, {100, 0});
    Road &road = network.road(0);
    road.enqueue(vehicleAt(1, 0, 88.0));
    road.vehicles().front().v = 1.0;

    SignalCue red;
    red.controlled = true;
    red.green = false;

    IntelligentDriverModel model;
    model.advance(road, red, 1.0 / 60.0, 0.0);
    const Vehicle &lead = road.vehicles().front();
    REQUIRE(lead.stopped);
    REQUIRE(lead.slowed);
    REQUIRE(lead.speed_cap == Catch::Detail::Approx(lead.profile.max_speed * red.timing.slow_factor));

    SignalCue green = red;
    green.green = true;
    model.advance(road, green, 1.0 / 60.0, 4.0);
    REQUIRE_FALSE(road.vehicles().front().stopped);
    REQUIRE_FALSE(road.vehicles().front().slowed);
    REQUIRE(road.vehicles().front().waitTime(10.0) == Catch::Detail::Approx(4.0));
}

TEST_CASE("Follower keeps its distance behind a standing lead", "[network]")
{
    RoadNetwork network;
    network.addRoad({0, 0}, {200, 0});
    Road &road = network.road(0);
    road.enqueue(vehicleAt(1, 0, 60.0));
    road.enqueue(vehicleAt(2, 0, 0.0));

    IntelligentDriverModel model;
    SignalCue none;
    for (int i = 0; i < 60 * 30; ++i)
    {
        // Pin the lead in place.
        road.vehicles().front().x = 60.0;
        road.vehicles().front().v = 0.0;
        road.vehicles().front().a = 0.0;
        model.advance(road, none, 1.0 / 60.0, i / 60.0);
    }

    const Vehicle &follower = road.vehicles().back();
    REQUIRE(follower.x < 60.0 - follower.profile.length);
    REQUIRE(follower.x > 30.0);
    REQUIRE(follower.position.x == Catch::Detail::Approx(follower.x));
}
