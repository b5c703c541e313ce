#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>
#include "greenwave/HttpEngineDisplay.hpp"
#include "greenwave/SimulatorEngine.hpp"

using namespace greenwave;

namespace
{
    // 0: short horizontal road, 1: vertical road crossing it, 2: long road.
    RoadNetwork testNetwork()
    {
        RoadNetwork network;
        network.addRoads({{{0, 0}, {20, 0}},
                          {{10, -10}, {10, 10}},
                          {{0, 100}, {1000, 100}}});
        return network;
    }

    Vehicle vehicleOn(uint32_t id, std::vector<RoadId> path, double x = 0.0)
    {
        Vehicle vehicle(id, std::move(path));
        vehicle.x = x;
        return vehicle;
    }

    class CountingDisplay : public IEngineDisplay
    {
    public:
        explicit CountingDisplay(int close_after) : close_after(close_after) {}

        void update(const SimulatorEngine &) override { updates++; }
        bool closed() const override { return updates >= close_after; }

        int updates = 0;

    private:
        int close_after;
    };

    class FrozenKinematics : public IVehicleKinematics
    {
    public:
        void advance(Road &, const SignalCue &, double, double) override { calls++; }
        int calls = 0;
    };
}

TEST_CASE("Average wait is zero when nothing was ever generated", "[engine]")
{
    SimulatorEngine engine(testNetwork());
    engine.simulate(2.0);

    REQUIRE(engine.vehiclesGenerated() == 0);
    REQUIRE(engine.averageWaitTime() == 0.0);
    REQUIRE_FALSE(engine.isCompleted());
    REQUIRE(engine.currentTime() == Catch::Detail::Approx(2.0).margin(1.0 / 60.0));
}

TEST_CASE("Completed journeys alone give the historical mean", "[engine]")
{
    SimulatorEngine engine(testNetwork(), std::size_t{1});
    Vehicle vehicle = vehicleOn(0, {0});
    vehicle.stop(0.0);
    vehicle.unstop(2.5);
    engine.injectVehicle(vehicle);

    REQUIRE_FALSE(engine.isCompleted());
    engine.simulate(30.0);

    REQUIRE(engine.isCompleted());
    REQUIRE_FALSE(engine.collisionDetected());
    REQUIRE(engine.vehiclesOnMap() == 0);
    REQUIRE(engine.vehiclesCompleted() == 1);
    REQUIRE(engine.averageWaitTime() == Catch::Detail::Approx(2.5));
    REQUIRE(engine.nonEmptyRoads().empty());
    // Stopped early on completion.
    REQUIRE(engine.currentTime() < 30.0);
}

TEST_CASE("Average wait sums the completed and on-map means", "[engine]")
{
    SimulatorEngine engine(testNetwork());

    Vehicle finished = vehicleOn(0, {0});
    finished.stop(0.0);
    finished.unstop(2.0);
    engine.injectVehicle(finished);

    Vehicle travelling = vehicleOn(1, {2});
    travelling.stop(0.0);
    travelling.unstop(4.0);
    engine.injectVehicle(travelling);

    engine.simulate(10.0);

    REQUIRE(engine.vehiclesCompleted() == 1);
    REQUIRE(engine.vehiclesOnMap() == 1);
    // Two independent means, not a pooled one (which would be 3).
    REQUIRE(engine.averageWaitTime() == Catch::Detail::Approx(6.0));
    REQUIRE_FALSE(engine.isCompleted());
}

TEST_CASE("Front vehicle transfers to the next road of its path", "[engine]")
{
    SimulatorEngine engine(testNetwork());
    engine.injectVehicle(vehicleOn(0, {0, 2}, 19.9));
    REQUIRE(engine.nonEmptyRoads() == std::set<RoadId>{0});

    engine.simulate(1.0);

    REQUIRE(engine.vehiclesOnMap() == 1);
    REQUIRE(engine.nonEmptyRoads() == std::set<RoadId>{2});
    const Vehicle &moved = engine.network().road(2).vehicles().front();
    REQUIRE(moved.current_road_index == 1);
    REQUIRE(moved.x < 20.0);
}

TEST_CASE("Collision is terminal and completes the run", "[engine]")
{
    SimulatorEngine engine(testNetwork());
    engine.network().addIntersections({{0, {1}}});
    engine.injectVehicle(vehicleOn(0, {0}, 10.0));
    engine.injectVehicle(vehicleOn(1, {1}, 10.0));

    REQUIRE_FALSE(engine.isCompleted());
    engine.tick(SimulatorEngine::DEFAULT_TIME_STEP);

    REQUIRE(engine.collisionDetected());
    REQUIRE(engine.isCompleted());
    REQUIRE(engine.activeIntersections().size() == 2);

    engine.tick(SimulatorEngine::DEFAULT_TIME_STEP);
    REQUIRE(engine.collisionDetected());
    REQUIRE(engine.getMetrics().collision_detected);
}

TEST_CASE("Overlapping roads without a conflict entry never collide", "[engine]")
{
    SimulatorEngine engine(testNetwork());
    engine.injectVehicle(vehicleOn(0, {0}, 10.0));
    engine.injectVehicle(vehicleOn(1, {1}, 10.0));
    engine.tick(SimulatorEngine::DEFAULT_TIME_STEP);

    REQUIRE_FALSE(engine.collisionDetected());
    REQUIRE_FALSE(engine.isCompleted());
}

TEST_CASE("A cap of zero is reached before anything moves", "[engine]")
{
    SimulatorEngine engine(testNetwork(), std::size_t{0});
    engine.addGenerator(60.0, {{1.0, {{0}}}});
    REQUIRE(engine.isCompleted());

    engine.tick(5.0);
    REQUIRE(engine.vehiclesGenerated() == 0);
}

TEST_CASE("Generation stops at the cap", "[engine]")
{
    SimulatorEngine engine(testNetwork(), std::size_t{2});
    engine.addGenerator(60.0, {{1.0, {{2}}}});
    engine.addGenerator(60.0, {{1.0, {{0}}}});
    REQUIRE(engine.inboundRoads() == std::set<RoadId>{0, 2});

    engine.simulate(20.0);

    REQUIRE(engine.vehiclesGenerated() == 2);
    REQUIRE_FALSE(engine.isCompleted()); // one vehicle still on the long road
}

TEST_CASE("Signal binding stops traffic at a red light", "[engine]")
{
    SimulatorEngine engine(testNetwork());
    // Road 2 is green only in the second phase, which never comes.
    engine.addTrafficSignal({{0}, {2}}, PhaseCycle::fromDurations({1000, 1000}));
    engine.injectVehicle(vehicleOn(0, {2}, 900.0));

    engine.simulate(60.0);

    const Vehicle &held = engine.network().road(2).vehicles().front();
    REQUIRE(held.stopped);
    REQUIRE(held.x < engine.network().road(2).length());
    REQUIRE(engine.averageWaitTime() > 0.0);
    REQUIRE(engine.vehiclesCompleted() == 0);
}

TEST_CASE("Block run forces a phase switch and advances 180 ticks", "[engine]")
{
    SimulatorEngine engine(testNetwork());
    engine.addTrafficSignal({{0}, {1}}, PhaseCycle::fromDurations({10, 10}));

    engine.run(true);
    REQUIRE(engine.signals()[0].phaseIndex() == 1);
    REQUIRE(engine.currentTime() == Catch::Detail::Approx(3.0));

    engine.run(false);
    REQUIRE(engine.signals()[0].phaseIndex() == 1);
    REQUIRE(engine.currentTime() == Catch::Detail::Approx(6.0));
}

TEST_CASE("Closed display stops the simulation loop", "[engine]")
{
    SimulatorEngine engine(testNetwork());
    auto display = std::make_shared<CountingDisplay>(5);
    engine.setDisplay(display);

    engine.simulate(10.0);

    REQUIRE(display->updates == 5);
    REQUIRE(engine.stopRequested());
    REQUIRE(engine.currentTime() == Catch::Detail::Approx(5.0 / 60.0));
}

TEST_CASE("Stop request halts simulate", "[engine]")
{
    SimulatorEngine engine(testNetwork());
    engine.requestStop();
    engine.simulate(10.0);
    REQUIRE(engine.currentTime() == 0.0);
}

TEST_CASE("Kinematics is only consulted for non-empty roads", "[engine]")
{
    SimulatorEngine engine(testNetwork());
    auto model = std::make_unique<FrozenKinematics>();
    FrozenKinematics *observed = model.get();
    engine.setKinematics(std::move(model));

    engine.tick(0.1);
    REQUIRE(observed->calls == 0);

    engine.injectVehicle(vehicleOn(0, {2}));
    engine.tick(0.1);
    REQUIRE(observed->calls == 1);
}

TEST_CASE("Non-positive ticks are ignored", "[engine]")
{
    SimulatorEngine engine(testNetwork());
    engine.tick(0.0);
    engine.tick(-1.0);
    REQUIRE(engine.currentTime() == 0.0);
    engine.update();
    REQUIRE(engine.currentTime() == Catch::Detail::Approx(SimulatorEngine::DEFAULT_TIME_STEP));
}

TEST_CASE("Unknown road ids are rejected at construction", "[engine]")
{
    SimulatorEngine engine(testNetwork());
    REQUIRE_THROWS_AS(engine.addTrafficSignal({{0}, {3}}, PhaseCycle{}), std::out_of_range);
    REQUIRE_THROWS_AS(engine.addGenerator(10.0, {{1.0, {{0, 5}}}}), std::out_of_range);
    REQUIRE_THROWS_AS(engine.injectVehicle(vehicleOn(0, {4})), std::out_of_range);
    REQUIRE(engine.signals().empty());
    REQUIRE(engine.generators().empty());
}

TEST_CASE("Empty generator paths are rejected at construction", "[engine]")
{
    SimulatorEngine engine(testNetwork());
    REQUIRE_THROWS_AS(engine.addGenerator(GenerationSpec{60.0, {{1.0, {}}}}), std::invalid_argument);
    REQUIRE_THROWS_AS(engine.addGenerator(GenerationSpec{60.0, {{1.0, {0}}, {2.0, {}}}}), std::invalid_argument);
    REQUIRE(engine.generators().empty());
    REQUIRE(engine.inboundRoads().empty());

    // Route options drop empty alternatives before they reach the generator.
    REQUIRE_NOTHROW(engine.addGenerator(60.0, {{1.0, {{}, {0}}}}));
    REQUIRE(engine.inboundRoads() == std::set<RoadId>{0});
}

TEST_CASE("Snapshot reports counters, signals and vehicles", "[engine]")
{
    SimulatorEngine engine(testNetwork());
    engine.setScenarioName("test");
    engine.addTrafficSignal({{0}, {1}}, PhaseCycle::fromDurations({10, 10}));
    engine.injectVehicle(vehicleOn(7, {2}, 5.0));
    engine.tick(0.5);

    nlohmann::json snapshot = nlohmann::json::parse(engine.getSnapshotJson());
    REQUIRE(snapshot["scenario"] == "test");
    REQUIRE(snapshot["sim_time"].get<double>() == Catch::Detail::Approx(0.5));
    REQUIRE(snapshot["metrics"]["vehicles_on_map"] == 1);
    REQUIRE(snapshot["signals"].size() == 1);
    REQUIRE(snapshot["signals"][0]["mask"] == nlohmann::json::array({true, false}));
    REQUIRE(snapshot["roads"].size() == 1);
    REQUIRE(snapshot["roads"][0]["id"] == 2);
    REQUIRE(snapshot["roads"][0]["vehicles"][0]["id"] == 7);
}

TEST_CASE("HTTP display publishes snapshots and closes on stop", "[engine][ui]")
{
    SimulatorEngine engine(testNetwork());
    auto display = std::make_shared<HttpEngineDisplay>(0, false);
    engine.setDisplay(display);
    engine.injectVehicle(vehicleOn(3, {2}));

    REQUIRE(display->latestSnapshot() == "{}");
    engine.tick(0.25);
    nlohmann::json snapshot = nlohmann::json::parse(display->latestSnapshot());
    REQUIRE(snapshot["sim_time"].get<double>() == Catch::Detail::Approx(0.25));

    display->handleCommand("pause");
    REQUIRE_FALSE(display->closed());
    display->handleCommand("stop");
    REQUIRE(display->closed());

    engine.simulate(10.0);
    REQUIRE(engine.stopRequested());
    REQUIRE(engine.currentTime() == Catch::Detail::Approx(0.25));
}

TEST_CASE("HTTP display routes snapshot and command requests", "[engine][ui]")
{
    SimulatorEngine engine(testNetwork());
    auto display = std::make_shared<HttpEngineDisplay>(0, false);
    engine.setDisplay(display);
    engine.tick(0.5);

    HttpReply snapshot = display->respond(parseRequestLine("GET /snapshot HTTP/1.1\r\nHost: x\r\n\r\n"));
    REQUIRE(snapshot.status == 200);
    REQUIRE(snapshot.content_type == "application/json");
    REQUIRE(nlohmann::json::parse(snapshot.body)["sim_time"].get<double>() == Catch::Detail::Approx(0.5));

    REQUIRE(display->respond(parseRequestLine("GET / HTTP/1.1\r\n\r\n")).status == 200);
    REQUIRE(display->respond(parseRequestLine("GET /missing HTTP/1.1\r\n\r\n")).status == 404);
    REQUIRE(display->respond(parseRequestLine("POST /snapshot HTTP/1.1\r\n\r\n")).status == 405);
    REQUIRE(display->respond(parseRequestLine("garbage")).status == 400);
    REQUIRE(display->respond(parseRequestLine("GET /command HTTP/1.1\r\n\r\n")).status == 400);
    REQUIRE(display->respond(parseRequestLine("GET /command?cmd=pause HTTP/1.1\r\n\r\n")).status == 400);
    REQUIRE_FALSE(display->closed());

    REQUIRE(display->respond(parseRequestLine("GET /command?cmd=stop&from=ui HTTP/1.1\r\n\r\n")).status == 200);
    REQUIRE(display->closed());
    REQUIRE(engine.stopRequested());
}

TEST_CASE("Request lines are split into path and query", "[engine][ui]")
{
    HttpRequest request = parseRequestLine("GET /command?cmd=stop&flag HTTP/1.1\r\nHost: localhost\r\n\r\n");
    REQUIRE(request.method == "GET");
    REQUIRE(request.path == "/command");
    REQUIRE(request.query.at("cmd") == "stop");
    REQUIRE(request.query.at("flag").empty());

    std::string reply = formatReply({404, "text/plain", "nope"});
    REQUIRE(reply.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
    REQUIRE(reply.find("Content-Length: 4\r\n") != std::string::npos);
    REQUIRE(reply.substr(reply.size() - 4) == "nope");
}
