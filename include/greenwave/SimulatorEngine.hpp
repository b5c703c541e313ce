#pragma once

#include "RoadNetwork.hpp"
#include "SafetyChecker.hpp"
#include "TrafficLightControllers.hpp"
#include "VehicleGenerator.hpp"
#include "VehicleKinematics.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace greenwave
{
    class SimulatorEngine;

    struct SimulatorMetrics
    {
        double total_time = 0.0;
        std::size_t vehicles_generated = 0;
        std::size_t vehicles_on_map = 0;
        std::size_t vehicles_completed = 0;
        double average_wait_time = 0.0;
        bool collision_detected = false;
        std::size_t non_empty_roads = 0;
    };

    // Optional observer notified after every tick. A closed display asks the
    // engine to stop.
    class IEngineDisplay
    {
    public:
        virtual ~IEngineDisplay() = default;
        virtual void update(const SimulatorEngine &engine) = 0;
        virtual bool closed() const = 0;
    };

    class SimulatorEngine
    {
    public:
        static constexpr double DEFAULT_TIME_STEP = 1.0 / 60.0;
        static constexpr std::size_t BLOCK_TICKS = 180; // 3 s at the default step

        explicit SimulatorEngine(RoadNetwork network, std::optional<std::size_t> max_generated = std::nullopt);

        SimulatorEngine(const SimulatorEngine &) = delete;
        SimulatorEngine &operator=(const SimulatorEngine &) = delete;

        // Scenario construction. Unknown road ids throw std::out_of_range, an
        // empty generator path throws std::invalid_argument.
        void addTrafficSignal(std::vector<SignalGroup> groups, const PhaseCycle &cycle, SignalTiming timing = SignalTiming{});
        void addGenerator(GenerationSpec spec);
        void addGenerator(double vehicles_per_minute, const std::vector<RouteOption> &routes);

        // Generators added afterwards draw routes from seed + generator index.
        void setTrafficSeed(uint32_t seed) { traffic_seed = seed; }
        void setKinematics(std::unique_ptr<IVehicleKinematics> model);
        void setDisplay(std::shared_ptr<IEngineDisplay> observer) { display = std::move(observer); }

        // Places a vehicle on the current road of its path, outside any generator.
        void injectVehicle(Vehicle vehicle);

        void tick(double dt);
        void update(std::optional<double> dt = std::nullopt);

        // Advances one block of BLOCK_TICKS ticks, optionally forcing every
        // controller to its next phase first. Stops early on completion.
        void run(bool switch_phase = false);

        // Ticks until `duration_seconds` of simulated time, completion or a
        // stop request, whichever comes first.
        void simulate(double duration_seconds, double time_step = DEFAULT_TIME_STEP);

        void switchAllPhases();

        void requestStop() { stop_requested = true; }
        bool stopRequested() const;

        bool isCompleted() const;
        bool collisionDetected() const { return collision_detected; }

        double currentTime() const { return current_time; }
        double timeStep() const { return time_step; }
        std::size_t vehiclesGenerated() const { return vehicles_generated; }
        std::size_t vehiclesOnMap() const { return vehicles_on_map; }
        std::size_t vehiclesCompleted() const { return vehicles_generated - vehicles_on_map; }
        std::optional<std::size_t> maxGenerated() const { return max_generated; }

        // Mean wait of completed journeys plus mean live wait of vehicles
        // still on the map; each term is 0 when its population is empty.
        double averageWaitTime() const;

        const std::set<RoadId> &nonEmptyRoads() const { return non_empty_roads; }
        ConflictGraph activeIntersections() const { return road_network.activeConflicts(non_empty_roads); }
        const std::set<RoadId> &inboundRoads() const { return inbound_roads; }
        const std::set<RoadId> &outboundRoads() const { return outbound_roads; }

        RoadNetwork &network() { return road_network; }
        const RoadNetwork &network() const { return road_network; }
        std::vector<SignalController> &signals() { return traffic_signals; }
        const std::vector<SignalController> &signals() const { return traffic_signals; }
        const std::vector<VehicleGenerator> &generators() const { return vehicle_generators; }

        void setScenarioName(std::string name) { scenario_name = std::move(name); }
        const std::string &scenarioName() const { return scenario_name; }

        SimulatorMetrics getMetrics() const;
        std::string getSnapshotJson() const;

    private:
        void advanceSignals(double dt);
        void advanceVehicles(double dt);
        void generateTraffic();
        void processRoadExits();
        void detectCollisions();
        SignalCue signalCueFor(const Road &road) const;

        RoadNetwork road_network;
        std::vector<SignalController> traffic_signals;
        std::vector<VehicleGenerator> vehicle_generators;
        std::unique_ptr<IVehicleKinematics> kinematics;
        std::shared_ptr<IEngineDisplay> display;
        SafetyChecker checker;

        std::optional<std::size_t> max_generated;
        uint32_t traffic_seed = 0;
        std::string scenario_name;

        double current_time = 0.0;
        double time_step = DEFAULT_TIME_STEP;
        std::size_t vehicles_generated = 0;
        std::size_t vehicles_on_map = 0;
        double completed_wait_sum = 0.0;
        bool collision_detected = false;
        std::atomic<bool> stop_requested{false};

        std::set<RoadId> non_empty_roads;
        std::set<RoadId> inbound_roads;
        std::set<RoadId> outbound_roads;
    };

} // namespace greenwave
