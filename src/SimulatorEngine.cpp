#include "greenwave/SimulatorEngine.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <stdexcept>
#include <utility>

namespace greenwave
{
    SimulatorEngine::SimulatorEngine(RoadNetwork network, std::optional<std::size_t> max_generated)
        : road_network(std::move(network)),
          kinematics(std::make_unique<IntelligentDriverModel>()),
          max_generated(max_generated)
    {
    }

    void SimulatorEngine::addTrafficSignal(std::vector<SignalGroup> groups, const PhaseCycle &cycle, SignalTiming timing)
    {
        for (const auto &group : groups)
        {
            for (RoadId id : group)
            {
                road_network.requireValid(id, "signal group");
            }
        }

        const std::size_t signal_index = traffic_signals.size();
        for (std::size_t g = 0; g < groups.size(); ++g)
        {
            for (RoadId id : groups[g])
            {
                road_network.road(id).bindSignal({signal_index, g});
            }
        }
        traffic_signals.emplace_back(std::move(groups), cycle, timing);
    }

    void SimulatorEngine::addGenerator(GenerationSpec spec)
    {
        for (const auto &entry : spec.paths)
        {
            if (entry.path.empty())
            {
                throw std::invalid_argument("generator path is empty");
            }
            for (RoadId id : entry.path)
            {
                road_network.requireValid(id, "generator path");
            }
        }

        const uint32_t seed = traffic_seed + static_cast<uint32_t>(vehicle_generators.size());
        vehicle_generators.emplace_back(std::move(spec), seed);

        const VehicleGenerator &added = vehicle_generators.back();
        inbound_roads.insert(added.inboundRoads().begin(), added.inboundRoads().end());
        outbound_roads.insert(added.outboundRoads().begin(), added.outboundRoads().end());
    }

    void SimulatorEngine::addGenerator(double vehicles_per_minute, const std::vector<RouteOption> &routes)
    {
        addGenerator(GenerationSpec{vehicles_per_minute, normalizeRoutes(routes)});
    }

    void SimulatorEngine::setKinematics(std::unique_ptr<IVehicleKinematics> model)
    {
        if (model)
        {
            kinematics = std::move(model);
        }
    }

    void SimulatorEngine::injectVehicle(Vehicle vehicle)
    {
        for (RoadId id : vehicle.path)
        {
            road_network.requireValid(id, "vehicle path");
        }

        const RoadId road_id = vehicle.currentRoad();
        road_network.road(road_id).enqueue(std::move(vehicle));
        vehicles_generated++;
        vehicles_on_map++;
        non_empty_roads.insert(road_id);
    }

    void SimulatorEngine::tick(double dt)
    {
        if (!std::isfinite(dt) || dt <= 0.0)
        {
            return;
        }

        advanceSignals(dt);
        advanceVehicles(dt);
        generateTraffic();
        processRoadExits();
        detectCollisions();

        current_time += dt;

        if (display)
        {
            display->update(*this);
        }
    }

    void SimulatorEngine::update(std::optional<double> dt)
    {
        tick(dt.value_or(time_step));
    }

    void SimulatorEngine::run(bool switch_phase)
    {
        if (switch_phase)
        {
            switchAllPhases();
            if (display)
            {
                display->update(*this);
            }
        }

        for (std::size_t i = 0; i < BLOCK_TICKS; ++i)
        {
            tick(time_step);
            if (isCompleted() || stopRequested())
            {
                return;
            }
        }
    }

    void SimulatorEngine::simulate(double duration_seconds, double step)
    {
        if (!std::isfinite(step) || step <= 0.0)
        {
            step = DEFAULT_TIME_STEP;
        }

        double elapsed = 0.0;
        while (elapsed < duration_seconds && !isCompleted() && !stopRequested())
        {
            tick(step);
            elapsed += step;
        }
    }

    void SimulatorEngine::switchAllPhases()
    {
        for (auto &signal : traffic_signals)
        {
            signal.update(std::nullopt);
        }
    }

    bool SimulatorEngine::stopRequested() const
    {
        return stop_requested || (display && display->closed());
    }

    bool SimulatorEngine::isCompleted() const
    {
        if (collision_detected)
        {
            return true;
        }
        return max_generated.has_value() && vehicles_generated >= *max_generated && vehicles_on_map == 0;
    }

    double SimulatorEngine::averageWaitTime() const
    {
        double completed_mean = 0.0;
        const std::size_t completed = vehiclesCompleted();
        if (completed > 0)
        {
            completed_mean = completed_wait_sum / static_cast<double>(completed);
        }

        double on_map_mean = 0.0;
        if (vehicles_on_map > 0)
        {
            double live_sum = 0.0;
            for (RoadId id : non_empty_roads)
            {
                for (const auto &vehicle : road_network.road(id).vehicles())
                {
                    live_sum += vehicle.waitTime(current_time);
                }
            }
            on_map_mean = live_sum / static_cast<double>(vehicles_on_map);
        }

        return completed_mean + on_map_mean;
    }

    void SimulatorEngine::advanceSignals(double dt)
    {
        for (auto &signal : traffic_signals)
        {
            signal.tick(dt);
        }
    }

    void SimulatorEngine::advanceVehicles(double dt)
    {
        for (RoadId id : non_empty_roads)
        {
            Road &road = road_network.road(id);
            kinematics->advance(road, signalCueFor(road), dt, current_time);
        }
    }

    void SimulatorEngine::generateTraffic()
    {
        for (auto &generator : vehicle_generators)
        {
            if (max_generated.has_value() && vehicles_generated >= *max_generated)
            {
                break;
            }

            std::optional<RoadId> placed = generator.update(current_time, vehicles_generated, road_network);
            if (placed.has_value())
            {
                vehicles_generated++;
                vehicles_on_map++;
                non_empty_roads.insert(*placed);
            }
        }
    }

    void SimulatorEngine::processRoadExits()
    {
        std::set<RoadId> became_empty;
        std::set<RoadId> became_non_empty;

        for (RoadId id : non_empty_roads)
        {
            Road &road = road_network.road(id);
            if (road.empty())
            {
                became_empty.insert(id);
                continue;
            }

            // Only the front vehicle may leave a road per tick.
            if (road.vehicles().front().x < road.length())
            {
                continue;
            }

            Vehicle lead = road.dequeueFront();
            if (road.empty())
            {
                became_empty.insert(id);
            }

            if (lead.hasNextRoad())
            {
                lead.current_road_index++;
                lead.x = 0.0;
                const RoadId next_id = lead.currentRoad();
                road_network.road(next_id).enqueue(std::move(lead));
                became_non_empty.insert(next_id);
            }
            else
            {
                vehicles_on_map--;
                completed_wait_sum += lead.waitTime(current_time);
            }
        }

        for (RoadId id : became_empty)
        {
            non_empty_roads.erase(id);
        }
        non_empty_roads.insert(became_non_empty.begin(), became_non_empty.end());
    }

    void SimulatorEngine::detectCollisions()
    {
        if (collision_detected)
        {
            return;
        }
        collision_detected = checker.detectCollision(road_network, non_empty_roads);
    }

    SignalCue SimulatorEngine::signalCueFor(const Road &road) const
    {
        SignalCue cue;
        const auto &binding = road.signal();
        if (!binding.has_value() || binding->signal_index >= traffic_signals.size())
        {
            return cue;
        }

        const SignalController &signal = traffic_signals[binding->signal_index];
        cue.controlled = true;
        cue.green = signal.isGreen(binding->group_index);
        cue.timing = signal.timing();
        return cue;
    }

    SimulatorMetrics SimulatorEngine::getMetrics() const
    {
        SimulatorMetrics metrics;
        metrics.total_time = current_time;
        metrics.vehicles_generated = vehicles_generated;
        metrics.vehicles_on_map = vehicles_on_map;
        metrics.vehicles_completed = vehiclesCompleted();
        metrics.average_wait_time = averageWaitTime();
        metrics.collision_detected = collision_detected;
        metrics.non_empty_roads = non_empty_roads.size();
        return metrics;
    }

    std::string SimulatorEngine::getSnapshotJson() const
    {
        using nlohmann::json;

        SimulatorMetrics metrics = getMetrics();
        json root;
        root["scenario"] = scenario_name;
        root["sim_time"] = metrics.total_time;
        root["completed"] = isCompleted();
        root["metrics"] = {
            {"vehicles_generated", metrics.vehicles_generated},
            {"vehicles_on_map", metrics.vehicles_on_map},
            {"vehicles_completed", metrics.vehicles_completed},
            {"average_wait_time", metrics.average_wait_time},
            {"collision_detected", metrics.collision_detected}};

        root["signals"] = json::array();
        for (const auto &signal : traffic_signals)
        {
            json signal_json;
            signal_json["phase"] = signal.phaseIndex();
            signal_json["mask"] = signal.currentPhaseMask();
            signal_json["time_in_phase"] = signal.timeInPhase();
            root["signals"].push_back(signal_json);
        }

        root["roads"] = json::array();
        for (RoadId id : non_empty_roads)
        {
            const Road &road = road_network.road(id);
            json road_json;
            road_json["id"] = id;
            road_json["vehicles"] = json::array();
            for (const auto &vehicle : road.vehicles())
            {
                road_json["vehicles"].push_back({{"id", vehicle.id},
                                                 {"x", vehicle.x},
                                                 {"speed", vehicle.v},
                                                 {"position", {vehicle.position.x, vehicle.position.y}},
                                                 {"stopped", vehicle.stopped}});
            }
            root["roads"].push_back(road_json);
        }

        return root.dump();
    }

} // namespace greenwave
