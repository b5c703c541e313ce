#pragma once

#include "RoadNetwork.hpp"
#include "TrafficLightControllers.hpp"
#include "VehicleGenerator.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace greenwave
{
    // Green time per group in the built-in default cycles.
    constexpr double DEFAULT_GREEN_SECONDS = 10.0;

    enum class ApproachId : uint8_t
    {
        North = 0,
        East = 1,
        South = 2,
        West = 3
    };

    enum class MovementType : uint8_t
    {
        Straight = 0,
        Left = 1,
        Right = 2
    };

    inline std::size_t approachIndex(ApproachId approach)
    {
        return static_cast<std::size_t>(static_cast<uint8_t>(approach));
    }

    inline ApproachId oppositeApproach(ApproachId approach)
    {
        return static_cast<ApproachId>((static_cast<uint8_t>(approach) + 2) % 4);
    }

    // Movement of a vehicle entering a junction from `from` and leaving it
    // through `to`. Approaches are listed clockwise (screen coordinates, y down).
    inline MovementType movementBetween(ApproachId from, ApproachId to)
    {
        if (to == oppositeApproach(from))
            return MovementType::Straight;
        if (static_cast<uint8_t>(to) == (static_cast<uint8_t>(from) + 1) % 4)
            return MovementType::Left;
        return MovementType::Right;
    }

    struct SignalConfig
    {
        std::vector<SignalGroup> groups;
        PhaseCycle default_cycle;
        SignalTiming timing;
    };

    struct GeneratorConfig
    {
        double vehicles_per_minute = 0.0;
        std::vector<RouteOption> routes;
    };

    struct ScenarioConfig
    {
        int id = 0;
        std::string name;
        std::vector<RoadSegment> roads;
        ConflictGraph intersections;
        std::vector<SignalConfig> signals;
        std::vector<GeneratorConfig> generators;
        std::optional<std::size_t> max_generated;

        // One duration gene per signal group, per controller, in controller order.
        std::vector<std::size_t> phasesPerSignal() const
        {
            std::vector<std::size_t> phases;
            for (const auto &signal : signals)
            {
                phases.push_back(signal.groups.size());
            }
            return phases;
        }

        std::size_t solutionLength() const
        {
            std::size_t total = 0;
            for (std::size_t n : phasesPerSignal())
            {
                total += n;
            }
            return total;
        }
    };

    // Built-in scenarios, ids 1..5.
    std::vector<int> builtinScenarioIds();
    std::optional<ScenarioConfig> makeBuiltinScenario(int scenario_id);

    ScenarioConfig makeFourWayScenario();
    ScenarioConfig makeTJunctionScenario();
    ScenarioConfig makeCorridorScenario();
    ScenarioConfig makeGridScenario();
    ScenarioConfig makeArterialScenario();

} // namespace greenwave
