#include "greenwave/ScenarioFactory.hpp"

#include <algorithm>
#include <utility>

namespace greenwave
{
    std::unique_ptr<SimulatorEngine> buildEngine(const ScenarioConfig &scenario,
                                                 const std::optional<std::vector<int>> &durations,
                                                 uint32_t traffic_seed)
    {
        RoadNetwork network;
        network.addRoads(scenario.roads);
        network.addIntersections(scenario.intersections);

        auto engine = std::make_unique<SimulatorEngine>(std::move(network), scenario.max_generated);
        engine->setScenarioName(scenario.name);
        engine->setTrafficSeed(traffic_seed);

        std::size_t cursor = 0;
        for (const auto &signal : scenario.signals)
        {
            PhaseCycle cycle = signal.default_cycle;
            if (durations.has_value() && cursor < durations->size())
            {
                const std::size_t take = std::min(signal.groups.size(), durations->size() - cursor);
                std::vector<double> slice;
                for (std::size_t i = 0; i < take; ++i)
                {
                    const int gene = std::clamp((*durations)[cursor + i], MIN_PHASE_SECONDS, MAX_PHASE_SECONDS);
                    slice.push_back(static_cast<double>(gene));
                }
                cursor += take;
                // Short slices are padded by the controller.
                cycle = PhaseCycle::fromDurations(std::move(slice));
            }
            engine->addTrafficSignal(signal.groups, cycle, signal.timing);
        }

        for (const auto &generator : scenario.generators)
        {
            engine->addGenerator(generator.vehicles_per_minute, generator.routes);
        }
        return engine;
    }

    ScenarioFactory::ScenarioFactory(ScenarioConfig scenario, uint32_t traffic_seed)
        : scenario_config(std::move(scenario)), traffic_seed(traffic_seed)
    {
    }

    std::unique_ptr<SimulatorEngine> ScenarioFactory::operator()(const std::optional<std::vector<int>> &durations,
                                                                 bool render) const
    {
        std::unique_ptr<SimulatorEngine> engine = buildEngine(scenario_config, durations, traffic_seed);
        if (render && display_factory)
        {
            engine->setDisplay(display_factory());
        }
        return engine;
    }

} // namespace greenwave
