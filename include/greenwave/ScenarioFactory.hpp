#pragma once

#include "ScenarioConfig.hpp"
#include "SimulatorEngine.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace greenwave
{
    constexpr int MIN_PHASE_SECONDS = 5;
    constexpr int MAX_PHASE_SECONDS = 90;

    // Traffic seed shared by every engine of one optimisation run; independent
    // of the GA stream.
    inline uint32_t trafficSeedFor(uint32_t run_seed)
    {
        return run_seed * 2654435761u + 1u;
    }

    using DisplayFactory = std::function<std::shared_ptr<IEngineDisplay>()>;

    // Builds a ready-to-run engine for a scenario. Genes are sliced per
    // controller in scenario order and clamped to [5, 90] seconds; a
    // controller left without genes keeps its default cycle.
    std::unique_ptr<SimulatorEngine> buildEngine(const ScenarioConfig &scenario,
                                                 const std::optional<std::vector<int>> &durations,
                                                 uint32_t traffic_seed);

    class ScenarioFactory
    {
    public:
        explicit ScenarioFactory(ScenarioConfig scenario, uint32_t traffic_seed = 0);

        std::unique_ptr<SimulatorEngine> operator()(const std::optional<std::vector<int>> &durations,
                                                    bool render = false) const;

        // Used for engines built with render = true.
        void setDisplayFactory(DisplayFactory factory) { display_factory = std::move(factory); }

        std::vector<std::size_t> phasesPerSignal() const { return scenario_config.phasesPerSignal(); }
        std::size_t solutionLength() const { return scenario_config.solutionLength(); }
        const ScenarioConfig &scenario() const { return scenario_config; }
        uint32_t trafficSeed() const { return traffic_seed; }

    private:
        ScenarioConfig scenario_config;
        uint32_t traffic_seed;
        DisplayFactory display_factory;
    };

} // namespace greenwave
