#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "greenwave/CliOptions.hpp"
#include "greenwave/GeneticOptimizer.hpp"
#include "greenwave/HttpEngineDisplay.hpp"
#include "greenwave/OptimizationResultJson.hpp"
#include "greenwave/ScenarioConfigJson.hpp"
#include "greenwave/ScenarioFactory.hpp"
#include "db/Database.hpp"

namespace
{
    using greenwave::Options;
    using greenwave::numericOption;
    using greenwave::parseOptions;
    using greenwave::stringOption;

    std::atomic<bool> g_stop_requested{false};

    void handleSignal(int)
    {
        g_stop_requested = true;
    }

    void printUsage()
    {
        std::cout << "Usage:\n"
                  << "  greenwave optimize --scenario N [--scenario-file F] [--pop P] [--gens G] [--sim-time S]\n"
                  << "                     [--seed X] [--threads T] [--out PATH] [--db FILE]\n"
                  << "  greenwave replay --scenario N [--scenario-file F] [--config PATH] [--sim-time S]\n"
                  << "                   [--seed X] [--serve PORT] [--db FILE]\n"
                  << "  greenwave list\n";
    }

    std::optional<greenwave::ScenarioConfig> loadScenario(const Options &options, int scenario_id)
    {
        auto file = options.find("scenario-file");
        if (file == options.end())
        {
            std::optional<greenwave::ScenarioConfig> scenario = greenwave::makeBuiltinScenario(scenario_id);
            if (!scenario.has_value())
            {
                std::cerr << "Unknown scenario " << scenario_id << " (see 'greenwave list')" << std::endl;
            }
            return scenario;
        }

        std::ifstream in(file->second);
        if (!in.good())
        {
            std::cerr << "Failed to open scenario file " << file->second << std::endl;
            return std::nullopt;
        }
        std::ostringstream content;
        content << in.rdbuf();

        greenwave::ScenarioParseResult parsed = greenwave::scenarioConfigFromJson(content.str());
        if (!parsed.ok)
        {
            std::cerr << "Invalid scenario file " << file->second << ":" << std::endl;
            for (const auto &error : parsed.errors)
            {
                std::cerr << "  " << error << std::endl;
            }
            return std::nullopt;
        }
        parsed.config.id = scenario_id;
        return parsed.config;
    }

    int runList()
    {
        std::cout << "Built-in scenarios:" << std::endl;
        for (int id : greenwave::builtinScenarioIds())
        {
            std::optional<greenwave::ScenarioConfig> scenario = greenwave::makeBuiltinScenario(id);
            if (!scenario.has_value())
            {
                continue;
            }
            std::cout << "  " << id << ": " << scenario->name << " (" << scenario->roads.size() << " roads, phases per signal [";
            const std::vector<std::size_t> phases = scenario->phasesPerSignal();
            for (std::size_t i = 0; i < phases.size(); ++i)
            {
                std::cout << (i == 0 ? "" : ", ") << phases[i];
            }
            std::cout << "])" << std::endl;
        }
        return 0;
    }

    int runOptimize(const Options &options)
    {
        const int scenario_id = numericOption<int>(options, "scenario", 1);
        std::optional<greenwave::ScenarioConfig> scenario = loadScenario(options, scenario_id);
        if (!scenario.has_value())
        {
            return 1;
        }

        greenwave::OptimizerParams params;
        params.population_size = numericOption<std::size_t>(options, "pop", params.population_size);
        params.generations = numericOption<std::size_t>(options, "gens", params.generations);
        params.sim_time = numericOption<double>(options, "sim-time", params.sim_time);
        params.seed = numericOption<uint32_t>(options, "seed", params.seed);
        params.threads = numericOption<std::size_t>(options, "threads", params.threads);
        const std::string out_path = stringOption(options, "out", "results/best_config_s" + std::to_string(scenario_id) + ".json");

        greenwave::ScenarioFactory factory(*scenario, greenwave::trafficSeedFor(params.seed));
        params.solution_length = factory.solutionLength();

        std::cout << "Starting GA optimization:" << std::endl;
        std::cout << "  Scenario: " << scenario_id << " - " << scenario->name << std::endl;
        std::cout << "  Population: " << params.population_size << std::endl;
        std::cout << "  Generations: " << params.generations << std::endl;
        std::cout << "  Simulation time: " << params.sim_time << "s" << std::endl;
        std::cout << "  Seed: " << params.seed << std::endl;
        std::cout << "  Threads: " << params.threads << std::endl;

        greenwave::GeneticOptimizer optimizer(params);
        optimizer.setStopFlag(&g_stop_requested);
        greenwave::OptimizationResult result = optimizer.run(factory);
        if (result.stopped)
        {
            std::cerr << "Warning: optimization interrupted, saving best configuration so far" << std::endl;
        }

        std::string error;
        if (!greenwave::saveOptimizationResult(out_path, result, params, &error))
        {
            std::cerr << "Failed to save result: " << error << std::endl;
            return 1;
        }

        if (auto db_path = options.find("db"); db_path != options.end())
        {
            greenwave::db::Database database(db_path->second);
            greenwave::db::RunRecord record;
            record.scenario_id = scenario_id;
            record.seed = params.seed;
            if (result.best_config.has_value())
            {
                record.best_fitness = result.best_fitness;
            }
            record.result_json = greenwave::optimizationResultToJson(result, params);

            if (!database.initialize(&error) || !database.recordOptimizationRun(record, &error))
            {
                std::cerr << "Warning: failed to record run in database: " << error << std::endl;
            }
        }

        std::cout << std::endl;
        std::cout << "Optimization completed!" << std::endl;
        std::cout << "Best fitness: " << result.best_fitness << std::endl;
        std::cout << "Best configuration saved to " << out_path << std::endl;
        return 0;
    }

    std::optional<greenwave::Candidate> loadReplayConfig(const Options &options, int scenario_id)
    {
        const std::string config_path =
            stringOption(options, "config", "results/best_config_s" + std::to_string(scenario_id) + ".json");
        if (std::optional<greenwave::Candidate> config = greenwave::loadBestConfig(config_path))
        {
            std::cout << "Loaded configuration from " << config_path << std::endl;
            return config;
        }

        if (auto db_path = options.find("db"); db_path != options.end())
        {
            greenwave::db::Database database(db_path->second);
            std::string error;
            std::optional<std::string> stored = database.loadLatestResultJson(scenario_id, &error);
            if (stored.has_value())
            {
                if (std::optional<greenwave::Candidate> config = greenwave::bestConfigFromJson(*stored))
                {
                    std::cout << "Loaded configuration from database " << db_path->second << std::endl;
                    return config;
                }
            }
            else if (!error.empty())
            {
                std::cerr << "Warning: failed to read database: " << error << std::endl;
            }
        }

        std::cerr << "Warning: no usable configuration at " << config_path << ", using scenario defaults" << std::endl;
        return std::nullopt;
    }

    int runReplay(const Options &options)
    {
        const int scenario_id = numericOption<int>(options, "scenario", 1);
        std::optional<greenwave::ScenarioConfig> scenario = loadScenario(options, scenario_id);
        if (!scenario.has_value())
        {
            return 1;
        }

        const double sim_time = numericOption<double>(options, "sim-time", 60.0);
        const uint32_t seed = numericOption<uint32_t>(options, "seed", 42);
        const std::optional<greenwave::Candidate> config = loadReplayConfig(options, scenario_id);

        greenwave::ScenarioFactory factory(*scenario, greenwave::trafficSeedFor(seed));
        const bool render = options.count("serve") > 0;
        if (render)
        {
            const int port = numericOption<int>(options, "serve", 8080);
            factory.setDisplayFactory([port]() -> std::shared_ptr<greenwave::IEngineDisplay>
                                      {
                auto display = std::make_shared<greenwave::HttpEngineDisplay>(port);
                if (!display->start())
                {
                    std::cerr << "Warning: failed to start UI server on port " << port << ", running headless" << std::endl;
                    return nullptr;
                }
                std::cout << "Open UI at: http://localhost:" << port << std::endl;
                return display; });
        }

        std::unique_ptr<greenwave::SimulatorEngine> engine = factory(config, render);
        const double step = engine->timeStep();
        while (engine->currentTime() < sim_time && !engine->isCompleted() && !engine->stopRequested() && !g_stop_requested)
        {
            engine->tick(step);
        }

        const greenwave::SimulatorMetrics metrics = engine->getMetrics();
        std::cout << std::endl;
        if (metrics.collision_detected)
        {
            std::cout << "Run ended: collision detected at t=" << metrics.total_time << "s" << std::endl;
        }
        else if (engine->stopRequested() || g_stop_requested)
        {
            std::cout << "Run ended: stopped at t=" << metrics.total_time << "s" << std::endl;
        }
        std::cout << "Vehicles done: " << metrics.vehicles_completed << " of " << metrics.vehicles_generated << std::endl;
        std::cout << "Average wait: " << metrics.average_wait_time << "s" << std::endl;
        return 0;
    }
}

int main(int argc, char **argv)
{
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    Options options;
    if (!parseOptions(argc, argv, options))
    {
        printUsage();
        return 1;
    }

    try
    {
        if (command == "list")
            return runList();
        if (command == "optimize")
            return runOptimize(options);
        if (command == "replay")
            return runReplay(options);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    printUsage();
    return 1;
}
