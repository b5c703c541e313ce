#pragma once

#include "SimulatorEngine.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace greenwave
{
    // Phase durations in seconds, one gene per signal group.
    using Candidate = std::vector<int>;

    using EngineFactory = std::function<std::unique_ptr<SimulatorEngine>(const std::optional<Candidate> &, bool)>;
    using ProgressCallback = std::function<void(std::size_t generation, std::size_t total_generations, double best_fitness)>;

    struct OptimizerParams
    {
        std::size_t population_size = 20;
        std::size_t generations = 50;
        std::size_t solution_length = 5;
        double mutation_rate = 0.1;
        double sim_time = 60.0; // simulated seconds per evaluation
        double time_step = SimulatorEngine::DEFAULT_TIME_STEP;
        uint32_t seed = 42;
        std::size_t threads = 1;
    };

    struct ScoredCandidate
    {
        Candidate genes;
        double fitness = 0.0;
    };

    struct OptimizationResult
    {
        std::optional<Candidate> best_config;
        double best_fitness = -std::numeric_limits<double>::infinity();
        std::vector<double> generation_best; // best fitness of each evaluated generation
        bool stopped = false;
    };

    class GeneticOptimizer
    {
    public:
        static constexpr int MIN_GENE = 5;
        static constexpr int MAX_GENE = 90;
        static constexpr int MUTATION_JITTER = 10;
        static constexpr std::size_t MIN_GENERATED_VEHICLES = 3;
        static constexpr double NO_TRAFFIC_FITNESS = -10000.0;
        static constexpr double FAILED_EVALUATION_FITNESS = -1.0;
        static constexpr double WAIT_WEIGHT = 2.0;
        static constexpr double COLLISION_PENALTY = 1000.0;

        explicit GeneticOptimizer(OptimizerParams params);

        std::vector<Candidate> initializePopulation();

        // Single-point crossover at a random point in [1, length - 1].
        // Mismatched or too short parents yield a copy of parent1.
        Candidate crossover(const Candidate &parent1, const Candidate &parent2);
        static Candidate crossoverAt(const Candidate &parent1, const Candidate &parent2, std::size_t point);

        Candidate mutate(const Candidate &individual, double mutation_rate);

        // Runs one fresh engine headless for the time budget. Never throws.
        double evaluateFitness(const Candidate &individual, const EngineFactory &factory) const;
        static double computeFitness(const SimulatorMetrics &metrics, double sim_time);

        OptimizationResult run(const EngineFactory &factory);

        void setProgressCallback(ProgressCallback callback) { progress_callback = std::move(callback); }
        void setStopFlag(const std::atomic<bool> *flag) { stop_flag = flag; }

        const OptimizerParams &params() const { return parameters; }

    private:
        std::vector<ScoredCandidate> evaluatePopulation(const std::vector<Candidate> &population,
                                                        const EngineFactory &factory) const;
        std::vector<Candidate> nextGeneration(const std::vector<ScoredCandidate> &scored);
        void notifyProgress(std::size_t generation, double best_fitness) const;
        bool stopRequested() const;

        OptimizerParams parameters;
        std::mt19937 rng;
        ProgressCallback progress_callback;
        const std::atomic<bool> *stop_flag = nullptr;
    };

} // namespace greenwave
