#include "greenwave/GeneticOptimizer.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <sstream>
#include <thread>

namespace greenwave
{
    GeneticOptimizer::GeneticOptimizer(OptimizerParams params)
        : parameters(params), rng(params.seed)
    {
        // The engine ignores ticks that are not strictly positive.
        if (!std::isfinite(parameters.time_step) || parameters.time_step <= 0.0)
        {
            parameters.time_step = SimulatorEngine::DEFAULT_TIME_STEP;
        }
        if (!std::isfinite(parameters.sim_time) || parameters.sim_time < 0.0)
        {
            parameters.sim_time = OptimizerParams{}.sim_time;
        }
    }

    std::vector<Candidate> GeneticOptimizer::initializePopulation()
    {
        std::uniform_int_distribution<int> gene(MIN_GENE, MAX_GENE);
        std::vector<Candidate> population;
        population.reserve(parameters.population_size);
        for (std::size_t i = 0; i < parameters.population_size; ++i)
        {
            Candidate individual(parameters.solution_length);
            for (int &g : individual)
            {
                g = gene(rng);
            }
            population.push_back(std::move(individual));
        }
        return population;
    }

    Candidate GeneticOptimizer::crossover(const Candidate &parent1, const Candidate &parent2)
    {
        if (parent1.size() != parent2.size() || parent1.size() < 2)
        {
            return parent1;
        }
        std::uniform_int_distribution<std::size_t> point(1, parent1.size() - 1);
        return crossoverAt(parent1, parent2, point(rng));
    }

    Candidate GeneticOptimizer::crossoverAt(const Candidate &parent1, const Candidate &parent2, std::size_t point)
    {
        if (parent1.size() != parent2.size() || parent1.size() < 2)
        {
            return parent1;
        }
        point = std::clamp<std::size_t>(point, 1, parent1.size() - 1);

        Candidate child(parent1.begin(), parent1.begin() + static_cast<std::ptrdiff_t>(point));
        child.insert(child.end(), parent2.begin() + static_cast<std::ptrdiff_t>(point), parent2.end());
        return child;
    }

    Candidate GeneticOptimizer::mutate(const Candidate &individual, double mutation_rate)
    {
        std::uniform_real_distribution<double> chance(0.0, 1.0);
        std::uniform_int_distribution<int> jitter(-MUTATION_JITTER, MUTATION_JITTER);

        Candidate child = individual;
        for (int &g : child)
        {
            if (chance(rng) < mutation_rate)
            {
                g = std::clamp(g + jitter(rng), MIN_GENE, MAX_GENE);
            }
        }
        return child;
    }

    double GeneticOptimizer::computeFitness(const SimulatorMetrics &metrics, double sim_time)
    {
        if (metrics.vehicles_generated < MIN_GENERATED_VEHICLES)
        {
            return NO_TRAFFIC_FITNESS;
        }

        const double flow = static_cast<double>(metrics.vehicles_completed) / std::max(sim_time, 1.0);
        const double collided = metrics.collision_detected ? 1.0 : 0.0;
        return flow - WAIT_WEIGHT * metrics.average_wait_time - COLLISION_PENALTY * collided;
    }

    double GeneticOptimizer::evaluateFitness(const Candidate &individual, const EngineFactory &factory) const
    {
        try
        {
            std::unique_ptr<SimulatorEngine> engine = factory(individual, false);
            if (!engine)
            {
                std::cerr << "Optimizer: scenario factory returned no engine\n";
                return FAILED_EVALUATION_FITNESS;
            }

            const auto ticks = static_cast<std::size_t>(std::ceil(parameters.sim_time / parameters.time_step - 1e-9));
            for (std::size_t i = 0; i < ticks; ++i)
            {
                if (engine->isCompleted() || engine->stopRequested() || stopRequested())
                {
                    break;
                }
                engine->tick(parameters.time_step);
            }
            return computeFitness(engine->getMetrics(), parameters.sim_time);
        }
        catch (const std::exception &e)
        {
            std::ostringstream line;
            line << "Optimizer: error in simulation: " << e.what() << "\n";
            std::cerr << line.str();
            return FAILED_EVALUATION_FITNESS;
        }
    }

    std::vector<ScoredCandidate> GeneticOptimizer::evaluatePopulation(const std::vector<Candidate> &population,
                                                                      const EngineFactory &factory) const
    {
        std::vector<ScoredCandidate> scored(population.size());
        for (std::size_t i = 0; i < population.size(); ++i)
        {
            scored[i].genes = population[i];
        }

        const std::size_t workers = std::min(std::max<std::size_t>(parameters.threads, 1), population.size());
        if (workers <= 1)
        {
            for (auto &entry : scored)
            {
                entry.fitness = evaluateFitness(entry.genes, factory);
            }
            return scored;
        }

        // Each worker owns a fixed stride of slots, so results do not depend on scheduling.
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w)
        {
            pool.emplace_back([this, w, workers, &scored, &factory]()
                              {
                for (std::size_t i = w; i < scored.size(); i += workers)
                {
                    scored[i].fitness = evaluateFitness(scored[i].genes, factory);
                } });
        }
        for (auto &t : pool)
        {
            t.join();
        }
        return scored;
    }

    std::vector<Candidate> GeneticOptimizer::nextGeneration(const std::vector<ScoredCandidate> &scored)
    {
        const std::size_t parent_count = std::min(scored.size(), std::max<std::size_t>(2, parameters.population_size / 2));

        std::vector<Candidate> parents;
        for (std::size_t i = 0; i < parent_count; ++i)
        {
            parents.push_back(scored[i].genes);
        }

        std::vector<Candidate> population = parents;
        if (parents.empty())
        {
            return population;
        }

        std::uniform_int_distribution<std::size_t> pick(0, parents.size() - 1);
        while (population.size() < parameters.population_size)
        {
            const Candidate &p1 = parents[pick(rng)];
            const Candidate &p2 = parents[pick(rng)];
            population.push_back(mutate(crossover(p1, p2), parameters.mutation_rate));
        }
        return population;
    }

    void GeneticOptimizer::notifyProgress(std::size_t generation, double best_fitness) const
    {
        if (!progress_callback)
        {
            return;
        }
        try
        {
            progress_callback(generation, parameters.generations, best_fitness);
        }
        catch (const std::exception &e)
        {
            std::cerr << "Warning: progress callback failed: " << e.what() << std::endl;
        }
        catch (...)
        {
            std::cerr << "Warning: progress callback failed with a non-standard exception" << std::endl;
        }
    }

    bool GeneticOptimizer::stopRequested() const
    {
        return stop_flag != nullptr && stop_flag->load();
    }

    OptimizationResult GeneticOptimizer::run(const EngineFactory &factory)
    {
        std::cout << "Starting GA optimization with " << parameters.population_size << " population, "
                  << parameters.generations << " generations" << std::endl;

        OptimizationResult result;
        std::vector<Candidate> population = initializePopulation();

        for (std::size_t gen = 0; gen < parameters.generations; ++gen)
        {
            if (stopRequested())
            {
                result.stopped = true;
                break;
            }

            std::cout << "Generation " << gen + 1 << "/" << parameters.generations << std::endl;
            std::vector<ScoredCandidate> scored = evaluatePopulation(population, factory);
            if (stopRequested())
            {
                // Evaluations cut short by the stop request are not comparable.
                result.stopped = true;
                break;
            }

            std::stable_sort(scored.begin(), scored.end(), [](const ScoredCandidate &a, const ScoredCandidate &b)
                             { return a.fitness > b.fitness; });
            if (scored.empty())
            {
                break;
            }

            const ScoredCandidate &best = scored.front();
            if (!result.best_config.has_value() || best.fitness > result.best_fitness)
            {
                result.best_fitness = best.fitness;
                result.best_config = best.genes;
            }
            result.generation_best.push_back(best.fitness);

            std::cout << "Best fitness in generation " << gen + 1 << ": " << best.fitness << std::endl;
            notifyProgress(gen + 1, best.fitness);

            if (gen + 1 < parameters.generations)
            {
                population = nextGeneration(scored);
            }
        }

        return result;
    }

} // namespace greenwave
