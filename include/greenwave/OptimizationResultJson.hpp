#pragma once

#include "GeneticOptimizer.hpp"

#include <optional>
#include <string>

namespace greenwave
{
    // {"best_config": [...] | null, "best_fitness": f,
    //  "optimization_params": {"population_size", "generations", "solution_length"}}
    std::string optimizationResultToJson(const OptimizationResult &result, const OptimizerParams &params);

    // Accepts a result document or a bare list of durations.
    std::optional<Candidate> bestConfigFromJson(const std::string &json_text);

    // Creates missing parent directories.
    bool saveOptimizationResult(const std::string &path,
                                const OptimizationResult &result,
                                const OptimizerParams &params,
                                std::string *error = nullptr);

    // Missing or unreadable documents yield nullopt.
    std::optional<Candidate> loadBestConfig(const std::string &path);
} // namespace greenwave
