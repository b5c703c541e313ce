#include "greenwave/OptimizationResultJson.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace greenwave
{
    namespace
    {
        using nlohmann::json;

        std::optional<Candidate> candidateFromJson(const json &value)
        {
            if (!value.is_array())
            {
                return std::nullopt;
            }
            Candidate genes;
            for (const auto &entry : value)
            {
                if (!entry.is_number())
                {
                    return std::nullopt;
                }
                const double raw = entry.get<double>();
                if (!std::isfinite(raw))
                {
                    return std::nullopt;
                }
                genes.push_back(static_cast<int>(std::lround(raw)));
            }
            return genes;
        }
    }

    std::string optimizationResultToJson(const OptimizationResult &result, const OptimizerParams &params)
    {
        json root;
        if (result.best_config.has_value())
        {
            root["best_config"] = *result.best_config;
        }
        else
        {
            root["best_config"] = nullptr;
        }
        // JSON has no infinities; a run without any evaluation stores null.
        if (std::isfinite(result.best_fitness))
        {
            root["best_fitness"] = result.best_fitness;
        }
        else
        {
            root["best_fitness"] = nullptr;
        }
        root["optimization_params"] = {
            {"population_size", params.population_size},
            {"generations", params.generations},
            {"solution_length", params.solution_length}};
        return root.dump(2);
    }

    std::optional<Candidate> bestConfigFromJson(const std::string &json_text)
    {
        json root = json::parse(json_text, nullptr, false);
        if (root.is_discarded())
        {
            return std::nullopt;
        }
        if (root.is_object())
        {
            if (!root.contains("best_config"))
            {
                return std::nullopt;
            }
            return candidateFromJson(root["best_config"]);
        }
        return candidateFromJson(root);
    }

    bool saveOptimizationResult(const std::string &path,
                                const OptimizationResult &result,
                                const OptimizerParams &params,
                                std::string *error)
    {
        const std::filesystem::path target(path);
        if (target.has_parent_path())
        {
            std::error_code ec;
            std::filesystem::create_directories(target.parent_path(), ec);
            if (ec)
            {
                if (error)
                {
                    *error = "failed to create " + target.parent_path().string() + ": " + ec.message();
                }
                return false;
            }
        }

        std::ofstream out(path, std::ios::trunc);
        if (!out.good())
        {
            if (error)
            {
                *error = "failed to open " + path + " for writing";
            }
            return false;
        }
        out << optimizationResultToJson(result, params) << "\n";
        return out.good();
    }

    std::optional<Candidate> loadBestConfig(const std::string &path)
    {
        std::ifstream in(path);
        if (!in.good())
        {
            return std::nullopt;
        }
        std::ostringstream content;
        content << in.rdbuf();
        return bestConfigFromJson(content.str());
    }
} // namespace greenwave
