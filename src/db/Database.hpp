#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace greenwave::db
{
    struct RunRecord
    {
        int scenario_id = 0;
        uint32_t seed = 0;
        std::optional<double> best_fitness;
        std::string result_json;
    };

    // History of finished optimisation runs, one row per run.
    class Database
    {
    public:
        explicit Database(std::string file_path);

        bool initialize(std::string *error = nullptr) const;
        bool recordOptimizationRun(const RunRecord &record, std::string *error = nullptr) const;
        // Result document of the most recent run for the scenario.
        std::optional<std::string> loadLatestResultJson(int scenario_id, std::string *error = nullptr) const;

    private:
        std::string file_path;
    };

} // namespace greenwave::db
