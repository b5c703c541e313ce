#include "Database.hpp"

#ifdef GREENWAVE_USE_SQLITE
#include <sqlite3.h>
#else
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#endif

#include <utility>

namespace greenwave::db
{
    namespace
    {
#ifdef GREENWAVE_USE_SQLITE
        sqlite3 *openHandle(const std::string &file_path, std::string *error)
        {
            sqlite3 *handle = nullptr;
            if (sqlite3_open(file_path.c_str(), &handle) != SQLITE_OK)
            {
                if (error)
                {
                    *error = sqlite3_errmsg(handle);
                }
                sqlite3_close(handle);
                return nullptr;
            }
            return handle;
        }
#else
        // Without SQLite the history is one JSON object keyed by scenario id,
        // holding the latest run of each scenario.
        nlohmann::json readFallback(const std::string &file_path)
        {
            std::ifstream in(file_path);
            if (!in.good())
            {
                return nlohmann::json::object();
            }
            std::ostringstream content;
            content << in.rdbuf();
            nlohmann::json root = nlohmann::json::parse(content.str(), nullptr, false);
            if (root.is_discarded() || !root.is_object())
            {
                return nlohmann::json::object();
            }
            return root;
        }
#endif
    }

    Database::Database(std::string file_path)
        : file_path(std::move(file_path))
    {
    }

    bool Database::initialize(std::string *error) const
    {
#ifdef GREENWAVE_USE_SQLITE
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return false;
        }

        const char *create_sql =
            "CREATE TABLE IF NOT EXISTS optimization_runs ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "scenario_id INTEGER NOT NULL,"
            "seed INTEGER NOT NULL,"
            "best_fitness REAL,"
            "result_json TEXT NOT NULL,"
            "created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP"
            ");";

        char *errmsg = nullptr;
        const int exec_rc = sqlite3_exec(handle, create_sql, nullptr, nullptr, &errmsg);
        if (exec_rc != SQLITE_OK)
        {
            if (error)
            {
                *error = errmsg ? errmsg : "failed to initialize schema";
            }
            sqlite3_free(errmsg);
            sqlite3_close(handle);
            return false;
        }

        sqlite3_close(handle);
        return true;
#else
        std::ofstream out(file_path, std::ios::app);
        if (!out.good())
        {
            if (error)
            {
                *error = "failed to open fallback storage file";
            }
            return false;
        }
        return true;
#endif
    }

    bool Database::recordOptimizationRun(const RunRecord &record, std::string *error) const
    {
#ifdef GREENWAVE_USE_SQLITE
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return false;
        }

        const char *insert_sql =
            "INSERT INTO optimization_runs(scenario_id, seed, best_fitness, result_json) VALUES(?, ?, ?, ?);";

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(handle, insert_sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            if (error)
            {
                *error = sqlite3_errmsg(handle);
            }
            sqlite3_close(handle);
            return false;
        }

        sqlite3_bind_int(stmt, 1, record.scenario_id);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(record.seed));
        if (record.best_fitness.has_value())
        {
            sqlite3_bind_double(stmt, 3, *record.best_fitness);
        }
        else
        {
            sqlite3_bind_null(stmt, 3);
        }
        sqlite3_bind_text(stmt, 4, record.result_json.c_str(), static_cast<int>(record.result_json.size()), SQLITE_TRANSIENT);

        const int step_rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (step_rc != SQLITE_DONE)
        {
            if (error)
            {
                *error = sqlite3_errmsg(handle);
            }
            sqlite3_close(handle);
            return false;
        }

        sqlite3_close(handle);
        return true;
#else
        nlohmann::json root = readFallback(file_path);
        root[std::to_string(record.scenario_id)] = record.result_json;

        std::ofstream out(file_path, std::ios::trunc);
        if (!out.good())
        {
            if (error)
            {
                *error = "failed to write fallback storage file";
            }
            return false;
        }
        out << root.dump();
        return out.good();
#endif
    }

    std::optional<std::string> Database::loadLatestResultJson(int scenario_id, std::string *error) const
    {
#ifdef GREENWAVE_USE_SQLITE
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return std::nullopt;
        }

        const char *select_sql =
            "SELECT result_json FROM optimization_runs WHERE scenario_id = ? ORDER BY id DESC LIMIT 1;";

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(handle, select_sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            if (error)
            {
                *error = sqlite3_errmsg(handle);
            }
            sqlite3_close(handle);
            return std::nullopt;
        }

        sqlite3_bind_int(stmt, 1, scenario_id);

        const int step_rc = sqlite3_step(stmt);
        if (step_rc == SQLITE_ROW)
        {
            const unsigned char *text = sqlite3_column_text(stmt, 0);
            std::string value = text ? reinterpret_cast<const char *>(text) : "";
            sqlite3_finalize(stmt);
            sqlite3_close(handle);
            return value;
        }

        if (step_rc != SQLITE_DONE && error)
        {
            *error = sqlite3_errmsg(handle);
        }

        sqlite3_finalize(stmt);
        sqlite3_close(handle);
        return std::nullopt;
#else
        (void)error;
        nlohmann::json root = readFallback(file_path);
        const std::string key = std::to_string(scenario_id);
        if (!root.contains(key) || !root[key].is_string())
        {
            return std::nullopt;
        }
        return root[key].get<std::string>();
#endif
    }
} // namespace greenwave::db
