#include "Database.hpp"

#include <sqlite3.h>

#include <utility>

namespace trafficjam::db
{
    namespace
    {
        sqlite3 *openHandle(const std::string &file_path, std::string *error)
        {
            sqlite3 *handle = nullptr;
            if (sqlite3_open(file_path.c_str(), &handle) != SQLITE_OK)
            {
                if (error)
                {
                    *error = handle ? sqlite3_errmsg(handle) : "failed to open database";
                }
                sqlite3_close(handle);
                return nullptr;
            }
            return handle;
        }

        sqlite3_stmt *prepare(sqlite3 *handle, const char *sql, std::string *error)
        {
            sqlite3_stmt *stmt = nullptr;
            if (sqlite3_prepare_v2(handle, sql, -1, &stmt, nullptr) != SQLITE_OK)
            {
                if (error)
                {
                    *error = sqlite3_errmsg(handle);
                }
                return nullptr;
            }
            return stmt;
        }
    }

    Database::Database(std::string file_path)
        : file_path(std::move(file_path))
    {
    }

    bool Database::initialize(std::string *error) const
    {
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return false;
        }

        const char *create_sql =
            "CREATE TABLE IF NOT EXISTS app_config ("
            "key TEXT PRIMARY KEY,"
            "value TEXT NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS runs ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "label TEXT NOT NULL,"
            "created_at TEXT NOT NULL DEFAULT (datetime('now')),"
            "artifact BLOB NOT NULL"
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
    }

    bool Database::saveActiveSimulationConfigJson(const std::string &config_json, std::string *error) const
    {
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return false;
        }

        const char *upsert_sql =
            "INSERT INTO app_config(key, value) VALUES('active_simulation_config', ?) "
            "ON CONFLICT(key) DO UPDATE SET value = excluded.value;";

        sqlite3_stmt *stmt = prepare(handle, upsert_sql, error);
        if (!stmt)
        {
            sqlite3_close(handle);
            return false;
        }

        sqlite3_bind_text(stmt, 1, config_json.c_str(), static_cast<int>(config_json.size()), SQLITE_TRANSIENT);

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
    }

    std::optional<std::string> Database::loadActiveSimulationConfigJson(std::string *error) const
    {
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return std::nullopt;
        }

        const char *select_sql = "SELECT value FROM app_config WHERE key = 'active_simulation_config' LIMIT 1;";

        sqlite3_stmt *stmt = prepare(handle, select_sql, error);
        if (!stmt)
        {
            sqlite3_close(handle);
            return std::nullopt;
        }

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
    }

    std::optional<int64_t> Database::saveRunArtifact(const std::string &label,
                                                     const std::vector<uint8_t> &artifact,
                                                     std::string *error) const
    {
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return std::nullopt;
        }

        sqlite3_stmt *stmt = prepare(handle, "INSERT INTO runs(label, artifact) VALUES(?, ?);", error);
        if (!stmt)
        {
            sqlite3_close(handle);
            return std::nullopt;
        }

        sqlite3_bind_text(stmt, 1, label.c_str(), static_cast<int>(label.size()), SQLITE_TRANSIENT);
        sqlite3_bind_blob(stmt, 2, artifact.data(), static_cast<int>(artifact.size()), SQLITE_TRANSIENT);

        const int step_rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (step_rc != SQLITE_DONE)
        {
            if (error)
            {
                *error = sqlite3_errmsg(handle);
            }
            sqlite3_close(handle);
            return std::nullopt;
        }

        const int64_t run_id = sqlite3_last_insert_rowid(handle);
        sqlite3_close(handle);
        return run_id;
    }

    std::optional<std::vector<uint8_t>> Database::loadRunArtifact(int64_t run_id, std::string *error) const
    {
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return std::nullopt;
        }

        sqlite3_stmt *stmt = prepare(handle, "SELECT artifact FROM runs WHERE id = ? LIMIT 1;", error);
        if (!stmt)
        {
            sqlite3_close(handle);
            return std::nullopt;
        }

        sqlite3_bind_int64(stmt, 1, run_id);

        const int step_rc = sqlite3_step(stmt);
        if (step_rc == SQLITE_ROW)
        {
            const auto *blob = static_cast<const uint8_t *>(sqlite3_column_blob(stmt, 0));
            const int size = sqlite3_column_bytes(stmt, 0);
            std::vector<uint8_t> artifact;
            if (blob && size > 0)
            {
                artifact.assign(blob, blob + size);
            }
            sqlite3_finalize(stmt);
            sqlite3_close(handle);
            return artifact;
        }

        if (error)
        {
            *error = step_rc == SQLITE_DONE ? "no run with id " + std::to_string(run_id) : sqlite3_errmsg(handle);
        }

        sqlite3_finalize(stmt);
        sqlite3_close(handle);
        return std::nullopt;
    }

    std::vector<RunRecord> Database::listRuns(std::string *error) const
    {
        std::vector<RunRecord> runs;
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return runs;
        }

        sqlite3_stmt *stmt = prepare(handle, "SELECT id, label, created_at, length(artifact) FROM runs ORDER BY id;", error);
        if (!stmt)
        {
            sqlite3_close(handle);
            return runs;
        }

        int step_rc = SQLITE_ROW;
        while ((step_rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            RunRecord record;
            record.id = sqlite3_column_int64(stmt, 0);
            const unsigned char *label = sqlite3_column_text(stmt, 1);
            record.label = label ? reinterpret_cast<const char *>(label) : "";
            const unsigned char *created = sqlite3_column_text(stmt, 2);
            record.created_at = created ? reinterpret_cast<const char *>(created) : "";
            record.artifact_bytes = static_cast<std::size_t>(sqlite3_column_int64(stmt, 3));
            runs.push_back(std::move(record));
        }

        if (step_rc != SQLITE_DONE && error)
        {
            *error = sqlite3_errmsg(handle);
        }

        sqlite3_finalize(stmt);
        sqlite3_close(handle);
        return runs;
    }
} // namespace trafficjam::db
