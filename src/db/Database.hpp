#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trafficjam::db
{
    struct RunRecord
    {
        int64_t id = 0;
        std::string label;
        std::string created_at;
        std::size_t artifact_bytes = 0;
    };

    class Database
    {
    public:
        explicit Database(std::string file_path);

        bool initialize(std::string *error = nullptr) const;
        bool saveActiveSimulationConfigJson(const std::string &config_json, std::string *error = nullptr) const;
        std::optional<std::string> loadActiveSimulationConfigJson(std::string *error = nullptr) const;

        std::optional<int64_t> saveRunArtifact(const std::string &label,
                                               const std::vector<uint8_t> &artifact,
                                               std::string *error = nullptr) const;
        std::optional<std::vector<uint8_t>> loadRunArtifact(int64_t run_id, std::string *error = nullptr) const;
        std::vector<RunRecord> listRuns(std::string *error = nullptr) const;

    private:
        std::string file_path;
    };

} // namespace trafficjam::db
