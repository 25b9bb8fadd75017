#include "RunnerCodec.hpp"
#include "Runner.hpp"
#include "SimulationError.hpp"

#include <nlohmann/json.hpp>
#include <zlib.h>

#include <fstream>
#include <iterator>
#include <limits>
#include <utility>

namespace trafficjam
{
    namespace
    {
        using nlohmann::json;

        // Upper bound of deflate's compression ratio.
        constexpr std::size_t ZLIB_MAX_EXPANSION = 1032;

        [[noreturn]] void corrupt(const std::string &message)
        {
            throw SimulationError(ErrorKind::CorruptArtifact, message);
        }

        const json &requireField(const json &object, const char *key)
        {
            auto it = object.find(key);
            if (it == object.end())
            {
                corrupt(std::string("missing field: ") + key);
            }
            return *it;
        }

        long long requireInteger(const json &object, const char *key)
        {
            const json &value = requireField(object, key);
            if (!value.is_number_integer())
            {
                corrupt(std::string(key) + " must be an integer");
            }
            return value.get<long long>();
        }

        int requireIntField(const json &object, const char *key)
        {
            const long long value = requireInteger(object, key);
            if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
            {
                corrupt(std::string(key) + " is out of range");
            }
            return static_cast<int>(value);
        }

        StreetConfig streetFromJson(const json &street_json)
        {
            if (!street_json.is_object())
            {
                corrupt("street must be an object");
            }

            StreetConfig config;
            config.lanes = requireIntField(street_json, "lanes");
            config.length = requireIntField(street_json, "length");
            config.car_count = requireIntField(street_json, "car_count");
            config.v_max = requireIntField(street_json, "v_max");
            const long long seed = requireInteger(street_json, "seed");
            if (seed < 0 || seed > std::numeric_limits<uint32_t>::max())
            {
                corrupt("seed is out of range");
            }
            config.seed = static_cast<uint32_t>(seed);

            const auto errors = validateStreetConfig(config);
            if (!errors.empty())
            {
                corrupt("invalid street parameters: " + errors.front());
            }
            return config;
        }

        std::vector<RuleDescriptor> rulesFromJson(const json &rules_json)
        {
            if (!rules_json.is_array())
            {
                corrupt("rules must be an array");
            }

            std::vector<RuleDescriptor> descriptors;
            for (const auto &rule_json : rules_json)
            {
                if (!rule_json.is_object())
                {
                    corrupt("rule entries must be objects");
                }
                const json &kind = requireField(rule_json, "kind");
                if (!kind.is_string())
                {
                    corrupt("rule kind must be a string");
                }

                RuleDescriptor descriptor;
                descriptor.kind = kind.get<std::string>();
                const json &params = requireField(rule_json, "params");
                if (!params.is_object())
                {
                    corrupt("rule params must be an object");
                }
                for (auto it = params.begin(); it != params.end(); ++it)
                {
                    if (!it.value().is_number())
                    {
                        corrupt("rule parameter " + it.key() + " must be a number");
                    }
                    descriptor.params[it.key()] = it.value().get<double>();
                }
                descriptors.push_back(std::move(descriptor));
            }
            return descriptors;
        }
    }

    std::vector<uint8_t> compressHistory(const std::vector<Grid> &history)
    {
        std::vector<uint8_t> raw;
        for (const Grid &grid : history)
        {
            for (CellValue value : grid.raw())
            {
                raw.push_back(static_cast<uint8_t>(value + 1));
            }
        }

        uLongf compressed_size = compressBound(static_cast<uLong>(raw.size()));
        std::vector<uint8_t> compressed(compressed_size);
        const int rc = compress2(compressed.data(), &compressed_size, raw.data(),
                                 static_cast<uLong>(raw.size()), Z_BEST_COMPRESSION);
        if (rc != Z_OK)
        {
            throw SimulationError(ErrorKind::CorruptArtifact, "zlib compression failed with code " + std::to_string(rc));
        }
        compressed.resize(compressed_size);
        return compressed;
    }

    std::vector<Grid> decompressHistory(const std::vector<uint8_t> &data,
                                        std::size_t steps,
                                        std::size_t lanes,
                                        std::size_t length)
    {
        std::vector<Grid> history;
        if (lanes != 0 && length > std::numeric_limits<std::size_t>::max() / lanes)
        {
            corrupt("history grid size overflows");
        }
        const std::size_t cells_per_grid = lanes * length;
        if (cells_per_grid != 0 && steps > std::numeric_limits<std::size_t>::max() / cells_per_grid)
        {
            corrupt("history shape overflows: " + std::to_string(steps) + " snapshots of " +
                    std::to_string(cells_per_grid) + " cells");
        }
        const std::size_t expected = steps * cells_per_grid;
        if (expected == 0)
        {
            return history;
        }
        if (expected / ZLIB_MAX_EXPANSION > data.size())
        {
            corrupt("history data of " + std::to_string(data.size()) + " bytes cannot hold " +
                    std::to_string(expected) + " cells");
        }

        std::vector<uint8_t> raw(expected);
        uLongf raw_size = static_cast<uLongf>(expected);
        const int rc = uncompress(raw.data(), &raw_size, data.data(), static_cast<uLong>(data.size()));
        if (rc != Z_OK)
        {
            corrupt("history data could not be decompressed (zlib code " + std::to_string(rc) + ")");
        }
        if (raw_size != expected)
        {
            corrupt("history data holds " + std::to_string(raw_size) + " cells, expected " + std::to_string(expected));
        }

        history.reserve(steps);
        std::size_t offset = 0;
        for (std::size_t t = 0; t < steps; ++t)
        {
            Grid grid(lanes, length);
            for (std::size_t lane = 0; lane < lanes; ++lane)
            {
                for (std::size_t cell = 0; cell < length; ++cell)
                {
                    grid.set(lane, cell, static_cast<CellValue>(static_cast<int>(raw[offset++]) - 1));
                }
            }
            history.push_back(std::move(grid));
        }
        return history;
    }

    std::vector<uint8_t> encodeRunArtifact(const Runner &runner)
    {
        const StreetConfig &street = runner.getStreetConfig();
        const auto &history = runner.getHistory();

        json root;
        root["format"] = RUN_ARTIFACT_FORMAT;
        root["version"] = RUN_ARTIFACT_VERSION;
        root["street"] = {
            {"lanes", street.lanes},
            {"length", street.length},
            {"car_count", street.car_count},
            {"v_max", street.v_max},
            {"seed", street.seed}};
        root["max_steps"] = runner.getMaxSteps();

        root["rules"] = json::array();
        for (const auto &descriptor : runner.describeRules())
        {
            json rule_json;
            rule_json["kind"] = descriptor.kind;
            rule_json["params"] = json::object();
            for (const auto &param : descriptor.params)
            {
                rule_json["params"][param.first] = param.second;
            }
            root["rules"].push_back(rule_json);
        }

        json history_json;
        history_json["shape"] = {history.size(),
                                 static_cast<std::size_t>(street.lanes),
                                 static_cast<std::size_t>(street.length)};
        history_json["encoding"] = HISTORY_ENCODING;
        history_json["data"] = json::binary(compressHistory(history));
        root["history"] = history_json;

        return json::to_cbor(root);
    }

    Runner decodeRunArtifact(const std::vector<uint8_t> &bytes)
    {
        json root;
        try
        {
            root = json::from_cbor(bytes);
        }
        catch (const json::exception &e)
        {
            corrupt(std::string("artifact is not valid CBOR: ") + e.what());
        }

        if (!root.is_object())
        {
            corrupt("artifact root must be an object");
        }

        const json &format = requireField(root, "format");
        if (!format.is_string() || format.get<std::string>() != RUN_ARTIFACT_FORMAT)
        {
            corrupt("artifact is not a trafficjam run");
        }

        const long long version = requireInteger(root, "version");
        if (version != static_cast<long long>(RUN_ARTIFACT_VERSION))
        {
            throw SimulationError(ErrorKind::VersionMismatch,
                                  "unsupported artifact version " + std::to_string(version));
        }

        const StreetConfig street = streetFromJson(requireField(root, "street"));
        const long long max_steps = requireInteger(root, "max_steps");
        if (max_steps < 0)
        {
            corrupt("max_steps must not be negative");
        }
        const std::vector<RuleDescriptor> descriptors = rulesFromJson(requireField(root, "rules"));

        const json &history_json = requireField(root, "history");
        if (!history_json.is_object())
        {
            corrupt("history must be an object");
        }
        const json &encoding = requireField(history_json, "encoding");
        if (!encoding.is_string() || encoding.get<std::string>() != HISTORY_ENCODING)
        {
            throw SimulationError(ErrorKind::VersionMismatch, "unsupported history encoding");
        }

        const json &shape = requireField(history_json, "shape");
        if (!shape.is_array() || shape.size() != 3 || !shape[0].is_number_unsigned() ||
            !shape[1].is_number_unsigned() || !shape[2].is_number_unsigned())
        {
            corrupt("history shape must be three non-negative integers");
        }
        const std::size_t steps = shape[0].get<std::size_t>();
        const std::size_t lanes = shape[1].get<std::size_t>();
        const std::size_t length = shape[2].get<std::size_t>();
        if (lanes != static_cast<std::size_t>(street.lanes) || length != static_cast<std::size_t>(street.length))
        {
            throw SimulationError(ErrorKind::VersionMismatch,
                                  "history shape [" + std::to_string(steps) + ", " + std::to_string(lanes) + ", " +
                                      std::to_string(length) + "] contradicts street " +
                                      std::to_string(street.lanes) + "x" + std::to_string(street.length));
        }
        if (steps > static_cast<std::size_t>(max_steps) + 1)
        {
            throw SimulationError(ErrorKind::VersionMismatch,
                                  "history holds " + std::to_string(steps) + " snapshots, more than max_steps allows");
        }

        const json &data = requireField(history_json, "data");
        if (!data.is_binary())
        {
            corrupt("history data must be binary");
        }
        const std::vector<uint8_t> compressed(data.get_binary().begin(), data.get_binary().end());
        std::vector<Grid> history = decompressHistory(compressed, steps, lanes, length);

        for (const Grid &grid : history)
        {
            for (CellValue value : grid.raw())
            {
                if (value < EMPTY_CELL || value > street.v_max)
                {
                    corrupt("history cell value " + std::to_string(value) + " outside [-1, v_max]");
                }
            }
            if (grid.occupiedCount() != static_cast<std::size_t>(street.car_count))
            {
                corrupt("history snapshot holds " + std::to_string(grid.occupiedCount()) + " cars, expected " +
                        std::to_string(street.car_count));
            }
        }

        try
        {
            return Runner::restore(street, makeRulePipeline(descriptors), static_cast<std::size_t>(max_steps),
                                   std::move(history));
        }
        catch (const SimulationError &e)
        {
            if (e.kind() == ErrorKind::ConfigurationError)
            {
                corrupt(std::string("artifact rules are invalid: ") + e.what());
            }
            throw;
        }
    }

    bool writeArtifactFile(const std::string &path, const std::vector<uint8_t> &bytes, std::string *error)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.good())
        {
            if (error)
            {
                *error = "failed to open " + path + " for writing";
            }
            return false;
        }
        out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out.good())
        {
            if (error)
            {
                *error = "failed to write " + path;
            }
            return false;
        }
        return true;
    }

    bool readArtifactFile(const std::string &path, std::vector<uint8_t> &bytes, std::string *error)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.good())
        {
            if (error)
            {
                *error = "failed to open " + path;
            }
            return false;
        }
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        return true;
    }

} // namespace trafficjam
