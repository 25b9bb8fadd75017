#include "SimulationConfigJson.hpp"
#include "SimulationError.hpp"

#include <nlohmann/json.hpp>

#include <limits>

namespace trafficjam
{
    namespace
    {
        using nlohmann::json;

        void readInt(const json &object, const char *key, int &out, std::vector<std::string> &errors)
        {
            if (!object.contains(key))
            {
                return;
            }
            const json &value = object[key];
            if (!value.is_number_integer() || value.get<long long>() > std::numeric_limits<int>::max() ||
                value.get<long long>() < std::numeric_limits<int>::min())
            {
                errors.push_back(std::string("street.") + key + " must be an integer");
                return;
            }
            out = value.get<int>();
        }

        void parseStreet(const json &street_json, StreetConfig &street, std::vector<std::string> &errors)
        {
            if (!street_json.is_object())
            {
                errors.push_back("street must be an object");
                return;
            }

            readInt(street_json, "lanes", street.lanes, errors);
            readInt(street_json, "length", street.length, errors);
            readInt(street_json, "car_count", street.car_count, errors);
            readInt(street_json, "v_max", street.v_max, errors);

            if (street_json.contains("seed"))
            {
                const json &seed = street_json["seed"];
                if (!seed.is_number_unsigned() || seed.get<unsigned long long>() > std::numeric_limits<uint32_t>::max())
                {
                    errors.push_back("street.seed must be a non-negative 32-bit integer");
                }
                else
                {
                    street.seed = seed.get<uint32_t>();
                }
            }
        }

        void parseRules(const json &rules_json, std::vector<RuleDescriptor> &rules, std::vector<std::string> &errors)
        {
            if (!rules_json.is_array())
            {
                errors.push_back("rules must be an array");
                return;
            }

            rules.clear();
            size_t rule_index = 0;
            for (const auto &rule_json : rules_json)
            {
                const std::string where = "rules[" + std::to_string(rule_index++) + "]";
                if (!rule_json.is_object())
                {
                    errors.push_back(where + " must be an object");
                    continue;
                }
                if (!rule_json.contains("kind") || !rule_json["kind"].is_string())
                {
                    errors.push_back(where + ".kind must be a string");
                    continue;
                }

                RuleDescriptor descriptor;
                descriptor.kind = rule_json["kind"].get<std::string>();
                if (rule_json.contains("params"))
                {
                    const json &params = rule_json["params"];
                    if (!params.is_object())
                    {
                        errors.push_back(where + ".params must be an object");
                        continue;
                    }
                    bool params_ok = true;
                    for (auto it = params.begin(); it != params.end(); ++it)
                    {
                        if (!it.value().is_number())
                        {
                            errors.push_back(where + ".params." + it.key() + " must be a number");
                            params_ok = false;
                            continue;
                        }
                        descriptor.params[it.key()] = it.value().get<double>();
                    }
                    if (!params_ok)
                    {
                        continue;
                    }
                }

                // Building the rule once validates kind and parameters.
                try
                {
                    makeRule(descriptor);
                }
                catch (const SimulationError &e)
                {
                    errors.push_back(where + ": " + e.what());
                    continue;
                }
                rules.push_back(std::move(descriptor));
            }
        }

        void checkAccelerationAgainstStreet(const SimulationConfig &config, std::vector<std::string> &errors)
        {
            for (const auto &rule : config.rules)
            {
                if (rule.kind != rule_kind::ACCELERATE)
                {
                    continue;
                }
                auto it = rule.params.find("v_max");
                if (it != rule.params.end() && it->second > config.street.v_max)
                {
                    errors.push_back("accelerate v_max must not exceed street.v_max");
                }
            }
        }
    }

    std::string simulationConfigToJson(const SimulationConfig &config)
    {
        json root;
        root["street"] = {
            {"lanes", config.street.lanes},
            {"length", config.street.length},
            {"car_count", config.street.car_count},
            {"v_max", config.street.v_max},
            {"seed", config.street.seed}};
        root["max_steps"] = config.max_steps;

        root["rules"] = json::array();
        for (const auto &rule : config.rules)
        {
            json rule_json;
            rule_json["kind"] = rule.kind;
            rule_json["params"] = json::object();
            for (const auto &param : rule.params)
            {
                rule_json["params"][param.first] = param.second;
            }
            root["rules"].push_back(rule_json);
        }

        return root.dump();
    }

    ConfigParseResult simulationConfigFromJson(const std::string &json_text)
    {
        ConfigParseResult result;
        result.config = makeDefaultSimulationConfig();

        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const std::exception &e)
        {
            result.errors.push_back(std::string("invalid JSON: ") + e.what());
            return result;
        }

        if (!root.is_object())
        {
            result.errors.push_back("root must be an object");
            return result;
        }

        if (root.contains("street"))
        {
            parseStreet(root["street"], result.config.street, result.errors);
        }

        if (root.contains("max_steps"))
        {
            if (!root["max_steps"].is_number_unsigned())
            {
                result.errors.push_back("max_steps must be a non-negative integer");
            }
            else
            {
                result.config.max_steps = root["max_steps"].get<size_t>();
            }
        }

        if (root.contains("rules"))
        {
            parseRules(root["rules"], result.config.rules, result.errors);
        }

        for (const auto &error : validateStreetConfig(result.config.street))
        {
            result.errors.push_back("street: " + error);
        }
        checkAccelerationAgainstStreet(result.config, result.errors);

        result.ok = result.errors.empty();
        return result;
    }

    std::string validationErrorsToJson(const std::vector<std::string> &errors)
    {
        json root;
        root["ok"] = false;
        root["errors"] = errors;
        return root.dump();
    }

} // namespace trafficjam
