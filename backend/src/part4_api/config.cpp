#include "student_grouper/config.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "student_grouper/branch.hpp"

namespace student_grouper
{

ServiceConfig default_service_config()
{
    ServiceConfig config;
    config.priority_branches = default_priority_branches();
    return config;
}

ServiceConfig parse_service_config(const nlohmann::json &config_json)
{
    if (!config_json.is_object())
    {
        throw std::runtime_error("Service config must be a JSON object.");
    }

    ServiceConfig config = default_service_config();
    config.host = config_json.value("host", config.host);
    config.port = config_json.value("port", config.port);
    config.default_groups = config_json.value("default_groups", config.default_groups);
    config.min_groups = config_json.value("min_groups", config.min_groups);
    config.max_groups = config_json.value("max_groups", config.max_groups);
    config.fetch_timeout_seconds = config_json.value("fetch_timeout_seconds", config.fetch_timeout_seconds);
    if (config_json.contains("priority_branches"))
    {
        config.priority_branches = config_json["priority_branches"].get<std::vector<std::string>>();
    }

    if (config.min_groups < 1 || config.max_groups < config.min_groups)
    {
        throw std::runtime_error("Invalid group range in service config.");
    }
    if (config.default_groups < config.min_groups || config.default_groups > config.max_groups)
    {
        throw std::runtime_error("default_groups lies outside the configured group range.");
    }
    return config;
}

ServiceConfig load_service_config(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        std::cout << "No config at " << path << ", using defaults." << std::endl;
        return default_service_config();
    }

    try
    {
        const auto config_json = nlohmann::json::parse(in);
        std::cout << "Loaded service config from " << path << std::endl;
        return parse_service_config(config_json);
    }
    catch (const nlohmann::json::exception &ex)
    {
        throw std::runtime_error("Unable to parse config " + path + ": " + ex.what());
    }
}

nlohmann::json service_config_to_json(const ServiceConfig &config)
{
    return {
        {"host", config.host},
        {"port", config.port},
        {"default_groups", config.default_groups},
        {"min_groups", config.min_groups},
        {"max_groups", config.max_groups},
        {"fetch_timeout_seconds", config.fetch_timeout_seconds},
        {"priority_branches", config.priority_branches}};
}

void validate_group_count(const ServiceConfig &config, int total_groups)
{
    if (total_groups < config.min_groups || total_groups > config.max_groups)
    {
        throw std::invalid_argument("Group count " + std::to_string(total_groups) + " outside allowed range " +
                                    std::to_string(config.min_groups) + ".." + std::to_string(config.max_groups) + ".");
    }
}

} // namespace student_grouper
