#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace student_grouper
{

struct ServiceConfig
{
    std::string host{"0.0.0.0"};
    int port{8080};
    int default_groups{12};
    int min_groups{2};
    int max_groups{50};
    long fetch_timeout_seconds{60};
    std::vector<std::string> priority_branches;
};

ServiceConfig default_service_config();
ServiceConfig parse_service_config(const nlohmann::json &config_json);
ServiceConfig load_service_config(const std::string &path);
nlohmann::json service_config_to_json(const ServiceConfig &config);
void validate_group_count(const ServiceConfig &config, int total_groups);

} // namespace student_grouper
