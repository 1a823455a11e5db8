#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace student_grouper
{

// The parts of an HTTP request that carry a roster or a group count.
struct RosterRequest
{
    std::string content_type;
    std::string body;
    std::optional<std::string> groups_param;
};

bool is_csv_content(const std::string &content_type);
bool is_xlsx_content(const std::string &content_type);

// text/csv and xlsx bodies are parsed directly. Anything else must be JSON:
// an array of records, or an object with records, csv or source_url.
std::vector<Record> roster_from_request(const RosterRequest &request, long fetch_timeout_seconds);

int parse_group_count(const std::string &text);

// groups from a JSON object body, then the groups query parameter, then the
// configured default. The result is checked against the configured range.
int group_count_from_request(const RosterRequest &request, const ServiceConfig &config);

} // namespace student_grouper
