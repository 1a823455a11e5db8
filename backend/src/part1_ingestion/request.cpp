#include "student_grouper/request.hpp"

#include <climits>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "student_grouper/fetch.hpp"
#include "student_grouper/roster.hpp"
#include "student_grouper/workbook.hpp"

namespace student_grouper
{
namespace
{

using json = nlohmann::json;

bool carries_json(const RosterRequest &request)
{
    return !request.body.empty() && !is_csv_content(request.content_type) &&
           !is_xlsx_content(request.content_type) && !looks_like_zip(request.body);
}

} // namespace

bool is_csv_content(const std::string &content_type)
{
    return content_type.find("text/csv") != std::string::npos;
}

bool is_xlsx_content(const std::string &content_type)
{
    return content_type.find("spreadsheetml.sheet") != std::string::npos;
}

std::vector<Record> roster_from_request(const RosterRequest &request, long fetch_timeout_seconds)
{
    if (is_csv_content(request.content_type))
    {
        return parse_roster_csv(request.body);
    }
    if (is_xlsx_content(request.content_type) || looks_like_zip(request.body))
    {
        return parse_roster_xlsx(request.body);
    }

    const auto body = json::parse(request.body);
    if (body.is_array() || (body.contains("records") && body["records"].is_array()))
    {
        return parse_roster_json(body);
    }
    if (body.contains("csv") && body["csv"].is_string())
    {
        return parse_roster_csv(body["csv"].get<std::string>());
    }
    if (body.contains("source_url") && body["source_url"].is_string())
    {
        return fetch_roster(body["source_url"].get<std::string>(), fetch_timeout_seconds);
    }
    throw std::runtime_error("Request must carry records, csv or source_url.");
}

int parse_group_count(const std::string &text)
{
    size_t consumed = 0;
    long long value = 0;
    try
    {
        value = std::stoll(text, &consumed);
    }
    catch (const std::logic_error &)
    {
        throw std::invalid_argument("groups must be an integer, got '" + text + "'.");
    }
    if (consumed != text.size() || value < INT_MIN || value > INT_MAX)
    {
        throw std::invalid_argument("groups must be an integer, got '" + text + "'.");
    }
    return static_cast<int>(value);
}

int group_count_from_request(const RosterRequest &request, const ServiceConfig &config)
{
    int total_groups = config.default_groups;
    bool from_body = false;

    if (carries_json(request))
    {
        const auto body = json::parse(request.body);
        if (body.is_object() && body.contains("groups"))
        {
            if (!body["groups"].is_number_integer())
            {
                throw std::invalid_argument("groups must be an integer.");
            }
            const auto &groups = body["groups"];
            const auto requested = groups.get<long long>();
            const bool too_large = groups.is_number_unsigned() && groups.get<unsigned long long>() > static_cast<unsigned long long>(INT_MAX);
            if (too_large || requested < INT_MIN || requested > INT_MAX)
            {
                throw std::invalid_argument("groups is out of range.");
            }
            total_groups = static_cast<int>(requested);
            from_body = true;
        }
    }
    if (!from_body && request.groups_param)
    {
        total_groups = parse_group_count(*request.groups_param);
    }

    validate_group_count(config, total_groups);
    return total_groups;
}

} // namespace student_grouper
