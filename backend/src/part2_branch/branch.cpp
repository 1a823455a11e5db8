#include "student_grouper/branch.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace student_grouper
{
namespace
{

bool is_upper_ascii(char c)
{
    return c >= 'A' && c <= 'Z';
}

} // namespace

const std::vector<std::string> &default_priority_branches()
{
    static const std::vector<std::string> priority = {
        "AI", "CB", "CE", "CH", "CS", "CT", "EC", "MC", "MM", "MT"};
    return priority;
}

std::string extract_branch(const std::string &roll_id)
{
    for (size_t i = 0; i + 1 < roll_id.size(); ++i)
    {
        if (is_upper_ascii(roll_id[i]) && is_upper_ascii(roll_id[i + 1]))
        {
            return roll_id.substr(i, 2);
        }
    }
    return kUnknownBranch;
}

std::string extract_branch(const std::optional<std::string> &roll_id)
{
    if (!roll_id)
    {
        return kUnknownBranch;
    }
    return extract_branch(*roll_id);
}

std::string extract_branch(const char *roll_id)
{
    if (!roll_id)
    {
        return kUnknownBranch;
    }
    return extract_branch(std::string(roll_id));
}

std::vector<std::string> build_draw_cycle(const std::vector<Record> &records, const std::vector<std::string> &priority)
{
    std::vector<std::string> active_codes;
    for (const auto &record : records)
    {
        if (std::find(active_codes.begin(), active_codes.end(), record.branch) == active_codes.end())
        {
            active_codes.push_back(record.branch);
        }
    }

    std::vector<std::string> cycle;
    cycle.reserve(active_codes.size());
    for (const auto &code : priority)
    {
        const bool present = std::find(active_codes.begin(), active_codes.end(), code) != active_codes.end();
        const bool seen = std::find(cycle.begin(), cycle.end(), code) != cycle.end();
        if (present && !seen)
        {
            cycle.push_back(code);
        }
    }
    for (const auto &code : active_codes)
    {
        if (std::find(priority.begin(), priority.end(), code) == priority.end())
        {
            cycle.push_back(code);
        }
    }
    return cycle;
}

// Codes in first-seen order.
std::vector<std::pair<std::string, int>> count_branches(const std::vector<Record> &records)
{
    std::vector<std::pair<std::string, int>> counts;
    std::unordered_map<std::string, size_t> position;

    for (const auto &record : records)
    {
        const auto it = position.find(record.branch);
        if (it == position.end())
        {
            position[record.branch] = counts.size();
            counts.push_back({record.branch, 1});
        }
        else
        {
            counts[it->second].second++;
        }
    }
    return counts;
}

} // namespace student_grouper
