#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace student_grouper
{

const std::vector<std::string> &default_priority_branches();

std::string extract_branch(const std::string &roll_id);
std::string extract_branch(const std::optional<std::string> &roll_id);
std::string extract_branch(const char *roll_id);
std::vector<std::string> build_draw_cycle(const std::vector<Record> &records, const std::vector<std::string> &priority);
std::vector<std::pair<std::string, int>> count_branches(const std::vector<Record> &records);

} // namespace student_grouper
