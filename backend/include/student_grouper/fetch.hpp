#pragma once

#include <string>
#include <vector>

#include "types.hpp"

namespace student_grouper
{

std::string fetch_roster_payload(const std::string &url, long timeout_seconds = 60);
std::vector<Record> fetch_roster(const std::string &url, long timeout_seconds = 60);

} // namespace student_grouper
