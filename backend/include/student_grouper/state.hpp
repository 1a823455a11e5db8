#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace student_grouper
{

extern std::mutex state_mutex;
extern ServiceConfig service_config;
extern std::vector<Record> roster;
extern bool roster_loaded;
extern AllocationResult branchwise_result;
extern AllocationResult uniform_result;
extern int last_group_count;

void reset_allocation_results();

} // namespace student_grouper
