#include "student_grouper/state.hpp"

namespace student_grouper
{

std::mutex state_mutex;
ServiceConfig service_config = default_service_config();
std::vector<Record> roster;
bool roster_loaded = false;
AllocationResult branchwise_result;
AllocationResult uniform_result;
int last_group_count = 0;

void reset_allocation_results()
{
    branchwise_result = AllocationResult{};
    uniform_result = AllocationResult{};
    last_group_count = 0;
}

} // namespace student_grouper
