#pragma once

#include <deque>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "types.hpp"

namespace student_grouper
{

using BranchStock = std::unordered_map<std::string, std::deque<Record>>;

std::vector<int> compute_group_targets(size_t total_records, int total_groups);
BranchStock build_branch_stock(const std::vector<Record> &records);

// Sweeps the cycle until the group reaches limit or a sweep draws nothing.
// A stalled group is left short; that is not an error.
size_t fill_group(Group &group, size_t limit, const std::vector<std::string> &cycle, BranchStock &stock);

Groups allocate_branchwise(const std::vector<Record> &records, int total_groups,
                           const std::vector<std::string> &priority);
Groups allocate_branchwise(const std::vector<Record> &records, int total_groups);

size_t compute_chunk_size(size_t total_records, int total_groups);
Groups allocate_uniform(const std::vector<Record> &records, int total_groups);

// Runs both allocators on their own copies of records. First is branch-wise, second uniform.
std::pair<AllocationResult, AllocationResult> run_allocations(const std::vector<Record> &records, int total_groups,
                                                              const std::vector<std::string> &priority);

} // namespace student_grouper
