#include "student_grouper/allocation.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "student_grouper/summary.hpp"

namespace student_grouper
{
namespace
{

template <typename Allocate>
AllocationResult timed_allocation(Allocate allocate)
{
    AllocationResult result;

    const auto start_time = std::chrono::high_resolution_clock::now();
    result.groups = allocate();
    result.summary = compile_summary(result.groups);
    const auto end_time = std::chrono::high_resolution_clock::now();

    result.computation_time_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    return result;
}

} // namespace

std::pair<AllocationResult, AllocationResult> run_allocations(const std::vector<Record> &records, int total_groups,
                                                              const std::vector<std::string> &priority)
{
    if (total_groups < 1)
    {
        throw std::invalid_argument("Group count must be at least 1.");
    }

    auto branchwise_future = std::async(std::launch::async, [records, total_groups, priority]()
                                        { return timed_allocation([&]()
                                                                  { return allocate_branchwise(records, total_groups, priority); }); });
    auto uniform_future = std::async(std::launch::async, [records, total_groups]()
                                     { return timed_allocation([&]()
                                                               { return allocate_uniform(records, total_groups); }); });

    std::pair<AllocationResult, AllocationResult> results;
    results.first = branchwise_future.get();
    results.second = uniform_future.get();

    std::ostringstream line;
    line << "Allocations complete (branch-wise " << results.first.computation_time_ms
         << " ms, uniform " << results.second.computation_time_ms << " ms).\n";
    std::cout << line.str() << std::flush;
    return results;
}

} // namespace student_grouper
