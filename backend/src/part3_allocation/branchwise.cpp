#include "student_grouper/allocation.hpp"

#include <deque>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "student_grouper/branch.hpp"
#include "student_grouper/summary.hpp"

namespace student_grouper
{
namespace
{

bool draw_round(Group &group, size_t limit, const std::vector<std::string> &cycle, BranchStock &stock)
{
    bool moved = false;
    for (const auto &code : cycle)
    {
        if (group.size() >= limit)
        {
            break;
        }

        const auto it = stock.find(code);
        if (it != stock.end() && !it->second.empty())
        {
            group.push_back(std::move(it->second.front()));
            it->second.pop_front();
            moved = true;
        }
    }
    return moved;
}

} // namespace

std::vector<int> compute_group_targets(size_t total_records, int total_groups)
{
    if (total_groups < 1)
    {
        throw std::invalid_argument("Group count must be at least 1.");
    }

    const size_t groups = static_cast<size_t>(total_groups);
    const size_t base_size = total_records / groups;
    const size_t remainder = total_records % groups;

    std::vector<int> targets;
    targets.reserve(groups);
    for (size_t i = 0; i < groups; ++i)
    {
        targets.push_back(static_cast<int>(base_size + (i < remainder ? 1 : 0)));
    }
    return targets;
}

BranchStock build_branch_stock(const std::vector<Record> &records)
{
    BranchStock stock;
    for (const auto &record : records)
    {
        stock[record.branch].push_back(record);
    }
    return stock;
}

size_t fill_group(Group &group, size_t limit, const std::vector<std::string> &cycle, BranchStock &stock)
{
    const size_t before = group.size();
    while (group.size() < limit)
    {
        if (!draw_round(group, limit, cycle, stock))
        {
            break;
        }
    }
    return group.size() - before;
}

Groups allocate_branchwise(const std::vector<Record> &records, int total_groups,
                           const std::vector<std::string> &priority)
{
    const auto targets = compute_group_targets(records.size(), total_groups);
    const auto cycle = build_draw_cycle(records, priority);

    std::ostringstream line;
    line << "Branch-wise allocation: " << records.size() << " records into "
         << total_groups << " groups, draw cycle of " << cycle.size() << " branches.\n";
    std::cout << line.str() << std::flush;

    auto stock = build_branch_stock(records);

    Groups groups(targets.size());
    size_t short_groups = 0;
    for (size_t gi = 0; gi < groups.size(); ++gi)
    {
        const size_t limit = static_cast<size_t>(targets[gi]);
        fill_group(groups[gi], limit, cycle, stock);
        if (groups[gi].size() < limit)
        {
            short_groups++;
        }
    }

    const size_t allocated = count_records(groups);
    if (short_groups > 0)
    {
        std::ostringstream dry;
        dry << "Branch stock ran dry: " << short_groups << " groups below target, "
            << records.size() - allocated << " records short.\n";
        std::cout << dry.str() << std::flush;
    }
    std::ostringstream placed;
    placed << "Branch-wise allocation placed " << allocated << " of " << records.size() << " records.\n";
    std::cout << placed.str() << std::flush;

    return groups;
}

Groups allocate_branchwise(const std::vector<Record> &records, int total_groups)
{
    return allocate_branchwise(records, total_groups, default_priority_branches());
}

} // namespace student_grouper
