#include "student_grouper/allocation.hpp"

#include <algorithm>
#include <cstddef>
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

using LeftoverBlock = std::vector<Record>;

std::vector<std::string> codes_by_population(const std::vector<Record> &records)
{
    auto counts = count_branches(records);
    std::stable_sort(counts.begin(), counts.end(),
                     [](const auto &a, const auto &b)
                     { return a.second > b.second; });

    std::vector<std::string> codes;
    codes.reserve(counts.size());
    for (const auto &[code, count] : counts)
    {
        codes.push_back(code);
    }
    return codes;
}

std::unordered_map<std::string, std::vector<Record>> partition_by_branch(const std::vector<Record> &records)
{
    std::unordered_map<std::string, std::vector<Record>> partitions;
    for (const auto &record : records)
    {
        partitions[record.branch].push_back(record);
    }
    return partitions;
}

// Seeds a group with the front block and tops it up from the blocks behind it.
// A block that does not fit is split and its tail goes back to the front.
Group merge_next_group(std::deque<LeftoverBlock> &leftovers, size_t chunk_size)
{
    Group group = std::move(leftovers.front());
    leftovers.pop_front();

    size_t remain_space = chunk_size - group.size();
    while (remain_space > 0 && !leftovers.empty())
    {
        LeftoverBlock candidate = std::move(leftovers.front());
        leftovers.pop_front();

        if (candidate.size() <= remain_space)
        {
            remain_space -= candidate.size();
            group.insert(group.end(),
                         std::make_move_iterator(candidate.begin()),
                         std::make_move_iterator(candidate.end()));
        }
        else
        {
            const auto split = candidate.begin() + static_cast<std::ptrdiff_t>(remain_space);
            group.insert(group.end(), std::make_move_iterator(candidate.begin()), std::make_move_iterator(split));
            leftovers.emplace_front(std::make_move_iterator(split), std::make_move_iterator(candidate.end()));
            remain_space = 0;
        }
    }
    return group;
}

} // namespace

size_t compute_chunk_size(size_t total_records, int total_groups)
{
    if (total_groups < 1)
    {
        throw std::invalid_argument("Group count must be at least 1.");
    }
    const size_t groups = static_cast<size_t>(total_groups);
    return (total_records + groups - 1) / groups;
}

Groups allocate_uniform(const std::vector<Record> &records, int total_groups)
{
    const size_t chunk_size = compute_chunk_size(records.size(), total_groups);

    std::ostringstream line;
    line << "Uniform allocation: " << records.size() << " records into "
         << total_groups << " groups, chunk size " << chunk_size << ".\n";
    std::cout << line.str() << std::flush;

    Groups groups;
    std::vector<LeftoverBlock> leftover_blocks;

    if (chunk_size > 0)
    {
        auto partitions = partition_by_branch(records);
        for (const auto &code : codes_by_population(records))
        {
            const auto &rows = partitions[code];
            size_t k = 0;
            while (rows.size() - k >= chunk_size)
            {
                groups.emplace_back(rows.begin() + static_cast<std::ptrdiff_t>(k),
                                    rows.begin() + static_cast<std::ptrdiff_t>(k + chunk_size));
                k += chunk_size;
            }
            if (k < rows.size())
            {
                leftover_blocks.emplace_back(rows.begin() + static_cast<std::ptrdiff_t>(k), rows.end());
            }
        }
    }

    const size_t full_chunks = groups.size();

    std::stable_sort(leftover_blocks.begin(), leftover_blocks.end(),
                     [](const LeftoverBlock &a, const LeftoverBlock &b)
                     { return a.size() > b.size(); });
    std::deque<LeftoverBlock> leftovers(std::make_move_iterator(leftover_blocks.begin()),
                                        std::make_move_iterator(leftover_blocks.end()));

    while (!leftovers.empty())
    {
        groups.push_back(merge_next_group(leftovers, chunk_size));
    }

    const size_t allocated = count_records(groups);
    if (allocated != records.size())
    {
        throw std::logic_error("Uniform allocation placed " + std::to_string(allocated) +
                               " records but received " + std::to_string(records.size()) + ".");
    }
    if (groups.size() > static_cast<size_t>(total_groups))
    {
        throw std::logic_error("Uniform allocation produced " + std::to_string(groups.size()) +
                               " groups for a target of " + std::to_string(total_groups) + ".");
    }

    std::ostringstream built;
    built << "Uniform allocation built " << full_chunks << " full chunks and "
          << groups.size() - full_chunks << " merged groups.\n";
    std::cout << built.str() << std::flush;

    groups.resize(static_cast<size_t>(total_groups));
    return groups;
}

} // namespace student_grouper
