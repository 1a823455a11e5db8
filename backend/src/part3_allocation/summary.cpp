#include "student_grouper/summary.hpp"

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace student_grouper
{

std::string group_label(size_t index)
{
    return "Group " + std::to_string(index + 1);
}

SummaryMatrix compile_summary(const Groups &groups)
{
    std::set<std::string> codes;
    for (const auto &group : groups)
    {
        for (const auto &record : group)
        {
            codes.insert(record.branch);
        }
    }

    SummaryMatrix summary;
    summary.branch_codes.assign(codes.begin(), codes.end());
    summary.rows.reserve(groups.size());

    for (size_t gi = 0; gi < groups.size(); ++gi)
    {
        SummaryRow row;
        row.label = group_label(gi);
        row.counts.assign(summary.branch_codes.size(), 0);

        for (size_t ci = 0; ci < summary.branch_codes.size(); ++ci)
        {
            for (const auto &record : groups[gi])
            {
                if (record.branch == summary.branch_codes[ci])
                {
                    row.counts[ci]++;
                }
            }
        }
        row.total = static_cast<int>(groups[gi].size());

        summary.rows.push_back(std::move(row));
    }
    return summary;
}

size_t count_records(const Groups &groups)
{
    size_t total = 0;
    for (const auto &group : groups)
    {
        total += group.size();
    }
    return total;
}

} // namespace student_grouper
