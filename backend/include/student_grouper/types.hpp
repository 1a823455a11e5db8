#pragma once

#include <string>
#include <vector>

namespace student_grouper
{

inline const std::string kUnknownBranch = "NA";

struct Record
{
    std::string roll;
    std::string name;
    std::string email;
    std::string branch;
};

inline bool operator==(const Record &lhs, const Record &rhs)
{
    return lhs.roll == rhs.roll && lhs.name == rhs.name && lhs.email == rhs.email && lhs.branch == rhs.branch;
}

inline bool operator!=(const Record &lhs, const Record &rhs)
{
    return !(lhs == rhs);
}

using Group = std::vector<Record>;
using Groups = std::vector<Group>;

struct SummaryRow
{
    std::string label;
    std::vector<int> counts;
    int total{0};
};

struct SummaryMatrix
{
    std::vector<std::string> branch_codes;
    std::vector<SummaryRow> rows;
};

struct AllocationResult
{
    Groups groups;
    SummaryMatrix summary;
    long long computation_time_ms{};
};

} // namespace student_grouper
