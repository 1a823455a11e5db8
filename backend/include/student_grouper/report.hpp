#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace student_grouper
{

nlohmann::json record_to_json(const Record &record);
nlohmann::json groups_to_json(const Groups &groups);
nlohmann::json summary_to_json(const SummaryMatrix &summary);
nlohmann::json allocation_to_json(const AllocationResult &result);

std::string escape_csv_field(const std::string &field);
std::string records_to_csv(const std::vector<Record> &records);
std::string summary_to_csv(const SummaryMatrix &summary);

// xlsx workbook: Branchwise_Summary, Uniform_Summary, then one sheet per group.
std::string build_group_report(const AllocationResult &branchwise, const AllocationResult &uniform);
std::string build_branch_archive(const std::vector<Record> &records);

} // namespace student_grouper
