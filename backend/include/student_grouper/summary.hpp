#pragma once

#include <string>

#include "types.hpp"

namespace student_grouper
{

std::string group_label(size_t index);
SummaryMatrix compile_summary(const Groups &groups);
size_t count_records(const Groups &groups);

} // namespace student_grouper
