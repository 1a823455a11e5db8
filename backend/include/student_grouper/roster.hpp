#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace student_grouper
{

Record make_record(const std::optional<std::string> &roll, const std::string &name, const std::string &email);
std::vector<std::vector<std::string>> parse_csv_rows(const std::string &text);

// First row is the header; Roll, Name and Email are picked by name.
std::vector<Record> parse_roster_table(std::vector<std::vector<std::string>> rows);
std::vector<Record> parse_roster_csv(const std::string &text);
std::vector<Record> parse_roster_xlsx(const std::string &bytes);
std::vector<Record> parse_roster_json(const nlohmann::json &payload);

// Sniffs the payload: ZIP signature means xlsx, a leading [ or { means JSON, otherwise CSV.
std::vector<Record> parse_roster_payload(const std::string &text);
std::vector<Record> load_roster_file(const std::string &path);

} // namespace student_grouper
