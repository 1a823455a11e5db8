#pragma once

#include <string>
#include <variant>
#include <vector>

namespace student_grouper
{

using SheetCell = std::variant<std::string, long long>;

struct WorksheetData
{
    std::string name;
    std::vector<std::vector<SheetCell>> rows;
};

std::string column_name(size_t index);
size_t column_index(const std::string &cell_reference);
bool looks_like_zip(const std::string &bytes);

std::string write_workbook(const std::vector<WorksheetData> &sheets);
std::vector<std::string> read_sheet_names(const std::string &xlsx_bytes);

// Rows of the first worksheet as text. Empty rows are dropped and missing
// cells inside a row come back as "".
std::vector<std::vector<std::string>> read_first_worksheet(const std::string &xlsx_bytes);

} // namespace student_grouper
