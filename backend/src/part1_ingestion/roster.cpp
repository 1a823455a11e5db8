#include "student_grouper/roster.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "student_grouper/branch.hpp"
#include "student_grouper/workbook.hpp"

namespace student_grouper
{
namespace
{

using json = nlohmann::json;

std::string trim(const std::string &value)
{
    const auto begin = std::find_if_not(value.begin(), value.end(),
                                        [](unsigned char c)
                                        { return std::isspace(c); });
    const auto end = std::find_if_not(value.rbegin(), value.rend(),
                                      [](unsigned char c)
                                      { return std::isspace(c); })
                         .base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool ends_with(const std::string &value, const std::string &suffix)
{
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<std::string> json_field(const json &row, const char *key)
{
    if (!row.contains(key) || row[key].is_null())
    {
        return std::nullopt;
    }

    const auto &value = row[key];
    if (value.is_string())
    {
        return value.get<std::string>();
    }
    return value.dump();
}

int find_column(const std::vector<std::string> &header, const std::string &name)
{
    for (size_t i = 0; i < header.size(); ++i)
    {
        if (trim(header[i]) == name)
        {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::string cell(const std::vector<std::string> &row, int column)
{
    if (column < 0 || static_cast<size_t>(column) >= row.size())
    {
        return "";
    }
    return row[static_cast<size_t>(column)];
}

} // namespace

Record make_record(const std::optional<std::string> &roll, const std::string &name, const std::string &email)
{
    Record record;
    record.roll = roll.value_or("");
    record.name = name;
    record.email = email;
    record.branch = extract_branch(roll);
    return record;
}

std::vector<std::vector<std::string>> parse_csv_rows(const std::string &text)
{
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool row_has_content = false;

    for (size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];

        if (in_quotes)
        {
            if (c == '"')
            {
                if (i + 1 < text.size() && text[i + 1] == '"')
                {
                    field.push_back('"');
                    ++i;
                }
                else
                {
                    in_quotes = false;
                }
            }
            else
            {
                field.push_back(c);
            }
            continue;
        }

        if (c == '"')
        {
            in_quotes = true;
            row_has_content = true;
        }
        else if (c == ',')
        {
            row.push_back(std::move(field));
            field.clear();
            row_has_content = true;
        }
        else if (c == '\n' || c == '\r')
        {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
            {
                ++i;
            }
            if (row_has_content || !field.empty())
            {
                row.push_back(std::move(field));
                rows.push_back(std::move(row));
            }
            field.clear();
            row.clear();
            row_has_content = false;
        }
        else
        {
            field.push_back(c);
            row_has_content = true;
        }
    }

    if (in_quotes)
    {
        throw std::runtime_error("Unterminated quoted field in CSV input.");
    }
    if (row_has_content || !field.empty())
    {
        row.push_back(std::move(field));
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<Record> parse_roster_table(std::vector<std::vector<std::string>> rows)
{
    std::vector<Record> records;
    if (rows.empty())
    {
        return records;
    }

    auto &header = rows.front();
    if (!header.empty() && header[0].compare(0, 3, "\xEF\xBB\xBF") == 0)
    {
        header[0].erase(0, 3);
    }

    const int roll_column = find_column(header, "Roll");
    const int name_column = find_column(header, "Name");
    const int email_column = find_column(header, "Email");
    if (roll_column < 0)
    {
        std::cout << "Roster has no Roll column; every record gets branch " << kUnknownBranch << "." << std::endl;
    }

    records.reserve(rows.size() - 1);
    for (size_t i = 1; i < rows.size(); ++i)
    {
        const auto &row = rows[i];
        records.push_back(make_record(cell(row, roll_column), cell(row, name_column), cell(row, email_column)));
    }
    return records;
}

std::vector<Record> parse_roster_csv(const std::string &text)
{
    auto records = parse_roster_table(parse_csv_rows(text));
    std::cout << "Parsed " << records.size() << " records from CSV roster." << std::endl;
    return records;
}

std::vector<Record> parse_roster_xlsx(const std::string &bytes)
{
    auto records = parse_roster_table(read_first_worksheet(bytes));
    std::cout << "Parsed " << records.size() << " records from xlsx roster." << std::endl;
    return records;
}

std::vector<Record> parse_roster_json(const json &payload)
{
    const json *rows = &payload;
    if (payload.is_object() && payload.contains("records"))
    {
        rows = &payload["records"];
    }
    if (!rows->is_array())
    {
        throw std::runtime_error("Roster JSON must be an array of records or an object with a records array.");
    }

    std::vector<Record> records;
    records.reserve(rows->size());
    for (const auto &row : *rows)
    {
        if (!row.is_object())
        {
            throw std::runtime_error("Roster JSON records must be objects.");
        }
        records.push_back(make_record(json_field(row, "Roll"),
                                      json_field(row, "Name").value_or(""),
                                      json_field(row, "Email").value_or("")));
    }

    std::cout << "Parsed " << records.size() << " records from JSON roster." << std::endl;
    return records;
}

std::vector<Record> parse_roster_payload(const std::string &text)
{
    if (looks_like_zip(text))
    {
        return parse_roster_xlsx(text);
    }

    const auto first = std::find_if_not(text.begin(), text.end(),
                                        [](unsigned char c)
                                        { return std::isspace(c); });
    if (first != text.end() && (*first == '[' || *first == '{'))
    {
        return parse_roster_json(json::parse(text));
    }
    return parse_roster_csv(text);
}

std::vector<Record> load_roster_file(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        throw std::runtime_error("Unable to open roster file " + path);
    }

    std::ostringstream contents;
    contents << in.rdbuf();

    std::cout << "Loading roster from " << path << "..." << std::endl;
    if (ends_with(path, ".json"))
    {
        return parse_roster_json(json::parse(contents.str()));
    }
    if (ends_with(path, ".csv"))
    {
        return parse_roster_csv(contents.str());
    }
    if (ends_with(path, ".xlsx"))
    {
        return parse_roster_xlsx(contents.str());
    }
    return parse_roster_payload(contents.str());
}

} // namespace student_grouper
