#include "student_grouper/report.hpp"

#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "student_grouper/archive.hpp"
#include "student_grouper/workbook.hpp"

namespace student_grouper
{
namespace
{

using json = nlohmann::json;

const std::vector<std::string> kRecordColumns = {"Roll", "Name", "Email", "Branch"};

void append_csv_row(std::string &out, const std::vector<std::string> &fields)
{
    for (size_t i = 0; i < fields.size(); ++i)
    {
        if (i > 0)
        {
            out.push_back(',');
        }
        out += escape_csv_field(fields[i]);
    }
    out.push_back('\n');
}

WorksheetData summary_sheet(const std::string &name, const SummaryMatrix &summary)
{
    WorksheetData sheet{name, {}};

    std::vector<SheetCell> header = {std::string("Group")};
    for (const auto &code : summary.branch_codes)
    {
        header.emplace_back(code);
    }
    header.emplace_back(std::string("Total"));
    sheet.rows.push_back(std::move(header));

    for (const auto &row : summary.rows)
    {
        std::vector<SheetCell> cells = {row.label};
        for (int count : row.counts)
        {
            cells.emplace_back(static_cast<long long>(count));
        }
        cells.emplace_back(static_cast<long long>(row.total));
        sheet.rows.push_back(std::move(cells));
    }
    return sheet;
}

void add_group_sheets(std::vector<WorksheetData> &sheets, const std::string &prefix, const Groups &groups)
{
    for (size_t gi = 0; gi < groups.size(); ++gi)
    {
        WorksheetData sheet{prefix + "_" + std::to_string(gi + 1), {}};
        sheet.rows.emplace_back(kRecordColumns.begin(), kRecordColumns.end());
        for (const auto &record : groups[gi])
        {
            sheet.rows.push_back({record.roll, record.name, record.email, record.branch});
        }
        sheets.push_back(std::move(sheet));
    }
}

} // namespace

json record_to_json(const Record &record)
{
    return {
        {"Roll", record.roll},
        {"Name", record.name},
        {"Email", record.email},
        {"Branch", record.branch}};
}

json groups_to_json(const Groups &groups)
{
    json groups_json = json::array();
    for (const auto &group : groups)
    {
        json members = json::array();
        for (const auto &record : group)
        {
            members.push_back(record_to_json(record));
        }
        groups_json.push_back(members);
    }
    return groups_json;
}

json summary_to_json(const SummaryMatrix &summary)
{
    json columns = json::array({"Group"});
    for (const auto &code : summary.branch_codes)
    {
        columns.push_back(code);
    }
    columns.push_back("Total");

    json rows = json::array();
    for (const auto &row : summary.rows)
    {
        json row_json;
        row_json["Group"] = row.label;
        for (size_t ci = 0; ci < summary.branch_codes.size(); ++ci)
        {
            row_json[summary.branch_codes[ci]] = row.counts[ci];
        }
        row_json["Total"] = row.total;
        rows.push_back(row_json);
    }

    return {{"columns", columns}, {"rows", rows}};
}

json allocation_to_json(const AllocationResult &result)
{
    return {
        {"groups", groups_to_json(result.groups)},
        {"summary", summary_to_json(result.summary)},
        {"computation_time_ms", result.computation_time_ms}};
}

std::string escape_csv_field(const std::string &field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos)
    {
        return field;
    }

    std::string escaped = "\"";
    for (char c : field)
    {
        if (c == '"')
        {
            escaped += "\"\"";
        }
        else
        {
            escaped.push_back(c);
        }
    }
    escaped.push_back('"');
    return escaped;
}

std::string records_to_csv(const std::vector<Record> &records)
{
    std::string out;
    append_csv_row(out, kRecordColumns);
    for (const auto &record : records)
    {
        append_csv_row(out, {record.roll, record.name, record.email, record.branch});
    }
    return out;
}

std::string summary_to_csv(const SummaryMatrix &summary)
{
    std::vector<std::string> header = {"Group"};
    header.insert(header.end(), summary.branch_codes.begin(), summary.branch_codes.end());
    header.push_back("Total");

    std::string out;
    append_csv_row(out, header);
    for (const auto &row : summary.rows)
    {
        std::vector<std::string> fields = {row.label};
        for (int count : row.counts)
        {
            fields.push_back(std::to_string(count));
        }
        fields.push_back(std::to_string(row.total));
        append_csv_row(out, fields);
    }
    return out;
}

std::string build_group_report(const AllocationResult &branchwise, const AllocationResult &uniform)
{
    std::vector<WorksheetData> sheets;
    sheets.push_back(summary_sheet("Branchwise_Summary", branchwise.summary));
    sheets.push_back(summary_sheet("Uniform_Summary", uniform.summary));
    add_group_sheets(sheets, "Branchwise", branchwise.groups);
    add_group_sheets(sheets, "Uniform", uniform.groups);

    std::ostringstream line;
    line << "Built group report with " << sheets.size() << " sheets.";
    std::cout << line.str() << std::endl;
    return write_workbook(sheets);
}

std::string build_branch_archive(const std::vector<Record> &records)
{
    std::map<std::string, std::vector<Record>> by_branch;
    for (const auto &record : records)
    {
        by_branch[record.branch].push_back(record);
    }

    ZipArchive archive;
    for (const auto &[branch, members] : by_branch)
    {
        archive.add_file(branch + "_students.csv", records_to_csv(members));
    }

    std::cout << "Built branch archive with " << archive.entry_count() << " files." << std::endl;
    return archive.finish();
}

} // namespace student_grouper
