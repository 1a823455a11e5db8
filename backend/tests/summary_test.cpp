#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "student_grouper/allocation.hpp"
#include "student_grouper/roster.hpp"
#include "student_grouper/summary.hpp"

using namespace student_grouper;

namespace
{

Group group_of(const std::vector<std::string> &rolls)
{
    Group group;
    for (const auto &roll : rolls)
    {
        group.push_back(make_record(roll, "", ""));
    }
    return group;
}

} // namespace

TEST(SummaryCompiler, LabelsAreOneBased)
{
    EXPECT_EQ(group_label(0), "Group 1");
    EXPECT_EQ(group_label(11), "Group 12");
}

TEST(SummaryCompiler, CountsBranchesPerGroup)
{
    const Groups groups = {
        group_of({"21EC001", "21CS001", "21CS002"}),
        group_of({}),
        group_of({"21AI001", "bad-roll"})};

    const auto summary = compile_summary(groups);

    EXPECT_EQ(summary.branch_codes, (std::vector<std::string>{"AI", "CS", "EC", "NA"}));
    ASSERT_EQ(summary.rows.size(), 3u);

    EXPECT_EQ(summary.rows[0].label, "Group 1");
    EXPECT_EQ(summary.rows[0].counts, (std::vector<int>{0, 2, 1, 0}));
    EXPECT_EQ(summary.rows[0].total, 3);

    EXPECT_EQ(summary.rows[1].label, "Group 2");
    EXPECT_EQ(summary.rows[1].counts, (std::vector<int>{0, 0, 0, 0}));
    EXPECT_EQ(summary.rows[1].total, 0);

    EXPECT_EQ(summary.rows[2].counts, (std::vector<int>{1, 0, 0, 1}));
    EXPECT_EQ(summary.rows[2].total, 2);
}

TEST(SummaryCompiler, EmptyGroupsGiveTotalColumnOnly)
{
    const auto summary = compile_summary(Groups(5));

    EXPECT_TRUE(summary.branch_codes.empty());
    ASSERT_EQ(summary.rows.size(), 5u);
    for (const auto &row : summary.rows)
    {
        EXPECT_TRUE(row.counts.empty());
        EXPECT_EQ(row.total, 0);
    }
}

TEST(SummaryCompiler, RowAndColumnSumsMatchInput)
{
    std::vector<Record> records;
    std::map<std::string, int> expected_columns;
    const std::vector<std::string> codes = {"CS", "EC", "ME", "AI", "CE"};
    for (int i = 0; i < 47; ++i)
    {
        const auto &code = codes[static_cast<size_t>(i * 7 % 5)];
        records.push_back(make_record("20" + code + std::to_string(i), "", ""));
        expected_columns[code]++;
    }

    for (const auto &groups : {allocate_branchwise(records, 6), allocate_uniform(records, 6)})
    {
        const auto summary = compile_summary(groups);
        ASSERT_EQ(summary.rows.size(), 6u);

        int grand_total = 0;
        std::vector<int> column_sums(summary.branch_codes.size(), 0);
        for (size_t ri = 0; ri < summary.rows.size(); ++ri)
        {
            const auto &row = summary.rows[ri];
            int row_sum = 0;
            for (size_t ci = 0; ci < row.counts.size(); ++ci)
            {
                row_sum += row.counts[ci];
                column_sums[ci] += row.counts[ci];
            }
            EXPECT_EQ(row.total, row_sum);
            EXPECT_EQ(row.total, static_cast<int>(groups[ri].size()));
            grand_total += row.total;
        }

        EXPECT_EQ(grand_total, static_cast<int>(records.size()));
        for (size_t ci = 0; ci < summary.branch_codes.size(); ++ci)
        {
            EXPECT_EQ(column_sums[ci], expected_columns[summary.branch_codes[ci]]);
        }
    }
}

TEST(SummaryCompiler, CountRecordsSumsGroupSizes)
{
    EXPECT_EQ(count_records(Groups{}), 0u);
    EXPECT_EQ(count_records(Groups{group_of({"21CS001"}), group_of({}), group_of({"21EC001", "21EC002"})}), 3u);
}
