#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "student_grouper/branch.hpp"
#include "student_grouper/roster.hpp"

using namespace student_grouper;

namespace
{

std::vector<Record> records_for(const std::vector<std::string> &rolls)
{
    std::vector<Record> records;
    for (const auto &roll : rolls)
    {
        records.push_back(make_record(roll, "", ""));
    }
    return records;
}

} // namespace

TEST(BranchExtractor, FindsCodeInsideRollNumber)
{
    EXPECT_EQ(extract_branch(std::string("21CS001")), "CS");
    EXPECT_EQ(extract_branch(std::string("2101EC17")), "EC");
    EXPECT_EQ(extract_branch(std::string("x1MMy")), "MM");
}

TEST(BranchExtractor, TakesFirstTwoLettersOfLongerRun)
{
    EXPECT_EQ(extract_branch(std::string("21ABC01")), "AB");
    EXPECT_EQ(extract_branch(std::string("1a2CE3MT")), "CE");
}

TEST(BranchExtractor, FallsBackToSentinel)
{
    EXPECT_EQ(extract_branch(std::string("")), kUnknownBranch);
    EXPECT_EQ(extract_branch(std::string("21cs001")), kUnknownBranch);
    EXPECT_EQ(extract_branch(std::string("C1S2")), kUnknownBranch);
    EXPECT_EQ(extract_branch(std::string("12345")), kUnknownBranch);
    EXPECT_EQ(extract_branch(std::optional<std::string>()), kUnknownBranch);
}

TEST(BranchExtractor, AcceptsStringLiterals)
{
    EXPECT_EQ(extract_branch("21CS001"), "CS");
    EXPECT_EQ(extract_branch("21cs001"), kUnknownBranch);
    EXPECT_EQ(extract_branch(""), kUnknownBranch);

    const char *missing = nullptr;
    EXPECT_EQ(extract_branch(missing), kUnknownBranch);
}

TEST(BranchExtractor, ExtractingACodeReturnsTheCode)
{
    for (const auto &code : default_priority_branches())
    {
        EXPECT_EQ(extract_branch(code), code);
        EXPECT_EQ(extract_branch(extract_branch("21" + code + "007")), code);
    }
    EXPECT_EQ(extract_branch(kUnknownBranch), kUnknownBranch);
}

TEST(DrawCycle, PriorityCodesFirstThenFirstSeen)
{
    const auto records = records_for({"21XY001", "21EC001", "nothing", "21CS001", "21AB001", "21EC002"});
    const auto cycle = build_draw_cycle(records, default_priority_branches());
    const std::vector<std::string> expected = {"CS", "EC", "XY", "NA", "AB"};
    EXPECT_EQ(cycle, expected);
}

TEST(DrawCycle, HonoursCustomPriority)
{
    const auto records = records_for({"21CS001", "21EC001", "21AI001"});
    const auto cycle = build_draw_cycle(records, {"EC", "ZZ", "CS"});
    const std::vector<std::string> expected = {"EC", "CS", "AI"};
    EXPECT_EQ(cycle, expected);
}

TEST(DrawCycle, EmptyInputGivesEmptyCycle)
{
    EXPECT_TRUE(build_draw_cycle({}, default_priority_branches()).empty());
}

TEST(CountBranches, CountsInFirstSeenOrder)
{
    const auto counts = count_branches(records_for({"21EC001", "21CS001", "21EC002", "x"}));
    ASSERT_EQ(counts.size(), 3u);
    EXPECT_EQ(counts[0], std::make_pair(std::string("EC"), 2));
    EXPECT_EQ(counts[1], std::make_pair(std::string("CS"), 1));
    EXPECT_EQ(counts[2], std::make_pair(std::string("NA"), 1));
}
