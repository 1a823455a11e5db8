#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "student_grouper/archive.hpp"
#include "student_grouper/workbook.hpp"

using namespace student_grouper;

namespace
{

using Rows = std::vector<std::vector<std::string>>;

// A workbook the way spreadsheet applications save it: shared strings,
// absolute relationship targets and sparse cells.
std::string shared_string_workbook()
{
    ZipArchive archive;
    archive.add_file("[Content_Types].xml",
                     "<?xml version=\"1.0\"?><Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\"/>");
    archive.add_file("xl/workbook.xml",
                     "<?xml version=\"1.0\"?>"
                     "<workbook xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\""
                     " xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">"
                     "<sheets><sheet name=\"Roster\" sheetId=\"7\" r:id=\"rId3\"/>"
                     "<sheet name=\"Notes\" sheetId=\"8\" r:id=\"rId4\"/></sheets></workbook>");
    archive.add_file("xl/_rels/workbook.xml.rels",
                     "<?xml version=\"1.0\"?>"
                     "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
                     "<Relationship Id=\"rId4\" Target=\"worksheets/sheet1.xml\"/>"
                     "<Relationship Id=\"rId3\" Target=\"/xl/worksheets/sheet2.xml\"/>"
                     "</Relationships>");
    archive.add_file("xl/sharedStrings.xml",
                     "<?xml version=\"1.0\"?>"
                     "<sst xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\">"
                     "<si><t>Roll</t></si><si><t>Name</t></si>"
                     "<si><r><t>Asha </t></r><r><t>K</t></r></si><si><t>21CS001</t></si></sst>");
    archive.add_file("xl/worksheets/sheet1.xml",
                     "<?xml version=\"1.0\"?><worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\">"
                     "<sheetData><row r=\"1\"><c r=\"A1\" t=\"inlineStr\"><is><t>wrong sheet</t></is></c></row></sheetData>"
                     "</worksheet>");
    archive.add_file("xl/worksheets/sheet2.xml",
                     "<?xml version=\"1.0\"?><worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\">"
                     "<sheetData>"
                     "<row r=\"1\"><c r=\"A1\" t=\"s\"><v>0</v></c><c r=\"C1\" t=\"s\"><v>1</v></c></row>"
                     "<row r=\"3\"><c r=\"A3\" t=\"s\"><v>3</v></c><c r=\"C3\" t=\"s\"><v>2</v></c></row>"
                     "<row r=\"4\"><c r=\"B4\"/></row>"
                     "<row r=\"5\"><c r=\"A5\"><v>42</v></c></row>"
                     "</sheetData></worksheet>");
    return archive.finish();
}

} // namespace

TEST(CellReferences, ColumnNamesFollowSpreadsheetLettering)
{
    EXPECT_EQ(column_name(0), "A");
    EXPECT_EQ(column_name(25), "Z");
    EXPECT_EQ(column_name(26), "AA");
    EXPECT_EQ(column_name(701), "ZZ");
    EXPECT_EQ(column_name(702), "AAA");
}

TEST(CellReferences, ColumnIndexIgnoresRowDigits)
{
    EXPECT_EQ(column_index("A1"), 0u);
    EXPECT_EQ(column_index("C17"), 2u);
    EXPECT_EQ(column_index("AA3"), 26u);
    EXPECT_EQ(column_index(column_name(730) + "9"), 730u);
    EXPECT_THROW(column_index("12"), std::runtime_error);
}

TEST(WorkbookWriter, RoundTripsTextAndNumbers)
{
    const std::vector<WorksheetData> sheets = {
        {"Branchwise_Summary",
         {{std::string("Group"), std::string("CS"), std::string("Total")},
          {std::string("Group 1"), 3LL, 3LL}}},
        {"Branchwise_1",
         {{std::string("Roll"), std::string("Name")},
          {std::string("21CS001"), std::string("  Rao, <Vikram> & \"Co\"  ")}}}};

    const auto bytes = write_workbook(sheets);
    EXPECT_TRUE(looks_like_zip(bytes));
    EXPECT_EQ(read_sheet_names(bytes), (std::vector<std::string>{"Branchwise_Summary", "Branchwise_1"}));
    EXPECT_EQ(read_first_worksheet(bytes),
              (Rows{{"Group", "CS", "Total"}, {"Group 1", "3", "3"}}));
}

TEST(WorkbookWriter, PreservesSurroundingSpacesAndMarkup)
{
    const std::string awkward = "  Rao, <Vikram> & \"Co\"  ";
    const auto bytes = write_workbook({{"Only", {{std::string("Name")}, {awkward}}}});

    const auto rows = read_first_worksheet(bytes);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1][0], awkward);
}

TEST(WorkbookWriter, DropsControlCharactersXmlCannotCarry)
{
    const auto bytes = write_workbook({{"Only", {{std::string("bell\x07here")}}}});
    EXPECT_EQ(read_first_worksheet(bytes), (Rows{{"bellhere"}}));
}

TEST(WorkbookWriter, RejectsInvalidSheetNames)
{
    EXPECT_THROW(write_workbook({}), std::invalid_argument);
    EXPECT_THROW(write_workbook({{"", {}}}), std::invalid_argument);
    EXPECT_THROW(write_workbook({{"Group/1", {}}}), std::invalid_argument);
    EXPECT_THROW(write_workbook({{std::string(32, 'x'), {}}}), std::invalid_argument);
    EXPECT_NO_THROW(write_workbook({{std::string(31, 'x'), {}}}));
}

TEST(WorkbookWriter, EmptySheetReadsBackWithoutRows)
{
    const auto bytes = write_workbook({{"Uniform_2", {}}});
    EXPECT_EQ(read_sheet_names(bytes), (std::vector<std::string>{"Uniform_2"}));
    EXPECT_TRUE(read_first_worksheet(bytes).empty());
}

TEST(WorkbookReader, FollowsRelationshipsAndSharedStrings)
{
    const auto bytes = shared_string_workbook();

    EXPECT_EQ(read_sheet_names(bytes), (std::vector<std::string>{"Roster", "Notes"}));
    EXPECT_EQ(read_first_worksheet(bytes),
              (Rows{{"Roll", "", "Name"}, {"21CS001", "", "Asha K"}, {"42"}}));
}

TEST(WorkbookReader, RejectsNonWorkbookInput)
{
    EXPECT_THROW(read_first_worksheet("Roll,Name\n21CS001,Asha\n"), std::runtime_error);

    ZipArchive archive;
    archive.add_file("readme.txt", "not a workbook");
    EXPECT_THROW(read_first_worksheet(archive.finish()), std::runtime_error);
}

TEST(WorkbookReader, RejectsMalformedWorksheetXml)
{
    ZipArchive archive;
    archive.add_file("xl/workbook.xml", "<workbook><sheets><sheet name=\"A\" sheetId=\"1\"/></sheets></workbook>");
    archive.add_file("xl/worksheets/sheet1.xml", "<worksheet><sheetData><row>");
    EXPECT_THROW(read_first_worksheet(archive.finish()), std::runtime_error);
}
