#include <gtest/gtest.h>

#include <zlib.h>

#include <stdexcept>
#include <string>

#include "student_grouper/archive.hpp"

using namespace student_grouper;

namespace
{

uint32_t crc_of(const std::string &contents)
{
    return static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef *>(contents.data()),
                                       static_cast<uInt>(contents.size())));
}

} // namespace

TEST(ZipArchive, EmptyArchiveIsJustTheEndRecord)
{
    ZipArchive archive;
    const auto bytes = archive.finish();

    ASSERT_EQ(bytes.size(), 22u);
    EXPECT_EQ(bytes.substr(0, 4), std::string("PK\x05\x06", 4));
    EXPECT_TRUE(read_zip_archive(bytes).empty());
}

TEST(ZipArchive, DeflatedMembersRoundTrip)
{
    const std::string first = "Roll,Name,Email,Branch\n21CS001,Asha,asha@example.edu,CS\n";
    const std::string second(4096, 'x');

    ZipArchive archive;
    archive.add_file("CS_students.csv", first);
    archive.add_file("padding.txt", second);
    archive.add_file("empty.csv", "");
    EXPECT_EQ(archive.entry_count(), 3u);

    const auto bytes = archive.finish();
    EXPECT_EQ(bytes.substr(0, 4), std::string("PK\x03\x04", 4));

    const auto members = read_zip_archive(bytes);
    ASSERT_EQ(members.size(), 3u);

    EXPECT_EQ(members[0].name, "CS_students.csv");
    EXPECT_EQ(members[0].method, 8);
    EXPECT_EQ(members[0].contents, first);
    EXPECT_EQ(members[0].crc, crc_of(first));

    EXPECT_EQ(members[1].name, "padding.txt");
    EXPECT_EQ(members[1].contents, second);
    EXPECT_LT(bytes.size(), second.size());

    EXPECT_EQ(members[2].name, "empty.csv");
    EXPECT_TRUE(members[2].contents.empty());
}

TEST(ZipArchive, StoredMembersKeepRawBytes)
{
    ZipArchive archive(false);
    archive.add_file("a.txt", "alpha");

    const auto members = read_zip_archive(archive.finish());
    ASSERT_EQ(members.size(), 1u);
    EXPECT_EQ(members[0].method, 0);
    EXPECT_EQ(members[0].contents, "alpha");
    EXPECT_EQ(members[0].crc, crc_of("alpha"));
}

TEST(ZipArchive, RejectsUseAfterFinish)
{
    ZipArchive archive;
    archive.add_file("a.txt", "alpha");
    archive.finish();

    EXPECT_THROW(archive.add_file("b.txt", "beta"), std::logic_error);
    EXPECT_THROW(archive.finish(), std::logic_error);
}

TEST(ZipReader, FindsMembersByName)
{
    ZipArchive archive;
    archive.add_file("xl/workbook.xml", "<workbook/>");
    archive.add_file("xl/worksheets/sheet1.xml", "<worksheet/>");

    const auto entries = read_zip_archive(archive.finish());
    const auto *sheet = find_zip_entry(entries, "xl/worksheets/sheet1.xml");
    ASSERT_NE(sheet, nullptr);
    EXPECT_EQ(sheet->contents, "<worksheet/>");
    EXPECT_EQ(find_zip_entry(entries, "xl/styles.xml"), nullptr);
}

TEST(ZipReader, RejectsNonArchiveInput)
{
    EXPECT_THROW(read_zip_archive("Roll,Name\n21CS001,Asha\n"), std::runtime_error);
    EXPECT_THROW(read_zip_archive(""), std::runtime_error);
}

TEST(ZipReader, RejectsCorruptedMemberData)
{
    ZipArchive archive(false);
    archive.add_file("a.txt", "alpha");
    auto bytes = archive.finish();

    // Stored data starts after the 30 byte local header and the 5 byte name.
    bytes[35] = 'A';
    EXPECT_THROW(read_zip_archive(bytes), std::runtime_error);
}

TEST(ZipReader, RejectsTruncatedArchive)
{
    ZipArchive archive;
    archive.add_file("a.txt", "alpha");
    const auto bytes = archive.finish();

    EXPECT_THROW(read_zip_archive(bytes.substr(0, bytes.size() - 30)), std::runtime_error);
}
