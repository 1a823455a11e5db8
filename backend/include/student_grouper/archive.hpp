#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace student_grouper
{

class ZipArchive
{
public:
    explicit ZipArchive(bool compress = true);

    void add_file(const std::string &name, const std::string &contents);
    std::string finish();

    size_t entry_count() const { return entries_.size(); }

private:
    struct Entry
    {
        std::string name;
        uint32_t crc{};
        uint32_t compressed_size{};
        uint32_t uncompressed_size{};
        uint16_t method{};
        uint32_t local_header_offset{};
    };

    bool compress_;
    bool finished_{false};
    std::string buffer_;
    std::vector<Entry> entries_;
};

struct ZipEntry
{
    std::string name;
    uint16_t method{};
    uint32_t crc{};
    std::string contents;
};

// Reads every member listed in the central directory. Stored and deflated
// members only; ZIP64 and encrypted archives are rejected.
std::vector<ZipEntry> read_zip_archive(const std::string &archive);
const ZipEntry *find_zip_entry(const std::vector<ZipEntry> &entries, const std::string &name);

std::string deflate_raw(const std::string &input);
std::string inflate_raw(const std::string &input, size_t expected_size);

} // namespace student_grouper
