#include "student_grouper/archive.hpp"

#include <zlib.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace student_grouper
{
namespace
{

constexpr uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSignature = 0x06054b50;
constexpr uint16_t kVersion = 20;
constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflated = 8;

// 1980-01-01 00:00, the DOS epoch. Fixed so archives are reproducible.
constexpr uint16_t kDosTime = 0;
constexpr uint16_t kDosDate = (1 << 5) | 1;

void put_u16(std::string &out, uint16_t value)
{
    out.push_back(static_cast<char>(value & 0xff));
    out.push_back(static_cast<char>((value >> 8) & 0xff));
}

void put_u32(std::string &out, uint32_t value)
{
    for (int shift = 0; shift < 32; shift += 8)
    {
        out.push_back(static_cast<char>((value >> shift) & 0xff));
    }
}

uint16_t get_u16(const std::string &data, size_t offset)
{
    if (offset + 2 > data.size())
    {
        throw std::runtime_error("Truncated ZIP archive.");
    }
    return static_cast<uint16_t>(static_cast<unsigned char>(data[offset]) |
                                 (static_cast<unsigned char>(data[offset + 1]) << 8));
}

uint32_t get_u32(const std::string &data, size_t offset)
{
    return static_cast<uint32_t>(get_u16(data, offset)) | (static_cast<uint32_t>(get_u16(data, offset + 2)) << 16);
}

size_t find_end_of_central_dir(const std::string &archive)
{
    if (archive.size() < 22)
    {
        throw std::runtime_error("Not a ZIP archive.");
    }

    // The end record is followed by a comment of at most 64 KiB.
    const size_t lowest = archive.size() > 22 + 0xffff ? archive.size() - 22 - 0xffff : 0;
    for (size_t offset = archive.size() - 22;; --offset)
    {
        if (get_u32(archive, offset) == kEndOfCentralDirSignature)
        {
            return offset;
        }
        if (offset == lowest)
        {
            break;
        }
    }
    throw std::runtime_error("ZIP end of central directory not found.");
}

uint32_t checked_u32(size_t value, const char *what)
{
    if (value > std::numeric_limits<uint32_t>::max())
    {
        throw std::length_error(std::string("ZIP entry too large: ") + what);
    }
    return static_cast<uint32_t>(value);
}

} // namespace

std::string deflate_raw(const std::string &input)
{
    z_stream stream{};
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK)
    {
        throw std::runtime_error("deflateInit2 failed");
    }

    std::string output(deflateBound(&stream, static_cast<uLong>(input.size())), '\0');
    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef *>(&output[0]);
    stream.avail_out = static_cast<uInt>(output.size());

    const int status = deflate(&stream, Z_FINISH);
    const size_t written = stream.total_out;
    deflateEnd(&stream);

    if (status != Z_STREAM_END)
    {
        throw std::runtime_error("deflate did not complete");
    }
    output.resize(written);
    return output;
}

std::string inflate_raw(const std::string &input, size_t expected_size)
{
    std::string output(expected_size, '\0');
    if (expected_size == 0)
    {
        return output;
    }

    z_stream stream{};
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK)
    {
        throw std::runtime_error("inflateInit2 failed");
    }

    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef *>(&output[0]);
    stream.avail_out = static_cast<uInt>(output.size());

    const int status = inflate(&stream, Z_FINISH);
    const size_t written = stream.total_out;
    inflateEnd(&stream);

    if (status != Z_STREAM_END || written != expected_size)
    {
        throw std::runtime_error("inflate did not produce the recorded size");
    }
    return output;
}

std::vector<ZipEntry> read_zip_archive(const std::string &archive)
{
    const size_t end_record = find_end_of_central_dir(archive);
    const uint16_t entry_total = get_u16(archive, end_record + 10);
    size_t cursor = get_u32(archive, end_record + 16);

    std::vector<ZipEntry> entries;
    entries.reserve(entry_total);
    for (uint16_t i = 0; i < entry_total; ++i)
    {
        if (get_u32(archive, cursor) != kCentralHeaderSignature)
        {
            throw std::runtime_error("Corrupt ZIP central directory.");
        }

        const uint16_t flags = get_u16(archive, cursor + 8);
        const uint32_t compressed_size = get_u32(archive, cursor + 20);
        const uint32_t uncompressed_size = get_u32(archive, cursor + 24);
        const uint16_t name_length = get_u16(archive, cursor + 28);
        const uint16_t extra_length = get_u16(archive, cursor + 30);
        const uint16_t comment_length = get_u16(archive, cursor + 32);
        const uint32_t local_offset = get_u32(archive, cursor + 42);

        if (flags & 0x1)
        {
            throw std::runtime_error("Encrypted ZIP members are not supported.");
        }
        if (compressed_size == 0xffffffff || uncompressed_size == 0xffffffff || local_offset == 0xffffffff)
        {
            throw std::runtime_error("ZIP64 archives are not supported.");
        }
        if (cursor + 46 + name_length > archive.size())
        {
            throw std::runtime_error("Truncated ZIP archive.");
        }

        ZipEntry entry;
        entry.method = get_u16(archive, cursor + 10);
        entry.crc = get_u32(archive, cursor + 16);
        entry.name = archive.substr(cursor + 46, name_length);

        if (get_u32(archive, local_offset) != kLocalHeaderSignature)
        {
            throw std::runtime_error("Corrupt ZIP local header for " + entry.name);
        }
        const size_t data_offset = local_offset + 30 + get_u16(archive, local_offset + 26) +
                                   get_u16(archive, local_offset + 28);
        if (data_offset + compressed_size > archive.size())
        {
            throw std::runtime_error("Truncated ZIP member " + entry.name);
        }
        const std::string payload = archive.substr(data_offset, compressed_size);

        if (entry.method == kMethodDeflated)
        {
            entry.contents = inflate_raw(payload, uncompressed_size);
        }
        else if (entry.method == kMethodStored)
        {
            entry.contents = payload;
        }
        else
        {
            throw std::runtime_error("Unsupported ZIP compression method for " + entry.name);
        }

        const auto actual_crc = static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef *>(entry.contents.data()),
                                                            static_cast<uInt>(entry.contents.size())));
        if (actual_crc != entry.crc)
        {
            throw std::runtime_error("CRC mismatch in ZIP member " + entry.name);
        }

        entries.push_back(std::move(entry));
        cursor += 46 + name_length + extra_length + comment_length;
    }
    return entries;
}

const ZipEntry *find_zip_entry(const std::vector<ZipEntry> &entries, const std::string &name)
{
    for (const auto &entry : entries)
    {
        if (entry.name == name)
        {
            return &entry;
        }
    }
    return nullptr;
}

ZipArchive::ZipArchive(bool compress)
    : compress_(compress)
{
}

void ZipArchive::add_file(const std::string &name, const std::string &contents)
{
    if (finished_)
    {
        throw std::logic_error("ZIP archive already finished");
    }

    Entry entry;
    entry.name = name;
    entry.crc = static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef *>(contents.data()),
                                            static_cast<uInt>(contents.size())));
    entry.uncompressed_size = checked_u32(contents.size(), name.c_str());
    entry.local_header_offset = checked_u32(buffer_.size(), name.c_str());

    std::string payload;
    if (compress_)
    {
        payload = deflate_raw(contents);
        entry.method = kMethodDeflated;
    }
    else
    {
        payload = contents;
        entry.method = kMethodStored;
    }
    entry.compressed_size = checked_u32(payload.size(), name.c_str());

    put_u32(buffer_, kLocalHeaderSignature);
    put_u16(buffer_, kVersion);
    put_u16(buffer_, 0);
    put_u16(buffer_, entry.method);
    put_u16(buffer_, kDosTime);
    put_u16(buffer_, kDosDate);
    put_u32(buffer_, entry.crc);
    put_u32(buffer_, entry.compressed_size);
    put_u32(buffer_, entry.uncompressed_size);
    put_u16(buffer_, static_cast<uint16_t>(name.size()));
    put_u16(buffer_, 0);
    buffer_ += name;
    buffer_ += payload;

    entries_.push_back(std::move(entry));
}

std::string ZipArchive::finish()
{
    if (finished_)
    {
        throw std::logic_error("ZIP archive already finished");
    }
    finished_ = true;

    const uint32_t directory_offset = checked_u32(buffer_.size(), "central directory");
    for (const auto &entry : entries_)
    {
        put_u32(buffer_, kCentralHeaderSignature);
        put_u16(buffer_, kVersion);
        put_u16(buffer_, kVersion);
        put_u16(buffer_, 0);
        put_u16(buffer_, entry.method);
        put_u16(buffer_, kDosTime);
        put_u16(buffer_, kDosDate);
        put_u32(buffer_, entry.crc);
        put_u32(buffer_, entry.compressed_size);
        put_u32(buffer_, entry.uncompressed_size);
        put_u16(buffer_, static_cast<uint16_t>(entry.name.size()));
        put_u16(buffer_, 0);
        put_u16(buffer_, 0);
        put_u16(buffer_, 0);
        put_u16(buffer_, 0);
        put_u32(buffer_, 0);
        put_u32(buffer_, entry.local_header_offset);
        buffer_ += entry.name;
    }
    const uint32_t directory_size = checked_u32(buffer_.size() - directory_offset, "central directory");

    put_u32(buffer_, kEndOfCentralDirSignature);
    put_u16(buffer_, 0);
    put_u16(buffer_, 0);
    put_u16(buffer_, static_cast<uint16_t>(entries_.size()));
    put_u16(buffer_, static_cast<uint16_t>(entries_.size()));
    put_u32(buffer_, directory_size);
    put_u32(buffer_, directory_offset);
    put_u16(buffer_, 0);

    return std::move(buffer_);
}

} // namespace student_grouper
