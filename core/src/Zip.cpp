#include "bc/core/util/Zip.hpp"
#include "bc/core/util/Errors.hpp"

#include <zlib.h>

#include <algorithm>
#include <ctime>
#include <iterator>
#include <limits>

namespace bc::zip {

namespace {

constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralSig = 0x06054b50;
constexpr uint16_t kVersion = 20;
constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflate = 8;

void put16(std::vector<uint8_t>& b, uint16_t v)
{
    b.push_back(static_cast<uint8_t>(v & 0xff));
    b.push_back(static_cast<uint8_t>(v >> 8));
}

void put32(std::vector<uint8_t>& b, uint32_t v)
{
    for (int i = 0; i < 4; ++i)
        b.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
}

uint16_t get16(const std::vector<uint8_t>& b, size_t at)
{
    if (at + 2 > b.size())
        throw FormatError("zip: truncated record");
    return static_cast<uint16_t>(b[at] | (b[at + 1] << 8));
}

uint32_t get32(const std::vector<uint8_t>& b, size_t at)
{
    if (at + 4 > b.size())
        throw FormatError("zip: truncated record");
    return static_cast<uint32_t>(b[at]) | (static_cast<uint32_t>(b[at + 1]) << 8) |
           (static_cast<uint32_t>(b[at + 2]) << 16) | (static_cast<uint32_t>(b[at + 3]) << 24);
}

std::vector<uint8_t> deflateRaw(const std::vector<uint8_t>& in, int level)
{
    z_stream strm{};
    // Negative window bits: raw deflate stream as stored in zip entries
    int ret = deflateInit2(&strm, level, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK)
        throw std::runtime_error("zip: deflateInit2 failed");

    std::vector<uint8_t> out(deflateBound(&strm, static_cast<uLong>(in.size())));
    strm.next_in = const_cast<Bytef*>(in.data());
    strm.avail_in = static_cast<uInt>(in.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    ret = deflate(&strm, Z_FINISH);
    if (ret != Z_STREAM_END) {
        deflateEnd(&strm);
        throw std::runtime_error("zip: deflate failed with code " + std::to_string(ret));
    }
    out.resize(strm.total_out);
    deflateEnd(&strm);
    return out;
}

std::vector<uint8_t> inflateRaw(const uint8_t* in, size_t len, size_t expected)
{
    z_stream strm{};
    if (inflateInit2(&strm, -15) != Z_OK)
        throw FormatError("zip: inflateInit2 failed");

    std::vector<uint8_t> out(expected);
    strm.next_in = const_cast<Bytef*>(in);
    strm.avail_in = static_cast<uInt>(len);
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret = inflate(&strm, Z_FINISH);
    inflateEnd(&strm);
    if (ret != Z_STREAM_END || strm.total_out != expected)
        throw FormatError("zip: corrupt deflate stream");
    return out;
}

} // namespace

uint32_t crc32(const std::vector<uint8_t>& data)
{
    uLong crc = ::crc32(0L, Z_NULL, 0);
    return static_cast<uint32_t>(
        ::crc32(crc, data.data(), static_cast<uInt>(data.size())));
}

ZipWriter::ZipWriter(const std::filesystem::path& path, int level)
    : path_(path), out_(path, std::ios::binary | std::ios::trunc), level_(level)
{
    if (!out_)
        throw IOError("cannot create archive " + path.string());

    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    dosTime_ = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    dosDate_ = static_cast<uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

ZipWriter::~ZipWriter() = default;

void ZipWriter::add(const std::string& name, const std::vector<uint8_t>& data)
{
    if (closed_)
        throw std::logic_error("zip: add() after close()");

    std::vector<uint8_t> packed = deflateRaw(data, level_);
    uint16_t method = kMethodDeflate;
    if (packed.size() >= data.size()) {
        packed = data;
        method = kMethodStored;
    }

    const auto offset = static_cast<uint64_t>(out_.tellp());
    if (offset > std::numeric_limits<uint32_t>::max() ||
        data.size() > std::numeric_limits<uint32_t>::max())
        throw IOError("zip: archive exceeds 4 GiB: " + path_.string());

    CentralRecord rec{name, method, crc32(data),
                      static_cast<uint32_t>(packed.size()),
                      static_cast<uint32_t>(data.size()),
                      static_cast<uint32_t>(offset)};

    std::vector<uint8_t> hdr;
    put32(hdr, kLocalHeaderSig);
    put16(hdr, kVersion);
    put16(hdr, 0);
    put16(hdr, rec.method);
    put16(hdr, dosTime_);
    put16(hdr, dosDate_);
    put32(hdr, rec.crc);
    put32(hdr, rec.compressedSize);
    put32(hdr, rec.size);
    put16(hdr, static_cast<uint16_t>(name.size()));
    put16(hdr, 0);
    hdr.insert(hdr.end(), name.begin(), name.end());

    out_.write(reinterpret_cast<const char*>(hdr.data()), static_cast<std::streamsize>(hdr.size()));
    out_.write(reinterpret_cast<const char*>(packed.data()), static_cast<std::streamsize>(packed.size()));
    if (!out_)
        throw IOError("zip: write failed for " + path_.string());

    records_.push_back(std::move(rec));
}

void ZipWriter::close()
{
    if (closed_)
        return;

    const auto cdOffset = static_cast<uint32_t>(out_.tellp());
    std::vector<uint8_t> cd;
    for (const auto& r : records_) {
        put32(cd, kCentralHeaderSig);
        put16(cd, kVersion);
        put16(cd, kVersion);
        put16(cd, 0);
        put16(cd, r.method);
        put16(cd, dosTime_);
        put16(cd, dosDate_);
        put32(cd, r.crc);
        put32(cd, r.compressedSize);
        put32(cd, r.size);
        put16(cd, static_cast<uint16_t>(r.name.size()));
        put16(cd, 0);
        put16(cd, 0);
        put16(cd, 0);
        put16(cd, 0);
        put32(cd, 0);
        put32(cd, r.offset);
        cd.insert(cd.end(), r.name.begin(), r.name.end());
    }

    const auto cdSize = static_cast<uint32_t>(cd.size());
    put32(cd, kEndOfCentralSig);
    put16(cd, 0);
    put16(cd, 0);
    put16(cd, static_cast<uint16_t>(records_.size()));
    put16(cd, static_cast<uint16_t>(records_.size()));
    put32(cd, cdSize);
    put32(cd, cdOffset);
    put16(cd, 0);

    out_.write(reinterpret_cast<const char*>(cd.data()), static_cast<std::streamsize>(cd.size()));
    out_.close();
    if (!out_)
        throw IOError("zip: failed to finalize " + path_.string());
    closed_ = true;
}

std::vector<ZipEntry> readZipArchive(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw IOError("cannot open archive " + path.string());
    std::vector<uint8_t> buf((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    if (buf.size() < 22)
        throw FormatError("not a zip archive: " + path.string());

    // EOCD sits in the last 22 + 65535 (max comment) bytes
    size_t eocd = std::string::npos;
    const size_t lowest = buf.size() > 22 + 65535 ? buf.size() - 22 - 65535 : 0;
    for (size_t at = buf.size() - 22 + 1; at-- > lowest;) {
        if (get32(buf, at) == kEndOfCentralSig) {
            eocd = at;
            break;
        }
    }
    if (eocd == std::string::npos)
        throw FormatError("zip: end of central directory not found in " + path.string());

    const uint16_t count = get16(buf, eocd + 10);
    size_t at = get32(buf, eocd + 16);

    std::vector<ZipEntry> entries;
    entries.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        if (get32(buf, at) != kCentralHeaderSig)
            throw FormatError("zip: bad central directory record in " + path.string());
        const uint16_t method = get16(buf, at + 10);
        const uint32_t crc = get32(buf, at + 16);
        const uint32_t csize = get32(buf, at + 20);
        const uint32_t usize = get32(buf, at + 24);
        const uint16_t nameLen = get16(buf, at + 28);
        const uint16_t extraLen = get16(buf, at + 30);
        const uint16_t commentLen = get16(buf, at + 32);
        const uint32_t localOffset = get32(buf, at + 42);
        if (at + 46 + nameLen > buf.size())
            throw FormatError("zip: truncated central directory in " + path.string());
        std::string name(buf.begin() + static_cast<std::ptrdiff_t>(at + 46),
                         buf.begin() + static_cast<std::ptrdiff_t>(at + 46 + nameLen));
        at += 46 + nameLen + extraLen + commentLen;

        if (get32(buf, localOffset) != kLocalHeaderSig)
            throw FormatError("zip: bad local header for " + name);
        const size_t dataStart = localOffset + 30 + get16(buf, localOffset + 26) +
                                 get16(buf, localOffset + 28);
        if (dataStart + csize > buf.size())
            throw FormatError("zip: truncated entry " + name);

        ZipEntry entry;
        entry.name = name;
        if (method == kMethodStored) {
            entry.data.assign(buf.begin() + static_cast<std::ptrdiff_t>(dataStart),
                              buf.begin() + static_cast<std::ptrdiff_t>(dataStart + csize));
        } else if (method == kMethodDeflate) {
            entry.data = inflateRaw(buf.data() + dataStart, csize, usize);
        } else {
            throw FormatError("zip: unsupported compression method " +
                              std::to_string(method) + " for " + name);
        }
        if (crc32(entry.data) != crc)
            throw FormatError("zip: CRC mismatch for " + name);
        entries.push_back(std::move(entry));
    }
    return entries;
}

} // namespace bc::zip
