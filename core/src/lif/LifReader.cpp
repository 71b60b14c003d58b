#include "bc/core/lif/LifReader.hpp"
#include "bc/core/util/Errors.hpp"
#include "bc/core/util/Logging.hpp"

#include <tinyxml.h>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace bc::lif {

namespace {

// Little-endian reads with truncation checks
class BlockStream {
public:
    BlockStream(std::ifstream& in, const fs::path& path, uint64_t size)
        : in_(in), path_(path), size_(size) {}

    [[nodiscard]] uint64_t tell() { return static_cast<uint64_t>(in_.tellg()); }
    [[nodiscard]] bool atEnd() { return tell() >= size_; }

    void read(void* dst, uint64_t n)
    {
        if (tell() + n > size_)
            throw FormatError("truncated LIF block in " + path_.string());
        in_.read(static_cast<char*>(dst), static_cast<std::streamsize>(n));
        if (!in_)
            throw FormatError("read error in " + path_.string());
    }

    uint8_t u8() { uint8_t b[1]; read(b, 1); return b[0]; }
    uint32_t u32()
    {
        uint8_t b[4];
        read(b, 4);
        return static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
               (static_cast<uint32_t>(b[2]) << 16) | (static_cast<uint32_t>(b[3]) << 24);
    }
    uint64_t u64()
    {
        const uint64_t lo = u32();
        const uint64_t hi = u32();
        return lo | (hi << 32);
    }

    void skip(uint64_t n)
    {
        if (tell() + n > size_)
            throw FormatError("truncated LIF memory block in " + path_.string());
        in_.seekg(static_cast<std::streamoff>(n), std::ios::cur);
    }

    void expectTestValue()
    {
        const uint32_t v = u32();
        if (v != static_cast<uint32_t>(LifReader::kTestValue))
            throw FormatError("bad LIF block marker 0x" + hex(v) + " in " + path_.string());
    }

    void expectSeparator()
    {
        if (u8() != LifReader::kSeparator)
            throw FormatError("missing LIF separator byte in " + path_.string());
    }

    std::string utf16(uint32_t units)
    {
        std::string raw(static_cast<size_t>(units) * 2, '\0');
        read(raw.data(), raw.size());
        return utf16leToUtf8(raw.data(), units);
    }

private:
    static std::string hex(uint32_t v)
    {
        static const char* digits = "0123456789abcdef";
        std::string s;
        for (int shift = 28; shift >= 0; shift -= 4)
            s += digits[(v >> shift) & 0xf];
        return s;
    }

    std::ifstream& in_;
    const fs::path& path_;
    uint64_t size_;
};

const char* attr(const TiXmlElement* e, const char* name)
{
    const char* v = e ? e->Attribute(name) : nullptr;
    return v ? v : "";
}

int64_t attrInt(const TiXmlElement* e, const char* name, int64_t def, const fs::path& path)
{
    const char* v = e ? e->Attribute(name) : nullptr;
    if (!v || !*v)
        return def;
    try {
        size_t used = 0;
        const long long parsed = std::stoll(v, &used);
        if (used != std::strlen(v))
            throw std::invalid_argument(v);
        return parsed;
    } catch (const std::exception&) {
        throw FormatError(std::string("attribute ") + name + "=\"" + v +
                          "\" is not an integer in " + path.string());
    }
}

const TiXmlElement* child(const TiXmlElement* e, const char* name)
{
    return e ? e->FirstChildElement(name) : nullptr;
}

} // namespace

std::string utf16leToUtf8(const char* data, size_t units)
{
    std::string out;
    out.reserve(units);
    auto unit = [&](size_t i) {
        return static_cast<uint32_t>(static_cast<uint8_t>(data[2 * i])) |
               (static_cast<uint32_t>(static_cast<uint8_t>(data[2 * i + 1])) << 8);
    };

    for (size_t i = 0; i < units; ++i) {
        uint32_t cp = unit(i);
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < units) {
            const uint32_t lo = unit(i + 1);
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                ++i;
            } else {
                cp = 0xFFFD;
            }
        } else if (cp >= 0xD800 && cp <= 0xDFFF) {
            cp = 0xFFFD;
        }

        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }
    return out;
}

LifReader::LifReader(const fs::path& path) : path_(path)
{
    indexFile();
}

void LifReader::indexFile()
{
    std::error_code ec;
    fileSize_ = fs::file_size(path_, ec);
    if (ec)
        throw IOError("cannot stat " + path_.string() + ": " + ec.message());

    std::ifstream in(path_, std::ios::binary);
    if (!in)
        throw IOError("cannot open " + path_.string());

    BlockStream bs(in, path_, fileSize_);

    // Header block
    bs.expectTestValue();
    (void)bs.u32();  // block length
    bs.expectSeparator();
    const uint32_t xmlUnits = bs.u32();
    xml_ = bs.utf16(xmlUnits);

    TiXmlDocument doc;
    doc.Parse(xml_.c_str(), nullptr, TIXML_ENCODING_UTF8);
    if (doc.Error())
        throw FormatError("invalid XML header in " + path_.string() + ": " + doc.ErrorDesc());

    const TiXmlElement* root = doc.RootElement();
    if (!root)
        throw FormatError("empty XML header in " + path_.string());
    version_ = static_cast<int>(attrInt(root, "Version", 1, path_));
    if (version_ < 1 || version_ > 2)
        throw FormatError("unsupported LIF version " + std::to_string(version_) +
                          " in " + path_.string());

    const TiXmlElement* top = child(root, "Element");
    if (!top)
        throw FormatError("XML header of " + path_.string() + " has no Element");
    collectImages(top, "", 0);

    // Memory blocks
    while (!bs.atEnd()) {
        bs.expectTestValue();
        (void)bs.u32();
        bs.expectSeparator();
        const uint64_t size = version_ >= 2 ? bs.u64() : bs.u32();
        bs.expectSeparator();
        const uint32_t idUnits = bs.u32();
        const std::string id = bs.utf16(idUnits);

        MemoryBlock block{bs.tell(), size};
        bs.skip(size);
        blocks_[id] = block;
    }

    for (const auto& img : images_) {
        auto it = blocks_.find(img.blockId);
        if (it == blocks_.end())
            throw FormatError("memory block " + img.blockId + " of series " + img.info.path +
                              " is missing from " + path_.string());
        if (it->second.size < img.memorySize)
            throw FormatError("memory block " + img.blockId + " is shorter than declared in " +
                              path_.string());
        validateLayout(img);
    }

    Logger()->debug("{}: LIF v{}, {} series, {} memory blocks",
                    path_.filename().string(), version_, images_.size(), blocks_.size());
}

void LifReader::collectImages(const TiXmlElement* element, const std::string& parentPath, int depth)
{
    const std::string name = attr(element, "Name");
    const std::string path = depth == 0 ? std::string() :
                             (parentPath.empty() ? name : parentPath + "/" + name);

    const TiXmlElement* image = child(child(element, "Data"), "Image");
    const TiXmlElement* memory = child(element, "Memory");
    const int64_t memSize = attrInt(memory, "Size", 0, path_);

    if (image && memSize > 0) {
        ImageEntry entry;
        entry.memorySize = static_cast<uint64_t>(memSize);
        entry.blockId = attr(memory, "MemoryBlockID");

        const TiXmlElement* desc = child(image, "ImageDescription");
        for (const TiXmlElement* c = child(child(desc, "Channels"), "ChannelDescription"); c;
             c = c->NextSiblingElement("ChannelDescription")) {
            ChannelLayout ch;
            ch.resolution = static_cast<int>(attrInt(c, "Resolution", 8, path_));
            ch.bytesInc = attrInt(c, "BytesInc", 0, path_);
            entry.channels.push_back(ch);
            entry.info.luts.push_back(lutFromName(attr(c, "LUTName")));
        }
        for (const TiXmlElement* d = child(child(desc, "Dimensions"), "DimensionDescription"); d;
             d = d->NextSiblingElement("DimensionDescription")) {
            Dimension dim;
            dim.id = static_cast<int>(attrInt(d, "DimID", 0, path_));
            dim.count = attrInt(d, "NumberOfElements", 1, path_);
            dim.bytesInc = attrInt(d, "BytesInc", 0, path_);
            entry.dims.push_back(dim);
        }

        auto sizeOf = [&](int id) -> int {
            for (const auto& d : entry.dims)
                if (d.id == id) return static_cast<int>(d.count);
            return 1;
        };
        const bool hasX = std::any_of(entry.dims.begin(), entry.dims.end(),
                                      [](const Dimension& d) { return d.id == 1; });
        const bool hasY = std::any_of(entry.dims.begin(), entry.dims.end(),
                                      [](const Dimension& d) { return d.id == 2; });
        if (!hasX || !hasY || entry.channels.empty()) {
            Logger()->warn("{}: element '{}' is not an XY image, ignored",
                           path_.filename().string(), path.empty() ? name : path);
        } else {
            entry.info.index = images_.size();
            entry.info.path = path.empty() ? name : path;
            entry.info.name = sanitizeSeriesName(entry.info.path);
            entry.info.sizeX = sizeOf(1);
            entry.info.sizeY = sizeOf(2);
            entry.info.sizeZ = sizeOf(3);
            entry.info.sizeT = sizeOf(4);
            entry.info.sizeC = static_cast<int>(entry.channels.size());
            int bits = 0;
            for (const auto& ch : entry.channels)
                bits = std::max(bits, ch.resolution);
            entry.info.bitsPerSample = bits;
            images_.push_back(std::move(entry));
        }
    }

    for (const TiXmlElement* c = child(child(element, "Children"), "Element"); c;
         c = c->NextSiblingElement("Element")) {
        collectImages(c, path, depth + 1);
    }
}

int64_t LifReader::strideOf(const ImageEntry& entry, int dimId) const
{
    for (const auto& d : entry.dims)
        if (d.id == dimId) return d.bytesInc;
    return 0;
}

void LifReader::validateLayout(const ImageEntry& entry) const
{
    const SeriesInfo& info = entry.info;
    if (info.sizeX <= 0 || info.sizeY <= 0 || info.sizeZ <= 0)
        throw FormatError("series " + info.path + " has empty dimensions in " + path_.string());
    if (info.bitsPerSample > 16)
        throw FormatError("series " + info.path + " has unsupported " +
                          std::to_string(info.bitsPerSample) + "-bit samples in " + path_.string());

    const int64_t bps = info.bitsPerSample > 8 ? 2 : 1;
    int64_t last = 0;
    for (const auto& d : entry.dims) {
        if (d.count <= 0 || d.bytesInc < 0)
            throw FormatError("series " + info.path + " has an invalid dimension in " + path_.string());
        // only X, Y, Z are traversed; other dimensions are read at index 0
        if (d.id >= 1 && d.id <= 3)
            last += (d.count - 1) * d.bytesInc;
    }
    int64_t maxChannel = 0;
    for (const auto& ch : entry.channels) {
        if (ch.bytesInc < 0)
            throw FormatError("series " + info.path + " has a negative channel offset in " + path_.string());
        maxChannel = std::max(maxChannel, ch.bytesInc);
    }
    if (static_cast<uint64_t>(last + maxChannel + bps) > entry.memorySize)
        throw FormatError("series " + info.path + " addresses pixels beyond its memory block in " +
                          path_.string());
}

const SeriesInfo& LifReader::info(size_t index) const
{
    if (index >= images_.size())
        throw std::out_of_range("series index " + std::to_string(index) + " out of range for " +
                                path_.string());
    return images_[index].info;
}

Series LifReader::read(size_t index) const
{
    const ImageEntry& entry = images_.at(index);
    const SeriesInfo& info = entry.info;
    const MemoryBlock& block = blocks_.at(entry.blockId);

    std::ifstream in(path_, std::ios::binary);
    if (!in)
        throw IOError("cannot reopen " + path_.string());

    if (info.sizeT > 1)
        Logger()->debug("series {} has {} time points, reading the first", info.name, info.sizeT);

    const bool wide = info.bitsPerSample > 8;
    const int64_t bps = wide ? 2 : 1;
    const int cvType = wide ? CV_16UC1 : CV_8UC1;
    const int64_t xInc = strideOf(entry, 1);
    const int64_t yInc = strideOf(entry, 2);
    const int64_t zInc = strideOf(entry, 3);
    const int64_t rowSpan = (info.sizeX - 1) * xInc + bps;

    std::vector<uint8_t> row(static_cast<size_t>(rowSpan));
    std::vector<std::vector<cv::Mat>> planes(entry.channels.size());

    for (size_t c = 0; c < entry.channels.size(); ++c) {
        for (int z = 0; z < info.sizeZ; ++z) {
            cv::Mat plane(info.sizeY, info.sizeX, cvType);
            for (int y = 0; y < info.sizeY; ++y) {
                const int64_t off = static_cast<int64_t>(block.offset) + entry.channels[c].bytesInc +
                                    y * yInc + z * zInc;
                in.seekg(off);
                in.read(reinterpret_cast<char*>(row.data()), rowSpan);
                if (!in)
                    throw FormatError("truncated pixel data for series " + info.path + " in " +
                                      path_.string());

                if (!wide) {
                    uint8_t* dst = plane.ptr<uint8_t>(y);
                    if (xInc == 1) {
                        std::memcpy(dst, row.data(), static_cast<size_t>(info.sizeX));
                    } else {
                        for (int x = 0; x < info.sizeX; ++x)
                            dst[x] = row[static_cast<size_t>(x * xInc)];
                    }
                } else {
                    uint16_t* dst = plane.ptr<uint16_t>(y);
                    for (int x = 0; x < info.sizeX; ++x) {
                        const size_t at = static_cast<size_t>(x * xInc);
                        dst[x] = static_cast<uint16_t>(row[at] | (row[at + 1] << 8));
                    }
                }
            }
            planes[c].push_back(plane);
        }
    }

    return Series(info, std::move(planes));
}

} // namespace bc::lif
