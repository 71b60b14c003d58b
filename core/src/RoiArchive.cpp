#include "bc/core/util/RoiArchive.hpp"
#include "bc/core/util/Errors.hpp"
#include "bc/core/util/Zip.hpp"

#include <cmath>
#include <cstring>

namespace bc {

namespace {

// Offsets from ImageJ's RoiDecoder
constexpr size_t kVersionOffset = 4;
constexpr size_t kTypeOffset = 6;
constexpr size_t kTop = 8;
constexpr size_t kLeft = 10;
constexpr size_t kBottom = 12;
constexpr size_t kRight = 14;
constexpr size_t kNCoordinates = 16;
constexpr size_t kOptions = 50;
constexpr size_t kHeader2Offset = 60;
constexpr size_t kHeaderSize = 64;

constexpr size_t kHeader2Size = 64;
constexpr size_t kNameOffset = 16;
constexpr size_t kNameLength = 20;

constexpr uint16_t kVersion = 228;
constexpr uint16_t kSubPixelResolution = 128;

enum RoiType : uint8_t { Polygon = 0, Rect = 1, Freehand = 7, Traced = 8 };

void put16(std::vector<uint8_t>& b, size_t at, uint16_t v)
{
    b[at] = static_cast<uint8_t>(v >> 8);
    b[at + 1] = static_cast<uint8_t>(v);
}

void put32(std::vector<uint8_t>& b, size_t at, uint32_t v)
{
    b[at] = static_cast<uint8_t>(v >> 24);
    b[at + 1] = static_cast<uint8_t>(v >> 16);
    b[at + 2] = static_cast<uint8_t>(v >> 8);
    b[at + 3] = static_cast<uint8_t>(v);
}

void putFloat(std::vector<uint8_t>& b, size_t at, float f)
{
    uint32_t bits;
    std::memcpy(&bits, &f, sizeof bits);
    put32(b, at, bits);
}

class BigEndianView {
public:
    explicit BigEndianView(const std::vector<uint8_t>& data) : d_(data) {}

    [[nodiscard]] uint16_t u16(size_t at) const
    {
        need(at, 2);
        return static_cast<uint16_t>((d_[at] << 8) | d_[at + 1]);
    }
    [[nodiscard]] int16_t i16(size_t at) const { return static_cast<int16_t>(u16(at)); }
    [[nodiscard]] uint32_t u32(size_t at) const
    {
        need(at, 4);
        return (uint32_t(d_[at]) << 24) | (uint32_t(d_[at + 1]) << 16) |
               (uint32_t(d_[at + 2]) << 8) | uint32_t(d_[at + 3]);
    }
    [[nodiscard]] float f32(size_t at) const
    {
        const uint32_t bits = u32(at);
        float f;
        std::memcpy(&f, &bits, sizeof f);
        return f;
    }
    [[nodiscard]] uint8_t u8(size_t at) const
    {
        need(at, 1);
        return d_[at];
    }

private:
    void need(size_t at, size_t n) const
    {
        if (at + n > d_.size())
            throw FormatError("truncated ImageJ ROI record");
    }

    const std::vector<uint8_t>& d_;
};

} // namespace

std::vector<uint8_t> encodeImageJRoi(const Roi& roi)
{
    const size_t n = roi.vertices.size();
    if (n == 0 || n > 0xFFFF)
        throw GeometryError("ROI '" + roi.label + "' has an unsupported vertex count " + std::to_string(n));

    const cv::Rect box = roiBounds(roi);
    const size_t intCoords = kHeaderSize;
    const size_t floatCoords = intCoords + 4 * n;
    const size_t header2 = floatCoords + 8 * n;
    const size_t name = header2 + kHeader2Size;

    std::vector<uint8_t> b(name + 2 * roi.label.size(), 0);
    std::memcpy(b.data(), "Iout", 4);
    put16(b, kVersionOffset, kVersion);
    b[kTypeOffset] = Polygon;
    put16(b, kTop, static_cast<uint16_t>(box.y));
    put16(b, kLeft, static_cast<uint16_t>(box.x));
    put16(b, kBottom, static_cast<uint16_t>(box.y + box.height));
    put16(b, kRight, static_cast<uint16_t>(box.x + box.width));
    put16(b, kNCoordinates, static_cast<uint16_t>(n));
    put16(b, kOptions, kSubPixelResolution);
    put32(b, kHeader2Offset, static_cast<uint32_t>(header2));

    for (size_t i = 0; i < n; ++i) {
        const auto& v = roi.vertices[i];
        put16(b, intCoords + 2 * i, static_cast<uint16_t>(std::lround(v.x) - box.x));
        put16(b, intCoords + 2 * (n + i), static_cast<uint16_t>(std::lround(v.y) - box.y));
        putFloat(b, floatCoords + 4 * i, v.x);
        putFloat(b, floatCoords + 4 * (n + i), v.y);
    }

    // labels are ASCII ("Cell_<n>"); stored as Java chars
    put32(b, header2 + kNameOffset, static_cast<uint32_t>(name));
    put32(b, header2 + kNameLength, static_cast<uint32_t>(roi.label.size()));
    for (size_t i = 0; i < roi.label.size(); ++i)
        put16(b, name + 2 * i, static_cast<uint8_t>(roi.label[i]));
    return b;
}

Roi decodeImageJRoi(const std::vector<uint8_t>& data, const std::string& fallbackLabel)
{
    if (data.size() < kHeaderSize || std::memcmp(data.data(), "Iout", 4) != 0)
        throw FormatError("not an ImageJ ROI: " + fallbackLabel);

    const BigEndianView in(data);
    const uint16_t version = in.u16(kVersionOffset);
    const uint8_t type = in.u8(kTypeOffset);
    const int top = in.i16(kTop);
    const int left = in.i16(kLeft);
    const int bottom = in.i16(kBottom);
    const int right = in.i16(kRight);
    const uint16_t options = in.u16(kOptions);

    Roi roi;
    roi.label = fallbackLabel;

    switch (type) {
    case Rect:
        roi.vertices = {{float(left), float(top)}, {float(right), float(top)},
                        {float(right), float(bottom)}, {float(left), float(bottom)}};
        break;
    case Polygon:
    case Freehand:
    case Traced: {
        const size_t n = in.u16(kNCoordinates);
        const bool subPixel = version >= 222 && (options & kSubPixelResolution);
        roi.vertices.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            if (subPixel) {
                const size_t base = kHeaderSize + 4 * n;
                roi.vertices.emplace_back(in.f32(base + 4 * i), in.f32(base + 4 * (n + i)));
            } else {
                roi.vertices.emplace_back(float(left + in.i16(kHeaderSize + 2 * i)),
                                          float(top + in.i16(kHeaderSize + 2 * (n + i))));
            }
        }
        break;
    }
    default:
        throw FormatError("unsupported ImageJ ROI type " + std::to_string(type) + " in " + fallbackLabel);
    }

    const uint32_t header2 = version >= 218 ? in.u32(kHeader2Offset) : 0;
    if (header2 > 0 && header2 + kHeader2Size <= data.size()) {
        const uint32_t nameOffset = in.u32(header2 + kNameOffset);
        const uint32_t nameLength = in.u32(header2 + kNameLength);
        if (nameOffset > 0 && nameLength > 0) {
            std::string label;
            for (uint32_t i = 0; i < nameLength; ++i) {
                const uint16_t ch = in.u16(nameOffset + 2 * i);
                label += ch < 0x80 ? static_cast<char>(ch) : '_';
            }
            roi.label = label;
        }
    }
    return roi;
}

void writeRoiSet(const std::filesystem::path& path, const std::vector<Roi>& rois)
{
    zip::ZipWriter writer(path);
    for (const auto& roi : rois)
        writer.add(roi.label + ".roi", encodeImageJRoi(roi));
    writer.close();
}

std::vector<Roi> readRoiSet(const std::filesystem::path& path)
{
    std::vector<Roi> rois;
    for (const auto& entry : zip::readZipArchive(path)) {
        std::string stem = entry.name;
        const auto slash = stem.find_last_of('/');
        if (slash != std::string::npos)
            stem = stem.substr(slash + 1);
        if (stem.size() > 4 && stem.compare(stem.size() - 4, 4, ".roi") == 0)
            stem.resize(stem.size() - 4);
        rois.push_back(decodeImageJRoi(entry.data, stem));
    }
    return rois;
}

} // namespace bc
