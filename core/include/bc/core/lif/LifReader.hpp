#pragma once

#include "bc/core/types/Series.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

class TiXmlElement;

namespace bc::lif {

/**
 * @brief Reader for Leica Image File (.lif) containers
 *
 * A LIF file is a sequence of blocks, each introduced by the test value
 * 0x70 and the separator byte 0x2A. The first block carries a UTF-16LE XML
 * header describing every element; the remaining blocks are the raw pixel
 * memory referenced by MemoryBlockID. Header version 1 stores 32-bit block
 * sizes, version 2 stores 64-bit sizes.
 *
 * The constructor indexes the file (XML + block offsets) without reading
 * any pixel data. Every element whose Data/Image has a non-empty memory
 * block is exposed as one series, in document order.
 */
class LifReader {
public:
    /**
     * @throws bc::IOError if the file cannot be opened
     * @throws bc::FormatError if the block structure or XML is malformed
     */
    explicit LifReader(const std::filesystem::path& path);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] int version() const { return version_; }
    [[nodiscard]] const std::string& xmlHeader() const { return xml_; }

    [[nodiscard]] size_t seriesCount() const { return images_.size(); }
    [[nodiscard]] const SeriesInfo& info(size_t index) const;

    // Read all channels and z slices of the first time point.
    [[nodiscard]] Series read(size_t index) const;

    static constexpr int32_t kTestValue = 0x70;
    static constexpr uint8_t kSeparator = 0x2A;

private:
    struct Dimension {
        int id = 0;           ///< 1=X 2=Y 3=Z 4=T, others (tiles, lambda) read at index 0
        int64_t count = 1;
        int64_t bytesInc = 0;
    };

    struct ChannelLayout {
        int resolution = 8;   ///< significant bits
        int64_t bytesInc = 0;
    };

    struct ImageEntry {
        SeriesInfo info;
        std::vector<Dimension> dims;
        std::vector<ChannelLayout> channels;
        std::string blockId;
        uint64_t memorySize = 0;
    };

    struct MemoryBlock {
        uint64_t offset = 0;
        uint64_t size = 0;
    };

    void indexFile();
    void collectImages(const TiXmlElement* element, const std::string& parentPath, int depth);
    void validateLayout(const ImageEntry& entry) const;
    [[nodiscard]] int64_t strideOf(const ImageEntry& entry, int dimId) const;

    std::filesystem::path path_;
    int version_ = 1;
    uint64_t fileSize_ = 0;
    std::string xml_;
    std::vector<ImageEntry> images_;
    std::map<std::string, MemoryBlock> blocks_;
};

// Convert `units` UTF-16LE code units to UTF-8 (unpaired surrogates become U+FFFD).
std::string utf16leToUtf8(const char* data, size_t units);

} // namespace bc::lif
