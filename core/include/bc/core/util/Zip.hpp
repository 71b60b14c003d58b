#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace bc::zip {

struct ZipEntry {
    std::string name;
    std::vector<uint8_t> data;
};

/**
 * @brief Streams entries into a PKZIP archive (deflate, CRC-32 via zlib)
 *
 * The central directory is written by close(); an archive that is
 * destroyed without close() is left incomplete and should be discarded.
 */
class ZipWriter {
public:
    explicit ZipWriter(const std::filesystem::path& path, int level = 6);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    void add(const std::string& name, const std::vector<uint8_t>& data);
    void close();

private:
    struct CentralRecord {
        std::string name;
        uint16_t method;
        uint32_t crc;
        uint32_t compressedSize;
        uint32_t size;
        uint32_t offset;
    };

    std::filesystem::path path_;
    std::ofstream out_;
    int level_;
    uint16_t dosTime_ = 0;
    uint16_t dosDate_ = 0;
    std::vector<CentralRecord> records_;
    bool closed_ = false;
};

// Read all entries of an archive (stored or deflated).
// @throws bc::IOError when unreadable, bc::FormatError when malformed
std::vector<ZipEntry> readZipArchive(const std::filesystem::path& path);

uint32_t crc32(const std::vector<uint8_t>& data);

} // namespace bc::zip
