#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace bc {

// Options for writing (multi-page) TIFF files
struct TiffWriteOptions {
    enum class Compression { NONE, LZW, DEFLATE };

    Compression compression = Compression::LZW;  // lossless only
    uint32_t rowsPerStrip = 64;
    std::string description;                      // ImageDescription of the first page
};

// Write one TIFF directory per page. Pages may be CV_8UC1, CV_16UC1,
// CV_32FC1 or CV_8UC3 (taken as BGR, stored as RGB).
void writeTiffPages(const std::filesystem::path& outPath,
                    const std::vector<cv::Mat>& pages,
                    const TiffWriteOptions& opts = {});

// Read every directory of a striped TIFF back into cv::Mat pages
// (RGB pages are returned as BGR).
std::vector<cv::Mat> readTiffPages(const std::filesystem::path& inPath);

// ImageJ hyperstack header so Fiji treats the pages as channels.
std::string imagejHyperstackDescription(int channels, bool composite);

} // namespace bc
