#pragma once

#include "bc/core/types/Roi.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace bc {

/**
 * @brief ImageJ binary ROI (.roi) encoding
 *
 * Polygons are stored as version 228 "Iout" records: big-endian header,
 * integer vertices relative to the bounding box, sub-pixel float vertices
 * and a header2 block carrying the ROI name as UTF-16BE.
 */
std::vector<uint8_t> encodeImageJRoi(const Roi& roi);

// Decodes polygon, freehand, traced and rectangle ROIs. The label comes from
// header2 when present, otherwise `fallbackLabel`.
// @throws bc::FormatError for truncated records or unsupported types
Roi decodeImageJRoi(const std::vector<uint8_t>& data, const std::string& fallbackLabel);

// Zip of "<label>.roi" entries in ROI order, as ImageJ's ROI Manager saves.
void writeRoiSet(const std::filesystem::path& path, const std::vector<Roi>& rois);
std::vector<Roi> readRoiSet(const std::filesystem::path& path);

} // namespace bc
