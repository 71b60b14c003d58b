#include "bc/core/util/Tiff.hpp"
#include "bc/core/util/Errors.hpp"

#include <tiffio.h>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstring>
#include <memory>
#include <sstream>

namespace bc {

namespace {

struct TiffCloser {
    void operator()(TIFF* tf) const { if (tf) TIFFClose(tf); }
};
using TiffHandle = std::unique_ptr<TIFF, TiffCloser>;

struct PageLayout {
    int bits = 0;
    int samplefmt = 0;
    int spp = 1;
    int photometric = PHOTOMETRIC_MINISBLACK;
};

PageLayout layoutFor(const cv::Mat& img, const std::filesystem::path& outPath)
{
    switch (img.type()) {
        case CV_8UC1:  return {8, SAMPLEFORMAT_UINT, 1, PHOTOMETRIC_MINISBLACK};
        case CV_16UC1: return {16, SAMPLEFORMAT_UINT, 1, PHOTOMETRIC_MINISBLACK};
        case CV_32FC1: return {32, SAMPLEFORMAT_IEEEFP, 1, PHOTOMETRIC_MINISBLACK};
        case CV_8UC3:  return {8, SAMPLEFORMAT_UINT, 3, PHOTOMETRIC_RGB};
        default:
            throw IOError("unsupported page type for " + outPath.string());
    }
}

} // namespace

void writeTiffPages(const std::filesystem::path& outPath,
                    const std::vector<cv::Mat>& pages,
                    const TiffWriteOptions& opts)
{
    if (pages.empty())
        throw IOError("no pages to write for " + outPath.string());

    TiffHandle tf(TIFFOpen(outPath.string().c_str(), "w"));
    if (!tf)
        throw IOError("Failed to open TIFF for writing: " + outPath.string());

    for (size_t p = 0; p < pages.size(); ++p) {
        const cv::Mat& page = pages[p];
        if (page.empty())
            throw IOError("empty page " + std::to_string(p) + " for " + outPath.string());

        const PageLayout layout = layoutFor(page, outPath);
        cv::Mat src;
        if (layout.spp == 3) {
            cv::cvtColor(page, src, cv::COLOR_BGR2RGB);
        } else {
            src = page.isContinuous() ? page : page.clone();
        }

        const uint32_t W = static_cast<uint32_t>(src.cols);
        const uint32_t H = static_cast<uint32_t>(src.rows);

        TIFFSetField(tf.get(), TIFFTAG_IMAGEWIDTH,      W);
        TIFFSetField(tf.get(), TIFFTAG_IMAGELENGTH,     H);
        TIFFSetField(tf.get(), TIFFTAG_SAMPLESPERPIXEL, layout.spp);
        TIFFSetField(tf.get(), TIFFTAG_BITSPERSAMPLE,   layout.bits);
        TIFFSetField(tf.get(), TIFFTAG_SAMPLEFORMAT,    layout.samplefmt);
        TIFFSetField(tf.get(), TIFFTAG_PHOTOMETRIC,     layout.photometric);
        TIFFSetField(tf.get(), TIFFTAG_ORIENTATION,     ORIENTATION_TOPLEFT);
        TIFFSetField(tf.get(), TIFFTAG_PLANARCONFIG,    PLANARCONFIG_CONTIG);
        TIFFSetField(tf.get(), TIFFTAG_ROWSPERSTRIP,    std::min(opts.rowsPerStrip, H));

        if (pages.size() > 1) {
            TIFFSetField(tf.get(), TIFFTAG_SUBFILETYPE, FILETYPE_PAGE);
            TIFFSetField(tf.get(), TIFFTAG_PAGENUMBER,
                         static_cast<uint16_t>(p), static_cast<uint16_t>(pages.size()));
        }
        if (p == 0 && !opts.description.empty()) {
            TIFFSetField(tf.get(), TIFFTAG_IMAGEDESCRIPTION, opts.description.c_str());
        }

        switch (opts.compression) {
            case TiffWriteOptions::Compression::NONE:
                TIFFSetField(tf.get(), TIFFTAG_COMPRESSION, COMPRESSION_NONE);
                break;
            case TiffWriteOptions::Compression::LZW:
                TIFFSetField(tf.get(), TIFFTAG_COMPRESSION, COMPRESSION_LZW);
                break;
            case TiffWriteOptions::Compression::DEFLATE:
                TIFFSetField(tf.get(), TIFFTAG_COMPRESSION, COMPRESSION_DEFLATE);
                break;
        }
        if (opts.compression != TiffWriteOptions::Compression::NONE && layout.bits != 32) {
            TIFFSetField(tf.get(), TIFFTAG_PREDICTOR, PREDICTOR_HORIZONTAL);
        }

        const size_t rowBytes = static_cast<size_t>(W) * src.elemSize();
        std::vector<uint8_t> rowBuf(rowBytes);
        for (uint32_t y = 0; y < H; ++y) {
            // libtiff may modify the buffer in place when applying the predictor
            std::memcpy(rowBuf.data(), src.ptr<uint8_t>(static_cast<int>(y)), rowBytes);
            if (TIFFWriteScanline(tf.get(), rowBuf.data(), y, 0) < 0) {
                throw IOError("TIFFWriteScanline failed at row " + std::to_string(y) +
                              " in " + outPath.string());
            }
        }

        if (!TIFFWriteDirectory(tf.get())) {
            throw IOError("TIFFWriteDirectory failed for " + outPath.string());
        }
    }
}

std::vector<cv::Mat> readTiffPages(const std::filesystem::path& inPath)
{
    TiffHandle tif(TIFFOpen(inPath.string().c_str(), "r"));
    if (!tif)
        throw IOError("cannot open " + inPath.string());

    std::vector<cv::Mat> pages;
    do {
        uint32_t w = 0, h = 0;
        uint16_t bps = 0, spp = 1, fmt = SAMPLEFORMAT_UINT;
        TIFFGetField(tif.get(), TIFFTAG_IMAGEWIDTH, &w);
        TIFFGetField(tif.get(), TIFFTAG_IMAGELENGTH, &h);
        TIFFGetField(tif.get(), TIFFTAG_BITSPERSAMPLE, &bps);
        TIFFGetFieldDefaulted(tif.get(), TIFFTAG_SAMPLESPERPIXEL, &spp);
        TIFFGetFieldDefaulted(tif.get(), TIFFTAG_SAMPLEFORMAT, &fmt);

        int cvType;
        if (bps == 8 && spp == 1) cvType = CV_8UC1;
        else if (bps == 8 && spp == 3) cvType = CV_8UC3;
        else if (bps == 16 && spp == 1) cvType = CV_16UC1;
        else if (bps == 32 && spp == 1 && fmt == SAMPLEFORMAT_IEEEFP) cvType = CV_32FC1;
        else
            throw FormatError("unsupported bps=" + std::to_string(bps) + " spp=" +
                              std::to_string(spp) + " in " + inPath.string());

        cv::Mat img(static_cast<int>(h), static_cast<int>(w), cvType);
        for (uint32_t y = 0; y < h; ++y) {
            if (TIFFReadScanline(tif.get(), img.ptr<uint8_t>(static_cast<int>(y)), y, 0) < 0) {
                throw FormatError("TIFFReadScanline failed at row " + std::to_string(y) +
                                  " in " + inPath.string());
            }
        }
        if (spp == 3) {
            cv::cvtColor(img, img, cv::COLOR_RGB2BGR);
        }
        pages.push_back(img);
    } while (TIFFReadDirectory(tif.get()));

    return pages;
}

std::string imagejHyperstackDescription(int channels, bool composite)
{
    std::ostringstream oss;
    oss << "ImageJ=1.54f\n"
        << "images=" << channels << "\n"
        << "channels=" << channels << "\n";
    if (composite) {
        oss << "mode=composite\n";
    }
    return oss.str();
}

} // namespace bc
