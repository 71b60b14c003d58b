#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace bc {

// One measured cell of one series.
struct ResultRow {
    std::string filename;  ///< sanitized series name
    std::string cell;      ///< ROI label
    size_t spots = 0;
    double area = 0.0;
};

/**
 * @brief Append-only, run-wide accumulator of ResultRows
 *
 * append() is safe to call from several threads; rows keep append order.
 */
class ResultTable {
public:
    void append(ResultRow row);
    void append(const std::vector<ResultRow>& rows);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::vector<ResultRow> rows() const;

    // Header "Filename,Cell,No_Spots,ROI_Area" plus one line per row.
    // The file is replaced atomically.
    void writeCsv(const std::filesystem::path& path) const;

    static constexpr const char* kHeader = "Filename,Cell,No_Spots,ROI_Area";

private:
    mutable std::mutex mutex_;
    std::vector<ResultRow> rows_;
};

// Quote a CSV field when it contains a separator, quote or newline.
std::string csvField(const std::string& value);

} // namespace bc
