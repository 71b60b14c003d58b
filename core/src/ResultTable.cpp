#include "bc/core/types/ResultTable.hpp"
#include "bc/core/util/Errors.hpp"
#include "bc/core/util/StagedOutputs.hpp"

#include <fstream>
#include <iomanip>

namespace bc {

void ResultTable::append(ResultRow row)
{
    std::lock_guard<std::mutex> lock(mutex_);
    rows_.push_back(std::move(row));
}

void ResultTable::append(const std::vector<ResultRow>& rows)
{
    std::lock_guard<std::mutex> lock(mutex_);
    rows_.insert(rows_.end(), rows.begin(), rows.end());
}

size_t ResultTable::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
}

std::vector<ResultRow> ResultTable::rows() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_;
}

void ResultTable::writeCsv(const std::filesystem::path& path) const
{
    const std::vector<ResultRow> snapshot = rows();
    writeAtomically(path, [&](const std::filesystem::path& tmp) {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out)
            throw IOError("cannot write " + tmp.string());

        out << kHeader << "\n";
        out << std::fixed << std::setprecision(3);
        for (const auto& r : snapshot) {
            out << csvField(r.filename) << ',' << csvField(r.cell) << ','
                << r.spots << ',' << r.area << "\n";
        }
        out.close();
        if (!out)
            throw IOError("failed writing " + tmp.string());
    });
}

std::string csvField(const std::string& value)
{
    if (value.find_first_of(",\"\n\r") == std::string::npos)
        return value;

    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"')
            quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace bc
