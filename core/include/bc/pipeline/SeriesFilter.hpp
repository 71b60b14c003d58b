#pragma once

#include <regex>
#include <string>

namespace bc {

// Name gate applied to series metadata before any pixel data is read.
class SeriesFilter {
public:
    // @throws std::regex_error if `pattern` does not compile
    SeriesFilter(bool enabled, const std::string& pattern);

    [[nodiscard]] bool enabled() const { return enabled_; }
    [[nodiscard]] bool accepts(const std::string& seriesName) const;

private:
    bool enabled_;
    std::regex pattern_;
};

} // namespace bc
