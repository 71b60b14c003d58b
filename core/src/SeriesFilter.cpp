#include "bc/pipeline/SeriesFilter.hpp"

namespace bc {

SeriesFilter::SeriesFilter(bool enabled, const std::string& pattern)
    : enabled_(enabled),
      pattern_(pattern, std::regex::ECMAScript | std::regex::icase)
{
}

bool SeriesFilter::accepts(const std::string& seriesName) const
{
    return !enabled_ || std::regex_search(seriesName, pattern_);
}

} // namespace bc
