#pragma once

#include "bc/core/types/Projection.hpp"
#include "bc/core/types/Roi.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace bc {

/**
 * @brief Source of the cell outlines for one projected series
 *
 * acquire() blocks until the ROIs for the series are known. An empty list
 * means the series is skipped. Implementations may throw bc::Cancelled to
 * stop the whole run.
 */
class RoiProvider {
public:
    virtual ~RoiProvider() = default;

    // displayChannel is 1-based, the channel spots are counted on
    virtual std::vector<Roi> acquire(const Projection& projection, int displayChannel) = 0;
};

// Replays "<dir>/<series>_RoiSet.zip" archives; no archive = skip.
class RoiSetFileProvider : public RoiProvider {
public:
    explicit RoiSetFileProvider(std::filesystem::path dir);

    std::vector<Roi> acquire(const Projection& projection, int displayChannel) override;

    [[nodiscard]] std::filesystem::path archiveFor(const std::string& seriesName) const;

private:
    std::filesystem::path dir_;
};

// Fixed ROI lists keyed by series name; unknown series are skipped.
class ScriptedRoiProvider : public RoiProvider {
public:
    ScriptedRoiProvider() = default;
    explicit ScriptedRoiProvider(std::map<std::string, std::vector<Roi>> bySeries);

    void set(const std::string& seriesName, std::vector<Roi> rois);
    std::vector<Roi> acquire(const Projection& projection, int displayChannel) override;

    // Series names in the order they were asked for.
    [[nodiscard]] const std::vector<std::string>& requested() const { return requested_; }

private:
    std::map<std::string, std::vector<Roi>> bySeries_;
    std::vector<std::string> requested_;
};

} // namespace bc
