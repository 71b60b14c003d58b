#pragma once

#include "bc/core/util/SpotDetector.hpp"

#include <string>

namespace bc {

// Run configuration. Field names match the JSON keys.
struct PipelineParams {
    // Spot detection
    double maxima_tolerance = 50.0;   // prominence on the filtered scale
    double top_hat_radius = 5.0;      // 0 = off
    double median_radius = 1.0;       // 0 = off
    bool exclude_edge_maxima = false;

    // Series selection
    bool choose_lng = false;
    std::string series_pattern = "LNG";   // ECMAScript, case-insensitive search

    int channel = 2;                  // 1-based quantification channel
    std::string extension = ".lif";
    int threads = 0;                  // 0 = OpenMP default
    std::string log_level = "info";

    [[nodiscard]] SpotDetectorParams detectorParams() const
    {
        SpotDetectorParams p;
        p.prominence = maxima_tolerance;
        p.topHatRadius = top_hat_radius;
        p.medianRadius = median_radius;
        p.excludeEdgeMaxima = exclude_edge_maxima;
        return p;
    }
};

} // namespace bc
