#include "bc/pipeline/CellAggregator.hpp"
#include "bc/core/util/Errors.hpp"

#include <exception>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace bc {

std::vector<CellMeasurement> measureCells(const PreparedPlane& plane,
                                          const std::vector<Roi>& rois,
                                          const SpotDetector& detector)
{
    const int n = static_cast<int>(rois.size());
    std::vector<CellMeasurement> out(rois.size());
    std::vector<std::exception_ptr> failures(rois.size());

    #pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n; ++i) {
        CellMeasurement& m = out[i];
        m.index = static_cast<size_t>(i);
        m.label = rois[i].label;
        try {
            const cv::Mat_<uint8_t> mask = rasterizeRoi(rois[i], plane.filtered.size());
            m.area = polygonArea(rois[i].vertices);
            m.spots = detector.detectPreprocessed(plane, &mask);
        } catch (const GeometryError& e) {
            m.error = e.what();
        } catch (const std::exception&) {
            failures[i] = std::current_exception();
        }
    }

    for (const auto& f : failures) {
        if (f)
            std::rethrow_exception(f);
    }
    return out;
}

std::vector<CellMeasurement> measureCells(const Projection& projection,
                                          const std::vector<Roi>& rois,
                                          const SpotDetector& detector,
                                          int channel)
{
    const PreparedPlane plane = detector.preprocess(projection.channel(channel));
    return measureCells(plane, rois, detector);
}

} // namespace bc
