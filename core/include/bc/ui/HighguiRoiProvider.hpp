#pragma once

#include "bc/pipeline/RoiProvider.hpp"

#include <opencv2/core.hpp>

#include <atomic>
#include <string>
#include <vector>

namespace bc::ui {

/**
 * @brief Polygon drawing on the projection in an OpenCV window
 *
 *   left click   add a vertex to the current polygon
 *   Enter        close the current polygon as the next Cell_<n>
 *   Backspace    drop the last vertex, or the last closed ROI
 *   c            toggle quantification channel / composite view
 *   Space        finish the series
 *   Esc          skip the series
 *   q            cancel the run (throws bc::Cancelled)
 *
 * Closing the window finishes the series with the ROIs closed so far.
 */
class HighguiRoiProvider : public RoiProvider {
public:
    explicit HighguiRoiProvider(const std::atomic<bool>* cancel = nullptr,
                                std::string windowName = "basalcount");

    std::vector<Roi> acquire(const Projection& projection, int displayChannel) override;

private:
    static void onMouse(int event, int x, int y, int flags, void* self);
    void redraw();

    const std::atomic<bool>* cancel_;
    std::string window_;

    cv::Mat channelView_;
    cv::Mat compositeView_;
    bool showComposite_ = false;
    std::vector<Roi> rois_;
    std::vector<cv::Point2f> current_;
};

} // namespace bc::ui
