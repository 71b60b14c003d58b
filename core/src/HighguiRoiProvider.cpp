#include "bc/ui/HighguiRoiProvider.hpp"
#include "bc/core/util/Errors.hpp"
#include "bc/core/util/Logging.hpp"
#include "bc/core/util/Overlay.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace bc::ui {

namespace {

constexpr int kKeyEsc = 27;
constexpr int kKeySpace = 32;

bool isEnter(int key) { return key == 13 || key == 10; }
bool isBackspace(int key) { return key == 8 || key == 127; }

} // namespace

HighguiRoiProvider::HighguiRoiProvider(const std::atomic<bool>* cancel, std::string windowName)
    : cancel_(cancel), window_(std::move(windowName))
{
}

void HighguiRoiProvider::onMouse(int event, int x, int y, int, void* self)
{
    auto* p = static_cast<HighguiRoiProvider*>(self);
    if (event != cv::EVENT_LBUTTONDOWN || p->channelView_.empty())
        return;

    const float fx = std::clamp(static_cast<float>(x), 0.0f, static_cast<float>(p->channelView_.cols));
    const float fy = std::clamp(static_cast<float>(y), 0.0f, static_cast<float>(p->channelView_.rows));
    p->current_.emplace_back(fx, fy);
    p->redraw();
}

void HighguiRoiProvider::redraw()
{
    cv::Mat canvas = (showComposite_ ? compositeView_ : channelView_).clone();
    drawRois(canvas, rois_);

    if (!current_.empty()) {
        std::vector<cv::Point> pts;
        for (const auto& v : current_)
            pts.emplace_back(cvRound(v.x), cvRound(v.y));
        cv::polylines(canvas, std::vector<std::vector<cv::Point>>{pts}, false, cv::Scalar(0, 0, 255), 1);
        for (const auto& p : pts)
            cv::circle(canvas, p, 2, cv::Scalar(0, 0, 255), cv::FILLED);
    }
    cv::imshow(window_, canvas);
}

std::vector<Roi> HighguiRoiProvider::acquire(const Projection& projection, int displayChannel)
{
    channelView_ = channelBgr(projection, displayChannel - 1);
    channelView_.convertTo(channelView_, CV_8UC3);
    compositeView_ = compositeBgr(projection);
    showComposite_ = false;
    rois_.clear();
    current_.clear();

    cv::namedWindow(window_, cv::WINDOW_NORMAL | cv::WINDOW_KEEPRATIO);
    cv::setWindowTitle(window_, projection.seriesName +
                                    "  [click: vertex  Enter: close  Backspace: undo  c: composite"
                                    "  Space: done  Esc: skip  q: quit]");
    cv::setMouseCallback(window_, &HighguiRoiProvider::onMouse, this);
    redraw();
    Logger()->info("draw cells on {} (channel {})", projection.seriesName, displayChannel);

    std::vector<Roi> result;
    bool done = false;
    while (!done) {
        if (cancel_ && cancel_->load()) {
            cv::destroyWindow(window_);
            throw Cancelled();
        }

        const int key = cv::waitKey(50);
        if (key < 0) {
            if (cv::getWindowProperty(window_, cv::WND_PROP_VISIBLE) < 1) {
                result = rois_;
                done = true;
            }
            continue;
        }

        const int k = key & 0xFF;
        if (isEnter(k)) {
            if (current_.size() < 3) {
                Logger()->warn("a cell outline needs at least 3 vertices");
                continue;
            }
            rois_.push_back({cellLabel(rois_.size()), current_});
            current_.clear();
            redraw();
        } else if (isBackspace(k)) {
            if (!current_.empty())
                current_.pop_back();
            else if (!rois_.empty())
                rois_.pop_back();
            redraw();
        } else if (k == 'c') {
            showComposite_ = !showComposite_;
            redraw();
        } else if (k == kKeySpace) {
            if (!current_.empty())
                Logger()->warn("discarding unclosed outline with {} vertices", current_.size());
            result = rois_;
            done = true;
        } else if (k == kKeyEsc) {
            result.clear();
            done = true;
        } else if (k == 'q') {
            cv::destroyWindow(window_);
            throw Cancelled("run cancelled from the ROI window");
        }
    }

    cv::destroyWindow(window_);
    cv::waitKey(1);
    return result;
}

} // namespace bc::ui
