#include "tablescan/PerspectiveCorrector.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

using namespace cv;

namespace tablescan {

PerspectiveCorrector::PerspectiveCorrector(int targetWidth)
    : targetWidth_(targetWidth) {}

Size PerspectiveCorrector::outputSize(const Quad& corners) const {
    double top = norm(corners[1] - corners[0]);
    double bottom = norm(corners[2] - corners[3]);
    double left = norm(corners[3] - corners[0]);
    double right = norm(corners[2] - corners[1]);

    // Corner points are pixel centres, so an edge of length d spans d+1 pixels.
    double w = std::max(top, bottom) + 1.0;
    double h = std::max(left, right) + 1.0;

    if (targetWidth_ > 0) {
        h = targetWidth_ * (h / w);
        w = targetWidth_;
    }

    return Size(std::max(1, static_cast<int>(std::lround(w))),
                std::max(1, static_cast<int>(std::lround(h))));
}

WarpResult PerspectiveCorrector::warp(const Mat& image, const Quad& corners) const {
    WarpResult R;
    R.size = outputSize(corners);

    std::vector<Point2f> srcPoints(corners.begin(), corners.end());
    std::vector<Point2f> dstPoints = {
        {0, 0},
        {(float)R.size.width - 1, 0},
        {(float)R.size.width - 1, (float)R.size.height - 1},
        {0, (float)R.size.height - 1}
    };

    R.homography = getPerspectiveTransform(srcPoints, dstPoints);

    warpPerspective(image, R.warped, R.homography, R.size,
                    INTER_LINEAR,
                    BORDER_REPLICATE);
    return R;
}

}
