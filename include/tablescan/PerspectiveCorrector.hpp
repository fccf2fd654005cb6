#pragma once
#include <opencv2/core.hpp>
#include "tablescan/CornerFinder.hpp"

namespace tablescan {

struct WarpResult {
    cv::Mat warped;
    cv::Mat homography;
    cv::Size size;
};

class PerspectiveCorrector {
public:
    // targetWidth <= 0 keeps the detected edge lengths; otherwise the output is
    // scaled to that width with the detected aspect ratio.
    explicit PerspectiveCorrector(int targetWidth = 0);

    cv::Size outputSize(const Quad& corners) const;

    WarpResult warp(const cv::Mat& image, const Quad& corners) const;

private:
    int targetWidth_;
};

}
