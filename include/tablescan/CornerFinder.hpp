#pragma once
#include <opencv2/core.hpp>
#include <array>
#include <vector>

namespace tablescan {

// Corner order used everywhere: top-left, top-right, bottom-right, bottom-left.
using Quad = std::array<cv::Point2f, 4>;

class CornerFinder {
public:
    // Extreme points of the outline along the two diagonals:
    // TL = min(x+y), BR = max(x+y), TR = min(y-x), BL = max(y-x).
    Quad findCorners(const std::vector<cv::Point>& outline) const;

    void drawCorners(cv::Mat& bgr, const Quad& corners) const;
};

}
