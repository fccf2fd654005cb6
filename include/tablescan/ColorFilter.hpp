#pragma once
#include <opencv2/core.hpp>
#include <array>
#include <vector>

namespace tablescan {

// RGB colour as printed on the table (background tint, icon ink).
struct Rgb {
    int r = 0;
    int g = 0;
    int b = 0;

    Rgb() = default;
    Rgb(int r_, int g_, int b_) : r(r_), g(g_), b(b_) {}
};

struct HsvRange {
    cv::Scalar lower;
    cv::Scalar upper;
};

class ColorFilter {
public:
    explicit ColorFilter(int hueTolerance = 10, cv::Size closeKernel = cv::Size(20, 20));

    // OpenCV HSV: H in [0,180], S and V in [0,255].
    static cv::Vec3i toOpenCvHsv(const Rgb& color);

    // One range, or two when the hue window wraps around 0/180.
    std::vector<HsvRange> hsvBoundaries(const Rgb& color) const;

    // 255 where any of the colours is present, closed to fill lighting gaps.
    cv::Mat colorMask(const cv::Mat& bgr, const std::vector<Rgb>& colors) const;

    // Masked pixels are painted with `fill`; everything else is kept.
    cv::Mat suppressColors(const cv::Mat& bgr, const std::vector<Rgb>& colors,
                           const cv::Scalar& fill = cv::Scalar::all(0)) const;

private:
    int hueTolerance_;
    cv::Size closeKernel_;
};

}
