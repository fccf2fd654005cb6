#include "tablescan/ColorFilter.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace cv;

namespace tablescan {

namespace {

constexpr int kMinSaturation = 20;
constexpr int kMinValue = 20;

bool inOpenRange(int v) { return v > 0 && v < 255; }

}

ColorFilter::ColorFilter(int hueTolerance, Size closeKernel)
    : hueTolerance_(hueTolerance), closeKernel_(closeKernel)
{
    if (hueTolerance_ < 0 || hueTolerance_ > 90)
        throw std::invalid_argument("hue tolerance must lie in [0,90]");
}

Vec3i ColorFilter::toOpenCvHsv(const Rgb& color) {
    if (!inOpenRange(color.r) || !inOpenRange(color.g) || !inOpenRange(color.b))
        throw std::invalid_argument("R,G,B values must lie strictly between 0 and 255");

    double r = color.r / 255.0, g = color.g / 255.0, b = color.b / 255.0;
    double maxV = std::max({r, g, b});
    double minV = std::min({r, g, b});
    double delta = maxV - minV;

    double h = 0.0;
    if (delta > 0.0) {
        if (maxV == r) h = 60.0 * std::fmod((g - b) / delta + 6.0, 6.0);
        else if (maxV == g) h = 60.0 * ((b - r) / delta + 2.0);
        else h = 60.0 * ((r - g) / delta + 4.0);
    }
    double s = maxV == 0.0 ? 0.0 : delta / maxV;

    return Vec3i(static_cast<int>(std::lround(h / 2.0)),
                 static_cast<int>(std::lround(s * 255.0)),
                 static_cast<int>(std::lround(maxV * 255.0)));
}

std::vector<HsvRange> ColorFilter::hsvBoundaries(const Rgb& color) const {
    int h = toOpenCvHsv(color)[0];
    int tol = hueTolerance_;
    std::vector<HsvRange> out;

    if (h < tol) {
        out.push_back({Scalar(h - tol + 180, kMinSaturation, kMinValue), Scalar(180, 255, 255)});
        out.push_back({Scalar(0, kMinSaturation, kMinValue), Scalar(h + tol, 255, 255)});
    } else if (h > 180 - tol) {
        out.push_back({Scalar(h - tol, kMinSaturation, kMinValue), Scalar(180, 255, 255)});
        out.push_back({Scalar(0, kMinSaturation, kMinValue), Scalar((h + tol) % 180, 255, 255)});
    } else {
        out.push_back({Scalar(h - tol, kMinSaturation, kMinValue), Scalar(h + tol, 255, 255)});
    }
    return out;
}

Mat ColorFilter::colorMask(const Mat& bgr, const std::vector<Rgb>& colors) const {
    Mat mask = Mat::zeros(bgr.size(), CV_8UC1);
    if (colors.empty() || bgr.channels() != 3) return mask;

    Mat hsv;
    cvtColor(bgr, hsv, COLOR_BGR2HSV);

    for (const auto& c : colors) {
        for (const auto& range : hsvBoundaries(c)) {
            Mat part;
            inRange(hsv, range.lower, range.upper, part);
            bitwise_or(mask, part, mask);
        }
    }

    if (closeKernel_.width > 0 && closeKernel_.height > 0) {
        Mat kernel = getStructuringElement(MORPH_ELLIPSE, closeKernel_);
        morphologyEx(mask, mask, MORPH_CLOSE, kernel);
    }
    return mask;
}

Mat ColorFilter::suppressColors(const Mat& bgr, const std::vector<Rgb>& colors, const Scalar& fill) const {
    Mat out = bgr.clone();
    if (colors.empty() || bgr.channels() != 3) return out;

    out.setTo(fill, colorMask(bgr, colors));
    return out;
}

}
