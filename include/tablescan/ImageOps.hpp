#pragma once
#include <opencv2/core.hpp>
#include <string>
#include "tablescan/Types.hpp"

namespace tablescan {

enum class ThresholdPolicy {
    FIXED,
    OTSU,
    ADAPTIVE
};

struct ThresholdSpec {
    ThresholdPolicy policy = ThresholdPolicy::OTSU;
    double value = 127.0;      // FIXED cutoff
    int blockSize = 31;        // ADAPTIVE neighbourhood, odd
    double offset = 10.0;      // ADAPTIVE constant subtracted from the mean

    static ThresholdSpec fixed(double v) { ThresholdSpec t; t.policy = ThresholdPolicy::FIXED; t.value = v; return t; }
    static ThresholdSpec otsu() { return ThresholdSpec(); }
    static ThresholdSpec adaptive(int block, double c) {
        ThresholdSpec t;
        t.policy = ThresholdPolicy::ADAPTIVE;
        t.blockSize = block;
        t.offset = c;
        return t;
    }
};

const char* toString(ThresholdPolicy policy);
ThresholdPolicy thresholdPolicyFromString(const std::string& name);
const char* toString(Orientation orientation);
Orientation orientationFromString(const std::string& name);

namespace ops {

// 3-channel BGR -> single channel. Single-channel input is returned as a copy.
cv::Mat toGray(const cv::Mat& image);

// Dark foreground on light background -> 0/255 image with the same polarity.
cv::Mat binarize(const cv::Mat& gray, const ThresholdSpec& spec);

cv::Mat invert(const cv::Mat& binary);

// grayscale + threshold + invert: foreground strokes become white on black.
cv::Mat foregroundMask(const cv::Mat& image, const ThresholdSpec& spec);

cv::Mat makeKernel(const KernelSpec& spec);

// Both keep the input size; the border never counts as foreground.
cv::Mat erode(const cv::Mat& image, const KernelSpec& spec);
cv::Mat dilate(const cv::Mat& image, const KernelSpec& spec);

cv::Mat addPadding(const cv::Mat& image, int px, const cv::Scalar& color = cv::Scalar::all(255));

// Drops 8-connected components with fewer than minArea pixels.
cv::Mat removeSmallComponents(const cv::Mat& binary, int minArea);

std::vector<Contour> findExternalContours(const cv::Mat& binary);

cv::Mat drawBoxes(const cv::Mat& image, const std::vector<cv::Rect>& boxes,
                  const cv::Scalar& color = cv::Scalar(0, 255, 0));

}

void validateKernel(const KernelSpec& spec, const std::string& what);
void validateThreshold(const ThresholdSpec& spec, const std::string& what);

}
