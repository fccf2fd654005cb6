#include "tablescan/ImageOps.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

using namespace cv;

namespace tablescan {

const char* toString(ThresholdPolicy policy) {
    switch (policy) {
        case ThresholdPolicy::FIXED: return "fixed";
        case ThresholdPolicy::OTSU: return "otsu";
        case ThresholdPolicy::ADAPTIVE: return "adaptive";
    }
    return "otsu";
}

ThresholdPolicy thresholdPolicyFromString(const std::string& name) {
    if (name == "fixed") return ThresholdPolicy::FIXED;
    if (name == "otsu") return ThresholdPolicy::OTSU;
    if (name == "adaptive") return ThresholdPolicy::ADAPTIVE;
    throw std::invalid_argument("unknown threshold policy: " + name);
}

const char* toString(Orientation orientation) {
    switch (orientation) {
        case Orientation::HORIZONTAL: return "horizontal";
        case Orientation::VERTICAL: return "vertical";
        case Orientation::BLOCK: return "block";
    }
    return "block";
}

Orientation orientationFromString(const std::string& name) {
    if (name == "horizontal") return Orientation::HORIZONTAL;
    if (name == "vertical") return Orientation::VERTICAL;
    if (name == "block") return Orientation::BLOCK;
    throw std::invalid_argument("unknown kernel orientation: " + name);
}

void validateKernel(const KernelSpec& spec, const std::string& what) {
    if (spec.width < 1 || spec.height < 1)
        throw std::invalid_argument(what + ": kernel size must be positive");
    if (spec.iterations < 0)
        throw std::invalid_argument(what + ": kernel iterations must not be negative");
}

void validateThreshold(const ThresholdSpec& spec, const std::string& what) {
    if (spec.policy == ThresholdPolicy::FIXED && (spec.value < 0.0 || spec.value > 255.0))
        throw std::invalid_argument(what + ": fixed threshold must lie in [0,255]");
    if (spec.policy == ThresholdPolicy::ADAPTIVE && (spec.blockSize < 3 || spec.blockSize % 2 == 0))
        throw std::invalid_argument(what + ": adaptive block size must be odd and >= 3");
}

namespace ops {

Mat toGray(const Mat& image) {
    Mat gray;
    if (image.channels() == 3) cvtColor(image, gray, COLOR_BGR2GRAY);
    else if (image.channels() == 4) cvtColor(image, gray, COLOR_BGRA2GRAY);
    else gray = image.clone();
    return gray;
}

Mat binarize(const Mat& gray, const ThresholdSpec& spec) {
    Mat bin;
    switch (spec.policy) {
        case ThresholdPolicy::FIXED:
            threshold(gray, bin, spec.value, 255, THRESH_BINARY);
            break;
        case ThresholdPolicy::OTSU:
            threshold(gray, bin, 0, 255, THRESH_BINARY | THRESH_OTSU);
            break;
        case ThresholdPolicy::ADAPTIVE:
            adaptiveThreshold(gray, bin, 255, ADAPTIVE_THRESH_GAUSSIAN_C, THRESH_BINARY,
                              spec.blockSize, spec.offset);
            break;
    }
    return bin;
}

Mat invert(const Mat& binary) {
    Mat inv;
    bitwise_not(binary, inv);
    return inv;
}

Mat foregroundMask(const Mat& image, const ThresholdSpec& spec) {
    return invert(binarize(toGray(image), spec));
}

Mat makeKernel(const KernelSpec& spec) {
    return getStructuringElement(MORPH_RECT, Size(spec.width, spec.height));
}

Mat erode(const Mat& image, const KernelSpec& spec) {
    Mat out;
    if (spec.iterations == 0) return image.clone();
    cv::erode(image, out, makeKernel(spec), Point(-1, -1), spec.iterations, BORDER_CONSTANT, Scalar::all(255));
    return out;
}

Mat dilate(const Mat& image, const KernelSpec& spec) {
    Mat out;
    if (spec.iterations == 0) return image.clone();
    cv::dilate(image, out, makeKernel(spec), Point(-1, -1), spec.iterations, BORDER_CONSTANT, Scalar::all(0));
    return out;
}

Mat addPadding(const Mat& image, int px, const Scalar& color) {
    if (px <= 0) return image.clone();
    Mat out;
    copyMakeBorder(image, out, px, px, px, px, BORDER_CONSTANT, color);
    return out;
}

Mat removeSmallComponents(const Mat& binary, int minArea) {
    if (minArea <= 1) return binary.clone();

    Mat labels, stats, centroids;
    int n = connectedComponentsWithStats(binary, labels, stats, centroids, 8, CV_32S);

    std::vector<uchar> keep(n, 0);
    for (int i = 1; i < n; ++i) {
        keep[i] = stats.at<int>(i, CC_STAT_AREA) >= minArea ? 1 : 0;
    }

    Mat out = Mat::zeros(binary.size(), CV_8UC1);
    for (int y = 0; y < labels.rows; ++y) {
        const int* lab = labels.ptr<int>(y);
        uchar* dst = out.ptr<uchar>(y);
        for (int x = 0; x < labels.cols; ++x) {
            if (keep[lab[x]]) dst[x] = 255;
        }
    }
    return out;
}

std::vector<Contour> findExternalContours(const Mat& binary) {
    std::vector<std::vector<Point>> raw;
    findContours(binary.clone(), raw, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

    std::vector<Contour> out;
    out.reserve(raw.size());
    for (auto& c : raw) out.emplace_back(std::move(c));
    return out;
}

Mat drawBoxes(const Mat& image, const std::vector<Rect>& boxes, const Scalar& color) {
    Mat vis;
    if (image.channels() == 1) cvtColor(image, vis, COLOR_GRAY2BGR);
    else vis = image.clone();
    for (const auto& r : boxes) rectangle(vis, r, color, 2);
    return vis;
}

}
}
