#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "tablescan/ColorFilter.hpp"
#include "tablescan/CornerFinder.hpp"
#include "tablescan/ImageOps.hpp"
#include "tablescan/PerspectiveCorrector.hpp"
#include "tablescan/Types.hpp"

namespace tablescan {

struct LocatorConfig {
    // Lighting varies across a photograph; Otsu picks the cutoff from the histogram.
    ThresholdSpec threshold = ThresholdSpec::otsu();
    int dilateIterations = 2;          // 3x3 passes closing gaps in the frame
    double minTableAreaRatio = 0.01;   // of the photo area
    double ambiguityRatio = 0.9;       // runner-up / best at or above this is ambiguous
    int padding = 20;                  // uniform border added to the crop, pixels
    int targetWidth = 0;               // 0 keeps the detected size
    bool hasBackgroundColor = false;
    Rgb backgroundColor;
    int hueTolerance = 10;

    void validate() const;
};

struct LocateResult {
    cv::Mat table;                 // padded, perspective-corrected colour crop
    Quad corners{};                // in photo coordinates
    cv::Rect tableBounds;          // bounding box of the selected contour
    int padding = 0;
    DebugImages debug;
};

class TableLocator {
public:
    explicit TableLocator(const LocatorConfig& config = LocatorConfig());

    // Throws TableError(NoTableFound | AmbiguousTable).
    LocateResult locate(const cv::Mat& photo, bool wantDebug = false) const;

    const LocatorConfig& config() const { return config_; }

private:
    LocatorConfig config_;
    CornerFinder finder_;
    PerspectiveCorrector corrector_;

    cv::Mat preprocess(const cv::Mat& photo, DebugImages* debug) const;
    const Contour& selectTableContour(const std::vector<Contour>& contours, double photoArea) const;
};

}
