#include "tablescan/TableLocator.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include "tablescan/Log.hpp"
#include "tablescan/TableError.hpp"

using namespace cv;

namespace tablescan {

namespace {
const char* kStage = "locate";
}

void LocatorConfig::validate() const {
    validateThreshold(threshold, "locator");
    if (dilateIterations < 0) throw std::invalid_argument("locator: dilateIterations must not be negative");
    if (minTableAreaRatio < 0.0 || minTableAreaRatio >= 1.0)
        throw std::invalid_argument("locator: minTableAreaRatio must lie in [0,1)");
    if (ambiguityRatio <= 0.0 || ambiguityRatio > 1.0)
        throw std::invalid_argument("locator: ambiguityRatio must lie in (0,1]");
    if (padding < 0) throw std::invalid_argument("locator: padding must not be negative");
    if (targetWidth < 0) throw std::invalid_argument("locator: targetWidth must not be negative");
    if (hueTolerance < 0 || hueTolerance > 90) throw std::invalid_argument("locator: hueTolerance must lie in [0,90]");
    if (hasBackgroundColor) ColorFilter::toOpenCvHsv(backgroundColor);
}

TableLocator::TableLocator(const LocatorConfig& config)
    : config_(config), corrector_(config.targetWidth)
{
    config_.validate();
}

Mat TableLocator::preprocess(const Mat& photo, DebugImages* debug) const {
    Mat source = photo;
    if (config_.hasBackgroundColor && photo.channels() == 3) {
        ColorFilter filter(config_.hueTolerance);
        // painted white so the background drops out of the foreground
        source = filter.suppressColors(photo, {config_.backgroundColor}, Scalar::all(255));
        if (debug) debug->emplace_back("background_filtered", source);
    }

    Mat fg = ops::foregroundMask(source, config_.threshold);
    if (debug) debug->emplace_back("binary_inverted", fg);

    if (config_.dilateIterations > 0) {
        fg = ops::dilate(fg, KernelSpec::block(3, 3, config_.dilateIterations));
        if (debug) debug->emplace_back("dilated", fg);
    }
    return fg;
}

const Contour& TableLocator::selectTableContour(const std::vector<Contour>& contours, double photoArea) const {
    double minArea = config_.minTableAreaRatio * photoArea;

    std::vector<const Contour*> ranked;
    for (const auto& c : contours) {
        if (c.area > 0.0) ranked.push_back(&c);
    }
    std::sort(ranked.begin(), ranked.end(), [](const Contour* a, const Contour* b) {
        return a->area > b->area;
    });

    if (ranked.empty() || ranked[0]->area < minArea) {
        std::ostringstream os;
        os << "no contour reaches the minimum table area of " << minArea << " px";
        if (!ranked.empty()) os << " (largest is " << ranked[0]->area << " px)";
        throw TableError(ErrorKind::NoTableFound, kStage, os.str(),
                         ranked.empty() ? Rect() : ranked[0]->box);
    }

    const Contour& best = *ranked[0];
    if (ranked.size() > 1 && ranked[1]->area >= minArea &&
        ranked[1]->area >= config_.ambiguityRatio * best.area) {
        std::ostringstream os;
        os << "runner-up contour area " << ranked[1]->area << " px is within "
           << config_.ambiguityRatio << " of the largest (" << best.area << " px)";
        throw TableError(ErrorKind::AmbiguousTable, kStage, os.str(), ranked[1]->box);
    }
    return best;
}

LocateResult TableLocator::locate(const Mat& photo, bool wantDebug) const {
    if (photo.empty() || photo.total() == 0) {
        throw TableError(ErrorKind::NoTableFound, kStage, "empty photograph");
    }

    LocateResult R;
    DebugImages* dbg = wantDebug ? &R.debug : nullptr;

    Mat fg = preprocess(photo, dbg);
    std::vector<Contour> contours = ops::findExternalContours(fg);
    logMessage(LogLevel::Debug, "locate: " + std::to_string(contours.size()) + " external contours");

    const Contour& table = selectTableContour(contours, static_cast<double>(photo.total()));
    R.tableBounds = table.box;
    R.corners = finder_.findCorners(table.points);

    if (logEnabled(LogLevel::Info)) {
        std::ostringstream os;
        os << "locate: table contour area " << table.area << " px, corners TL" << R.corners[0]
           << " TR" << R.corners[1] << " BR" << R.corners[2] << " BL" << R.corners[3];
        logMessage(LogLevel::Info, os.str());
    }

    if (dbg) {
        Mat vis;
        if (photo.channels() == 1) cvtColor(photo, vis, COLOR_GRAY2BGR);
        else vis = photo.clone();
        std::vector<std::vector<Point>> all;
        for (const auto& c : contours) all.push_back(c.points);
        drawContours(vis, all, -1, Scalar(0, 255, 0), 2);
        finder_.drawCorners(vis, R.corners);
        dbg->emplace_back("table_corners", vis);
    }

    WarpResult W = corrector_.warp(photo, R.corners);
    if (dbg) dbg->emplace_back("perspective_corrected", W.warped);

    R.padding = config_.padding;
    R.table = ops::addPadding(W.warped, config_.padding);
    logMessage(LogLevel::Debug, "locate: corrected table " + std::to_string(W.size.width) + "x" +
                                    std::to_string(W.size.height) + ", padded " +
                                    std::to_string(R.table.cols) + "x" + std::to_string(R.table.rows));
    return R;
}

}
