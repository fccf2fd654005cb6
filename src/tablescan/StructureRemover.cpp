#include "tablescan/StructureRemover.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include "tablescan/Log.hpp"
#include "tablescan/TableError.hpp"

using namespace cv;

namespace tablescan {

namespace {
const char* kStage = "remove_structure";
}

const char* toString(StructurePattern pattern) {
    switch (pattern) {
        case StructurePattern::VERTICAL_LINES: return "vertical_lines";
        case StructurePattern::HORIZONTAL_LINES: return "horizontal_lines";
        case StructurePattern::ICONS: return "icons";
    }
    return "icons";
}

StructurePattern structurePatternFromString(const std::string& name) {
    if (name == "vertical_lines") return StructurePattern::VERTICAL_LINES;
    if (name == "horizontal_lines") return StructurePattern::HORIZONTAL_LINES;
    if (name == "icons") return StructurePattern::ICONS;
    throw std::invalid_argument("unknown structure pattern: " + name);
}

PatternKernels defaultPatternKernels() {
    return {
        {StructurePattern::VERTICAL_LINES, KernelSpec::vertical(6, 10)},
        {StructurePattern::HORIZONTAL_LINES, KernelSpec::horizontal(6, 10)},
        {StructurePattern::ICONS, KernelSpec::block(3, 3, 10)}
    };
}

void StructureConfig::validate() const {
    validateThreshold(threshold, "structure");
    for (const auto& kv : kernels) validateKernel(kv.second, std::string("structure.") + toString(kv.first));
    validateKernel(maskDilation, "structure.maskDilation");
    validateKernel(smoothing, "structure.smoothing");
    if (minComponentArea < 0) throw std::invalid_argument("structure: minComponentArea must not be negative");
    if (hueTolerance < 0 || hueTolerance > 90) throw std::invalid_argument("structure: hueTolerance must lie in [0,90]");
    for (const auto& c : iconColors) ColorFilter::toOpenCvHsv(c);
}

StructureRemover::StructureRemover(const StructureConfig& config)
    : config_(config)
{
    config_.validate();
}

Mat StructureRemover::isolatePattern(const Mat& foreground, const KernelSpec& kernel) const {
    return ops::dilate(ops::erode(foreground, kernel), kernel);
}

StructureResult StructureRemover::removeStructure(const Mat& tableImage, bool wantDebug) const {
    if (tableImage.empty() || tableImage.rows == 0 || tableImage.cols == 0) {
        throw TableError(ErrorKind::StructureRemovalFailed, kStage, "table image has zero area");
    }
    int ch = tableImage.channels();
    if (ch != 1 && ch != 3 && ch != 4) {
        throw TableError(ErrorKind::StructureRemovalFailed, kStage,
                         "unsupported channel count " + std::to_string(ch));
    }
    if (tableImage.depth() != CV_8U) {
        throw TableError(ErrorKind::StructureRemovalFailed, kStage, "expected an 8-bit image");
    }

    StructureResult R;
    DebugImages* dbg = wantDebug ? &R.debug : nullptr;

    Mat source = tableImage;
    if (!config_.iconColors.empty() && ch == 3) {
        ColorFilter filter(config_.hueTolerance);
        source = filter.suppressColors(tableImage, config_.iconColors);
        if (dbg) dbg->emplace_back("icon_colors_masked", source);
    }

    Mat inverted = ops::foregroundMask(source, config_.threshold);
    if (dbg) dbg->emplace_back("binary_inverted", inverted);

    Mat mask = Mat::zeros(inverted.size(), CV_8UC1);
    for (const auto& kv : config_.kernels) {
        Mat isolated = isolatePattern(inverted, kv.second);
        logMessage(LogLevel::Debug, std::string("remove_structure: ") + toString(kv.first) + " kept " +
                                        std::to_string(countNonZero(isolated)) + " px");
        if (dbg) dbg->emplace_back(std::string("pattern_") + toString(kv.first), isolated);
        add(mask, isolated, mask);
    }

    if (countNonZero(mask) > 0) {
        mask = ops::dilate(mask, config_.maskDilation);
    } else {
        logMessage(LogLevel::Info, "remove_structure: no lines or icons detected");
    }
    if (dbg) dbg->emplace_back("structure_mask", mask);

    Mat text;
    subtract(inverted, mask, text);
    if (dbg) dbg->emplace_back("structure_removed", text);

    text = ops::removeSmallComponents(text, config_.minComponentArea);
    if (config_.smoothing.iterations > 0) {
        Mat kernel = ops::makeKernel(config_.smoothing);
        morphologyEx(text, text, MORPH_CLOSE, kernel, Point(-1, -1), config_.smoothing.iterations);
    }
    if (dbg) dbg->emplace_back("noise_removed", text);

    if (text.size() != tableImage.size()) {
        throw TableError(ErrorKind::StructureRemovalFailed, kStage, "text image size differs from the table image");
    }
    R.text = text;
    R.structureMask = mask;
    return R;
}

}
