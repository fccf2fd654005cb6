#pragma once
#include <opencv2/core.hpp>
#include <map>
#include <string>
#include <vector>
#include "tablescan/ColorFilter.hpp"
#include "tablescan/ImageOps.hpp"
#include "tablescan/Types.hpp"

namespace tablescan {

enum class StructurePattern {
    VERTICAL_LINES,
    HORIZONTAL_LINES,
    ICONS
};

const char* toString(StructurePattern pattern);
StructurePattern structurePatternFromString(const std::string& name);

using PatternKernels = std::map<StructurePattern, KernelSpec>;

// Kernels that survive only on the matching shape: a long thin line keeps
// vertical strokes, a wide flat one keeps horizontal strokes, a solid block
// keeps filled icon glyphs.
PatternKernels defaultPatternKernels();

struct StructureConfig {
    ThresholdSpec threshold = ThresholdSpec::fixed(127);
    PatternKernels kernels = defaultPatternKernels();
    KernelSpec maskDilation = KernelSpec::block(3, 3, 5);
    int minComponentArea = 20;                          // 0 disables the cleanup
    KernelSpec smoothing = KernelSpec::block(3, 3, 0);  // closing; 0 iterations disables
    std::vector<Rgb> iconColors;
    int hueTolerance = 10;

    void validate() const;
};

struct StructureResult {
    cv::Mat text;            // white text on black, same size as the input
    cv::Mat structureMask;   // what was subtracted
    DebugImages debug;
};

class StructureRemover {
public:
    explicit StructureRemover(const StructureConfig& config = StructureConfig());

    // Throws TableError(StructureRemovalFailed) on an empty or unsupported image.
    StructureResult removeStructure(const cv::Mat& tableImage, bool wantDebug = false) const;

    // Erode then dilate with the pattern kernel: only matching shapes remain.
    cv::Mat isolatePattern(const cv::Mat& foreground, const KernelSpec& kernel) const;

    const StructureConfig& config() const { return config_; }

private:
    StructureConfig config_;
};

}
