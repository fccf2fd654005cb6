#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "tablescan/BoxSorter.hpp"
#include "tablescan/ImageOps.hpp"
#include "tablescan/TextRecognizer.hpp"
#include "tablescan/Types.hpp"

namespace tablescan {

struct CellConfig {
    // Wide flat passes join letters and words of a line, the square pass
    // pulls accents and dots into the same blob.
    std::vector<KernelSpec> blobDilation = {
        KernelSpec::block(10, 2, 5),
        KernelSpec::block(5, 5, 2)
    };
    int minBoxArea = 50;              // pixels; smaller blobs are noise
    double maxBoxAreaRatio = 0.5;     // of the image; larger blobs span several cells
    double minHeightRatio = 1.0 / 1.5; // of the mean box height; shorter boxes are line residue. 0 disables
    OrderingConfig ordering;
    int slicePadding = 0;             // grows each slice, clamped to the image
    int missingCellTolerance = 1;     // short rows are padded up to this many cells
    int recognitionThreads = 4;       // 1 recognises sequentially

    void validate() const;
};

struct ExtractResult {
    Table table;
    std::vector<TextBox> boxes;          // ordered, (row, col) assigned
    std::vector<cv::Rect> rejectedBoxes; // filtered out before or during ordering
    DebugImages debug;
};

class CellExtractor {
public:
    CellExtractor(const CellConfig& config, const TextRecognizer& recognizer);

    // textImage: white text on black. original: the table image the slices come
    // from; must have the same size. Throws TableError(IrregularGrid).
    ExtractResult extractCells(const cv::Mat& textImage, const cv::Mat& original,
                               bool wantDebug = false) const;

    cv::Mat createBlobs(const cv::Mat& textImage) const;

    // Candidate boxes that pass the area and height filters.
    std::vector<cv::Rect> detectBoxes(const cv::Mat& blobs, std::vector<cv::Rect>* rejected = nullptr) const;

    // Grid from ordered boxes; short rows padded with empty cells.
    Table assemble(const std::vector<TextBox>& boxes, int columns, const cv::Mat& original) const;

    cv::Mat slice(const cv::Mat& original, const cv::Rect& box) const;

    const CellConfig& config() const { return config_; }

private:
    CellConfig config_;
    BoxSorter sorter_;
    const TextRecognizer& recognizer_;

    std::string recognizeSafely(const cv::Mat& cellImage, int row, int col) const;
    void recognizeAll(std::vector<Cell*>& cells) const;
};

}
