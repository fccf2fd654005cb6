#include "tablescan/CellExtractor.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <future>
#include <sstream>
#include <stdexcept>
#include "tablescan/Log.hpp"
#include "tablescan/TableError.hpp"

using namespace cv;

namespace tablescan {

namespace {
const char* kStage = "extract_cells";
}

void CellConfig::validate() const {
    for (const auto& k : blobDilation) validateKernel(k, "cells.blobDilation");
    if (minBoxArea < 0) throw std::invalid_argument("cells: minBoxArea must not be negative");
    if (maxBoxAreaRatio <= 0.0 || maxBoxAreaRatio > 1.0)
        throw std::invalid_argument("cells: maxBoxAreaRatio must lie in (0,1]");
    if (minHeightRatio < 0.0) throw std::invalid_argument("cells: minHeightRatio must not be negative");
    if (slicePadding < 0) throw std::invalid_argument("cells: slicePadding must not be negative");
    if (missingCellTolerance < 0) throw std::invalid_argument("cells: missingCellTolerance must not be negative");
    if (recognitionThreads < 1) throw std::invalid_argument("cells: recognitionThreads must be at least 1");
    ordering.validate();
}

CellExtractor::CellExtractor(const CellConfig& config, const TextRecognizer& recognizer)
    : config_(config), sorter_(config.ordering), recognizer_(recognizer)
{
    config_.validate();
}

Mat CellExtractor::createBlobs(const Mat& textImage) const {
    Mat blobs = textImage;
    if (blobs.channels() != 1) {
        blobs = ops::binarize(ops::toGray(textImage), ThresholdSpec::fixed(127));
    }
    for (const auto& k : config_.blobDilation) blobs = ops::dilate(blobs, k);
    return blobs;
}

std::vector<Rect> CellExtractor::detectBoxes(const Mat& blobs, std::vector<Rect>* rejected) const {
    double maxArea = config_.maxBoxAreaRatio * static_cast<double>(blobs.total());

    std::vector<Rect> sized;
    for (const auto& c : ops::findExternalContours(blobs)) {
        double area = c.box.area();
        if (area < config_.minBoxArea || area > maxArea) {
            if (rejected) rejected->push_back(c.box);
            continue;
        }
        sized.push_back(c.box);
    }

    if (config_.minHeightRatio <= 0.0 || sized.empty()) return sized;

    double minHeight = BoxSorter::meanHeight(sized) * config_.minHeightRatio;
    std::vector<Rect> kept;
    for (const auto& r : sized) {
        if (r.height < minHeight) {
            if (rejected) rejected->push_back(r);
        } else {
            kept.push_back(r);
        }
    }
    return kept;
}

Mat CellExtractor::slice(const Mat& original, const Rect& box) const {
    Rect grown(box.x - config_.slicePadding, box.y - config_.slicePadding,
               box.width + 2 * config_.slicePadding, box.height + 2 * config_.slicePadding);
    Rect clipped = grown & Rect(0, 0, original.cols, original.rows);
    if (clipped.area() <= 0) return Mat();
    return original(clipped).clone();
}

Table CellExtractor::assemble(const std::vector<TextBox>& boxes, int columns, const Mat& original) const {
    int rows = 0;
    for (const auto& b : boxes) {
        rows = std::max(rows, b.row + 1);
        columns = std::max(columns, b.col + 1);
    }

    std::vector<std::vector<Cell>> grid(rows, std::vector<Cell>(columns));
    std::vector<std::vector<bool>> filled(rows, std::vector<bool>(columns, false));
    std::vector<Rect> rowExtent(rows);

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < columns; ++c) {
            grid[r][c].row = r;
            grid[r][c].col = c;
        }
    }

    for (const auto& b : boxes) {
        if (b.row < 0 || b.col < 0) {
            throw TableError(ErrorKind::IrregularGrid, kStage, "text box without grid position", b.box);
        }
        if (filled[b.row][b.col]) {
            std::ostringstream os;
            os << "two text boxes claim cell (" << b.row << ", " << b.col << ")";
            throw TableError(ErrorKind::IrregularGrid, kStage, os.str(), b.box);
        }
        Cell& cell = grid[b.row][b.col];
        cell.box = b.box;
        cell.image = slice(original, b.box);
        filled[b.row][b.col] = true;
        rowExtent[b.row] = rowExtent[b.row].area() > 0 ? (rowExtent[b.row] | b.box) : b.box;
    }

    for (int r = 0; r < rows; ++r) {
        int present = static_cast<int>(std::count(filled[r].begin(), filled[r].end(), true));
        int missing = columns - present;
        if (missing > config_.missingCellTolerance) {
            std::ostringstream os;
            os << "row " << r << " has " << present << " of " << columns
               << " cells, more than " << config_.missingCellTolerance << " missing";
            throw TableError(ErrorKind::IrregularGrid, kStage, os.str(), rowExtent[r]);
        }
        if (missing > 0) {
            logMessage(LogLevel::Debug, "extract_cells: row " + std::to_string(r) + " padded with " +
                                            std::to_string(missing) + " empty cells");
        }
    }

    return Table(std::move(grid));
}

std::string CellExtractor::recognizeSafely(const Mat& cellImage, int row, int col) const {
    if (cellImage.empty()) return std::string();
    try {
        return cleanRecognizedText(recognizer_.recognize(cellImage));
    } catch (const std::exception& e) {
        logMessage(LogLevel::Warn, "extract_cells: recognition failed for cell (" + std::to_string(row) + ", " +
                                       std::to_string(col) + "): " + e.what());
    } catch (...) {
        logMessage(LogLevel::Warn, "extract_cells: unknown recognition error for cell (" + std::to_string(row) +
                                       ", " + std::to_string(col) + ")");
    }
    return std::string();
}

void CellExtractor::recognizeAll(std::vector<Cell*>& cells) const {
    if (cells.empty()) return;

    int workers = std::min(config_.recognitionThreads, static_cast<int>(cells.size()));
    if (workers <= 1) {
        for (Cell* c : cells) c->text = recognizeSafely(c->image, c->row, c->col);
        return;
    }

    // Every cell is written by exactly one task; no ordering between tasks.
    std::vector<std::future<void>> tasks;
    tasks.reserve(workers);
    for (int w = 0; w < workers; ++w) {
        tasks.push_back(std::async(std::launch::async, [this, &cells, w, workers]() {
            for (size_t i = w; i < cells.size(); i += workers) {
                Cell* c = cells[i];
                c->text = recognizeSafely(c->image, c->row, c->col);
            }
        }));
    }
    for (auto& t : tasks) t.get();
}

ExtractResult CellExtractor::extractCells(const Mat& textImage, const Mat& original, bool wantDebug) const {
    if (textImage.empty()) {
        throw std::invalid_argument("extract_cells: empty text image");
    }
    if (original.size() != textImage.size()) {
        throw std::invalid_argument("extract_cells: original and text images differ in size");
    }

    ExtractResult R;

    Mat blobs = createBlobs(textImage);
    if (wantDebug) R.debug.emplace_back("text_blobs", blobs);

    std::vector<Rect> candidates = detectBoxes(blobs, &R.rejectedBoxes);
    logMessage(LogLevel::Debug, "extract_cells: " + std::to_string(candidates.size()) + " text boxes kept, " +
                                    std::to_string(R.rejectedBoxes.size()) + " rejected");

    OrderedBoxes ordered = sorter_.order(candidates);
    R.rejectedBoxes.insert(R.rejectedBoxes.end(), ordered.rejected.begin(), ordered.rejected.end());
    R.boxes = ordered.boxes;

    if (wantDebug) {
        std::vector<Rect> kept;
        for (const auto& b : R.boxes) kept.push_back(b.box);
        Mat vis = ops::drawBoxes(original, kept);
        for (const auto& b : R.boxes) {
            putText(vis, std::to_string(b.row) + "," + std::to_string(b.col), b.box.tl() + Point(2, 14),
                    FONT_HERSHEY_SIMPLEX, 0.5, Scalar(255, 0, 0), 1);
        }
        R.debug.emplace_back("text_boxes", vis);
        R.debug.emplace_back("rejected_boxes", ops::drawBoxes(original, R.rejectedBoxes, Scalar(0, 0, 255)));
    }

    if (R.boxes.empty()) {
        logMessage(LogLevel::Warn, "extract_cells: no text boxes found");
        return R;
    }

    R.table = assemble(R.boxes, ordered.columns, original);

    std::vector<Cell*> pending;
    for (int r = 0; r < R.table.rowCount(); ++r) {
        for (int c = 0; c < R.table.columnCount(); ++c) {
            if (!R.table.at(r, c).image.empty()) pending.push_back(&R.table.at(r, c));
        }
    }
    recognizeAll(pending);

    logMessage(LogLevel::Info, "extract_cells: table " + std::to_string(R.table.rowCount()) + " rows x " +
                                  std::to_string(R.table.columnCount()) + " columns");
    return R;
}

}
