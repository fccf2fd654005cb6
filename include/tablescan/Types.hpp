#pragma once
#include <opencv2/core.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tablescan {

enum class Orientation {
    HORIZONTAL,
    VERTICAL,
    BLOCK
};

// Rectangular structuring element: width x height, applied `iterations` times.
struct KernelSpec {
    Orientation orientation = Orientation::BLOCK;
    int width = 3;
    int height = 3;
    int iterations = 1;

    KernelSpec() = default;
    KernelSpec(Orientation o, int w, int h, int it = 1)
        : orientation(o), width(w), height(h), iterations(it) {}

    static KernelSpec horizontal(int length, int it = 1) { return {Orientation::HORIZONTAL, length, 1, it}; }
    static KernelSpec vertical(int length, int it = 1) { return {Orientation::VERTICAL, 1, length, it}; }
    static KernelSpec block(int w, int h, int it = 1) { return {Orientation::BLOCK, w, h, it}; }
};

struct Contour {
    std::vector<cv::Point> points;
    cv::Rect box;
    double area = 0.0;

    Contour() = default;
    explicit Contour(std::vector<cv::Point> pts);
};

struct TextBox {
    cv::Rect box;
    int row = -1;
    int col = -1;

    TextBox() = default;
    explicit TextBox(const cv::Rect& r) : box(r) {}

    double centerX() const { return box.x + box.width / 2.0; }
    double centerY() const { return box.y + box.height / 2.0; }
};

struct Cell {
    int row = 0;
    int col = 0;
    cv::Rect box;       // empty for padded cells
    cv::Mat image;
    std::string text;
};

// Rows of cells. Every row holds columnCount() cells once finalized.
class Table {
public:
    Table() = default;
    explicit Table(std::vector<std::vector<Cell>> rows) : rows_(std::move(rows)) {}

    int rowCount() const { return static_cast<int>(rows_.size()); }
    int columnCount() const { return rows_.empty() ? 0 : static_cast<int>(rows_.front().size()); }
    bool empty() const { return rows_.empty(); }

    const Cell& at(int row, int col) const { return rows_.at(row).at(col); }
    Cell& at(int row, int col) { return rows_.at(row).at(col); }

    const std::vector<std::vector<Cell>>& rows() const { return rows_; }
    std::vector<std::vector<std::string>> texts() const;

private:
    std::vector<std::vector<Cell>> rows_;
};

// Intermediate images kept for inspection, in production order.
using DebugImages = std::vector<std::pair<std::string, cv::Mat>>;

}
