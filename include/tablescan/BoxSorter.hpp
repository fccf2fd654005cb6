#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "tablescan/Types.hpp"

namespace tablescan {

enum class ColumnAssignment {
    ORDINAL,    // column = position within the row, left to right
    CLUSTERED   // column = cluster of box left edges across the whole table
};

enum class RowAnchor {
    CENTER,
    TOP
};

const char* toString(ColumnAssignment mode);
ColumnAssignment columnAssignmentFromString(const std::string& name);
const char* toString(RowAnchor anchor);
RowAnchor rowAnchorFromString(const std::string& name);

struct OrderingConfig {
    double rowTolerance = 0.0;      // pixels; <= 0 uses half the mean box height
    RowAnchor rowAnchor = RowAnchor::CENTER;
    ColumnAssignment columns = ColumnAssignment::ORDINAL;
    int columnTolerance = 30;       // CLUSTERED: max left-edge drift inside a column
    int expectedColumns = 0;        // CLUSTERED: drop the sparsest columns beyond this; 0 keeps all
    double lineMergeGap = 0.0;      // CLUSTERED: stacked lines closer than this share a cell; <= 0 uses half the mean height

    void validate() const;
};

struct OrderedBoxes {
    std::vector<TextBox> boxes;     // row-major, (row, col) unique
    int rows = 0;
    int columns = 0;                // widest row, or cluster count
    double rowTolerance = 0.0;      // tolerance actually applied
    std::vector<cv::Rect> rejected; // boxes of dropped columns
};

class BoxSorter {
public:
    explicit BoxSorter(const OrderingConfig& config = OrderingConfig());

    // Detection order does not matter: the result depends only on geometry.
    OrderedBoxes order(const std::vector<cv::Rect>& boxes) const;

    // Sorted by vertical anchor; a box joins the current row when its anchor is
    // within `tolerance` (inclusive) of the row's running mean anchor.
    std::vector<std::vector<cv::Rect>> groupRows(std::vector<cv::Rect> boxes, double tolerance) const;

    // Left-edge clusters, ordered left to right.
    std::vector<std::vector<cv::Rect>> clusterColumns(std::vector<cv::Rect> boxes) const;

    double effectiveRowTolerance(const std::vector<cv::Rect>& boxes) const;

    static double meanHeight(const std::vector<cv::Rect>& boxes);

private:
    OrderingConfig config_;

    double anchorOf(const cv::Rect& r) const;
    OrderedBoxes orderOrdinal(const std::vector<cv::Rect>& boxes) const;
    OrderedBoxes orderClustered(const std::vector<cv::Rect>& boxes) const;
    std::vector<cv::Rect> mergeStackedLines(std::vector<cv::Rect> column, double gap) const;
};

}
