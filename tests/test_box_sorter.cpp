#include <catch2/catch_all.hpp>

#include "tablescan/BoxSorter.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>

using namespace tablescan;

namespace {

// 3 rows x 4 columns of 40x20 boxes with a little vertical jitter.
std::vector<cv::Rect> jitteredGrid() {
    const int jitter[3][4] = {{0, 2, -3, 1}, {3, -2, 0, 2}, {-1, 1, 3, -3}};
    std::vector<cv::Rect> boxes;
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 4; ++c) {
            boxes.emplace_back(20 + 100 * c, 30 + 50 * r + jitter[r][c], 40, 20);
        }
    }
    return boxes;
}

const TextBox& boxAt(const OrderedBoxes& ordered, int row, int col) {
    for (const auto& b : ordered.boxes) {
        if (b.row == row && b.col == col) return b;
    }
    FAIL("no box at (" << row << ", " << col << ")");
    return ordered.boxes.front();
}

}

TEST_CASE("boxes are ordered into rows and columns regardless of input order", "[ordering]") {
    std::vector<cv::Rect> boxes = jitteredGrid();
    std::mt19937 rng(1234);

    BoxSorter sorter;
    for (int attempt = 0; attempt < 5; ++attempt) {
        std::shuffle(boxes.begin(), boxes.end(), rng);
        OrderedBoxes ordered = sorter.order(boxes);

        REQUIRE(ordered.rows == 3);
        REQUIRE(ordered.columns == 4);
        REQUIRE(ordered.boxes.size() == 12);
        REQUIRE(ordered.rowTolerance == Catch::Approx(10.0));

        for (const auto& b : ordered.boxes) {
            REQUIRE(b.col == (b.box.x - 20) / 100);
            REQUIRE(b.row == (b.box.y - 27) / 50);
        }
        // row-major output
        for (size_t i = 1; i < ordered.boxes.size(); ++i) {
            const TextBox& prev = ordered.boxes[i - 1];
            const TextBox& cur = ordered.boxes[i];
            REQUIRE((prev.row < cur.row || (prev.row == cur.row && prev.col < cur.col)));
        }
    }
}

TEST_CASE("two blobs on the same line share a row", "[ordering]") {
    OrderingConfig cfg;
    cfg.rowTolerance = 5;
    BoxSorter sorter(cfg);

    OrderedBoxes ordered = sorter.order({cv::Rect(200, 12, 50, 20), cv::Rect(10, 10, 50, 20)});
    REQUIRE(ordered.rows == 1);
    REQUIRE(ordered.columns == 2);
    REQUIRE(boxAt(ordered, 0, 0).box.x == 10);
    REQUIRE(boxAt(ordered, 0, 1).box.x == 200);
}

TEST_CASE("the row tolerance boundary is inclusive", "[ordering]") {
    OrderingConfig cfg;
    cfg.rowTolerance = 5;
    BoxSorter sorter(cfg);

    // centres 15 and 20: exactly the tolerance apart
    OrderedBoxes same = sorter.order({cv::Rect(10, 10, 30, 10), cv::Rect(200, 15, 30, 10)});
    REQUIRE(same.rows == 1);

    // centres 15 and 21: one pixel beyond
    OrderedBoxes split = sorter.order({cv::Rect(10, 10, 30, 10), cv::Rect(200, 16, 30, 10)});
    REQUIRE(split.rows == 2);
    REQUIRE(boxAt(split, 1, 0).box.x == 200);
}

TEST_CASE("rows can be anchored on the top edge", "[ordering]") {
    std::vector<cv::Rect> boxes = {cv::Rect(10, 10, 30, 40), cv::Rect(100, 10, 30, 10)};

    OrderingConfig cfg;
    cfg.rowTolerance = 5;
    REQUIRE(BoxSorter(cfg).order(boxes).rows == 2);

    cfg.rowAnchor = RowAnchor::TOP;
    REQUIRE(BoxSorter(cfg).order(boxes).rows == 1);
}

TEST_CASE("short rows take ordinal columns from the left", "[ordering]") {
    std::vector<cv::Rect> boxes = {
        cv::Rect(20, 20, 40, 20), cv::Rect(120, 20, 40, 20), cv::Rect(220, 20, 40, 20),
        cv::Rect(20, 80, 40, 20), cv::Rect(220, 80, 40, 20)
    };
    OrderedBoxes ordered = BoxSorter().order(boxes);

    REQUIRE(ordered.rows == 2);
    REQUIRE(ordered.columns == 3);
    REQUIRE(boxAt(ordered, 1, 1).box.x == 220);
}

TEST_CASE("clustered columns keep gaps in place", "[ordering]") {
    std::vector<cv::Rect> boxes = {
        cv::Rect(20, 20, 40, 20), cv::Rect(120, 22, 40, 20), cv::Rect(220, 20, 40, 20),
        cv::Rect(24, 80, 40, 20), cv::Rect(218, 81, 40, 20),
        cv::Rect(18, 140, 40, 20), cv::Rect(125, 140, 40, 20), cv::Rect(222, 139, 40, 20)
    };

    OrderingConfig cfg;
    cfg.columns = ColumnAssignment::CLUSTERED;
    OrderedBoxes ordered = BoxSorter(cfg).order(boxes);

    REQUIRE(ordered.rows == 3);
    REQUIRE(ordered.columns == 3);
    REQUIRE(ordered.boxes.size() == 8);
    REQUIRE(boxAt(ordered, 1, 2).box.x == 218);
    for (const auto& b : ordered.boxes) REQUIRE(b.row != 1 || b.col != 1);
}

TEST_CASE("clustering drops the sparsest columns beyond the expected count", "[ordering]") {
    std::vector<cv::Rect> boxes;
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) boxes.emplace_back(20 + 200 * c, 20 + 60 * r, 60, 20);
    }
    cv::Rect residue(640, 82, 30, 18);
    boxes.push_back(residue);

    OrderingConfig cfg;
    cfg.columns = ColumnAssignment::CLUSTERED;

    REQUIRE(BoxSorter(cfg).order(boxes).columns == 4);

    cfg.expectedColumns = 3;
    OrderedBoxes ordered = BoxSorter(cfg).order(boxes);
    REQUIRE(ordered.columns == 3);
    REQUIRE(ordered.boxes.size() == 9);
    REQUIRE(ordered.rejected.size() == 1);
    REQUIRE(ordered.rejected.front() == residue);
}

TEST_CASE("stacked lines of one cell are merged in clustered mode", "[ordering]") {
    std::vector<cv::Rect> boxes = {
        cv::Rect(20, 20, 60, 20), cv::Rect(220, 20, 60, 20),
        cv::Rect(20, 100, 60, 20), cv::Rect(20, 125, 50, 20), cv::Rect(220, 110, 60, 20)
    };

    OrderingConfig cfg;
    cfg.columns = ColumnAssignment::CLUSTERED;
    OrderedBoxes ordered = BoxSorter(cfg).order(boxes);

    REQUIRE(ordered.rows == 2);
    REQUIRE(ordered.boxes.size() == 4);
    REQUIRE(boxAt(ordered, 1, 0).box == cv::Rect(20, 100, 60, 45));
    REQUIRE(boxAt(ordered, 1, 1).box.x == 220);
}

TEST_CASE("ordering edge cases", "[ordering]") {
    OrderedBoxes none = BoxSorter().order({});
    REQUIRE(none.rows == 0);
    REQUIRE(none.columns == 0);
    REQUIRE(none.boxes.empty());

    REQUIRE(BoxSorter::meanHeight({cv::Rect(0, 0, 5, 10), cv::Rect(0, 0, 5, 20)}) == Catch::Approx(15.0));

    OrderingConfig bad;
    bad.columnTolerance = 0;
    REQUIRE_THROWS_AS(BoxSorter(bad), std::invalid_argument);

    REQUIRE(columnAssignmentFromString("clustered") == ColumnAssignment::CLUSTERED);
    REQUIRE(rowAnchorFromString(toString(RowAnchor::TOP)) == RowAnchor::TOP);
    REQUIRE_THROWS_AS(rowAnchorFromString("bottom"), std::invalid_argument);
}
