#include "tablescan/BoxSorter.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>
#include "tablescan/Log.hpp"

using namespace cv;

namespace tablescan {

const char* toString(ColumnAssignment mode) {
    return mode == ColumnAssignment::CLUSTERED ? "clustered" : "ordinal";
}

ColumnAssignment columnAssignmentFromString(const std::string& name) {
    if (name == "ordinal") return ColumnAssignment::ORDINAL;
    if (name == "clustered") return ColumnAssignment::CLUSTERED;
    throw std::invalid_argument("unknown column assignment: " + name);
}

const char* toString(RowAnchor anchor) {
    return anchor == RowAnchor::TOP ? "top" : "center";
}

RowAnchor rowAnchorFromString(const std::string& name) {
    if (name == "center") return RowAnchor::CENTER;
    if (name == "top") return RowAnchor::TOP;
    throw std::invalid_argument("unknown row anchor: " + name);
}

void OrderingConfig::validate() const {
    if (columnTolerance < 1) throw std::invalid_argument("ordering: columnTolerance must be positive");
    if (expectedColumns < 0) throw std::invalid_argument("ordering: expectedColumns must not be negative");
}

BoxSorter::BoxSorter(const OrderingConfig& config)
    : config_(config)
{
    config_.validate();
}

double BoxSorter::meanHeight(const std::vector<Rect>& boxes) {
    if (boxes.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& b : boxes) sum += b.height;
    return sum / boxes.size();
}

double BoxSorter::effectiveRowTolerance(const std::vector<Rect>& boxes) const {
    if (config_.rowTolerance > 0.0) return config_.rowTolerance;
    return meanHeight(boxes) / 2.0;
}

double BoxSorter::anchorOf(const Rect& r) const {
    if (config_.rowAnchor == RowAnchor::TOP) return r.y;
    return r.y + r.height / 2.0;
}

std::vector<std::vector<Rect>> BoxSorter::groupRows(std::vector<Rect> boxes, double tolerance) const {
    std::vector<std::vector<Rect>> rows;
    if (boxes.empty()) return rows;

    std::sort(boxes.begin(), boxes.end(), [this](const Rect& a, const Rect& b) {
        double ya = anchorOf(a), yb = anchorOf(b);
        if (ya != yb) return ya < yb;
        return a.x < b.x;
    });

    double anchorSum = 0.0;
    for (const auto& b : boxes) {
        double y = anchorOf(b);
        if (!rows.empty()) {
            double mean = anchorSum / rows.back().size();
            if (std::abs(y - mean) <= tolerance) {
                rows.back().push_back(b);
                anchorSum += y;
                continue;
            }
        }
        rows.push_back({b});
        anchorSum = y;
    }

    for (auto& row : rows) {
        std::sort(row.begin(), row.end(), [](const Rect& a, const Rect& b) {
            if (a.x != b.x) return a.x < b.x;
            return a.y < b.y;
        });
    }
    return rows;
}

std::vector<std::vector<Rect>> BoxSorter::clusterColumns(std::vector<Rect> boxes) const {
    std::vector<std::vector<Rect>> columns;
    if (boxes.empty()) return columns;

    std::sort(boxes.begin(), boxes.end(), [](const Rect& a, const Rect& b) {
        if (a.x != b.x) return a.x < b.x;
        return a.y < b.y;
    });

    long sumX = 0;
    int mid = 0;
    for (const auto& b : boxes) {
        if (!columns.empty() && b.x >= mid - config_.columnTolerance && b.x < mid + config_.columnTolerance) {
            columns.back().push_back(b);
            sumX += b.x;
            // perspective residue makes left edges drift; follow the column's mean
            mid = static_cast<int>(sumX / static_cast<long>(columns.back().size()));
            continue;
        }
        columns.push_back({b});
        sumX = b.x;
        mid = b.x;
    }
    return columns;
}

std::vector<Rect> BoxSorter::mergeStackedLines(std::vector<Rect> column, double gap) const {
    std::sort(column.begin(), column.end(), [](const Rect& a, const Rect& b) { return a.y < b.y; });

    std::vector<Rect> merged;
    for (const auto& b : column) {
        if (!merged.empty()) {
            int bottom = merged.back().y + merged.back().height;
            if (std::abs(b.y - bottom) < gap) {
                merged.back() |= b;
                continue;
            }
        }
        merged.push_back(b);
    }
    return merged;
}

OrderedBoxes BoxSorter::orderOrdinal(const std::vector<Rect>& boxes) const {
    OrderedBoxes R;
    R.rowTolerance = effectiveRowTolerance(boxes);

    auto rows = groupRows(boxes, R.rowTolerance);
    for (int r = 0; r < static_cast<int>(rows.size()); ++r) {
        for (int c = 0; c < static_cast<int>(rows[r].size()); ++c) {
            TextBox tb(rows[r][c]);
            tb.row = r;
            tb.col = c;
            R.boxes.push_back(tb);
        }
        R.columns = std::max(R.columns, static_cast<int>(rows[r].size()));
    }
    R.rows = static_cast<int>(rows.size());
    return R;
}

OrderedBoxes BoxSorter::orderClustered(const std::vector<Rect>& boxes) const {
    OrderedBoxes R;
    auto columns = clusterColumns(boxes);

    if (config_.expectedColumns > 0) {
        // Leftover line fragments form sparse spurious columns.
        while (static_cast<int>(columns.size()) > config_.expectedColumns) {
            auto sparsest = std::min_element(columns.begin(), columns.end(),
                [](const std::vector<Rect>& a, const std::vector<Rect>& b) { return a.size() < b.size(); });
            logMessage(LogLevel::Debug, "order: dropping column at x=" + std::to_string(sparsest->front().x) +
                                            " with " + std::to_string(sparsest->size()) + " boxes");
            R.rejected.insert(R.rejected.end(), sparsest->begin(), sparsest->end());
            columns.erase(sparsest);
        }
    }

    std::vector<Rect> kept;
    for (const auto& col : columns) kept.insert(kept.end(), col.begin(), col.end());
    double gap = config_.lineMergeGap > 0.0 ? config_.lineMergeGap : meanHeight(kept) / 2.0;

    std::vector<std::pair<Rect, int>> cells;   // merged box, column index
    for (int c = 0; c < static_cast<int>(columns.size()); ++c) {
        for (const auto& m : mergeStackedLines(columns[c], gap)) cells.emplace_back(m, c);
    }

    std::vector<Rect> merged;
    for (const auto& cell : cells) merged.push_back(cell.first);
    R.rowTolerance = effectiveRowTolerance(merged);

    auto rows = groupRows(merged, R.rowTolerance);
    for (int r = 0; r < static_cast<int>(rows.size()); ++r) {
        std::map<int, Rect> byColumn;
        for (const auto& b : rows[r]) {
            int col = -1;
            for (const auto& cell : cells) {
                if (cell.first == b) { col = cell.second; break; }
            }
            auto it = byColumn.find(col);
            if (it == byColumn.end()) byColumn.emplace(col, b);
            else it->second |= b;
        }
        for (const auto& kv : byColumn) {
            TextBox tb(kv.second);
            tb.row = r;
            tb.col = kv.first;
            R.boxes.push_back(tb);
        }
    }
    R.rows = static_cast<int>(rows.size());
    R.columns = static_cast<int>(columns.size());
    return R;
}

OrderedBoxes BoxSorter::order(const std::vector<Rect>& boxes) const {
    OrderedBoxes R = config_.columns == ColumnAssignment::CLUSTERED ? orderClustered(boxes)
                                                                    : orderOrdinal(boxes);
    if (logEnabled(LogLevel::Debug)) {
        std::ostringstream os;
        os << "order: " << boxes.size() << " boxes -> " << R.rows << " rows x "
           << R.columns << " columns (row tolerance " << R.rowTolerance << " px)";
        logMessage(LogLevel::Debug, os.str());
    }
    return R;
}

}
