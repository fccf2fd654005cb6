#include "tablescan/Types.hpp"
#include <opencv2/imgproc.hpp>

namespace tablescan {

Contour::Contour(std::vector<cv::Point> pts)
    : points(std::move(pts))
{
    if (points.empty()) return;
    box = cv::boundingRect(points);
    area = cv::contourArea(points);
}

std::vector<std::vector<std::string>> Table::texts() const {
    std::vector<std::vector<std::string>> out;
    out.reserve(rows_.size());
    for (const auto& row : rows_) {
        std::vector<std::string> line;
        line.reserve(row.size());
        for (const auto& cell : row) line.push_back(cell.text);
        out.push_back(std::move(line));
    }
    return out;
}

}
