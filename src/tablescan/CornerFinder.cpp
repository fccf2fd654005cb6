#include "tablescan/CornerFinder.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

using namespace cv;

namespace tablescan {

Quad CornerFinder::findCorners(const std::vector<Point>& outline) const {
    if (outline.empty()) {
        throw std::invalid_argument("cannot derive corners from an empty outline");
    }

    Point tl = outline[0], tr = outline[0], br = outline[0], bl = outline[0];
    for (const auto& p : outline) {
        if (p.x + p.y < tl.x + tl.y) tl = p;
        if (p.x + p.y > br.x + br.y) br = p;
        if (p.y - p.x < tr.y - tr.x) tr = p;
        if (p.y - p.x > bl.y - bl.x) bl = p;
    }

    return {Point2f(tl), Point2f(tr), Point2f(br), Point2f(bl)};
}

void CornerFinder::drawCorners(Mat& bgr, const Quad& corners) const {
    static const char* labels[] = {"TL", "TR", "BR", "BL"};
    const Scalar colors[] = {
        Scalar(255, 0, 0),
        Scalar(0, 255, 0),
        Scalar(0, 0, 255),
        Scalar(255, 255, 0)
    };

    for (int i = 0; i < 4; ++i) {
        circle(bgr, corners[i], 10, colors[i], -1);
        putText(bgr, labels[i], corners[i] + Point2f(15, 0),
                FONT_HERSHEY_SIMPLEX, 0.8, colors[i], 2);
    }
    for (int i = 0; i < 4; ++i) {
        line(bgr, corners[i], corners[(i + 1) % 4], Scalar(0, 255, 255), 2);
    }
}

}
