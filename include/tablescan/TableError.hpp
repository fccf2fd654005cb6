#pragma once
#include <opencv2/core.hpp>
#include <stdexcept>
#include <string>

namespace tablescan {

enum class ErrorKind {
    NoTableFound,
    AmbiguousTable,
    StructureRemovalFailed,
    IrregularGrid
};

const char* toString(ErrorKind kind);

// Terminal failure for one image. No partial table is produced.
class TableError : public std::runtime_error {
public:
    TableError(ErrorKind kind, std::string stage, const std::string& detail,
               cv::Rect offending = cv::Rect());

    ErrorKind kind() const { return kind_; }
    const std::string& stage() const { return stage_; }
    const std::string& detail() const { return detail_; }
    const std::string& imageId() const { return imageId_; }
    cv::Rect offending() const { return offending_; }
    bool hasOffending() const { return offending_.area() > 0; }

    // Same error, tagged with the image it was raised for.
    TableError withImageId(const std::string& imageId) const;

private:
    TableError(ErrorKind kind, std::string stage, const std::string& detail,
               cv::Rect offending, const std::string& imageId);

    ErrorKind kind_;
    std::string stage_;
    std::string detail_;
    std::string imageId_;
    cv::Rect offending_;

    static std::string format(ErrorKind kind, const std::string& stage, const std::string& detail,
                              const std::string& imageId, cv::Rect offending);
};

}
