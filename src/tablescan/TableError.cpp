#include "tablescan/TableError.hpp"
#include <sstream>

namespace tablescan {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NoTableFound: return "NoTableFound";
        case ErrorKind::AmbiguousTable: return "AmbiguousTable";
        case ErrorKind::StructureRemovalFailed: return "StructureRemovalFailed";
        case ErrorKind::IrregularGrid: return "IrregularGrid";
    }
    return "Unknown";
}

TableError::TableError(ErrorKind kind, std::string stage, const std::string& detail, cv::Rect offending)
    : TableError(kind, std::move(stage), detail, offending, std::string())
{
}

TableError::TableError(ErrorKind kind, std::string stage, const std::string& detail,
                       cv::Rect offending, const std::string& imageId)
    : std::runtime_error(format(kind, stage, detail, imageId, offending)),
      kind_(kind),
      stage_(std::move(stage)),
      detail_(detail),
      imageId_(imageId),
      offending_(offending)
{
}

TableError TableError::withImageId(const std::string& imageId) const {
    return TableError(kind_, stage_, detail_, offending_, imageId);
}

std::string TableError::format(ErrorKind kind, const std::string& stage, const std::string& detail,
                               const std::string& imageId, cv::Rect offending) {
    std::ostringstream os;
    os << toString(kind) << " [" << stage << "]";
    if (!imageId.empty()) os << " image '" << imageId << "'";
    os << ": " << detail;
    if (offending.area() > 0) {
        os << " (at x=" << offending.x << " y=" << offending.y
           << " w=" << offending.width << " h=" << offending.height << ")";
    }
    return os.str();
}

}
