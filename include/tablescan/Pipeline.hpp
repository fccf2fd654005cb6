#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "tablescan/CellExtractor.hpp"
#include "tablescan/Config.hpp"
#include "tablescan/StructureRemover.hpp"
#include "tablescan/TableError.hpp"
#include "tablescan/TableLocator.hpp"
#include "tablescan/TableWriter.hpp"
#include "tablescan/TextRecognizer.hpp"

namespace tablescan {

struct PipelineResult {
    std::string imageId;
    Table table;
    TextGrid rows;            // table texts, bullet lists split when enabled
    cv::Mat tableImage;       // perspective-corrected, padded crop
    cv::Mat textImage;        // structure removed
    Quad corners{};
    std::vector<TextBox> boxes;
    DebugImages debug;        // "<stage>/<step>" names, when enabled
};

struct BatchOutcome {
    std::string imageId;
    bool ok = false;
    PipelineResult result;    // meaningful only when ok
    std::string error;
    bool hasKind = false;
    ErrorKind kind = ErrorKind::NoTableFound;
};

// Output file stems for a batch, in input order. Inputs sharing a stem
// ("a/x.jpg", "b/x.png") get "_2", "_3"... suffixes that clash with no other stem.
std::vector<std::string> uniqueOutputStems(const std::vector<std::string>& paths);

class TablePipeline {
public:
    TablePipeline(const PipelineConfig& config, const TextRecognizer& recognizer);

    // Locate, strip structure, extract cells. Throws TableError tagged with imageId.
    PipelineResult process(const cv::Mat& photo, const std::string& imageId) const;

    // Reads the photograph with cv::imread; the path is the image id.
    PipelineResult processFile(const std::string& path) const;

    // Independent images in parallel; one outcome per path, in input order.
    std::vector<BatchOutcome> processBatch(const std::vector<std::string>& paths) const;

    const PipelineConfig& config() const { return config_; }

private:
    PipelineConfig config_;
    TableLocator locator_;
    StructureRemover remover_;
    CellExtractor extractor_;

    BatchOutcome runOne(const std::string& path) const;
};

}
