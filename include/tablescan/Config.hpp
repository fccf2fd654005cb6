#pragma once
#include <string>
#include "tablescan/CellExtractor.hpp"
#include "tablescan/StructureRemover.hpp"
#include "tablescan/TableLocator.hpp"
#include "tablescan/TableWriter.hpp"

namespace tablescan {

struct PipelineConfig {
    LocatorConfig locator;
    StructureConfig structure;
    CellConfig cells;
    BulletSplitConfig bullets;  // applied to the recognised texts before writing
    char delimiter = '|';
    int batchThreads = 2;     // images processed at once by processBatch
    bool debug = false;       // keep intermediate images of every stage

    void validate() const;
};

// YAML or JSON (chosen by extension) through cv::FileStorage. Missing keys keep
// their defaults; bad values throw std::invalid_argument.
PipelineConfig loadConfig(const std::string& path);
void saveConfig(const std::string& path, const PipelineConfig& config);

// In-memory variants, used by the file versions.
PipelineConfig parseConfig(const std::string& content, const std::string& formatHint = ".yml");
std::string dumpConfig(const PipelineConfig& config, const std::string& formatHint = ".yml");

}
