#include "tablescan/Pipeline.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <future>
#include <set>
#include <stdexcept>
#include "tablescan/Log.hpp"

using namespace cv;

namespace tablescan {

namespace {

void appendDebug(DebugImages& out, const char* stage, const DebugImages& in) {
    for (const auto& kv : in) out.emplace_back(std::string(stage) + "/" + kv.first, kv.second);
}

}

std::vector<std::string> uniqueOutputStems(const std::vector<std::string>& paths) {
    std::set<std::string> natural;
    for (const auto& p : paths) natural.insert(std::filesystem::path(p).stem().string());

    std::set<std::string> used;
    std::vector<std::string> stems;
    stems.reserve(paths.size());
    for (const auto& p : paths) {
        std::string stem = std::filesystem::path(p).stem().string();
        std::string name = stem;
        for (int n = 2; used.count(name) > 0 || (name != stem && natural.count(name) > 0); ++n) {
            name = stem + "_" + std::to_string(n);
        }
        used.insert(name);
        stems.push_back(name);
    }
    return stems;
}

TablePipeline::TablePipeline(const PipelineConfig& config, const TextRecognizer& recognizer)
    : config_(config),
      locator_(config.locator),
      remover_(config.structure),
      extractor_(config.cells, recognizer)
{
    config_.validate();
}

PipelineResult TablePipeline::process(const Mat& photo, const std::string& imageId) const {
    PipelineResult R;
    R.imageId = imageId;
    bool dbg = config_.debug;

    try {
        LocateResult L = locator_.locate(photo, dbg);
        R.tableImage = L.table;
        R.corners = L.corners;
        appendDebug(R.debug, "locate", L.debug);

        StructureResult S = remover_.removeStructure(L.table, dbg);
        R.textImage = S.text;
        appendDebug(R.debug, "remove_structure", S.debug);

        ExtractResult E = extractor_.extractCells(S.text, L.table, dbg);
        R.table = std::move(E.table);
        R.boxes = std::move(E.boxes);
        appendDebug(R.debug, "extract_cells", E.debug);

        R.rows = R.table.texts();
        if (config_.bullets.enabled) {
            R.rows = splitBulletRows(R.rows, config_.bullets.columns, config_.bullets.markers);
        }
    } catch (const TableError& e) {
        TableError tagged = e.withImageId(imageId);
        logMessage(LogLevel::Error, tagged.what());
        throw tagged;
    }

    logMessage(LogLevel::Info, "'" + imageId + "': " + std::to_string(R.table.rowCount()) + " x " +
                                  std::to_string(R.table.columnCount()) + " table");
    return R;
}

PipelineResult TablePipeline::processFile(const std::string& path) const {
    Mat photo = imread(path, IMREAD_COLOR);
    if (photo.empty()) {
        throw std::runtime_error("cannot read image " + path);
    }
    return process(photo, path);
}

BatchOutcome TablePipeline::runOne(const std::string& path) const {
    BatchOutcome out;
    out.imageId = path;
    try {
        out.result = processFile(path);
        out.ok = true;
    } catch (const TableError& e) {
        out.error = e.what();
        out.hasKind = true;
        out.kind = e.kind();
    } catch (const std::exception& e) {
        logMessage(LogLevel::Error, "'" + path + "': " + e.what());
        out.error = e.what();
    }
    return out;
}

std::vector<BatchOutcome> TablePipeline::processBatch(const std::vector<std::string>& paths) const {
    std::vector<BatchOutcome> outcomes(paths.size());
    if (paths.empty()) return outcomes;

    int workers = std::min(config_.batchThreads, static_cast<int>(paths.size()));
    std::atomic<size_t> next{0};

    std::vector<std::future<void>> tasks;
    tasks.reserve(workers);
    for (int w = 0; w < workers; ++w) {
        tasks.push_back(std::async(std::launch::async, [this, &paths, &outcomes, &next]() {
            for (size_t i = next++; i < paths.size(); i = next++) {
                outcomes[i] = runOne(paths[i]);
            }
        }));
    }
    for (auto& t : tasks) t.get();

    size_t failed = std::count_if(outcomes.begin(), outcomes.end(), [](const BatchOutcome& o) { return !o.ok; });
    logMessage(LogLevel::Info, "batch: " + std::to_string(paths.size() - failed) + " of " +
                                  std::to_string(paths.size()) + " images processed");
    return outcomes;
}

}
