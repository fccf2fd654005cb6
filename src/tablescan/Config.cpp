#include "tablescan/Config.hpp"
#include <opencv2/core/persistence.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace cv;

namespace tablescan {

namespace {

template <typename T>
void readIfPresent(const FileNode& node, const char* key, T& value) {
    FileNode n = node[key];
    if (!n.empty()) n >> value;
}

// Unquoted YAML words such as `true` arrive as string nodes.
void readBool(const FileNode& node, const char* key, bool& value) {
    FileNode n = node[key];
    if (n.empty()) return;
    if (n.isInt()) {
        value = static_cast<int>(n) != 0;
        return;
    }
    if (n.isString()) {
        std::string s = static_cast<std::string>(n);
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        if (s == "true" || s == "yes" || s == "on" || s == "1") {
            value = true;
            return;
        }
        if (s == "false" || s == "no" || s == "off" || s == "0") {
            value = false;
            return;
        }
    }
    throw std::invalid_argument(std::string(key) + " must be a boolean (true/false or 0/1)");
}

void readString(const FileNode& node, const char* key, std::string& value) {
    FileNode n = node[key];
    if (!n.empty()) value = static_cast<std::string>(n);
}

void readThreshold(const FileNode& node, ThresholdSpec& spec) {
    if (node.empty()) return;
    std::string policy;
    readString(node, "policy", policy);
    if (!policy.empty()) spec.policy = thresholdPolicyFromString(policy);
    readIfPresent(node, "value", spec.value);
    readIfPresent(node, "block_size", spec.blockSize);
    readIfPresent(node, "offset", spec.offset);
}

void writeThreshold(FileStorage& fs, const char* key, const ThresholdSpec& spec) {
    fs << key << "{";
    fs << "policy" << toString(spec.policy);
    fs << "value" << spec.value;
    fs << "block_size" << spec.blockSize;
    fs << "offset" << spec.offset;
    fs << "}";
}

KernelSpec readKernel(const FileNode& node, KernelSpec spec) {
    if (node.empty()) return spec;
    std::string orientation;
    readString(node, "orientation", orientation);
    if (!orientation.empty()) spec.orientation = orientationFromString(orientation);
    readIfPresent(node, "width", spec.width);
    readIfPresent(node, "height", spec.height);
    readIfPresent(node, "iterations", spec.iterations);
    return spec;
}

void writeKernelBody(FileStorage& fs, const KernelSpec& spec) {
    fs << "orientation" << toString(spec.orientation);
    fs << "width" << spec.width;
    fs << "height" << spec.height;
    fs << "iterations" << spec.iterations;
}

void writeKernel(FileStorage& fs, const char* key, const KernelSpec& spec) {
    fs << key << "{";
    writeKernelBody(fs, spec);
    fs << "}";
}

Rgb readRgb(const FileNode& node) {
    if (!node.isSeq() || node.size() != 3) throw std::invalid_argument("colour must be a sequence [r, g, b]");
    return Rgb(static_cast<int>(node[0]), static_cast<int>(node[1]), static_cast<int>(node[2]));
}

void writeRgb(FileStorage& fs, const Rgb& c) {
    fs << "[" << c.r << c.g << c.b << "]";
}

void readLocator(const FileNode& node, LocatorConfig& c) {
    if (node.empty()) return;
    readThreshold(node["threshold"], c.threshold);
    readIfPresent(node, "dilate_iterations", c.dilateIterations);
    readIfPresent(node, "min_table_area_ratio", c.minTableAreaRatio);
    readIfPresent(node, "ambiguity_ratio", c.ambiguityRatio);
    readIfPresent(node, "padding", c.padding);
    readIfPresent(node, "target_width", c.targetWidth);
    readIfPresent(node, "hue_tolerance", c.hueTolerance);
    FileNode bg = node["background_color"];
    if (!bg.empty()) {
        c.backgroundColor = readRgb(bg);
        c.hasBackgroundColor = true;
    }
}

void readStructure(const FileNode& node, StructureConfig& c) {
    if (node.empty()) return;
    readThreshold(node["threshold"], c.threshold);

    FileNode kernels = node["kernels"];
    if (!kernels.empty()) {
        if (!kernels.isMap()) throw std::invalid_argument("structure.kernels must be a mapping");
        PatternKernels parsed;
        for (auto it = kernels.begin(); it != kernels.end(); ++it) {
            FileNode k = *it;
            StructurePattern p = structurePatternFromString(k.name());
            auto def = c.kernels.find(p);
            parsed[p] = readKernel(k, def != c.kernels.end() ? def->second : KernelSpec());
        }
        c.kernels = parsed;
    }

    c.maskDilation = readKernel(node["mask_dilation"], c.maskDilation);
    c.smoothing = readKernel(node["smoothing"], c.smoothing);
    readIfPresent(node, "min_component_area", c.minComponentArea);
    readIfPresent(node, "hue_tolerance", c.hueTolerance);

    FileNode icons = node["icon_colors"];
    if (!icons.empty()) {
        if (!icons.isSeq()) throw std::invalid_argument("structure.icon_colors must be a sequence");
        c.iconColors.clear();
        for (auto it = icons.begin(); it != icons.end(); ++it) c.iconColors.push_back(readRgb(*it));
    }
}

void readOrdering(const FileNode& node, OrderingConfig& c) {
    if (node.empty()) return;
    readIfPresent(node, "row_tolerance", c.rowTolerance);
    std::string s;
    readString(node, "row_anchor", s);
    if (!s.empty()) c.rowAnchor = rowAnchorFromString(s);
    s.clear();
    readString(node, "columns", s);
    if (!s.empty()) c.columns = columnAssignmentFromString(s);
    readIfPresent(node, "column_tolerance", c.columnTolerance);
    readIfPresent(node, "expected_columns", c.expectedColumns);
    readIfPresent(node, "line_merge_gap", c.lineMergeGap);
}

void readCells(const FileNode& node, CellConfig& c) {
    if (node.empty()) return;
    FileNode dil = node["blob_dilation"];
    if (!dil.empty()) {
        if (!dil.isSeq()) throw std::invalid_argument("cells.blob_dilation must be a sequence");
        c.blobDilation.clear();
        for (auto it = dil.begin(); it != dil.end(); ++it) c.blobDilation.push_back(readKernel(*it, KernelSpec()));
    }
    readIfPresent(node, "min_box_area", c.minBoxArea);
    readIfPresent(node, "max_box_area_ratio", c.maxBoxAreaRatio);
    readIfPresent(node, "min_height_ratio", c.minHeightRatio);
    readIfPresent(node, "slice_padding", c.slicePadding);
    readIfPresent(node, "missing_cell_tolerance", c.missingCellTolerance);
    readIfPresent(node, "recognition_threads", c.recognitionThreads);
    readOrdering(node["ordering"], c.ordering);
}

void readBullets(const FileNode& node, BulletSplitConfig& c) {
    if (node.empty()) return;
    readBool(node, "enabled", c.enabled);

    FileNode columns = node["columns"];
    if (!columns.empty()) {
        if (!columns.isSeq()) throw std::invalid_argument("bullets.columns must be a sequence");
        c.columns.clear();
        for (auto it = columns.begin(); it != columns.end(); ++it) c.columns.push_back(static_cast<int>(*it));
    }

    FileNode markers = node["markers"];
    if (!markers.empty()) {
        if (!markers.isSeq()) throw std::invalid_argument("bullets.markers must be a sequence");
        c.markers.clear();
        for (auto it = markers.begin(); it != markers.end(); ++it) c.markers.push_back(static_cast<std::string>(*it));
    }
}

PipelineConfig readPipeline(FileStorage& fs) {
    PipelineConfig cfg;
    FileNode root = fs.root();
    readLocator(root["locator"], cfg.locator);
    readStructure(root["structure"], cfg.structure);
    readCells(root["cells"], cfg.cells);
    readBullets(root["bullets"], cfg.bullets);

    std::string delimiter;
    readString(root, "delimiter", delimiter);
    if (!delimiter.empty()) {
        if (delimiter.size() != 1) throw std::invalid_argument("delimiter must be a single character");
        cfg.delimiter = delimiter[0];
    }
    readIfPresent(root, "batch_threads", cfg.batchThreads);
    readBool(root, "debug", cfg.debug);

    cfg.validate();
    return cfg;
}

void writePipeline(FileStorage& fs, const PipelineConfig& cfg) {
    const LocatorConfig& l = cfg.locator;
    fs << "locator" << "{";
    writeThreshold(fs, "threshold", l.threshold);
    fs << "dilate_iterations" << l.dilateIterations;
    fs << "min_table_area_ratio" << l.minTableAreaRatio;
    fs << "ambiguity_ratio" << l.ambiguityRatio;
    fs << "padding" << l.padding;
    fs << "target_width" << l.targetWidth;
    fs << "hue_tolerance" << l.hueTolerance;
    if (l.hasBackgroundColor) {
        fs << "background_color";
        writeRgb(fs, l.backgroundColor);
    }
    fs << "}";

    const StructureConfig& s = cfg.structure;
    fs << "structure" << "{";
    writeThreshold(fs, "threshold", s.threshold);
    fs << "kernels" << "{";
    for (const auto& kv : s.kernels) writeKernel(fs, toString(kv.first), kv.second);
    fs << "}";
    writeKernel(fs, "mask_dilation", s.maskDilation);
    writeKernel(fs, "smoothing", s.smoothing);
    fs << "min_component_area" << s.minComponentArea;
    fs << "hue_tolerance" << s.hueTolerance;
    fs << "icon_colors" << "[";
    for (const auto& c : s.iconColors) writeRgb(fs, c);
    fs << "]";
    fs << "}";

    const CellConfig& c = cfg.cells;
    fs << "cells" << "{";
    fs << "blob_dilation" << "[";
    for (const auto& k : c.blobDilation) {
        fs << "{";
        writeKernelBody(fs, k);
        fs << "}";
    }
    fs << "]";
    fs << "min_box_area" << c.minBoxArea;
    fs << "max_box_area_ratio" << c.maxBoxAreaRatio;
    fs << "min_height_ratio" << c.minHeightRatio;
    fs << "slice_padding" << c.slicePadding;
    fs << "missing_cell_tolerance" << c.missingCellTolerance;
    fs << "recognition_threads" << c.recognitionThreads;
    fs << "ordering" << "{";
    fs << "row_tolerance" << c.ordering.rowTolerance;
    fs << "row_anchor" << toString(c.ordering.rowAnchor);
    fs << "columns" << toString(c.ordering.columns);
    fs << "column_tolerance" << c.ordering.columnTolerance;
    fs << "expected_columns" << c.ordering.expectedColumns;
    fs << "line_merge_gap" << c.ordering.lineMergeGap;
    fs << "}";
    fs << "}";

    fs << "bullets" << "{";
    fs << "enabled" << static_cast<int>(cfg.bullets.enabled);
    fs << "columns" << "[";
    for (int col : cfg.bullets.columns) fs << col;
    fs << "]";
    fs << "markers" << "[";
    for (const auto& m : cfg.bullets.markers) fs << m;
    fs << "]";
    fs << "}";

    fs << "delimiter" << std::string(1, cfg.delimiter);
    fs << "batch_threads" << cfg.batchThreads;
    fs << "debug" << static_cast<int>(cfg.debug);
}

int memoryFlag(const std::string& formatHint) {
    if (formatHint.size() >= 5 && formatHint.compare(formatHint.size() - 5, 5, ".json") == 0)
        return FileStorage::FORMAT_JSON;
    return FileStorage::FORMAT_YAML;
}

}

void PipelineConfig::validate() const {
    locator.validate();
    structure.validate();
    cells.validate();
    bullets.validate();
    if (delimiter == '\n' || delimiter == '\r' || delimiter == '\0')
        throw std::invalid_argument("delimiter cannot be a line break or NUL");
    if (batchThreads < 1) throw std::invalid_argument("batch_threads must be at least 1");
}

PipelineConfig loadConfig(const std::string& path) {
    FileStorage fs(path, FileStorage::READ);
    if (!fs.isOpened()) throw std::runtime_error("cannot open config " + path);
    return readPipeline(fs);
}

void saveConfig(const std::string& path, const PipelineConfig& config) {
    config.validate();
    FileStorage fs(path, FileStorage::WRITE);
    if (!fs.isOpened()) throw std::runtime_error("cannot write config " + path);
    writePipeline(fs, config);
}

PipelineConfig parseConfig(const std::string& content, const std::string& formatHint) {
    FileStorage fs(content, FileStorage::READ | FileStorage::MEMORY | memoryFlag(formatHint));
    if (!fs.isOpened()) throw std::invalid_argument("unreadable config content");
    return readPipeline(fs);
}

std::string dumpConfig(const PipelineConfig& config, const std::string& formatHint) {
    config.validate();
    FileStorage fs(".yml", FileStorage::WRITE | FileStorage::MEMORY | memoryFlag(formatHint));
    writePipeline(fs, config);
    return fs.releaseAndGetString();
}

}
