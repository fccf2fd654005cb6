#include <catch2/catch_all.hpp>

#include "tablescan/Config.hpp"
#include "test_support.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

using namespace tablescan;

TEST_CASE("missing keys keep their defaults", "[config]") {
    PipelineConfig cfg = parseConfig("%YAML:1.0\n---\nbatch_threads: 3\n");

    REQUIRE(cfg.batchThreads == 3);
    REQUIRE(cfg.delimiter == '|');
    REQUIRE(cfg.locator.padding == 20);
    REQUIRE(cfg.structure.threshold.policy == ThresholdPolicy::FIXED);
    REQUIRE(cfg.structure.kernels.size() == 3);
    REQUIRE(cfg.cells.blobDilation.size() == 2);
    REQUIRE(cfg.cells.ordering.columns == ColumnAssignment::ORDINAL);
}

TEST_CASE("nested sections are read", "[config]") {
    const std::string yaml =
        "%YAML:1.0\n"
        "---\n"
        "locator:\n"
        "   threshold:\n"
        "      policy: adaptive\n"
        "      block_size: 21\n"
        "      offset: 4.\n"
        "   padding: 12\n"
        "   background_color: [ 200, 60, 60 ]\n"
        "structure:\n"
        "   kernels:\n"
        "      vertical_lines:\n"
        "         orientation: vertical\n"
        "         width: 1\n"
        "         height: 8\n"
        "         iterations: 6\n"
        "   icon_colors:\n"
        "      - [ 120, 90, 30 ]\n"
        "      - [ 30, 90, 120 ]\n"
        "cells:\n"
        "   blob_dilation:\n"
        "      - { orientation: block, width: 8, height: 3, iterations: 4 }\n"
        "   slice_padding: 2\n"
        "   ordering:\n"
        "      row_tolerance: 7.5\n"
        "      row_anchor: top\n"
        "      columns: clustered\n"
        "      expected_columns: 4\n"
        "delimiter: \";\"\n"
        "debug: 1\n";

    PipelineConfig cfg = parseConfig(yaml);

    REQUIRE(cfg.locator.threshold.policy == ThresholdPolicy::ADAPTIVE);
    REQUIRE(cfg.locator.threshold.blockSize == 21);
    REQUIRE(cfg.locator.threshold.offset == Catch::Approx(4.0));
    REQUIRE(cfg.locator.padding == 12);
    REQUIRE(cfg.locator.hasBackgroundColor);
    REQUIRE(cfg.locator.backgroundColor.r == 200);

    // only the listed pattern stays
    REQUIRE(cfg.structure.kernels.size() == 1);
    const KernelSpec& v = cfg.structure.kernels.at(StructurePattern::VERTICAL_LINES);
    REQUIRE(v.height == 8);
    REQUIRE(v.iterations == 6);
    REQUIRE(cfg.structure.iconColors.size() == 2);
    REQUIRE(cfg.structure.iconColors[1].b == 120);

    REQUIRE(cfg.cells.blobDilation.size() == 1);
    REQUIRE(cfg.cells.blobDilation[0].width == 8);
    REQUIRE(cfg.cells.slicePadding == 2);
    REQUIRE(cfg.cells.ordering.rowTolerance == Catch::Approx(7.5));
    REQUIRE(cfg.cells.ordering.rowAnchor == RowAnchor::TOP);
    REQUIRE(cfg.cells.ordering.columns == ColumnAssignment::CLUSTERED);
    REQUIRE(cfg.cells.ordering.expectedColumns == 4);

    REQUIRE(cfg.delimiter == ';');
    REQUIRE(cfg.debug);
}

TEST_CASE("a dumped configuration reads back the same", "[config]") {
    PipelineConfig cfg;
    cfg.locator.padding = 7;
    cfg.locator.hasBackgroundColor = true;
    cfg.locator.backgroundColor = Rgb(10, 20, 30);
    cfg.structure.iconColors = {Rgb(158, 130, 90)};
    cfg.structure.kernels.erase(StructurePattern::ICONS);
    cfg.cells.ordering.columns = ColumnAssignment::CLUSTERED;
    cfg.cells.missingCellTolerance = 0;
    cfg.delimiter = ',';
    cfg.batchThreads = 5;

    SECTION("yaml") {
        PipelineConfig back = parseConfig(dumpConfig(cfg));
        REQUIRE(dumpConfig(back) == dumpConfig(cfg));
        REQUIRE(back.delimiter == ',');
        REQUIRE(back.structure.kernels.count(StructurePattern::ICONS) == 0);
        REQUIRE(back.locator.backgroundColor.b == 30);
    }
    SECTION("json") {
        PipelineConfig back = parseConfig(dumpConfig(cfg, ".json"), ".json");
        REQUIRE(dumpConfig(back, ".json") == dumpConfig(cfg, ".json"));
        REQUIRE(back.batchThreads == 5);
    }
    SECTION("file") {
        std::string path = testsupport::tempPath("pipeline.yml");
        saveConfig(path, cfg);
        PipelineConfig back = loadConfig(path);
        std::remove(path.c_str());
        REQUIRE(back.cells.missingCellTolerance == 0);
        REQUIRE(back.cells.ordering.columns == ColumnAssignment::CLUSTERED);
    }
}

TEST_CASE("bad values are rejected", "[config]") {
    const std::string header = "%YAML:1.0\n---\n";

    REQUIRE_THROWS_AS(parseConfig(header + "locator:\n   padding: -1\n"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseConfig(header + "locator:\n   threshold:\n      policy: magic\n"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseConfig(header + "structure:\n   kernels:\n      dots: { width: 3 }\n"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseConfig(header + "structure:\n   icon_colors:\n      - [ 0, 90, 30 ]\n"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseConfig(header + "cells:\n   ordering:\n      columns: diagonal\n"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseConfig(header + "delimiter: \"ab\"\n"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseConfig(header + "batch_threads: 0\n"), std::invalid_argument);

    REQUIRE_THROWS_AS(loadConfig("/nonexistent-dir/pipeline.yml"), std::runtime_error);
}

TEST_CASE("boolean keys accept words as well as numbers", "[config]") {
    const std::string header = "%YAML:1.0\n---\n";

    REQUIRE(parseConfig(header + "debug: true\n").debug);
    REQUIRE(parseConfig(header + "debug: True\n").debug);
    REQUIRE(parseConfig(header + "debug: 1\n").debug);
    REQUIRE_FALSE(parseConfig(header + "debug: false\n").debug);
    REQUIRE_FALSE(parseConfig(header + "debug: 0\n").debug);

    REQUIRE_THROWS_AS(parseConfig(header + "debug: maybe\n"), std::invalid_argument);
}

TEST_CASE("bullet splitting is configured in its own section", "[config][bullets]") {
    const std::string header = "%YAML:1.0\n---\n";

    PipelineConfig defaults = parseConfig(header + "batch_threads: 2\n");
    REQUIRE_FALSE(defaults.bullets.enabled);
    REQUIRE(defaults.bullets.markers.size() == 4);

    PipelineConfig cfg = parseConfig(header +
                                     "bullets:\n"
                                     "   enabled: true\n"
                                     "   columns: [ 1, 2 ]\n"
                                     "   markers: [ \"+ \", \"- \" ]\n");
    REQUIRE(cfg.bullets.enabled);
    REQUIRE(cfg.bullets.columns == std::vector<int>{1, 2});
    REQUIRE(cfg.bullets.markers == std::vector<std::string>{"+ ", "- "});

    // enabled without any column
    REQUIRE_THROWS_AS(parseConfig(header + "bullets:\n   enabled: 1\n"), std::invalid_argument);

    PipelineConfig saved;
    saved.bullets.enabled = true;
    saved.bullets.columns = {2, 1};
    PipelineConfig yaml = parseConfig(dumpConfig(saved));
    REQUIRE(yaml.bullets.enabled);
    REQUIRE(yaml.bullets.columns == std::vector<int>{2, 1});
    REQUIRE(yaml.bullets.markers == saved.bullets.markers);
    PipelineConfig json = parseConfig(dumpConfig(saved, ".json"), ".json");
    REQUIRE(json.bullets.markers == saved.bullets.markers);
}
