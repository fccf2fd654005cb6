#include <catch2/catch_all.hpp>

#include <opencv2/imgcodecs.hpp>
#include "tablescan/Log.hpp"
#include "tablescan/Pipeline.hpp"
#include "tablescan/TableWriter.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace tablescan;
using namespace testsupport;

namespace {

FunctionRecognizer glyphCounter() {
    return FunctionRecognizer([](const cv::Mat& slice) { return std::to_string(countGlyphs(slice)); });
}

cv::Mat ruledTablePhoto() {
    cv::Mat photo = whiteImage(700, 300);
    drawGridTable(photo, GridSpec());
    return photo;
}

bool hasDebug(const PipelineResult& r, const std::string& name) {
    return std::any_of(r.debug.begin(), r.debug.end(),
                       [&name](const std::pair<std::string, cv::Mat>& kv) { return kv.first == name; });
}

}

TEST_CASE("a ruled table photo becomes a text grid", "[pipeline]") {
    FunctionRecognizer reader = glyphCounter();
    TablePipeline pipeline(PipelineConfig(), reader);

    PipelineResult r = pipeline.process(ruledTablePhoto(), "ruled");

    REQUIRE(r.imageId == "ruled");
    REQUIRE(r.table.rowCount() == 3);
    REQUIRE(r.table.columnCount() == 3);
    REQUIRE(r.textImage.size() == r.tableImage.size());
    REQUIRE(r.debug.empty());

    TextGrid expected = {{"1", "2", "3"}, {"4", "5", "6"}, {"7", "8", "9"}};
    REQUIRE(r.table.texts() == expected);
    REQUIRE(toDelimited(r.table) == "1|2|3\n4|5|6\n7|8|9\n");

    TextGrid back = parseDelimited(toDelimited(r.table));
    REQUIRE(back == r.table.texts());
}

TEST_CASE("debug images are grouped by stage", "[pipeline]") {
    FunctionRecognizer reader = glyphCounter();
    PipelineConfig cfg;
    cfg.debug = true;
    PipelineResult r = TablePipeline(cfg, reader).process(ruledTablePhoto(), "ruled");

    REQUIRE(hasDebug(r, "locate/binary_inverted"));
    REQUIRE(hasDebug(r, "locate/perspective_corrected"));
    REQUIRE(hasDebug(r, "remove_structure/structure_mask"));
    REQUIRE(hasDebug(r, "extract_cells/text_boxes"));
}

TEST_CASE("failures carry the image id", "[pipeline]") {
    FunctionRecognizer reader = glyphCounter();
    TablePipeline pipeline(PipelineConfig(), reader);

    try {
        pipeline.process(whiteImage(300, 200), "blank-photo");
        FAIL("expected NoTableFound");
    } catch (const TableError& e) {
        REQUIRE(e.kind() == ErrorKind::NoTableFound);
        REQUIRE(e.imageId() == "blank-photo");
        REQUIRE(std::string(e.what()).find("blank-photo") != std::string::npos);
    }

    REQUIRE_THROWS_AS(pipeline.processFile("/nonexistent-dir/photo.png"), std::runtime_error);
}

TEST_CASE("a batch reports every image in input order", "[pipeline]") {
    std::string good = tempPath("ruled.png");
    std::string blank = tempPath("blank.png");
    std::string missing = tempPath("missing.png");
    REQUIRE(cv::imwrite(good, ruledTablePhoto()));
    REQUIRE(cv::imwrite(blank, whiteImage(300, 200)));

    FunctionRecognizer reader = glyphCounter();
    PipelineConfig cfg;
    cfg.batchThreads = 3;
    TablePipeline pipeline(cfg, reader);

    std::vector<std::string> paths = {good, blank, missing, good};
    std::vector<BatchOutcome> outcomes = pipeline.processBatch(paths);
    std::remove(good.c_str());
    std::remove(blank.c_str());

    REQUIRE(outcomes.size() == 4);
    for (size_t i = 0; i < paths.size(); ++i) REQUIRE(outcomes[i].imageId == paths[i]);

    REQUIRE(outcomes[0].ok);
    REQUIRE(outcomes[0].result.table.at(2, 0).text == "7");
    REQUIRE(outcomes[3].ok);

    REQUIRE_FALSE(outcomes[1].ok);
    REQUIRE(outcomes[1].hasKind);
    REQUIRE(outcomes[1].kind == ErrorKind::NoTableFound);

    REQUIRE_FALSE(outcomes[2].ok);
    REQUIRE_FALSE(outcomes[2].hasKind);
    REQUIRE_FALSE(outcomes[2].error.empty());

    REQUIRE(pipeline.processBatch({}).empty());
}

TEST_CASE("pipeline configuration is validated up front", "[pipeline]") {
    FunctionRecognizer reader = glyphCounter();
    PipelineConfig cfg;
    cfg.batchThreads = 0;
    REQUIRE_THROWS_AS(TablePipeline(cfg, reader), std::invalid_argument);

    cfg = PipelineConfig();
    cfg.delimiter = '\n';
    REQUIRE_THROWS_AS(TablePipeline(cfg, reader), std::invalid_argument);
}

TEST_CASE("log level gates messages", "[pipeline]") {
    LogLevel saved = logLevel();

    setLogLevel(LogLevel::Warn);
    REQUIRE_FALSE(logEnabled(LogLevel::Info));
    REQUIRE(logEnabled(LogLevel::Error));

    setLogLevel(LogLevel::Off);
    REQUIRE_FALSE(logEnabled(LogLevel::Error));
    REQUIRE_FALSE(logEnabled(LogLevel::Off));

    setLogLevel(saved);
}

TEST_CASE("logMessage writes enabled levels to clog", "[pipeline][log]") {
    LogLevel saved = logLevel();
    std::ostringstream captured;
    std::streambuf* old = std::clog.rdbuf(captured.rdbuf());

    setLogLevel(LogLevel::Warn);
    logMessage(LogLevel::Info, "hidden detail");
    logMessage(LogLevel::Warn, "cell (1, 2) unreadable");
    logMessage(LogLevel::Off, "never");

    std::clog.rdbuf(old);
    setLogLevel(saved);

    REQUIRE(captured.str() == "[warn] cell (1, 2) unreadable\n");
}

TEST_CASE("inputs sharing a file stem get distinct output names", "[pipeline]") {
    std::vector<std::string> paths = {"a/x.jpg", "b/x.jpg", "x_2.png", "c/y.png", "d/x.tif"};
    std::vector<std::string> stems = uniqueOutputStems(paths);

    std::vector<std::string> expected = {"x", "x_3", "x_2", "y", "x_4"};
    REQUIRE(stems == expected);

    std::vector<std::string> distinct = {"scans/menu.jpg", "scans/carte.jpg"};
    std::vector<std::string> plain = {"menu", "carte"};
    REQUIRE(uniqueOutputStems(distinct) == plain);
    REQUIRE(uniqueOutputStems({}).empty());
}

TEST_CASE("recognised bullet lists are split into rows", "[pipeline][bullets]") {
    FunctionRecognizer reader([](const cv::Mat& slice) {
        std::string n = std::to_string(countGlyphs(slice));
        return "+ " + n + "a . " + n + "b";
    });

    PipelineConfig plain;
    PipelineResult unsplit = TablePipeline(plain, reader).process(ruledTablePhoto(), "ruled");
    REQUIRE(unsplit.rows == unsplit.table.texts());
    REQUIRE(unsplit.rows.size() == 3);

    PipelineConfig cfg;
    cfg.bullets.enabled = true;
    cfg.bullets.columns = {1, 2};
    PipelineResult r = TablePipeline(cfg, reader).process(ruledTablePhoto(), "ruled");

    REQUIRE(r.table.rowCount() == 3);
    REQUIRE(r.rows.size() == 6);
    std::vector<std::string> first = {"+ 1a . 1b", "2a", "3a"};
    std::vector<std::string> second = {"+ 1a . 1b", "2b", "3b"};
    std::vector<std::string> last = {"+ 7a . 7b", "8b", "9b"};
    REQUIRE(r.rows[0] == first);
    REQUIRE(r.rows[1] == second);
    REQUIRE(r.rows[5] == last);
}
