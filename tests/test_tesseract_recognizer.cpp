#include <catch2/catch_all.hpp>

#include "tablescan/TesseractRecognizer.hpp"

#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tablescan;

namespace {

// Null when no language data is installed.
std::unique_ptr<TesseractRecognizer> englishRecognizer(int poolSize) {
    TesseractConfig cfg;
    cfg.language = "eng";
    cfg.poolSize = poolSize;
    try {
        return std::unique_ptr<TesseractRecognizer>(new TesseractRecognizer(cfg));
    } catch (const std::runtime_error&) {
        return nullptr;
    }
}

}

TEST_CASE("pool size must be positive", "[tesseract]") {
    TesseractConfig cfg;
    cfg.poolSize = 0;
    REQUIRE_THROWS_AS(TesseractRecognizer(cfg), std::invalid_argument);
}

TEST_CASE("engines are reused across concurrent calls", "[tesseract]") {
    std::unique_ptr<TesseractRecognizer> reader = englishRecognizer(2);
    if (!reader) SKIP("no eng tessdata installed");

    REQUIRE(reader->idleEngines() == 1);
    REQUIRE(reader->recognize(cv::Mat()).empty());

    cv::Mat blank(40, 120, CV_8UC3, cv::Scalar::all(255));
    std::vector<std::future<std::string>> calls;
    for (int i = 0; i < 6; ++i) {
        calls.push_back(std::async(std::launch::async, [&reader, &blank]() { return reader->recognize(blank); }));
    }
    for (auto& c : calls) REQUIRE(c.get().empty());

    REQUIRE(reader->idleEngines() >= 1);
    REQUIRE(reader->idleEngines() <= 2);
}
