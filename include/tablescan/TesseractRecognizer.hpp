#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "tablescan/TextRecognizer.hpp"

namespace tesseract {
class TessBaseAPI;
}

namespace tablescan {

struct TesseractConfig {
    std::string language = "fra";
    std::string dataPath;        // empty: Tesseract's default tessdata lookup
    int poolSize = 4;            // engines available to concurrent callers
};

// Single text line first; when that yields nothing the slice most likely holds
// several lines and is read again as a uniform block.
class TesseractRecognizer : public TextRecognizer {
public:
    explicit TesseractRecognizer(const TesseractConfig& config = TesseractConfig());
    ~TesseractRecognizer() override;

    TesseractRecognizer(const TesseractRecognizer&) = delete;
    TesseractRecognizer& operator=(const TesseractRecognizer&) = delete;

    std::string recognize(const cv::Mat& cellImage) const override;

    // Engines parked in the pool, at most poolSize.
    int idleEngines() const;

private:
    struct EngineDeleter {
        void operator()(tesseract::TessBaseAPI* api) const;
    };
    using Engine = std::unique_ptr<tesseract::TessBaseAPI, EngineDeleter>;

    TesseractConfig config_;
    mutable std::mutex poolMutex_;
    mutable std::vector<Engine> idle_;

    Engine createEngine() const;
    Engine acquire() const;
    void release(Engine engine) const;
};

}
