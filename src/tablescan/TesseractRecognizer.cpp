#include "tablescan/TesseractRecognizer.hpp"
#include <opencv2/imgproc.hpp>
#include <tesseract/baseapi.h>
#include <stdexcept>

namespace tablescan {

void TesseractRecognizer::EngineDeleter::operator()(tesseract::TessBaseAPI* api) const {
    if (!api) return;
    api->End();
    delete api;
}

TesseractRecognizer::TesseractRecognizer(const TesseractConfig& config)
    : config_(config)
{
    if (config_.poolSize < 1) throw std::invalid_argument("tesseract: poolSize must be at least 1");
    // Fail early on a missing language pack instead of on the first cell.
    idle_.push_back(createEngine());
}

TesseractRecognizer::~TesseractRecognizer() = default;

TesseractRecognizer::Engine TesseractRecognizer::createEngine() const {
    Engine api(new tesseract::TessBaseAPI());
    const char* dataPath = config_.dataPath.empty() ? nullptr : config_.dataPath.c_str();
    if (api->Init(dataPath, config_.language.c_str(), tesseract::OEM_DEFAULT) != 0) {
        throw std::runtime_error("tesseract: could not initialise language '" + config_.language + "'");
    }
    return api;
}

TesseractRecognizer::Engine TesseractRecognizer::acquire() const {
    {
        std::lock_guard<std::mutex> lock(poolMutex_);
        if (!idle_.empty()) {
            Engine e = std::move(idle_.back());
            idle_.pop_back();
            return e;
        }
    }
    return createEngine();
}

int TesseractRecognizer::idleEngines() const {
    std::lock_guard<std::mutex> lock(poolMutex_);
    return static_cast<int>(idle_.size());
}

void TesseractRecognizer::release(Engine engine) const {
    std::lock_guard<std::mutex> lock(poolMutex_);
    if (static_cast<int>(idle_.size()) < config_.poolSize) idle_.push_back(std::move(engine));
}

std::string TesseractRecognizer::recognize(const cv::Mat& cellImage) const {
    if (cellImage.empty()) return std::string();

    cv::Mat gray;
    if (cellImage.channels() == 3) cv::cvtColor(cellImage, gray, cv::COLOR_BGR2GRAY);
    else if (cellImage.channels() == 4) cv::cvtColor(cellImage, gray, cv::COLOR_BGRA2GRAY);
    else gray = cellImage;
    if (!gray.isContinuous()) gray = gray.clone();

    Engine api = acquire();

    auto pass = [&](tesseract::PageSegMode mode) {
        return [&api, &gray, mode]() {
            api->SetPageSegMode(mode);
            api->SetImage(gray.data, gray.cols, gray.rows, 1, static_cast<int>(gray.step));
            std::unique_ptr<char[]> raw(api->GetUTF8Text());
            api->Clear();
            return raw ? std::string(raw.get()) : std::string();
        };
    };

    std::string text = firstNonEmptyPass({pass(tesseract::PSM_SINGLE_LINE), pass(tesseract::PSM_SINGLE_BLOCK)});

    release(std::move(api));
    return text;
}

}
