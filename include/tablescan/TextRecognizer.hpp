#pragma once
#include <opencv2/core.hpp>
#include <functional>
#include <string>
#include <vector>

namespace tablescan {

// Character recognition for one cell slice. Implementations must allow
// concurrent calls; they may throw, which the caller treats as "no text".
class TextRecognizer {
public:
    virtual ~TextRecognizer() = default;
    virtual std::string recognize(const cv::Mat& cellImage) const = 0;
};

// Adapts a plain callable, mainly for tests and quick wiring.
class FunctionRecognizer : public TextRecognizer {
public:
    using Fn = std::function<std::string(const cv::Mat&)>;

    explicit FunctionRecognizer(Fn fn) : fn_(std::move(fn)) {}

    std::string recognize(const cv::Mat& cellImage) const override { return fn_(cellImage); }

private:
    Fn fn_;
};

// Line breaks become spaces, surrounding whitespace is dropped.
std::string cleanRecognizedText(const std::string& raw);

// Runs the passes in order until one yields non-blank text, which is returned
// cleaned. Later passes are not run.
std::string firstNonEmptyPass(const std::vector<std::function<std::string()>>& passes);

}
