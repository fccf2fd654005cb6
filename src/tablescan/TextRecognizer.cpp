#include "tablescan/TextRecognizer.hpp"
#include <cctype>
#include "tablescan/Log.hpp"

namespace tablescan {

std::string cleanRecognizedText(const std::string& raw) {
    std::string s;
    s.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '\r') {
            s.push_back(' ');
            if (i + 1 < raw.size() && raw[i + 1] == '\n') ++i;
        } else if (c == '\n') {
            s.push_back(' ');
        } else {
            s.push_back(c);
        }
    }

    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
    return s.substr(a, b - a);
}

std::string firstNonEmptyPass(const std::vector<std::function<std::string()>>& passes) {
    for (size_t i = 0; i < passes.size(); ++i) {
        std::string text = cleanRecognizedText(passes[i]());
        if (!text.empty()) return text;
        if (i + 1 < passes.size()) {
            logMessage(LogLevel::Debug, "recognize: pass " + std::to_string(i + 1) + " empty, trying the next");
        }
    }
    return std::string();
}

}
