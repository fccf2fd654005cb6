#include "tablescan/TableWriter.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tablescan {

namespace {

std::string sanitize(const std::string& s, char delimiter) {
    std::string out = s;
    for (auto& c : out) {
        if (c == delimiter || c == '\n' || c == '\r') c = ' ';
    }
    return out;
}

void appendLine(std::string& out, const std::vector<std::string>& cells, char delimiter) {
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) out.push_back(delimiter);
        out += sanitize(cells[i], delimiter);
    }
    out.push_back('\n');
}

std::string trimmed(const std::string& s) {
    size_t a = s.find_first_not_of(" \t");
    if (a == std::string::npos) return std::string();
    size_t b = s.find_last_not_of(" \t");
    return s.substr(a, b - a + 1);
}

size_t markerLengthAt(const std::string& text, size_t pos, const std::vector<std::string>& markers) {
    for (const auto& m : markers) {
        if (!m.empty() && text.compare(pos, m.size(), m) == 0) return m.size();
    }
    return 0;
}

// Text following each marker. Empty when the cell does not open with a marker.
std::vector<std::string> bulletItems(const std::string& text, const std::vector<std::string>& markers) {
    std::vector<std::string> items;
    size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos || markerLengthAt(text, first, markers) == 0) return items;

    size_t pos = first;
    size_t itemStart = std::string::npos;
    while (pos < text.size()) {
        size_t len = markerLengthAt(text, pos, markers);
        if (len == 0) {
            ++pos;
            continue;
        }
        if (itemStart != std::string::npos) items.push_back(trimmed(text.substr(itemStart, pos - itemStart)));
        pos += len;
        itemStart = pos;
    }
    items.push_back(trimmed(text.substr(itemStart)));
    return items;
}

}

std::string toDelimited(const TextGrid& grid, char delimiter, const std::vector<std::string>& header) {
    if (delimiter == '\n' || delimiter == '\r') throw std::invalid_argument("delimiter cannot be a line break");

    size_t columns = grid.empty() ? header.size() : grid.front().size();
    if (!header.empty() && header.size() != columns) {
        throw std::invalid_argument("header has " + std::to_string(header.size()) +
                                    " names for " + std::to_string(columns) + " columns");
    }

    std::string out;
    if (!header.empty()) appendLine(out, header, delimiter);
    for (const auto& row : grid) {
        if (row.size() != columns) throw std::invalid_argument("rows differ in column count");
        appendLine(out, row, delimiter);
    }
    return out;
}

std::string toDelimited(const Table& table, char delimiter, const std::vector<std::string>& header) {
    return toDelimited(table.texts(), delimiter, header);
}

void writeDelimited(const std::string& path, const TextGrid& grid, char delimiter,
                    const std::vector<std::string>& header) {
    std::string text = toDelimited(grid, delimiter, header);
    std::ofstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + path + " for writing");
    f << text;
    if (!f) throw std::runtime_error("failed writing " + path);
}

void writeDelimited(const std::string& path, const Table& table, char delimiter,
                    const std::vector<std::string>& header) {
    writeDelimited(path, table.texts(), delimiter, header);
}

TextGrid parseDelimited(const std::string& text, char delimiter) {
    TextGrid grid;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() && in.eof()) break;

        std::vector<std::string> row;
        size_t start = 0;
        while (true) {
            size_t pos = line.find(delimiter, start);
            if (pos == std::string::npos) {
                row.push_back(line.substr(start));
                break;
            }
            row.push_back(line.substr(start, pos - start));
            start = pos + 1;
        }

        if (!grid.empty() && row.size() != grid.front().size()) {
            throw std::invalid_argument("line " + std::to_string(grid.size() + 1) + " has " +
                                        std::to_string(row.size()) + " cells, expected " +
                                        std::to_string(grid.front().size()));
        }
        grid.push_back(std::move(row));
    }
    return grid;
}

TextGrid readDelimited(const std::string& path, char delimiter) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return parseDelimited(ss.str(), delimiter);
}

void BulletSplitConfig::validate() const {
    if (!enabled) return;
    if (columns.empty()) throw std::invalid_argument("bullets: columns must name at least one column");
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] < 0) throw std::invalid_argument("bullets: column indices must not be negative");
        for (size_t j = 0; j < i; ++j) {
            if (columns[j] == columns[i]) throw std::invalid_argument("bullets: column listed twice");
        }
    }
    if (markers.empty()) throw std::invalid_argument("bullets: markers must not be empty");
    for (const auto& m : markers) {
        if (m.empty()) throw std::invalid_argument("bullets: empty marker");
    }
}

TextGrid splitBulletRows(const TextGrid& grid, const std::vector<int>& columns,
                         const std::vector<std::string>& markers) {
    TextGrid out;
    for (const auto& row : grid) {
        std::vector<std::vector<std::string>> lists;
        bool split = !columns.empty() && !markers.empty();
        for (size_t k = 0; split && k < columns.size(); ++k) {
            int c = columns[k];
            if (c < 0 || c >= static_cast<int>(row.size())) {
                split = false;
                break;
            }
            lists.push_back(bulletItems(row[c], markers));
            if (lists.back().empty() || lists.back().size() != lists.front().size()) split = false;
        }

        if (!split) {
            out.push_back(row);
            continue;
        }
        for (size_t i = 0; i < lists.front().size(); ++i) {
            std::vector<std::string> expanded = row;
            for (size_t k = 0; k < columns.size(); ++k) expanded[columns[k]] = lists[k][i];
            out.push_back(std::move(expanded));
        }
    }
    return out;
}

}
