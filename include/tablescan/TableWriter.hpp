#pragma once
#include <string>
#include <vector>
#include "tablescan/Types.hpp"

namespace tablescan {

using TextGrid = std::vector<std::vector<std::string>>;

// Row-major, one line per row, cells joined by `delimiter`. Delimiters and
// line breaks inside cell text are replaced by spaces.
std::string toDelimited(const Table& table, char delimiter = '|',
                        const std::vector<std::string>& header = {});
std::string toDelimited(const TextGrid& grid, char delimiter = '|',
                        const std::vector<std::string>& header = {});

// Throws std::runtime_error when the file cannot be written.
void writeDelimited(const std::string& path, const Table& table, char delimiter = '|',
                    const std::vector<std::string>& header = {});
void writeDelimited(const std::string& path, const TextGrid& grid, char delimiter = '|',
                    const std::vector<std::string>& header = {});

// Throws std::invalid_argument when rows differ in column count.
TextGrid parseDelimited(const std::string& text, char delimiter = '|');
TextGrid readDelimited(const std::string& path, char delimiter = '|');

// Bullet lists that OCR flattened into one cell ("+ Blancs vifs . Rosés")
// across several paired columns.
struct BulletSplitConfig {
    bool enabled = false;
    std::vector<int> columns;
    std::vector<std::string> markers = {". ", "* ", "+ ", "- "};

    void validate() const;
};

// A row whose listed columns all open with a marker and hold the same number
// of items becomes one row per item, the other columns repeated. Every other
// row, including one too short to hold a listed column, passes through.
TextGrid splitBulletRows(const TextGrid& grid, const std::vector<int>& columns,
                         const std::vector<std::string>& markers);

}
