#include <opencv2/imgcodecs.hpp>
#include "tablescan/Config.hpp"
#include "tablescan/Log.hpp"
#include "tablescan/Pipeline.hpp"
#include "tablescan/TableWriter.hpp"
#include "tablescan/TesseractRecognizer.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace std;
using namespace tablescan;

/* =========================================================
   HELPERS
   ========================================================= */
static void printUsage(const char* argv0) {
    cerr << "Usage: " << argv0 << " [options] <image> [image...]\n"
         << "  --config <file>       YAML/JSON pipeline configuration\n"
         << "  --dump-config <file>  write the effective configuration and exit\n"
         << "  --out-dir <dir>       where <image>.csv files go (default: outputs)\n"
         << "  --delimiter <c>       cell delimiter (default: |)\n"
         << "  --header <a|b|c>      column names, split on the delimiter\n"
         << "  --split-bullets <i,j> split bullet lists in these columns into rows\n"
         << "  --lang <code>         Tesseract language (default: fra)\n"
         << "  --tessdata <dir>      Tesseract data directory\n"
         << "  --debug-dir <dir>     store intermediate images of every stage\n"
         << "  --verbose             debug logging\n";
}

static vector<string> splitOn(const string& s, char delim) {
    vector<string> out;
    stringstream ss(s);
    string tok;
    while (getline(ss, tok, delim)) out.push_back(tok);
    return out;
}

static string sanitizeName(string name) {
    for (auto& c : name) {
        if (c == '/' || c == '\\' || c == ' ') c = '_';
    }
    return name;
}

static void storeDebugImages(const fs::path& dir, const string& stem, const DebugImages& images) {
    fs::create_directories(dir);
    int idx = 0;
    for (const auto& kv : images) {
        ostringstream name;
        name << stem << "_" << (idx < 10 ? "0" : "") << idx++ << "_" << sanitizeName(kv.first) << ".png";
        fs::path p = dir / name.str();
        if (!cv::imwrite(p.string(), kv.second)) {
            cerr << "Failed to write debug image: " << p.string() << endl;
        }
    }
}

/* =========================================================
   MAIN
   ========================================================= */
int main(int argc, char** argv) {
    try {
        string configPath, dumpPath, outDir = "outputs", debugDir, header, delimiterArg, bulletColumns;
        TesseractConfig tess;
        vector<string> images;

        for (int i = 1; i < argc; ++i) {
            string arg = argv[i];
            auto value = [&](const char* name) -> string {
                if (i + 1 >= argc) throw invalid_argument(string(name) + " needs a value");
                return argv[++i];
            };

            if (arg == "--config") configPath = value("--config");
            else if (arg == "--dump-config") dumpPath = value("--dump-config");
            else if (arg == "--out-dir") outDir = value("--out-dir");
            else if (arg == "--delimiter") delimiterArg = value("--delimiter");
            else if (arg == "--header") header = value("--header");
            else if (arg == "--split-bullets") bulletColumns = value("--split-bullets");
            else if (arg == "--lang") tess.language = value("--lang");
            else if (arg == "--tessdata") tess.dataPath = value("--tessdata");
            else if (arg == "--debug-dir") debugDir = value("--debug-dir");
            else if (arg == "--verbose") setLogLevel(LogLevel::Debug);
            else if (arg == "-h" || arg == "--help") { printUsage(argv[0]); return 0; }
            else if (!arg.empty() && arg[0] == '-') throw invalid_argument("unknown option " + arg);
            else images.push_back(arg);
        }

        PipelineConfig config = configPath.empty() ? PipelineConfig() : loadConfig(configPath);
        if (!delimiterArg.empty()) {
            if (delimiterArg.size() != 1) throw invalid_argument("--delimiter takes a single character");
            config.delimiter = delimiterArg[0];
        }
        if (!debugDir.empty()) config.debug = true;
        if (!bulletColumns.empty()) {
            config.bullets.enabled = true;
            config.bullets.columns.clear();
            for (const auto& tok : splitOn(bulletColumns, ',')) config.bullets.columns.push_back(stoi(tok));
        }
        config.validate();

        if (!dumpPath.empty()) {
            saveConfig(dumpPath, config);
            cout << "Configuration written to " << dumpPath << "\n";
            return 0;
        }

        if (images.empty()) {
            printUsage(argv[0]);
            return 2;
        }

        vector<string> columnNames = header.empty() ? vector<string>() : splitOn(header, config.delimiter);

        tess.poolSize = config.cells.recognitionThreads;
        TesseractRecognizer recognizer(tess);
        TablePipeline pipeline(config, recognizer);

        fs::create_directories(outDir);
        int failures = 0;

        vector<string> stems = uniqueOutputStems(images);
        vector<BatchOutcome> outcomes = pipeline.processBatch(images);

        for (size_t i = 0; i < outcomes.size(); ++i) {
            const BatchOutcome& outcome = outcomes[i];
            const string& stem = stems[i];
            if (stem != fs::path(outcome.imageId).stem().string()) {
                cerr << "Output name clash: " << outcome.imageId << " is written as " << stem << ".csv\n";
            }
            if (!outcome.ok) {
                cerr << "FAILED " << outcome.imageId << ": " << outcome.error << "\n";
                ++failures;
                continue;
            }

            const Table& table = outcome.result.table;
            if (!columnNames.empty() && static_cast<int>(columnNames.size()) != table.columnCount()) {
                cerr << "Header ignored for " << outcome.imageId << ": " << columnNames.size()
                     << " names, " << table.columnCount() << " columns\n";
            }
            const vector<string>& names =
                static_cast<int>(columnNames.size()) == table.columnCount() ? columnNames : vector<string>();

            fs::path csv = fs::path(outDir) / (stem + ".csv");
            writeDelimited(csv.string(), outcome.result.rows, config.delimiter, names);
            cout << outcome.imageId << " -> " << csv.string() << " (" << outcome.result.rows.size() << " rows, "
                 << table.columnCount() << " columns)\n";

            if (!debugDir.empty()) storeDebugImages(debugDir, stem, outcome.result.debug);
        }

        return failures == 0 ? 0 : 1;
    } catch (const exception& ex) {
        cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
