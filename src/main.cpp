#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include "config/redaction_config.hpp"
#include "core/statement_document.hpp"
#include "redaction/redaction_engine.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--config=<file>] [--log-level=<level>] [--report] [<input>|-]\n"
              << "Reads statement text from <input> (stdin if omitted or '-'),\n"
              << "writes the PII-scrubbed text to stdout.\n";
}

std::string readAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

int main(int argc, char** argv) {
    namespace logger = stmtguard::util::logger;

    std::string configPath;
    std::string inputPath = "-";
    std::string logLevelOverride;
    bool printReport = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--config=", 0) == 0) {
            configPath = arg.substr(std::string("--config=").size());
        } else if (arg.rfind("--log-level=", 0) == 0) {
            logLevelOverride = arg.substr(std::string("--log-level=").size());
        } else if (arg == "--report") {
            printReport = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        } else {
            inputPath = arg;
        }
    }

    try {
        // 1. Configuration
        stmtguard::config::RedactionConfig config;
        if (!configPath.empty()) {
            stmtguard::util::ConfigParser parser(config);
            parser.loadFromFile(configPath);
        }
        if (!logLevelOverride.empty()) {
            config.logLevel = logLevelOverride;
        }
        logger::setLogLevel(logger::parseLogLevel(config.logLevel));
        if (!config.logFile.empty() && !logger::enableFileOutput(config.logFile, true)) {
            logger::warn("[main] Logging to stderr only");
        }

        // 2. Compile the rule set before touching any input
        stmtguard::redaction::RedactionEngine engine(config);

        // 3. Read the document
        stmtguard::core::StatementDocument doc;
        if (inputPath == "-") {
            doc.content = readAll(std::cin);
        } else {
            std::ifstream in(inputPath, std::ios::binary);
            if (!in.is_open()) {
                logger::error("[main] Cannot open input file: " + inputPath);
                return 1;
            }
            doc.content = readAll(in);
        }

        // 4. Scrub and emit
        stmtguard::redaction::ScrubReport report = engine.stripPII(doc);

        std::cout << doc.content;
        std::cout.flush();

        logger::info("[main] Scrubbed document " + doc.docID + " (" +
                     std::to_string(report.totalRedactions()) + " redaction(s))");
        if (printReport) {
            std::cerr << report.summary() << "\n";
        }
    } catch (const std::exception& ex) {
        logger::error(std::string("[main] ") + ex.what());
        return 1;
    }

    return 0;
}
