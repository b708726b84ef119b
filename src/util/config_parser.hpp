#ifndef STMTGUARD_UTIL_CONFIG_PARSER_HPP
#define STMTGUARD_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <istream>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include "../../config/redaction_config.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads StmtGuard's key=value configuration into a RedactionConfig.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" style configuration file.
 *   - Extend the keyword table of stmtguard::config::RedactionConfig without
 *     recompiling (address_keyword=..., safe_header=...).
 *   - Header-only, no external libraries.
 *
 * RECOGNIZED KEYS:
 *   address_keyword=<WORD>   (repeatable)
 *   safe_header=<WORD>       (repeatable)
 *   log_level=<DEBUG|INFO|WARN|ERROR>
 *   log_file=<path>
 *
 * USAGE:
 *   @code
 *   stmtguard::config::RedactionConfig cfg;
 *   stmtguard::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("stmtguard.conf");
 *   @endcode
 */

namespace stmtguard {
namespace util {

/**
 * @class ConfigParser
 * @brief Parses a plain text key=value config and updates RedactionConfig fields.
 */
class ConfigParser
{
public:
    explicit ConfigParser(stmtguard::config::RedactionConfig &config)
        : config_(config)
    {
    }

    /**
     * @brief Read the given file. A missing file is logged and leaves the defaults.
     * @return true if the file was found and parsed.
     * @throw std::runtime_error if a line is malformed.
     */
    bool loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            stmtguard::util::logger::warn("ConfigParser: File not found: " + filepath);
            return false;
        }

        stmtguard::util::logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        stmtguard::util::logger::info("ConfigParser: Config loaded.");
        return true;
    }

    /**
     * @brief Parse config text from any stream, line by line.
     * @throw std::runtime_error if a line has no '=' or a value is invalid.
     */
    void loadFromStream(std::istream &in)
    {
        std::string line;
        std::size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);

            // Skip comments (# at line start) or blank lines
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo)
                                         + " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

private:
    stmtguard::config::RedactionConfig &config_;

    void applyKeyValue(const std::string &key, const std::string &val)
    {
        using stmtguard::config::KeywordCategory;

        if (key == "address_keyword") {
            addKeyword(val, KeywordCategory::AddressKeyword);
        }
        else if (key == "safe_header") {
            addKeyword(val, KeywordCategory::SafeHeader);
        }
        else if (key == "log_level") {
            // Validate now so a typo fails at load time, not at first log call.
            stmtguard::util::logger::parseLogLevel(val);
            config_.logLevel = val;
            stmtguard::util::logger::debug("ConfigParser: log_level set to " + val);
        }
        else if (key == "log_file") {
            config_.logFile = val;
            stmtguard::util::logger::debug("ConfigParser: log_file set to " + val);
        }
        else {
            stmtguard::util::logger::warn("ConfigParser: Unrecognized key '" + key + "'");
        }
    }

    void addKeyword(const std::string &val, stmtguard::config::KeywordCategory category)
    {
        if (val.empty()) {
            throw std::runtime_error("ConfigParser: empty keyword value");
        }
        std::string upper(val);
        for (char &c : upper) {
            if (!std::isalnum(static_cast<unsigned char>(c))) {
                throw std::runtime_error("ConfigParser: keyword must be alphanumeric: '" + val + "'");
            }
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        // A later entry re-categorizes an existing keyword.
        config_.keywords[upper] = category;
        stmtguard::util::logger::debug("ConfigParser: keyword " + upper + " added");
    }

    static void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }
};

} // namespace util
} // namespace stmtguard

#endif // STMTGUARD_UTIL_CONFIG_PARSER_HPP
