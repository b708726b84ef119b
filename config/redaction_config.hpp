#ifndef STMTGUARD_CONFIG_REDACTION_CONFIG_HPP
#define STMTGUARD_CONFIG_REDACTION_CONFIG_HPP

#include <string>
#include <map>
#include <vector>

/**
 * @file redaction_config.hpp
 * @brief Defines the configurable data behind the StmtGuard redaction engine.
 *
 * USAGE:
 *   - This struct can be populated either manually or through config_parser.hpp
 *   - Holds the keyword table (address keywords, safe headers) and logging settings.
 *   - The algorithm never hardcodes keywords; it compiles whatever is in the table.
 */

namespace stmtguard {
namespace config {

/**
 * @enum KeywordCategory
 * @brief What a keyword means to the line classifier.
 *   - AddressKeyword: whole-word presence forces full-line address redaction.
 *   - SafeHeader: whole-word presence exempts a line from the name-candidate heuristic.
 */
enum class KeywordCategory {
    AddressKeyword,
    SafeHeader
};

/// Upper-case keyword -> category.
using KeywordTable = std::map<std::string, KeywordCategory>;

/**
 * @brief Built-in keyword table used when no configuration adds to it.
 */
inline KeywordTable defaultKeywordTable()
{
    static const char* const addressKeywords[] = {
        "ROAD", "RD", "NAGAR", "SECTOR", "COLONY", "LANE", "STREET", "PO",
        "DIST", "DISTRICT", "MARG", "CHOWK", "VIHAR", "ENCLAVE", "APARTMENT",
        "APARTMENTS", "APT", "FLAT", "FLOOR", "BLOCK", "PHASE", "VILLAGE",
        "TALUK", "TEHSIL", "SOCIETY", "LAYOUT", "NEAR", "OPP", "PINCODE",
        "HOUSE", "BUILDING", "PLOT", "CROSS", "MOHALLA", "BAZAR", "TOWNSHIP"
    };
    static const char* const safeHeaders[] = {
        "STATEMENT", "AMOUNT", "BALANCE", "CARD", "BANK", "TOTAL", "DATE",
        "TRANSACTION", "TRANSACTIONS", "DESCRIPTION", "CREDIT", "DEBIT",
        "PAYMENT", "PAYMENTS", "DUE", "MINIMUM", "LIMIT", "ACCOUNT", "SUMMARY",
        "REWARD", "REWARDS", "POINTS", "INTEREST", "CHARGES", "FEE", "FEES",
        "PAGE", "OPENING", "CLOSING", "PREVIOUS", "PURCHASES", "CASH",
        "AVAILABLE", "DETAILS", "REFERENCE", "GST", "TAX", "DR", "CR",
        "INR", "USD", "CUSTOMER", "CARE", "IMPORTANT", "MESSAGE"
    };

    KeywordTable table;
    for (const char* kw : addressKeywords) {
        table[kw] = KeywordCategory::AddressKeyword;
    }
    for (const char* kw : safeHeaders) {
        table[kw] = KeywordCategory::SafeHeader;
    }
    return table;
}

/**
 * @struct RedactionConfig
 * @brief Holds everything that can be tuned without touching the algorithm:
 *   - keywords: keyword -> category table (address keywords, safe headers).
 *   - logLevel: minimal log level name ("DEBUG", "INFO", ...).
 *   - logFile: optional log file path; empty means console only.
 */
struct RedactionConfig
{
    RedactionConfig()
        : keywords(defaultKeywordTable()),
          logLevel("INFO")
    {
    }

    /// Keyword table compiled by the engine.
    KeywordTable keywords;

    /// Name of the minimal log level.
    std::string logLevel;

    /// If non-empty, logs are also appended to this file.
    std::string logFile;

    /**
     * @brief All keywords of one category, in table order.
     */
    std::vector<std::string> keywordsOf(KeywordCategory category) const
    {
        std::vector<std::string> out;
        for (const auto &entry : keywords) {
            if (entry.second == category) {
                out.push_back(entry.first);
            }
        }
        return out;
    }
};

} // namespace config
} // namespace stmtguard

#endif // STMTGUARD_CONFIG_REDACTION_CONFIG_HPP
