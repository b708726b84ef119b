#ifndef STMTGUARD_REDACTION_REDACTION_PATTERNS_HPP
#define STMTGUARD_REDACTION_REDACTION_PATTERNS_HPP

#include <string>
#include <vector>
#include <regex>
#include <optional>
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <cctype>
#include <cstddef>
#include "../../config/redaction_config.hpp"

/**
 * @file redaction_patterns.hpp
 * @brief The compiled regular expressions behind every redaction rule.
 *
 * DESIGN GOALS:
 *   - Compile everything exactly once, in the constructor. A RedactionPatterns
 *     object is never modified afterwards, so one instance can be shared by any
 *     number of threads without locking.
 *   - Keyword patterns are derived from the configured KeywordTable, not hardcoded.
 *
 * Every pattern is applied through searchBounded() / replaceCounting(), which feed
 * std::regex at most kRegexWindow characters at a time: its matcher recurses once
 * per repeated character and overflows the stack on very long lines. Emails are
 * searched only around each '@' (replaceAroundAnchor()).
 *
 * "Standalone" numeric tokens (PIN, phone) may not touch a word character, and may
 * not be the integer part of a decimal ("123456.78") or the tail of one ("0.123456").
 */

namespace stmtguard {
namespace redaction {

namespace placeholder {
constexpr const char* kEmail = "[REDACTED_EMAIL]";
constexpr const char* kPin = "[REDACTED_PIN]";
constexpr const char* kPhone = "[REDACTED_PHONE]";
constexpr const char* kName = "[REDACTED_NAME]";
constexpr const char* kAddress = "[REDACTED_ADDRESS]";
constexpr const char* kAddressLine = "[REDACTED_ADDRESS_LINE]";
constexpr const char* kNameCandidate = "[REDACTED_NAME_CANDIDATE]";
} // namespace placeholder

/**
 * @brief Build "\b(?:KW1|KW2|...)\b" from a keyword list.
 * @throw std::runtime_error if a keyword is empty or not alphanumeric.
 */
inline std::string buildKeywordAlternation(const std::vector<std::string> &keywords)
{
    std::string pattern = R"(\b(?:)";
    bool first = true;
    for (const auto &kw : keywords) {
        if (kw.empty()) {
            throw std::runtime_error("RedactionPatterns: empty keyword in keyword table");
        }
        for (char c : kw) {
            if (!std::isalnum(static_cast<unsigned char>(c))) {
                throw std::runtime_error("RedactionPatterns: keyword must be alphanumeric: '" + kw + "'");
            }
        }
        if (!first) {
            pattern += "|";
        }
        pattern += kw;
        first = false;
    }
    pattern += R"()\b)";
    return pattern;
}

/// Longest stretch of text handed to std::regex in one call.
constexpr std::size_t kRegexWindow = 2048;

/**
 * @brief End of the regex window starting at begin. Long lines are cut after a
 *        blank in the second half of the window, or hard at the window size.
 */
inline std::size_t regexWindowEnd(const std::string &text, std::size_t begin)
{
    if (text.size() - begin <= kRegexWindow) {
        return text.size();
    }
    std::size_t limit = begin + kRegexWindow;
    std::size_t blank = text.find_last_of(" \t", limit - 1);
    if (blank != std::string::npos && blank >= begin + kRegexWindow / 2) {
        return blank + 1;
    }
    return limit;
}

inline std::regex_constants::match_flag_type windowFlags(std::size_t begin)
{
    // Later windows see the character before them, so ^ and \b stay correct.
    return begin > 0 ? std::regex_constants::match_prev_avail : std::regex_constants::match_default;
}

/**
 * @brief regex_search over text in bounded windows.
 * @param matchEnd If non-null and a match is found, receives the offset just past it.
 */
inline bool searchBounded(const std::string &text, const std::regex &re, std::size_t *matchEnd = nullptr)
{
    std::size_t begin = 0;
    do {
        std::size_t end = regexWindowEnd(text, begin);
        std::smatch m;
        if (std::regex_search(text.cbegin() + begin, text.cbegin() + end, m, re, windowFlags(begin))) {
            if (matchEnd != nullptr) {
                *matchEnd = static_cast<std::size_t>(m[0].second - text.cbegin());
            }
            return true;
        }
        begin = end;
    } while (begin < text.size());
    return false;
}

/**
 * @brief Replace every match of re in line with fmt, window by window.
 * @return Number of matches replaced.
 */
inline std::size_t replaceCounting(std::string &line, const std::regex &re, const std::string &fmt)
{
    std::string out;
    out.reserve(line.size());
    std::size_t hits = 0;
    std::size_t begin = 0;
    while (begin < line.size()) {
        std::size_t end = regexWindowEnd(line, begin);
        auto first = line.cbegin() + begin;
        auto last = line.cbegin() + end;
        std::size_t windowHits = static_cast<std::size_t>(std::distance(
            std::sregex_iterator(first, last, re, windowFlags(begin)), std::sregex_iterator()));
        if (windowHits > 0) {
            std::regex_replace(std::back_inserter(out), first, last, re, fmt, windowFlags(begin));
            hits += windowHits;
        }
        else {
            out.append(first, last);
        }
        begin = end;
    }
    if (hits > 0) {
        line.swap(out);
    }
    return hits;
}

/// Longest local part and domain of an address (RFC 5321).
constexpr std::size_t kEmailLocalMax = 64;
constexpr std::size_t kEmailDomainMax = 255;

/**
 * @brief Replace matches of re that contain an anchor character, searching only
 *        the span [anchor - before, anchor + after] around each occurrence.
 * @return Number of matches replaced.
 */
inline std::size_t replaceAroundAnchor(std::string &line, char anchor, const std::regex &re,
                                       const std::string &fmt, std::size_t before, std::size_t after)
{
    std::string out;
    std::size_t copied = 0;
    std::size_t hits = 0;
    std::size_t at = line.find(anchor);
    while (at != std::string::npos) {
        std::size_t begin = std::max(copied, at >= before ? at - before : 0);
        std::size_t end = std::min(line.size(), at + 1 + after);
        std::smatch m;
        if (std::regex_search(line.cbegin() + begin, line.cbegin() + end, m, re, windowFlags(begin))) {
            std::size_t matchBegin = static_cast<std::size_t>(m[0].first - line.cbegin());
            std::size_t matchEnd = static_cast<std::size_t>(m[0].second - line.cbegin());
            out.append(line, copied, matchBegin - copied);
            out += m.format(fmt);
            copied = matchEnd;
            ++hits;
            at = line.find(anchor, std::max(matchEnd, at + 1));
        }
        else {
            at = line.find(anchor, at + 1);
        }
    }
    if (hits > 0) {
        out.append(line, copied, std::string::npos);
        line.swap(out);
    }
    return hits;
}

/**
 * @class RedactionPatterns
 * @brief Immutable, compiled rule set for one keyword configuration.
 */
class RedactionPatterns
{
public:
    explicit RedactionPatterns(const config::RedactionConfig &cfg)
        : email(R"([A-Za-z0-9._%+\-]+@[A-Za-z0-9.\-]+\.[A-Za-z]{2,})")
        , date(R"(\b\d{1,2}[/\-]\d{1,2}[/\-]\d{1,4}\b|\b\d{4}[/\-]\d{2}[/\-]\d{2}\b)")
        , amount(R"(\b\d{1,3}(?:,\d{2,3})+\.\d{2}(?!\d)|\b\d+\.\d{2}(?!\d))")
        , pin(R"((^|[^\w.])\d{6}(?!\w|[.,]\d))")
        , phone(R"((^|[^\w.+])(?:\+?91[ \-]?|0)?[6-9]\d{9}(?!\w|[.,]\d))")
        , nameWithColon(R"((\b(?:[Nn]ame|NAME)\s*:\s*)[A-Z][A-Za-z.'\-]*(?:[ \t]+[A-Z][A-Za-z.'\-]*)*)")
        , nameUpperRun(R"((\b(?:[Nn]ame|NAME)[ \t]+)[A-Z]+(?:[ \t]+[A-Z]+)+\b)")
        , addressLabel(R"(\b(?:[Aa]ddress|ADDRESS)\s*:)")
    {
        std::vector<std::string> addressKeywords = cfg.keywordsOf(config::KeywordCategory::AddressKeyword);
        if (!addressKeywords.empty()) {
            addressKeyword.emplace(buildKeywordAlternation(addressKeywords));
        }
        std::vector<std::string> safeHeaders = cfg.keywordsOf(config::KeywordCategory::SafeHeader);
        if (!safeHeaders.empty()) {
            safeHeader.emplace(buildKeywordAlternation(safeHeaders));
        }
        addressKeywordCount = addressKeywords.size();
        safeHeaderCount = safeHeaders.size();
    }

    // Global rules
    const std::regex email;

    // Transaction classification
    const std::regex date;
    const std::regex amount;

    // Conditional substitutions ($1 is the preserved prefix)
    const std::regex pin;
    const std::regex phone;
    const std::regex nameWithColon;
    const std::regex nameUpperRun;
    // Everything after "Address:" and its blanks is the value.
    const std::regex addressLabel;

    // Keyword tests, run on the upper-cased line. Empty when no keyword is configured.
    std::optional<std::regex> addressKeyword;
    std::optional<std::regex> safeHeader;

    std::size_t addressKeywordCount = 0;
    std::size_t safeHeaderCount = 0;
};

} // namespace redaction
} // namespace stmtguard

#endif // STMTGUARD_REDACTION_REDACTION_PATTERNS_HPP
