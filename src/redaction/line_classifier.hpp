#ifndef STMTGUARD_REDACTION_LINE_CLASSIFIER_HPP
#define STMTGUARD_REDACTION_LINE_CLASSIFIER_HPP

#include <string>
#include <sstream>
#include <regex>
#include <memory>
#include <utility>
#include <cctype>
#include <stdexcept>
#include "redaction_patterns.hpp"

/**
 * @file line_classifier.hpp
 * @brief Decides what a single statement line is.
 *
 * A line is classified twice by the redactor:
 *   1. isTransaction() on the line after the global rules. Transaction lines are
 *      final and get no further scrubbing.
 *   2. classifyScrubbed() on a non-transaction line after the targeted substitutions
 *      (PIN, phone, header fields). Address keywords win over the name heuristic.
 */

namespace stmtguard {
namespace redaction {

enum class LineClass {
    Transaction,
    AddressLine,
    NameCandidate,
    Plain
};

inline const char* lineClassName(LineClass cls)
{
    switch (cls) {
        case LineClass::Transaction:   return "Transaction";
        case LineClass::AddressLine:   return "AddressLine";
        case LineClass::NameCandidate: return "NameCandidate";
        case LineClass::Plain:         return "Plain";
    }
    return "Plain";
}

/**
 * @struct TokenCounts
 * @brief Inputs of the name-candidate heuristic.
 *   - upper: tokens made only of letters, all of them upper case.
 *   - total: all non-empty whitespace-separated tokens.
 */
struct TokenCounts
{
    std::size_t upper = 0;
    std::size_t total = 0;
};

inline std::string toUpper(const std::string &s)
{
    std::string out(s);
    for (char &c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

inline TokenCounts countTokens(const std::string &line)
{
    TokenCounts counts;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        ++counts.total;
        bool allUpperAlpha = true;
        for (char c : token) {
            unsigned char uc = static_cast<unsigned char>(c);
            if (!std::isalpha(uc) || !std::isupper(uc)) {
                allUpperAlpha = false;
                break;
            }
        }
        if (allUpperAlpha) {
            ++counts.upper;
        }
    }
    return counts;
}

/**
 * @class LineClassifier
 * @brief Applies the classification half of the rule pipeline to one line.
 */
class LineClassifier
{
public:
    /// Minimum number of all-caps words before a line can be a name candidate.
    static constexpr std::size_t kMinUpperTokens = 2;

    explicit LineClassifier(std::shared_ptr<const RedactionPatterns> patterns)
        : patterns_(std::move(patterns))
    {
        if (!patterns_) {
            throw std::runtime_error("LineClassifier: null pattern set");
        }
    }

    /**
     * @brief A transaction line holds both a date and a two-decimal amount.
     */
    bool isTransaction(const std::string &line) const
    {
        return searchBounded(line, patterns_->date) && searchBounded(line, patterns_->amount);
    }

    bool hasAddressKeyword(const std::string &line) const
    {
        return patterns_->addressKeyword && searchBounded(toUpper(line), *patterns_->addressKeyword);
    }

    bool hasSafeHeader(const std::string &line) const
    {
        return patterns_->safeHeader && searchBounded(toUpper(line), *patterns_->safeHeader);
    }

    /**
     * @brief Upper-case name block: no safe header, at least two all-caps words,
     *        and all-caps words make up at least 80% of the tokens.
     */
    bool isNameCandidate(const std::string &line) const
    {
        if (hasSafeHeader(line)) {
            return false;
        }
        TokenCounts counts = countTokens(line);
        if (counts.total == 0 || counts.upper < kMinUpperTokens) {
            return false;
        }
        // upper >= 0.8 * total, kept in integers
        return counts.upper * 5 >= counts.total * 4;
    }

    /**
     * @brief Final class of a non-transaction line whose targeted substitutions
     *        have already been applied.
     */
    LineClass classifyScrubbed(const std::string &line) const
    {
        if (hasAddressKeyword(line)) {
            return LineClass::AddressLine;
        }
        if (isNameCandidate(line)) {
            return LineClass::NameCandidate;
        }
        return LineClass::Plain;
    }

private:
    std::shared_ptr<const RedactionPatterns> patterns_;
};

} // namespace redaction
} // namespace stmtguard

#endif // STMTGUARD_REDACTION_LINE_CLASSIFIER_HPP
