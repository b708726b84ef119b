#ifndef STMTGUARD_REDACTION_TEXT_REDACTOR_HPP
#define STMTGUARD_REDACTION_TEXT_REDACTOR_HPP

#include <string>
#include <regex>
#include <memory>
#include <sstream>
#include <utility>
#include "redaction_patterns.hpp"
#include "line_classifier.hpp"
#include "number_masking.hpp"
#include "../core/statement_document.hpp"
#include "../util/hashing.hpp"
#include "../util/logger.hpp"

/**
 * @file text_redactor.hpp
 * @brief Removes PII from extracted statement text before it leaves the process.
 *
 * PIPELINE (per line, in this order):
 *   1. Global rules, every line: emails, then long digit runs.
 *   2. Transaction check: a line with a date and a two-decimal amount is emitted now.
 *   3. Targeted substitutions, non-transaction lines only: PIN, phone, then the
 *      "Name:" / "Name ALL CAPS" / "Address:" header fields.
 *   4. Final class of the substituted line: AddressLine (keyword), NameCandidate
 *      (all-caps block) or Plain. AddressLine and NameCandidate lines are replaced
 *      whole by their placeholder.
 *
 * Lines are split on '\n'. A trailing '\r' is kept out of the rules and put back, so
 * CRLF text round-trips with its line endings.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace stmtguard::redaction;
 *   auto patterns = std::make_shared<const RedactionPatterns>(config::RedactionConfig());
 *   TextRedactor redactor(patterns);
 *
 *   std::string safe = redactor.scrub(extractedText);
 *
 *   core::StatementDocument doc(extractedText);
 *   redactor.stripPII(doc);   // doc.scrubbed == true, doc.docID is the fingerprint
 *   @endcode
 */

namespace stmtguard {
namespace redaction {

/**
 * @struct ScrubReport
 * @brief What one scrub call did: lines per class and hits per substitution rule.
 */
struct ScrubReport
{
    std::size_t lines = 0;
    std::size_t transactionLines = 0;
    std::size_t addressLines = 0;
    std::size_t nameCandidateLines = 0;
    std::size_t plainLines = 0;

    std::size_t emails = 0;
    std::size_t longNumbers = 0;
    std::size_t pins = 0;
    std::size_t phones = 0;
    std::size_t headerNames = 0;
    std::size_t headerAddresses = 0;

    void countLine(LineClass cls)
    {
        ++lines;
        switch (cls) {
            case LineClass::Transaction:   ++transactionLines; break;
            case LineClass::AddressLine:   ++addressLines; break;
            case LineClass::NameCandidate: ++nameCandidateLines; break;
            case LineClass::Plain:         ++plainLines; break;
        }
    }

    /// Placeholders written, whole-line replacements included.
    std::size_t totalRedactions() const
    {
        return emails + longNumbers + pins + phones + headerNames + headerAddresses +
               addressLines + nameCandidateLines;
    }

    std::string summary() const
    {
        std::ostringstream ss;
        ss << lines << " line(s): "
           << transactionLines << " transaction, "
           << addressLines << " address, "
           << nameCandidateLines << " name-candidate, "
           << plainLines << " plain; redactions: "
           << "email=" << emails
           << " number=" << longNumbers
           << " pin=" << pins
           << " phone=" << phones
           << " name=" << headerNames
           << " address=" << headerAddresses;
        return ss.str();
    }
};

struct ScrubResult
{
    std::string text;
    ScrubReport report;
};

/**
 * @class TextRedactor
 * @brief Line-classifying PII scrubber for raw statement text. Stateless between
 *        calls; safe to share across threads.
 */
class TextRedactor
{
public:
    explicit TextRedactor(std::shared_ptr<const RedactionPatterns> patterns)
        : patterns_(patterns)
        , classifier_(std::move(patterns))
    {
    }

    /**
     * @brief Scrub a whole document. Empty input gives empty output. Never throws
     *        on any input text.
     */
    std::string scrub(const std::string &text) const
    {
        return scrubWithReport(text).text;
    }

    /**
     * @brief Same output as scrub(), plus counts of what was done.
     */
    ScrubResult scrubWithReport(const std::string &text) const
    {
        ScrubResult result;
        if (text.empty()) {
            return result;
        }
        result.text.reserve(text.size());

        std::size_t start = 0;
        while (true) {
            std::size_t nl = text.find('\n', start);
            std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);

            bool cr = !line.empty() && line.back() == '\r';
            if (cr) {
                line.pop_back();
            }
            result.text += scrubLine(std::move(line), result.report);
            if (cr) {
                result.text += '\r';
            }

            if (nl == std::string::npos) {
                break;
            }
            result.text += '\n';
            start = nl + 1;
        }
        return result;
    }

    /**
     * @brief Final class of one line as the pipeline would see it (global rules applied).
     */
    LineClass classifyLine(const std::string &line) const
    {
        ScrubReport ignored;
        std::string working = applyGlobalRules(line, ignored);
        if (classifier_.isTransaction(working)) {
            return LineClass::Transaction;
        }
        applySubstitutions(working, ignored);
        return classifier_.classifyScrubbed(working);
    }

    /**
     * @brief Strip PII from a StatementDocument in place. Assigns docID from the raw
     *        content if it is empty, and marks the document scrubbed.
     * @return What the scrub did.
     * @throw std::runtime_error if the fingerprint cannot be computed.
     */
    ScrubReport stripPII(core::StatementDocument &doc) const
    {
        if (doc.docID.empty()) {
            doc.docID = util::hashing::documentFingerprint(doc.content);
        }

        ScrubResult result = scrubWithReport(doc.content);
        doc.content = std::move(result.text);
        doc.scrubbed = true;

        util::logger::debug("TextRedactor: docID=" + doc.docID + " " + result.report.summary());
        return result.report;
    }

private:
    std::string applyGlobalRules(const std::string &line, ScrubReport &report) const
    {
        std::string out = line;
        report.emails += replaceAroundAnchor(out, '@', patterns_->email, placeholder::kEmail,
                                             kEmailLocalMax, kEmailDomainMax);
        return redactLongNumbers(out, &report.longNumbers);
    }

    void applySubstitutions(std::string &line, ScrubReport &report) const
    {
        const std::string keepPrefix = "$1";
        report.pins += replaceCounting(line, patterns_->pin, keepPrefix + placeholder::kPin);
        report.phones += replaceCounting(line, patterns_->phone, keepPrefix + placeholder::kPhone);
        report.headerNames += replaceCounting(line, patterns_->nameWithColon, keepPrefix + placeholder::kName);
        report.headerNames += replaceCounting(line, patterns_->nameUpperRun, keepPrefix + placeholder::kName);
        report.headerAddresses += redactAddressValue(line);
    }

    std::size_t redactAddressValue(std::string &line) const
    {
        std::size_t labelEnd = 0;
        if (!searchBounded(line, patterns_->addressLabel, &labelEnd)) {
            return 0;
        }
        std::size_t value = line.find_first_not_of(" \t\f\v", labelEnd);
        if (value == std::string::npos) {
            return 0;
        }
        line.replace(value, std::string::npos, placeholder::kAddress);
        return 1;
    }

    std::string scrubLine(std::string line, ScrubReport &report) const
    {
        line = applyGlobalRules(line, report);

        if (classifier_.isTransaction(line)) {
            report.countLine(LineClass::Transaction);
            return line;
        }

        applySubstitutions(line, report);

        LineClass cls = classifier_.classifyScrubbed(line);
        report.countLine(cls);
        switch (cls) {
            case LineClass::AddressLine:   return placeholder::kAddressLine;
            case LineClass::NameCandidate: return placeholder::kNameCandidate;
            default:                       return line;
        }
    }

    std::shared_ptr<const RedactionPatterns> patterns_;
    LineClassifier classifier_;
};

} // namespace redaction
} // namespace stmtguard

#endif // STMTGUARD_REDACTION_TEXT_REDACTOR_HPP
