#ifndef STMTGUARD_REDACTION_REDACTION_ENGINE_HPP
#define STMTGUARD_REDACTION_REDACTION_ENGINE_HPP

#include <string>
#include <vector>
#include <memory>
#include "redaction_patterns.hpp"
#include "text_redactor.hpp"
#include "record_masker.hpp"
#include "number_masking.hpp"
#include "../../config/redaction_config.hpp"
#include "../core/statement_document.hpp"
#include "../core/transaction_record.hpp"
#include "../util/logger.hpp"

/**
 * @file redaction_engine.hpp
 * @brief Entry point of StmtGuard: the text redactor and the record masker behind
 *        one immutable, compiled configuration.
 *
 * DESIGN GOALS:
 *   - Compile the rule set once, when the engine is constructed. Nothing is compiled
 *     lazily on a request path.
 *   - One process-wide default engine built from the built-in keyword table.
 *     initializeDefaultEngine() builds it at startup; defaultEngine() relies on
 *     thread-safe static initialization if startup did not.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace stmtguard;
 *
 *   // Startup
 *   redaction::initializeDefaultEngine();
 *
 *   // Before the outbound inference call
 *   std::string prompt = redaction::scrub(extractedText);
 *
 *   // After parsing the provider's response
 *   auto safeRecords = redaction::maskRecords(parsedRecords);
 *   @endcode
 */

namespace stmtguard {
namespace redaction {

/**
 * @class RedactionEngine
 * @brief Owns one compiled RedactionPatterns and the two components built on it.
 */
class RedactionEngine
{
public:
    /**
     * @throw std::runtime_error if a configured keyword is not alphanumeric.
     */
    explicit RedactionEngine(const config::RedactionConfig &cfg)
        : patterns_(std::make_shared<const RedactionPatterns>(cfg))
        , textRedactor_(patterns_)
    {
        util::logger::debug("RedactionEngine: compiled " +
                            std::to_string(patterns_->addressKeywordCount) + " address keyword(s), " +
                            std::to_string(patterns_->safeHeaderCount) + " safe header(s)");
    }

    std::string scrub(const std::string &text) const
    {
        return textRedactor_.scrub(text);
    }

    ScrubResult scrubWithReport(const std::string &text) const
    {
        return textRedactor_.scrubWithReport(text);
    }

    ScrubReport stripPII(core::StatementDocument &doc) const
    {
        return textRedactor_.stripPII(doc);
    }

    LineClass classifyLine(const std::string &line) const
    {
        return textRedactor_.classifyLine(line);
    }

    std::vector<core::TransactionRecord> maskRecords(const std::vector<core::TransactionRecord> &records) const
    {
        return recordMasker_.maskRecords(records);
    }

    std::string maskAccountNumber(const std::string &text) const
    {
        return redaction::maskAccountNumber(text);
    }

private:
    std::shared_ptr<const RedactionPatterns> patterns_;
    TextRedactor textRedactor_;
    RecordMasker recordMasker_;
};

/**
 * @brief The process-wide engine over the built-in keyword table.
 */
inline const RedactionEngine& defaultEngine()
{
    static const RedactionEngine engine{config::RedactionConfig()};
    return engine;
}

/**
 * @brief Build the default engine now, so no request pays for pattern compilation.
 */
inline void initializeDefaultEngine()
{
    (void)defaultEngine();
}

inline std::string scrub(const std::string &text)
{
    return defaultEngine().scrub(text);
}

inline std::vector<core::TransactionRecord> maskRecords(const std::vector<core::TransactionRecord> &records)
{
    return defaultEngine().maskRecords(records);
}

} // namespace redaction
} // namespace stmtguard

#endif // STMTGUARD_REDACTION_REDACTION_ENGINE_HPP
