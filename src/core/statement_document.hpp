#ifndef STMTGUARD_CORE_STATEMENT_DOCUMENT_HPP
#define STMTGUARD_CORE_STATEMENT_DOCUMENT_HPP

#include <string>
#include <utility>

/**
 * @file statement_document.hpp
 * @brief The unit of work handed to the text redactor: one extracted statement.
 */

namespace stmtguard {
namespace core {

/**
 * @struct StatementDocument
 * @brief Text extracted from one uploaded statement.
 */
struct StatementDocument
{
    std::string docID;      ///< Fingerprint of the raw content; empty until assigned
    std::string content;    ///< Extracted text, scrubbed in place by TextRedactor::stripPII
    bool scrubbed;          ///< Whether PII has been removed

    StatementDocument()
        : scrubbed(false)
    {}

    explicit StatementDocument(std::string text)
        : content(std::move(text))
        , scrubbed(false)
    {}
};

} // namespace core
} // namespace stmtguard

#endif // STMTGUARD_CORE_STATEMENT_DOCUMENT_HPP
