#ifndef STMTGUARD_REDACTION_RECORD_MASKER_HPP
#define STMTGUARD_REDACTION_RECORD_MASKER_HPP

#include <string>
#include <vector>
#include <optional>
#include "number_masking.hpp"
#include "../core/transaction_record.hpp"
#include "../util/logger.hpp"

namespace stmtguard {
namespace redaction {

/*
  RecordMasker
  --------------------------------
  Re-masks account and card numbers that survive into the structured records
  returned by the inference provider.

  Only free-text fields are touched: merchant, and notes/description/memo when
  present. date, amount, category and isRecurring pass through as they are.
  The input is never modified; masked copies are returned.
*/
class RecordMasker
{
public:
    RecordMasker() = default;

    core::TransactionRecord maskRecord(const core::TransactionRecord &record) const
    {
        std::size_t ignored = 0;
        return maskRecord(record, ignored);
    }

    std::vector<core::TransactionRecord> maskRecords(const std::vector<core::TransactionRecord> &records) const
    {
        std::vector<core::TransactionRecord> masked;
        masked.reserve(records.size());

        std::size_t changedFields = 0;
        for (const auto &record : records) {
            masked.push_back(maskRecord(record, changedFields));
        }

        util::logger::debug("RecordMasker: masked " + std::to_string(changedFields) +
                            " field(s) across " + std::to_string(records.size()) + " record(s)");
        return masked;
    }

private:
    core::TransactionRecord maskRecord(const core::TransactionRecord &record, std::size_t &changedFields) const
    {
        core::TransactionRecord out = record;
        maskField(out.merchant, changedFields);
        maskOptionalField(out.notes, changedFields);
        maskOptionalField(out.description, changedFields);
        maskOptionalField(out.memo, changedFields);
        return out;
    }

    static void maskField(std::string &field, std::size_t &changedFields)
    {
        std::string masked = maskAccountNumber(field);
        if (masked != field) {
            ++changedFields;
            field.swap(masked);
        }
    }

    static void maskOptionalField(std::optional<std::string> &field, std::size_t &changedFields)
    {
        if (field) {
            maskField(*field, changedFields);
        }
    }
};

} // namespace redaction
} // namespace stmtguard

#endif // STMTGUARD_REDACTION_RECORD_MASKER_HPP
