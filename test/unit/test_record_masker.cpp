// test/unit/test_record_masker.cpp
// -----------------------------------------------------------
// Structured-record masking of merchant and free-text fields.

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/transaction_record.hpp"
#include "redaction/record_masker.hpp"
#include "redaction/redaction_engine.hpp"

namespace {

using stmtguard::core::Category;
using stmtguard::core::TransactionRecord;

TransactionRecord makeRecord(const std::string& merchant, double amount = 245.0) {
    TransactionRecord rec;
    rec.date = "2024-03-15";
    rec.merchant = merchant;
    rec.amount = amount;
    rec.category = Category::Transport;
    rec.isRecurring = false;
    return rec;
}

TEST(RecordMaskerTest, MerchantAccountNumberIsMasked) {
    std::vector<TransactionRecord> records = {makeRecord("UBER *trip 411122223333 4444")};
    std::vector<TransactionRecord> masked = stmtguard::redaction::maskRecords(records);

    ASSERT_EQ(masked.size(), (size_t)1);
    EXPECT_EQ(masked[0].merchant, "UBER *trip XXXX-XXXX-4444");
}

TEST(RecordMaskerTest, InputIsNotMutated) {
    const std::vector<TransactionRecord> records = {makeRecord("CARD 4111-1111-1111-1234")};
    std::vector<TransactionRecord> masked = stmtguard::redaction::maskRecords(records);

    EXPECT_EQ(records[0].merchant, "CARD 4111-1111-1111-1234");
    EXPECT_EQ(masked[0].merchant, "CARD XXXX-XXXX-XXXX-1234");
}

TEST(RecordMaskerTest, OptionalFieldsMaskedOnlyWhenPresent) {
    TransactionRecord rec = makeRecord("AMAZON");
    rec.notes = std::string("refund to 4111 1111 1111 1234");
    rec.memo = std::string("acct 123456789012");

    stmtguard::redaction::RecordMasker masker;
    TransactionRecord out = masker.maskRecord(rec);

    ASSERT_TRUE(out.notes.has_value());
    EXPECT_EQ(*out.notes, "refund to XXXX-XXXX-XXXX-1234");
    EXPECT_FALSE(out.description.has_value());
    ASSERT_TRUE(out.memo.has_value());
    EXPECT_EQ(*out.memo, "acct XXXX-XXXX-9012");
}

TEST(RecordMaskerTest, OtherFieldsPassThrough) {
    TransactionRecord rec = makeRecord("NETFLIX.COM 4111111111111111", -649.0);
    rec.category = Category::Entertainment;
    rec.isRecurring = true;
    rec.description = std::string("Monthly plan");

    TransactionRecord out = stmtguard::redaction::RecordMasker().maskRecord(rec);

    EXPECT_EQ(out.date, "2024-03-15");
    EXPECT_DOUBLE_EQ(out.amount, -649.0);
    EXPECT_EQ(out.category, Category::Entertainment);
    EXPECT_TRUE(out.isRecurring);
    EXPECT_EQ(out.merchant, "NETFLIX.COM XXXX-XXXX-XXXX-1111");
    EXPECT_EQ(*out.description, "Monthly plan");
}

TEST(RecordMaskerTest, CleanRecordsAreUnchanged) {
    std::vector<TransactionRecord> records = {makeRecord("SWIGGY"), makeRecord("ZOMATO 649.00")};
    EXPECT_EQ(stmtguard::redaction::maskRecords(records), records);
    EXPECT_TRUE(stmtguard::redaction::maskRecords({}).empty());
}

TEST(RecordMaskerTest, MaskingTwiceIsIdempotent) {
    std::vector<TransactionRecord> records = {
        makeRecord("UBER *trip 411122223333 4444"),
        makeRecord("CARD 4111-1111-1111-1234"),
        makeRecord("IMPS 123456789012345 RAHUL"),
        makeRecord("SWIGGY"),
    };
    records[2].notes = std::string("ref 5500 0000 0000 0004");

    std::vector<TransactionRecord> once = stmtguard::redaction::maskRecords(records);
    std::vector<TransactionRecord> twice = stmtguard::redaction::maskRecords(once);
    EXPECT_EQ(once, twice);
}

TEST(RecordMaskerTest, EngineExposesAccountMask) {
    EXPECT_EQ(stmtguard::redaction::defaultEngine().maskAccountNumber("4111 1111 1111 1234"),
              "XXXX-XXXX-XXXX-1234");
}

}  // namespace
