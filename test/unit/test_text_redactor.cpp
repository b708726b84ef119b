// test/unit/test_text_redactor.cpp
// -----------------------------------------------------------
// End-to-end behavior of the raw-text redactor: global rules,
// transaction preservation, targeted substitutions and whole-line
// replacements.

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "config/redaction_config.hpp"
#include "core/statement_document.hpp"
#include "redaction/redaction_engine.hpp"
#include "redaction/text_redactor.hpp"
#include "util/hashing.hpp"

namespace {

using namespace stmtguard;
using redaction::LineClass;

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TEST(TextRedactorTest, EmailIsRedacted) {
    std::string out = redaction::scrub("Contact me at user@example.com for info.");
    EXPECT_TRUE(contains(out, "[REDACTED_EMAIL]"));
    EXPECT_FALSE(contains(out, "user@example.com"));
    EXPECT_EQ(out, "Contact me at [REDACTED_EMAIL] for info.");
}

TEST(TextRedactorTest, CardNumberIsRedacted) {
    std::string out = redaction::scrub("Card: 4111 2222 3333 4444");
    EXPECT_TRUE(contains(out, "[REDACTED_NUM_4444]"));
    EXPECT_FALSE(contains(out, "4111 2222 3333 4444"));
}

TEST(TextRedactorTest, IsoDateIsPreserved) {
    EXPECT_EQ(redaction::scrub("Date: 2024-01-30"), "Date: 2024-01-30");
}

TEST(TextRedactorTest, ShortAmountIsPreserved) {
    EXPECT_EQ(redaction::scrub("Amount: 1234.56"), "Amount: 1234.56");
}

TEST(TextRedactorTest, TransactionLineIsVerbatim) {
    const std::string line = "15/03/2024  UBER TRIP  245.00";
    EXPECT_EQ(redaction::scrub(line), line);
    EXPECT_EQ(redaction::defaultEngine().classifyLine(line), LineClass::Transaction);
}

TEST(TextRedactorTest, TransactionLineSkipsConditionalRules) {
    // A PIN-like and a phone-like token would be redacted on any other line.
    const std::string line = "15/03/2024 PAYTM 9876543210 REF 110001 245.00";
    EXPECT_EQ(redaction::scrub(line), line);
}

TEST(TextRedactorTest, TransactionLineStillGetsGlobalRules) {
    EXPECT_EQ(redaction::scrub("15/03/2024 PAYPAL john@x.com 245.00"),
              "15/03/2024 PAYPAL [REDACTED_EMAIL] 245.00");
    EXPECT_EQ(redaction::scrub("15/03/2024 4111 2222 3333 4444 AMAZON 1,299.00"),
              "15/03/2024 [REDACTED_NUM_4444] AMAZON 1,299.00");
}

TEST(TextRedactorTest, CardAfterPunctuationIsRedacted) {
    EXPECT_EQ(redaction::scrub("Card no.4111 2222 3333 4444"), "Card no.[REDACTED_NUM_4444]");
    EXPECT_EQ(redaction::scrub("Acct/4111 2222 3333 4444"), "Acct/[REDACTED_NUM_4444]");
}

TEST(TextRedactorTest, ShortDashDateLineKeepsDateAndAmount) {
    const std::string line = "5-3-2024 4111222233334444 100.00";
    EXPECT_EQ(redaction::scrub(line), "5-3-2024 [REDACTED_NUM_4444] 100.00");
    EXPECT_EQ(redaction::defaultEngine().classifyLine(line), LineClass::Transaction);
}

TEST(TextRedactorTest, VeryLongLines) {
    const std::string letters(200000, 'a');
    EXPECT_EQ(redaction::scrub(letters), letters);
    EXPECT_EQ(redaction::scrub("Address: " + letters), "Address: [REDACTED_ADDRESS]");

    const std::string prefix(150000, 'b');
    EXPECT_EQ(redaction::scrub(prefix + " user@example.com"), prefix + " [REDACTED_EMAIL]");

    EXPECT_EQ(redaction::scrub(std::string(100000, '7')), "[REDACTED_NUM_7777]");

    // Matches far apart on one line are all found.
    const std::string spaced = "a@b.co " + std::string(5000, 'x') + " 110001 " +
                               std::string(5000, 'y') + " c@d.co";
    const std::string out = redaction::scrub(spaced);
    EXPECT_EQ(out.find("a@b.co"), std::string::npos);
    EXPECT_EQ(out.find("c@d.co"), std::string::npos);
    EXPECT_TRUE(contains(out, " [REDACTED_PIN] "));
}

TEST(TextRedactorTest, PinAndPhone) {
    EXPECT_EQ(redaction::scrub("Delhi - 110001"), "Delhi - [REDACTED_PIN]");
    EXPECT_EQ(redaction::scrub("Mobile: 9876543210"), "Mobile: [REDACTED_PHONE]");
    EXPECT_EQ(redaction::scrub("Call +91 9876543210 now"), "Call [REDACTED_PHONE] now");
    // Starts with 5: not a mobile number.
    EXPECT_EQ(redaction::scrub("Ref 5876543210"), "Ref 5876543210");
    // The integer part of an amount is not a PIN.
    EXPECT_EQ(redaction::scrub("Total Due 123456.78"), "Total Due 123456.78");
}

TEST(TextRedactorTest, HeaderFields) {
    EXPECT_EQ(redaction::scrub("Name: John Doe"), "Name: [REDACTED_NAME]");
    EXPECT_EQ(redaction::scrub("NAME RAHUL SHARMA"), "NAME [REDACTED_NAME]");
    EXPECT_EQ(redaction::scrub("Address: 221B Baker Street"), "Address: [REDACTED_ADDRESS]");
    // Lower-case value after "Name:" is not a capitalized name.
    EXPECT_EQ(redaction::scrub("Name: not available"), "Name: not available");
}

TEST(TextRedactorTest, AddressKeywordReplacesWholeLine) {
    EXPECT_EQ(redaction::scrub("12, MG Road, Bengaluru"), "[REDACTED_ADDRESS_LINE]");
    EXPECT_EQ(redaction::defaultEngine().classifyLine("12, MG Road, Bengaluru"), LineClass::AddressLine);
}

TEST(TextRedactorTest, NameCandidateReplacesWholeLine) {
    EXPECT_EQ(redaction::scrub("RAHUL KUMAR SHARMA"), "[REDACTED_NAME_CANDIDATE]");
    EXPECT_EQ(redaction::scrub("CREDIT CARD STATEMENT"), "CREDIT CARD STATEMENT");
    EXPECT_EQ(redaction::scrub("SHARMA"), "SHARMA");
    EXPECT_EQ(redaction::scrub("Statement Date 15/03/2024"), "Statement Date 15/03/2024");
}

TEST(TextRedactorTest, EmptyInput) {
    EXPECT_EQ(redaction::scrub(""), "");
    EXPECT_EQ(redaction::scrub("\n\n"), "\n\n");
}

TEST(TextRedactorTest, MultiLineDocumentKeepsLineEndings) {
    const std::string input =
        "RAHUL SHARMA\r\n"
        "Flat 12, Sector 4\r\n"
        "15/03/2024 UBER 245.00\r\n";
    const std::string expected =
        "[REDACTED_NAME_CANDIDATE]\r\n"
        "[REDACTED_ADDRESS_LINE]\r\n"
        "15/03/2024 UBER 245.00\r\n";
    EXPECT_EQ(redaction::scrub(input), expected);
}

TEST(TextRedactorTest, StatementDocumentScenario) {
    const std::string input =
        "HDFC BANK CREDIT CARD STATEMENT\n"
        "PRIYA RAMESH IYER\n"
        "Flat 302, Lotus Apartments, Andheri\n"
        "Email: priya.iyer@gmail.com Mobile: 9820012345\n"
        "Card No: 5500 1111 2222 3333\n"
        "Statement Date 2024-03-31\n"
        "Date        Description              Amount\n"
        "01/03/2024  SWIGGY BANGALORE         349.00\n"
        "05/03/2024  AMAZON PAY 4111111111111111  1,299.00\n";

    redaction::ScrubResult result = redaction::defaultEngine().scrubWithReport(input);
    const std::string& out = result.text;

    EXPECT_TRUE(contains(out, "HDFC BANK CREDIT CARD STATEMENT\n"));
    EXPECT_FALSE(contains(out, "PRIYA"));
    EXPECT_FALSE(contains(out, "Lotus"));
    EXPECT_FALSE(contains(out, "priya.iyer@gmail.com"));
    EXPECT_FALSE(contains(out, "9820012345"));
    EXPECT_FALSE(contains(out, "5500 1111 2222 3333"));
    EXPECT_FALSE(contains(out, "4111111111111111"));
    EXPECT_TRUE(contains(out, "[REDACTED_NUM_3333]"));
    EXPECT_TRUE(contains(out, "[REDACTED_NUM_1111]"));
    EXPECT_TRUE(contains(out, "2024-03-31"));
    EXPECT_TRUE(contains(out, "01/03/2024  SWIGGY BANGALORE         349.00"));
    EXPECT_TRUE(contains(out, "05/03/2024  AMAZON PAY [REDACTED_NUM_1111]  1,299.00"));

    EXPECT_EQ(result.report.lines, (size_t)10);
    EXPECT_EQ(result.report.transactionLines, (size_t)2);
    EXPECT_EQ(result.report.nameCandidateLines, (size_t)1);
    EXPECT_EQ(result.report.addressLines, (size_t)1);
    EXPECT_EQ(result.report.emails, (size_t)1);
    EXPECT_EQ(result.report.phones, (size_t)1);
    EXPECT_EQ(result.report.longNumbers, (size_t)2);
}

TEST(TextRedactorTest, StripPIIMarksDocument) {
    core::StatementDocument doc("Name: John Doe\n15/03/2024 UBER 245.00");
    const std::string expectedId = util::hashing::documentFingerprint(doc.content);

    redaction::defaultEngine().stripPII(doc);

    EXPECT_TRUE(doc.scrubbed);
    EXPECT_EQ(doc.docID, expectedId);
    EXPECT_EQ(doc.docID.size(), util::hashing::kFingerprintLength);
    EXPECT_EQ(doc.content, "Name: [REDACTED_NAME]\n15/03/2024 UBER 245.00");
}

TEST(TextRedactorTest, StripPIIReturnsReport) {
    core::StatementDocument doc("RAHUL SHARMA\nContact user@example.com\n15/03/2024 UBER 245.00");
    redaction::ScrubReport report = redaction::defaultEngine().stripPII(doc);

    EXPECT_EQ(report.lines, (size_t)3);
    EXPECT_EQ(report.nameCandidateLines, (size_t)1);
    EXPECT_EQ(report.emails, (size_t)1);
    EXPECT_EQ(report.transactionLines, (size_t)1);
    EXPECT_EQ(report.totalRedactions(), (size_t)2);
}

TEST(TextRedactorTest, StripPIIKeepsExistingId) {
    core::StatementDocument doc("hello");
    doc.docID = "upload-42";
    redaction::defaultEngine().stripPII(doc);
    EXPECT_EQ(doc.docID, "upload-42");
    EXPECT_TRUE(doc.scrubbed);
}

TEST(TextRedactorTest, CustomKeywordsViaEngine) {
    config::RedactionConfig cfg;
    cfg.keywords["GALI"] = config::KeywordCategory::AddressKeyword;
    redaction::RedactionEngine engine(cfg);

    EXPECT_EQ(engine.scrub("Gali No 4, Karol Bagh"), "[REDACTED_ADDRESS_LINE]");
    EXPECT_EQ(redaction::scrub("Gali No 4, Karol Bagh"), "Gali No 4, Karol Bagh");
}

TEST(TextRedactorTest, ConcurrentCallsShareOneEngine) {
    redaction::initializeDefaultEngine();
    const std::string input = "RAHUL SHARMA\nContact user@example.com\n15/03/2024 UBER 245.00";
    const std::string expected = redaction::scrub(input);

    std::vector<std::string> outputs(8);
    std::vector<std::thread> workers;
    for (size_t i = 0; i < outputs.size(); ++i) {
        workers.emplace_back([&outputs, &input, i]() { outputs[i] = redaction::scrub(input); });
    }
    for (auto& t : workers) {
        t.join();
    }
    for (const auto& out : outputs) {
        EXPECT_EQ(out, expected);
    }
}

}  // namespace
