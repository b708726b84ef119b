#ifndef STMTGUARD_REDACTION_NUMBER_MASKING_HPP
#define STMTGUARD_REDACTION_NUMBER_MASKING_HPP

#include <string>
#include <vector>
#include <algorithm>
#include <utility>
#include <cctype>
#include <cstddef>

/**
 * @file number_masking.hpp
 * @brief Digit-run primitives shared by the text redactor and the record masker.
 *
 * A "digit run" is a maximal sequence of digit groups joined by single spaces or
 * dashes, e.g. "4111 2222 3333 4444" or "2024-01-30 4111222233334444". Runs are
 * found by a linear scan, never by a regular expression, so a run of any length
 * is safe to process.
 *
 * A run is considered once it holds enough digits in total. Inside it, the
 * following are then kept verbatim and the remaining pieces are judged alone:
 *   - dash-separated dates, YYYY-MM-DD or D[D]-D[D]-D[DDD];
 *   - a leading group that is the year of a slashed date ("15/03/2024 4111 ...")
 *     or the fraction of a decimal ("245.00 4111 ...");
 *   - a trailing group that is the integer part of an amount ("4111... 100.00").
 *
 * Two rules are built on top:
 *   - redactLongNumbers(): raw statement text, runs of 13+ digits become
 *     "[REDACTED_NUM_<last4>]".
 *   - maskAccountNumber(): structured record fields, card layouts become
 *     "XXXX-XXXX-XXXX-<last4>", other 12-16 digit account numbers "XXXX-XXXX-<last4>".
 */

namespace stmtguard {
namespace redaction {

/// A run shorter than this is never considered by the raw-text rule.
constexpr std::size_t kLongRunMinDigits = 13;
/// A date-free piece of a long run is redacted from this many digits on.
constexpr std::size_t kRedactMinDigits = 12;
/// Longest leading group treated as the year of a slashed date.
constexpr std::size_t kProtectedTailMaxDigits = 4;
/// Account-number window used for structured fields.
constexpr std::size_t kAccountMinDigits = 12;
constexpr std::size_t kAccountMaxDigits = 16;
/// Shortest contiguous body of an account number printed with its last four split off.
constexpr std::size_t kAccountBodyMinDigits = 8;
constexpr std::size_t kCardGroupDigits = 4;

/**
 * @struct DigitGroup
 * @brief One group of a digit run and the separator in front of it ("" for the first).
 */
struct DigitGroup
{
    std::string separator;
    std::string digits;
};

inline bool isDigit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

inline std::string digitsOnly(const std::string &text)
{
    std::string out;
    for (char c : text) {
        if (isDigit(c)) {
            out.push_back(c);
        }
    }
    return out;
}

/**
 * @brief Last four digits of text, ignoring any separators. Fewer if text has fewer.
 */
inline std::string lastFourDigits(const std::string &text)
{
    std::string digits = digitsOnly(text);
    return digits.size() <= 4 ? digits : digits.substr(digits.size() - 4);
}

/**
 * @brief Split a digit run ("2024-01-30 1234") into its groups.
 */
inline std::vector<DigitGroup> splitDigitRun(const std::string &run)
{
    std::vector<DigitGroup> groups;
    std::string separator;
    for (char c : run) {
        if (isDigit(c)) {
            if (groups.empty() || !separator.empty()) {
                groups.push_back(DigitGroup{separator, std::string()});
                separator.clear();
            }
            groups.back().digits.push_back(c);
        }
        else {
            separator.push_back(c);
        }
    }
    return groups;
}

inline bool inRange(const std::string &digits, int lo, int hi)
{
    if (digits.empty() || digits.size() > 4) {
        return false;
    }
    int value = std::stoi(digits);
    return value >= lo && value <= hi;
}

/**
 * @brief True if groups[i..i+2], all below limit, spell a dash-separated date:
 *        YYYY-MM-DD, or D[D]-D[D]-D[DDD] with day and month in either order.
 */
inline bool isDateAt(const std::vector<DigitGroup> &groups, std::size_t i,
                     std::size_t limit = static_cast<std::size_t>(-1))
{
    limit = std::min(limit, groups.size());
    if (i + 2 >= limit) {
        return false;
    }
    if (groups[i + 1].separator != "-" || groups[i + 2].separator != "-") {
        return false;
    }
    const std::string &a = groups[i].digits;
    const std::string &b = groups[i + 1].digits;
    const std::string &c = groups[i + 2].digits;

    if (a.size() == 4 && b.size() == 2 && c.size() == 2) {
        return inRange(b, 1, 12) && inRange(c, 1, 31);
    }
    if (a.size() <= 2 && b.size() <= 2 && c.size() <= 4) {
        return inRange(a, 1, 31) && inRange(b, 1, 31) && (inRange(a, 1, 12) || inRange(b, 1, 12));
    }
    return false;
}

/**
 * @brief True if the run starting at runBegin opens with the year of a D[D]/D[D]/
 *        date or the two-digit fraction of a decimal.
 */
inline bool leadingGroupIsTail(const std::string &text, std::size_t runBegin, std::size_t firstGroupDigits)
{
    if (runBegin < 2 || !isDigit(text[runBegin - 2])) {
        return false;
    }
    char before = text[runBegin - 1];
    if (before == '.') {
        return firstGroupDigits == 2;
    }
    if (before != '/' || firstGroupDigits > kProtectedTailMaxDigits) {
        return false;
    }

    // Walk back over "D[D]/D[D]/".
    std::size_t p = runBegin - 1;
    for (int field = 0; field < 2; ++field) {
        std::size_t n = 0;
        while (p > 0 && n < 3 && isDigit(text[p - 1])) {
            --p;
            ++n;
        }
        if (n < 1 || n > 2) {
            return false;
        }
        if (field == 0) {
            if (p == 0 || text[p - 1] != '/') {
                return false;
            }
            --p;
        }
    }
    return true;
}

/**
 * @brief True if the run ending at runEnd closes with the integer part of an
 *        amount: followed by ".dd", or a group of at most three digits followed
 *        by a ",dd" / ",ddd" thousands group.
 */
inline bool trailingGroupIsAmount(const std::string &text, std::size_t runEnd, std::size_t lastGroupDigits)
{
    if (runEnd >= text.size()) {
        return false;
    }
    char next = text[runEnd];
    if (next != '.' && next != ',') {
        return false;
    }
    std::size_t p = runEnd + 1;
    while (p < text.size() && isDigit(text[p])) {
        ++p;
    }
    std::size_t n = p - (runEnd + 1);
    if (next == '.') {
        return n == 2;
    }
    return lastGroupDigits <= 3 && (n == 2 || n == 3);
}

/**
 * @brief Position of the next digit run at or after from: [begin, end).
 *        begin == text.size() when there is none.
 */
inline std::pair<std::size_t, std::size_t> findDigitRun(const std::string &text, std::size_t from)
{
    std::size_t begin = from;
    while (begin < text.size() && !isDigit(text[begin])) {
        ++begin;
    }
    std::size_t end = begin;
    while (end < text.size()) {
        while (end < text.size() && isDigit(text[end])) {
            ++end;
        }
        bool joined = end + 1 < text.size() && (text[end] == ' ' || text[end] == '-') && isDigit(text[end + 1]);
        if (!joined) {
            break;
        }
        ++end;
    }
    return {begin, end};
}

/**
 * @brief Rewrite one digit run. Runs with fewer than minRunDigits digits are
 *        returned unchanged. Otherwise dates and the kept first/last groups are
 *        emitted verbatim and every other piece goes through
 *        onSegment(pieceText, pieceDigitCount).
 * @param keepFirst The first group is a date year or decimal fraction.
 * @param keepLast The last group is the integer part of an amount.
 */
template <typename SegmentFn>
std::string rewriteDigitRun(const std::string &run, std::size_t minRunDigits, bool keepFirst, bool keepLast,
                            SegmentFn &&onSegment)
{
    std::vector<DigitGroup> groups = splitDigitRun(run);

    std::size_t first = (keepFirst && !groups.empty()) ? 1 : 0;
    std::size_t last = groups.size();
    if (keepLast && last > first + 1) {
        --last;
    }

    std::size_t total = 0;
    for (const auto &group : groups) {
        total += group.digits.size();
    }
    if (total < minRunDigits) {
        return run;
    }

    std::string out;
    if (first == 1) {
        out += groups[0].digits;
    }
    std::string pending;
    std::size_t pendingDigits = 0;
    auto flush = [&]() {
        if (!pending.empty()) {
            out += onSegment(pending, pendingDigits);
            pending.clear();
            pendingDigits = 0;
        }
    };

    std::size_t i = first;
    while (i < last) {
        if (isDateAt(groups, i, last)) {
            flush();
            for (std::size_t d = i; d < i + 3; ++d) {
                out += groups[d].separator + groups[d].digits;
            }
            i += 3;
            continue;
        }
        // The separator in front of a new piece stays outside of it.
        if (pending.empty()) {
            out += groups[i].separator;
        }
        else {
            pending += groups[i].separator;
        }
        pending += groups[i].digits;
        pendingDigits += groups[i].digits.size();
        ++i;
    }
    flush();

    for (std::size_t g = last; g < groups.size(); ++g) {
        out += groups[g].separator + groups[g].digits;
    }
    return out;
}

/**
 * @brief Apply rewriteDigitRun to every digit run found in text.
 */
template <typename SegmentFn>
std::string rewriteDigitRuns(const std::string &text, std::size_t minRunDigits, SegmentFn &&onSegment)
{
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::pair<std::size_t, std::size_t> run = findDigitRun(text, pos);
        out.append(text, pos, run.first - pos);
        if (run.first == text.size()) {
            break;
        }

        std::size_t firstGroup = run.first;
        while (firstGroup < run.second && isDigit(text[firstGroup])) {
            ++firstGroup;
        }
        std::size_t lastGroup = run.second;
        while (lastGroup > run.first && isDigit(text[lastGroup - 1])) {
            --lastGroup;
        }
        bool keepFirst = leadingGroupIsTail(text, run.first, firstGroup - run.first);
        bool keepLast = trailingGroupIsAmount(text, run.second, run.second - lastGroup);

        out += rewriteDigitRun(text.substr(run.first, run.second - run.first), minRunDigits,
                               keepFirst, keepLast, onSegment);
        pos = run.second;
    }
    return out;
}

/**
 * @brief Raw-text long-number rule: every run of 13+ digits is replaced with
 *        "[REDACTED_NUM_<last4>]", except embedded dates and amounts, which are
 *        kept; a date-free remainder is redacted when it still holds 12+ digits.
 * @param text A single line or a whole document.
 * @param redactedCount If non-null, incremented once per placeholder written.
 */
inline std::string redactLongNumbers(const std::string &text, std::size_t *redactedCount = nullptr)
{
    return rewriteDigitRuns(text, kLongRunMinDigits,
        [redactedCount](const std::string &piece, std::size_t digits) -> std::string {
            if (digits < kRedactMinDigits) {
                return piece;
            }
            if (redactedCount != nullptr) {
                ++(*redactedCount);
            }
            return "[REDACTED_NUM_" + lastFourDigits(piece) + "]";
        });
}

/**
 * @brief Account masking of one date-free piece, group by group:
 *   - four 4-digit groups, or one contiguous 16-digit group: a card,
 *     "XXXX-XXXX-XXXX-<last4>";
 *   - a contiguous body of 8+ digits, optionally followed by 4-digit groups,
 *     12-16 digits in all: "XXXX-XXXX-<last4>".
 * Short groups that are not part of either shape are kept.
 */
inline std::string maskAccountPiece(const std::string &piece)
{
    std::vector<DigitGroup> groups = splitDigitRun(piece);
    auto isCardGroup = [&groups](std::size_t g) {
        return g < groups.size() && groups[g].digits.size() == kCardGroupDigits;
    };

    std::string out;
    std::size_t i = 0;
    while (i < groups.size()) {
        const std::string &digits = groups[i].digits;
        out += groups[i].separator;

        if (isCardGroup(i) && isCardGroup(i + 1) && isCardGroup(i + 2) && isCardGroup(i + 3)) {
            out += "XXXX-XXXX-XXXX-" + groups[i + 3].digits;
            i += 4;
            continue;
        }
        if (digits.size() == kAccountMaxDigits) {
            out += "XXXX-XXXX-XXXX-" + lastFourDigits(digits);
            ++i;
            continue;
        }
        if (digits.size() >= kAccountBodyMinDigits && digits.size() <= kAccountMaxDigits) {
            std::size_t total = digits.size();
            std::size_t next = i + 1;
            while (isCardGroup(next) && total + kCardGroupDigits <= kAccountMaxDigits) {
                total += kCardGroupDigits;
                ++next;
            }
            if (total >= kAccountMinDigits) {
                const std::string &tail = groups[next - 1].digits;
                out += "XXXX-XXXX-" + lastFourDigits(tail);
                i = next;
                continue;
            }
        }
        out += digits;
        ++i;
    }
    return out;
}

/**
 * @brief Mask card and account numbers inside an already-structured text field.
 *
 *   "4111-1111-1111-1234" -> "XXXX-XXXX-XXXX-1234"
 *   "411122223333 4444"   -> "XXXX-XXXX-4444"
 *   "Order 1234 5678 9012" is left alone: no group is an account body.
 *
 * Masked output contains no group of 8+ digits, so masking is idempotent.
 */
inline std::string maskAccountNumber(const std::string &text)
{
    return rewriteDigitRuns(text, kAccountMinDigits,
        [](const std::string &piece, std::size_t) -> std::string {
            return maskAccountPiece(piece);
        });
}

} // namespace redaction
} // namespace stmtguard

#endif // STMTGUARD_REDACTION_NUMBER_MASKING_HPP
