#ifndef STMTGUARD_CORE_TRANSACTION_RECORD_HPP
#define STMTGUARD_CORE_TRANSACTION_RECORD_HPP

#include <string>
#include <optional>
#include <cctype>

/*
  transaction_record.hpp
  ----------------------------------------------------------------
  One transaction as returned by the inference provider, already structured.

  Invariants:
   - amount is signed: positive = expense, negative = credit/payment.
   - category is one of the closed Category set; unknown provider names map to Other.
   - date is an ISO calendar date (YYYY-MM-DD), see isIsoDate().

  notes/description/memo are optional free-text fields; the provider may
  omit any of them.
*/

namespace stmtguard {
namespace core {

enum class Category {
    Food,
    Transport,
    Shopping,
    Utilities,
    Entertainment,
    Health,
    Travel,
    Other
};

// Provider-facing name of a category.
inline const char* categoryName(Category category)
{
    switch (category) {
        case Category::Food:          return "Food";
        case Category::Transport:     return "Transport";
        case Category::Shopping:      return "Shopping";
        case Category::Utilities:     return "Utilities";
        case Category::Entertainment: return "Entertainment";
        case Category::Health:        return "Health";
        case Category::Travel:        return "Travel";
        case Category::Other:         return "Other";
    }
    return "Other";
}

// Case-insensitive inverse of categoryName(). Anything unrecognized is Other.
inline Category parseCategory(const std::string &name)
{
    static const Category all[] = {
        Category::Food, Category::Transport, Category::Shopping, Category::Utilities,
        Category::Entertainment, Category::Health, Category::Travel, Category::Other
    };
    for (Category c : all) {
        const std::string candidate = categoryName(c);
        if (candidate.size() != name.size()) {
            continue;
        }
        bool same = true;
        for (std::size_t i = 0; i < name.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(name[i])) !=
                std::tolower(static_cast<unsigned char>(candidate[i]))) {
                same = false;
                break;
            }
        }
        if (same) {
            return c;
        }
    }
    return Category::Other;
}

/*
  isIsoDate:
    - true for "YYYY-MM-DD" with month 01-12 and day 01-31 (no per-month day check).
*/
inline bool isIsoDate(const std::string &date)
{
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
        return false;
    }
    for (std::size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(date[i]))) {
            return false;
        }
    }
    int month = (date[5] - '0') * 10 + (date[6] - '0');
    int day = (date[8] - '0') * 10 + (date[9] - '0');
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

struct TransactionRecord
{
    std::string date;       ///< ISO date, YYYY-MM-DD
    std::string merchant;   ///< Merchant name as extracted
    double amount = 0.0;    ///< Positive = expense, negative = credit/payment
    Category category = Category::Other;
    bool isRecurring = false;

    std::optional<std::string> notes;
    std::optional<std::string> description;
    std::optional<std::string> memo;
};

inline bool operator==(const TransactionRecord &a, const TransactionRecord &b)
{
    return a.date == b.date && a.merchant == b.merchant && a.amount == b.amount &&
           a.category == b.category && a.isRecurring == b.isRecurring &&
           a.notes == b.notes && a.description == b.description && a.memo == b.memo;
}

inline bool operator!=(const TransactionRecord &a, const TransactionRecord &b)
{
    return !(a == b);
}

} // namespace core
} // namespace stmtguard

#endif // STMTGUARD_CORE_TRANSACTION_RECORD_HPP
