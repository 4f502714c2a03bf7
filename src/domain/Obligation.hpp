/**
 * @file Obligation.hpp
 * @brief Domain entities for bills and scheduled loan payments awaiting settlement.
 */

#pragma once
#include <optional>
#include <string>

namespace ledgerwise::domain {

/**
 * @enum ObligationStatus
 * @brief Lifecycle of an obligation. Paid is terminal for matching.
 */
enum class ObligationStatus {
    Scheduled,
    Posted,
    Paid,
    Overdue
};

enum class ObligationKind {
    Bill,
    LoanPayment
};

inline std::string StatusToString(ObligationStatus status) {
    switch (status) {
        case ObligationStatus::Scheduled: return "scheduled";
        case ObligationStatus::Posted: return "posted";
        case ObligationStatus::Paid: return "paid";
        case ObligationStatus::Overdue: return "overdue";
    }
    return "scheduled";
}

inline ObligationStatus StatusFromString(const std::string& value) {
    if (value == "posted") return ObligationStatus::Posted;
    if (value == "paid") return ObligationStatus::Paid;
    if (value == "overdue") return ObligationStatus::Overdue;
    return ObligationStatus::Scheduled;
}

/**
 * @struct Obligation
 * @brief A bill or loan payment that should be settled by some transaction.
 */
struct Obligation {
    std::string id;
    ObligationKind kind = ObligationKind::Bill;
    std::string name;
    double amount = 0.0;                 ///< Expected amount, unsigned.
    std::string dueDate;                 ///< YYYY-MM-DD
    std::optional<std::string> accountRef;
    std::optional<std::string> category;
    ObligationStatus status = ObligationStatus::Scheduled;
    std::optional<std::string> matchedTransactionRef;
    std::optional<std::string> loanRef;  ///< Set for LoanPayment obligations.
    bool expectsDebit = true;            ///< Settled by money leaving the account.

    /** @brief Stable reference: the id, or a key derived from name and due date. */
    std::string reference() const {
        if (!id.empty()) return id;
        return "OB-" + name + "-" + dueDate;
    }

    bool isOpen() const {
        return status != ObligationStatus::Paid && !matchedTransactionRef;
    }
};

/**
 * @struct MatchCandidate
 * @brief One obligation/transaction pairing produced during a reconciliation pass.
 */
struct MatchCandidate {
    std::string obligationRef;
    std::string transactionRef;
    double confidence = 0.0;
    double amountDiff = 0.0;
};

} // namespace ledgerwise::domain
