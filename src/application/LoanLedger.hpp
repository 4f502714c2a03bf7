/**
 * @file LoanLedger.hpp
 * @brief Owns the loans and applies reconciled payments to them.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/Loan.hpp"
#include "domain/Transaction.hpp"

namespace ledgerwise::application {

/**
 * @class LoanLedger
 * @brief Amortization bookkeeping.
 *
 * Principal payments reduce the balance (never below zero) and mark the loan
 * paid off when it reaches zero. Interest payments are recorded only.
 */
class LoanLedger {
public:
    LoanLedger() = default;
    explicit LoanLedger(std::vector<domain::Loan> loans);

    const std::vector<domain::Loan>& loans() const { return m_loans; }
    std::vector<domain::Loan>& loans() { return m_loans; }

    domain::Loan* find(const std::string& loanId);

    /** @brief Returns false if the loan is unknown or the amount is not positive. */
    bool applyPayment(const std::string& loanId,
                      double amount,
                      const std::string& date,
                      const std::string& transactionRef,
                      domain::LoanPaymentKind kind);

    /**
     * @brief The loan a transaction pays, by payment account (digits only) or by
     * the loan number appearing in the description.
     */
    std::optional<std::string> findLoanFor(const domain::Transaction& transaction) const;

    /** @brief Interest when the description names interest, principal otherwise. */
    static domain::LoanPaymentKind ClassifyPaymentKind(const std::string& description);

private:
    std::vector<domain::Loan> m_loans;
};

} // namespace ledgerwise::application
