/**
 * @file LoanLedger.cpp
 * @brief Implementation of LoanLedger.
 */

#include "application/LoanLedger.hpp"
#include "application/TextUtils.hpp"
#include <algorithm>
#include <iostream>

namespace ledgerwise::application {

namespace {

const char* const kInterestKeywords[] = {"interest", "ränta", "ränte", "rente"};

} // namespace

LoanLedger::LoanLedger(std::vector<domain::Loan> loans) : m_loans(std::move(loans)) {}

domain::Loan* LoanLedger::find(const std::string& loanId) {
    auto it = std::find_if(m_loans.begin(), m_loans.end(),
                           [&](const domain::Loan& loan) { return loan.id == loanId; });
    return it == m_loans.end() ? nullptr : &*it;
}

bool LoanLedger::applyPayment(const std::string& loanId,
                              double amount,
                              const std::string& date,
                              const std::string& transactionRef,
                              domain::LoanPaymentKind kind) {
    domain::Loan* loan = find(loanId);
    if (!loan) {
        std::cerr << "[LoanLedger] Unknown loan: " << loanId << std::endl;
        return false;
    }
    if (amount <= 0.0) {
        std::cerr << "[LoanLedger] Ignoring non-positive payment on " << loanId << std::endl;
        return false;
    }

    domain::LoanPayment payment{date, amount, transactionRef};
    if (kind == domain::LoanPaymentKind::Interest) {
        loan->interestPayments.push_back(payment);
        std::cout << "[LoanLedger] Interest " << amount << " recorded on " << loan->name << std::endl;
        return true;
    }

    loan->payments.push_back(payment);
    loan->currentBalance = std::max(0.0, loan->currentBalance - amount);
    if (loan->currentBalance <= 0.0) {
        loan->status = domain::LoanStatus::PaidOff;
        std::cout << "[LoanLedger] " << loan->name << " paid off" << std::endl;
    } else {
        std::cout << "[LoanLedger] Principal " << amount << " applied to " << loan->name
                  << ", balance " << loan->currentBalance << std::endl;
    }
    return true;
}

std::optional<std::string> LoanLedger::findLoanFor(const domain::Transaction& transaction) const {
    const std::string account = text::DigitsOnly(transaction.accountRef);
    for (const auto& loan : m_loans) {
        if (!account.empty() && loan.paymentAccount && text::DigitsOnly(*loan.paymentAccount) == account) {
            return loan.id;
        }
    }

    // Loan numbers are compared digits-only as well, so "12-345" finds "12345".
    const std::string descriptionDigits = text::DigitsOnly(transaction.description);
    for (const auto& loan : m_loans) {
        if (!loan.loanNumber) continue;
        if (text::ContainsFolded(transaction.description, *loan.loanNumber)) return loan.id;
        const std::string number = text::DigitsOnly(*loan.loanNumber);
        if (!number.empty() && descriptionDigits.find(number) != std::string::npos) return loan.id;
    }
    return std::nullopt;
}

domain::LoanPaymentKind LoanLedger::ClassifyPaymentKind(const std::string& description) {
    for (const char* keyword : kInterestKeywords) {
        if (text::ContainsFolded(description, keyword)) return domain::LoanPaymentKind::Interest;
    }
    return domain::LoanPaymentKind::Principal;
}

} // namespace ledgerwise::application
