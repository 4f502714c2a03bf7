/**
 * @file Loan.hpp
 * @brief Domain entity for an amortizing loan and its payment history.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/Obligation.hpp"

namespace ledgerwise::domain {

enum class LoanStatus {
    Active,
    PaidOff
};

/**
 * @enum LoanPaymentKind
 * @brief Principal payments amortize the balance; interest payments do not.
 */
enum class LoanPaymentKind {
    Principal,
    Interest
};

inline std::string PaymentKindToString(LoanPaymentKind kind) {
    return kind == LoanPaymentKind::Interest ? "interest" : "principal";
}

struct LoanPayment {
    std::string date;
    double amount = 0.0;
    std::string transactionRef;
};

struct Loan {
    std::string id;
    std::string name;
    std::optional<std::string> loanNumber;
    double principal = 0.0;
    double currentBalance = 0.0;
    std::optional<std::string> paymentAccount;
    LoanStatus status = LoanStatus::Active;
    std::vector<LoanPayment> payments;          ///< Principal (amortization) payments.
    std::vector<LoanPayment> interestPayments;
};

/**
 * @struct LoanPaymentMatch
 * @brief An accepted reconciliation match against a loan payment obligation.
 */
struct LoanPaymentMatch {
    MatchCandidate match;
    std::string loanRef;
    LoanPaymentKind kind = LoanPaymentKind::Principal;
    double amount = 0.0;
};

} // namespace ledgerwise::domain
