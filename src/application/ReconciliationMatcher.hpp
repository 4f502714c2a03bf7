/**
 * @file ReconciliationMatcher.hpp
 * @brief Fuzzy pairing of obligations (bills, loan payments) with settling transactions.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "application/EngineConfig.hpp"
#include "application/LoanLedger.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/Loan.hpp"
#include "domain/Obligation.hpp"
#include "domain/Transaction.hpp"

namespace ledgerwise::application {

/**
 * @class ReconciliationMatcher
 * @brief Scores every open obligation against the candidate transactions and
 * links the best pair when it reaches the acceptance threshold.
 *
 * Score components: account +0.4; amount exact +0.5, under the tolerance +0.3,
 * under 10% +0.2; name/description substring +0.3, two or more shared words
 * +0.2, one shared word +0.1; category +0.1. Clamped to 1.0.
 *
 * Obligations are processed in input order and a transaction linked in a
 * pass is never offered to a later obligation.
 */
class ReconciliationMatcher {
public:
    explicit ReconciliationMatcher(ReconciliationSettings settings = {});

    /** @brief Uses the configured tolerances. */
    std::vector<domain::MatchCandidate> reconcile(std::vector<domain::Obligation>& obligations,
                                                  std::vector<domain::Transaction>& transactions) const;

    /**
     * @brief One matching pass. Accepted pairs are linked on both sides and the
     * obligation is marked paid. Only accepted matches are returned.
     */
    std::vector<domain::MatchCandidate> reconcile(std::vector<domain::Obligation>& obligations,
                                                  std::vector<domain::Transaction>& transactions,
                                                  int dateToleranceDays,
                                                  double amountTolerancePercent) const;

    /**
     * @brief Reconciles, then books accepted loan-payment matches on the ledger.
     *
     * The loan is the obligation's loanRef, or failing that the one the
     * transaction points to. Interest payments leave the balance untouched.
     */
    std::vector<domain::LoanPaymentMatch> reconcileLoans(std::vector<domain::Obligation>& obligations,
                                                         std::vector<domain::Transaction>& transactions,
                                                         LoanLedger& ledger) const;

    /** @brief Match score in [0,1]; no date or direction checks. */
    double score(const domain::Obligation& obligation,
                 const domain::Transaction& transaction,
                 double amountTolerancePercent) const;
    double score(const domain::Obligation& obligation, const domain::Transaction& transaction) const;

    /** @brief Moves open scheduled/posted obligations due before today to overdue. Returns how many. */
    size_t markOverdue(std::vector<domain::Obligation>& obligations, const domain::CalendarDate& today) const;

    /**
     * @brief Links a pair chosen by a person, bypassing the scorer.
     * @return nullopt if the obligation is paid/linked or the transaction already reconciled.
     */
    std::optional<domain::MatchCandidate> manualMatch(domain::Obligation& obligation,
                                                      domain::Transaction& transaction) const;

    /** @brief Obligations that still await a transaction. */
    std::vector<domain::Obligation> unmatched(const std::vector<domain::Obligation>& obligations) const;

private:
    /** @brief An accepted match and the input positions of the pair it links. */
    struct LinkedPair {
        size_t obligationIndex = 0;
        size_t transactionIndex = 0;
        domain::MatchCandidate match;
    };

    std::vector<LinkedPair> linkPass(std::vector<domain::Obligation>& obligations,
                                     std::vector<domain::Transaction>& transactions,
                                     int dateToleranceDays,
                                     double amountTolerancePercent) const;

    bool isCandidate(const domain::Obligation& obligation,
                     const domain::Transaction& transaction,
                     int dateToleranceDays) const;

    ReconciliationSettings m_settings;
};

/** @brief Account identifier reduced to its digits. Empty means "no identifier". */
std::string NormalizeAccount(const std::string& account);

} // namespace ledgerwise::application
