/**
 * @file ReconciliationMatcher.cpp
 * @brief Implementation of ReconciliationMatcher.
 */

#include "application/ReconciliationMatcher.hpp"
#include "application/TextUtils.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <iostream>
#include <set>

namespace ledgerwise::application {

namespace {

constexpr double kAccountWeight = 0.4;
constexpr double kExactAmountWeight = 0.5;
constexpr double kToleranceAmountWeight = 0.3;
constexpr double kLooseAmountWeight = 0.2;
constexpr double kLooseAmountPercent = 10.0;
constexpr double kSubstringWeight = 0.3;
constexpr double kManyTokensWeight = 0.2;
constexpr double kOneTokenWeight = 0.1;
constexpr double kCategoryWeight = 0.1;
constexpr double kExactAmountEpsilon = 0.01;

double AmountScore(double expected, double actual, double tolerancePercent) {
    const double diff = std::fabs(expected - actual);
    if (diff < kExactAmountEpsilon) return kExactAmountWeight;
    if (expected <= 0.0) return 0.0;

    // Both bands are exclusive: exactly 5% off falls to the looser band.
    const double percent = diff * 100.0 / expected;
    if (percent < tolerancePercent) return kToleranceAmountWeight;
    if (percent < kLooseAmountPercent) return kLooseAmountWeight;
    return 0.0;
}

double DescriptionScore(const std::string& name, const std::string& description) {
    const std::string a = text::FoldCase(text::Trim(name));
    const std::string b = text::FoldCase(text::Trim(description));
    if (a.empty() || b.empty()) return 0.0;

    if (b.find(a) != std::string::npos || a.find(b) != std::string::npos) return kSubstringWeight;

    const auto nameTokens = text::SplitWhitespace(a);
    const auto descTokens = text::SplitWhitespace(b);
    std::set<std::string> left(nameTokens.begin(), nameTokens.end());
    std::set<std::string> right(descTokens.begin(), descTokens.end());

    size_t shared = 0;
    for (const auto& token : left) {
        if (right.count(token)) ++shared;
    }
    if (shared >= 2) return kManyTokensWeight;
    if (shared == 1) return kOneTokenWeight;
    return 0.0;
}

// Derived keys can collide between id-less records; the input position keeps them apart.
std::string PassReference(const std::string& id, const std::string& reference, size_t index) {
    if (!id.empty()) return reference;
    return reference + "#" + std::to_string(index);
}

bool MatchableStatus(domain::ObligationStatus status) {
    return status == domain::ObligationStatus::Scheduled ||
           status == domain::ObligationStatus::Posted ||
           status == domain::ObligationStatus::Overdue;
}

} // namespace

std::string NormalizeAccount(const std::string& account) {
    return text::DigitsOnly(account);
}

ReconciliationMatcher::ReconciliationMatcher(ReconciliationSettings settings)
    : m_settings(std::move(settings)) {}

double ReconciliationMatcher::score(const domain::Obligation& obligation,
                                    const domain::Transaction& transaction,
                                    double amountTolerancePercent) const {
    double total = 0.0;

    if (obligation.accountRef) {
        const std::string expected = NormalizeAccount(*obligation.accountRef);
        if (!expected.empty() && expected == NormalizeAccount(transaction.accountRef)) {
            total += kAccountWeight;
        }
    }

    total += AmountScore(std::fabs(obligation.amount), std::fabs(transaction.amount), amountTolerancePercent);
    total += DescriptionScore(obligation.name, transaction.description);

    if (obligation.category && !obligation.category->empty() && !transaction.category.empty() &&
        text::FoldCase(*obligation.category) == text::FoldCase(transaction.category)) {
        total += kCategoryWeight;
    }

    return std::min(1.0, total);
}

double ReconciliationMatcher::score(const domain::Obligation& obligation,
                                    const domain::Transaction& transaction) const {
    return score(obligation, transaction, m_settings.amountTolerancePercent);
}

bool ReconciliationMatcher::isCandidate(const domain::Obligation& obligation,
                                        const domain::Transaction& transaction,
                                        int dateToleranceDays) const {
    if (transaction.reconciled || transaction.matchedObligationRef) return false;
    if (obligation.expectsDebit ? transaction.amount >= 0.0 : transaction.amount <= 0.0) return false;

    auto due = domain::CalendarDate::Parse(obligation.dueDate);
    auto posted = domain::CalendarDate::Parse(transaction.date);
    if (!due || !posted) return false;
    return domain::DaysBetween(*due, *posted) <= dateToleranceDays;
}

std::vector<domain::MatchCandidate> ReconciliationMatcher::reconcile(std::vector<domain::Obligation>& obligations,
                                                                     std::vector<domain::Transaction>& transactions) const {
    return reconcile(obligations, transactions, m_settings.dateToleranceDays, m_settings.amountTolerancePercent);
}

std::vector<domain::MatchCandidate> ReconciliationMatcher::reconcile(std::vector<domain::Obligation>& obligations,
                                                                     std::vector<domain::Transaction>& transactions,
                                                                     int dateToleranceDays,
                                                                     double amountTolerancePercent) const {
    std::vector<domain::MatchCandidate> accepted;
    for (auto& linked : linkPass(obligations, transactions, dateToleranceDays, amountTolerancePercent)) {
        accepted.push_back(std::move(linked.match));
    }
    return accepted;
}

std::vector<ReconciliationMatcher::LinkedPair> ReconciliationMatcher::linkPass(std::vector<domain::Obligation>& obligations,
                                                                               std::vector<domain::Transaction>& transactions,
                                                                               int dateToleranceDays,
                                                                               double amountTolerancePercent) const {
    std::vector<LinkedPair> linked;
    if (obligations.empty() || transactions.empty()) return linked;

    for (size_t i = 0; i < obligations.size(); ++i) {
        auto& obligation = obligations[i];
        if (!MatchableStatus(obligation.status) || obligation.matchedTransactionRef) continue;

        std::optional<size_t> best;
        double bestScore = 0.0;
        for (size_t j = 0; j < transactions.size(); ++j) {
            const auto& tx = transactions[j];
            if (!isCandidate(obligation, tx, dateToleranceDays)) continue;
            const double s = score(obligation, tx, amountTolerancePercent);
            if (!best || s > bestScore) {
                best = j;
                bestScore = s;
            }
        }

        if (!best || bestScore < m_settings.acceptanceThreshold) continue;
        auto& tx = transactions[*best];

        LinkedPair pair;
        pair.obligationIndex = i;
        pair.transactionIndex = *best;
        pair.match.obligationRef = PassReference(obligation.id, obligation.reference(), i);
        pair.match.transactionRef = PassReference(tx.id, tx.reference(), *best);
        pair.match.confidence = bestScore;
        pair.match.amountDiff = std::fabs(std::fabs(tx.amount) - std::fabs(obligation.amount));

        obligation.status = domain::ObligationStatus::Paid;
        obligation.matchedTransactionRef = pair.match.transactionRef;
        tx.matchedObligationRef = pair.match.obligationRef;
        tx.reconciled = true;

        linked.push_back(std::move(pair));
    }

    std::cout << "[ReconciliationMatcher] Matched " << linked.size() << " of "
              << obligations.size() << " obligations" << std::endl;
    return linked;
}

std::vector<domain::LoanPaymentMatch> ReconciliationMatcher::reconcileLoans(std::vector<domain::Obligation>& obligations,
                                                                           std::vector<domain::Transaction>& transactions,
                                                                           LoanLedger& ledger) const {
    std::vector<domain::LoanPaymentMatch> loanMatches;
    auto linked = linkPass(obligations, transactions, m_settings.dateToleranceDays, m_settings.amountTolerancePercent);

    for (const auto& pair : linked) {
        const auto& obligation = obligations[pair.obligationIndex];
        const auto& tx = transactions[pair.transactionIndex];
        if (obligation.kind != domain::ObligationKind::LoanPayment) continue;

        std::optional<std::string> loanId = obligation.loanRef;
        if (!loanId) loanId = ledger.findLoanFor(tx);
        if (!loanId) {
            std::cerr << "[ReconciliationMatcher] No loan found for obligation " << pair.match.obligationRef << std::endl;
            continue;
        }

        domain::LoanPaymentMatch loanMatch;
        loanMatch.match = pair.match;
        loanMatch.loanRef = *loanId;
        loanMatch.kind = LoanLedger::ClassifyPaymentKind(tx.description);
        loanMatch.amount = std::fabs(tx.amount);

        if (ledger.applyPayment(loanMatch.loanRef, loanMatch.amount, tx.date, pair.match.transactionRef, loanMatch.kind)) {
            loanMatches.push_back(loanMatch);
        }
    }
    return loanMatches;
}

size_t ReconciliationMatcher::markOverdue(std::vector<domain::Obligation>& obligations,
                                          const domain::CalendarDate& today) const {
    size_t changed = 0;
    for (auto& obligation : obligations) {
        if (obligation.matchedTransactionRef) continue;
        if (obligation.status != domain::ObligationStatus::Scheduled &&
            obligation.status != domain::ObligationStatus::Posted) continue;

        auto due = domain::CalendarDate::Parse(obligation.dueDate);
        if (due && *due < today) {
            obligation.status = domain::ObligationStatus::Overdue;
            ++changed;
        }
    }
    return changed;
}

std::optional<domain::MatchCandidate> ReconciliationMatcher::manualMatch(domain::Obligation& obligation,
                                                                         domain::Transaction& transaction) const {
    if (!obligation.isOpen()) {
        std::cerr << "[ReconciliationMatcher] Obligation " << obligation.reference() << " is already settled" << std::endl;
        return std::nullopt;
    }
    if (transaction.reconciled || transaction.matchedObligationRef) {
        std::cerr << "[ReconciliationMatcher] Transaction " << transaction.reference() << " is already reconciled" << std::endl;
        return std::nullopt;
    }

    domain::MatchCandidate match;
    match.obligationRef = obligation.reference();
    match.transactionRef = transaction.reference();
    match.confidence = 1.0;
    match.amountDiff = std::fabs(std::fabs(transaction.amount) - std::fabs(obligation.amount));

    obligation.status = domain::ObligationStatus::Paid;
    obligation.matchedTransactionRef = match.transactionRef;
    transaction.matchedObligationRef = match.obligationRef;
    transaction.reconciled = true;
    return match;
}

std::vector<domain::Obligation> ReconciliationMatcher::unmatched(const std::vector<domain::Obligation>& obligations) const {
    std::vector<domain::Obligation> open;
    std::copy_if(obligations.begin(), obligations.end(), std::back_inserter(open),
                 [](const domain::Obligation& o) { return o.isOpen(); });
    return open;
}

} // namespace ledgerwise::application
