#include <cassert>
#include <cmath>
#include <iostream>
#include <set>
#include "application/ReconciliationMatcher.hpp"

using namespace ledgerwise;
using application::ReconciliationMatcher;
using domain::ObligationStatus;

namespace {

domain::Obligation Bill(const std::string& id, const std::string& name, double amount,
                        const std::string& due, std::optional<std::string> account = std::nullopt) {
    domain::Obligation o;
    o.id = id;
    o.name = name;
    o.amount = amount;
    o.dueDate = due;
    o.accountRef = std::move(account);
    return o;
}

domain::Transaction Tx(const std::string& id, const std::string& description, double amount,
                       const std::string& date, const std::string& account = "") {
    domain::Transaction t;
    t.id = id;
    t.description = description;
    t.amount = amount;
    t.date = date;
    t.accountRef = account;
    return t;
}

void TestElectricityScenario() {
    std::cout << "[Test] Electricity bill..." << std::endl;
    ReconciliationMatcher matcher;
    std::vector<domain::Obligation> obligations = {Bill("OB-1", "Electricity", 850.00, "2025-11-15", "1234-5678")};
    std::vector<domain::Transaction> transactions = {
        Tx("TX-1", "Electricity bill payment", -850.00, "2025-11-14", "1234 5678")
    };

    assert(matcher.score(obligations[0], transactions[0]) >= 0.9);

    auto matches = matcher.reconcile(obligations, transactions);
    assert(matches.size() == 1);
    assert(matches[0].confidence >= 0.9 && matches[0].confidence <= 1.0);
    assert(matches[0].obligationRef == "OB-1");
    assert(matches[0].transactionRef == "TX-1");
    assert(matches[0].amountDiff < 0.01);

    assert(obligations[0].status == ObligationStatus::Paid);
    assert(obligations[0].matchedTransactionRef == std::string("TX-1"));
    assert(transactions[0].reconciled);
    assert(transactions[0].matchedObligationRef == std::string("OB-1"));
    std::cout << "[PASS] confidence=" << matches[0].confidence << std::endl;
}

void TestPoorMatchRejected() {
    std::cout << "[Test] Poor match..." << std::endl;
    ReconciliationMatcher matcher;
    std::vector<domain::Obligation> obligations = {Bill("OB-1", "Rent", 1000.00, "2025-11-01")};
    std::vector<domain::Transaction> transactions = {Tx("TX-1", "Grocery store", -860.00, "2025-11-02")};

    assert(matcher.score(obligations[0], transactions[0]) < 0.3);
    assert(matcher.reconcile(obligations, transactions).empty());
    assert(obligations[0].status == ObligationStatus::Scheduled);
    assert(!transactions[0].reconciled);
    std::cout << "[PASS] Left unresolved." << std::endl;
}

void TestScoreComponents() {
    std::cout << "[Test] Score components..." << std::endl;
    ReconciliationMatcher matcher;
    auto tx = Tx("T", "Vattenfall el november", -104.0, "2025-11-10", "555");

    // 4% off: tolerance band +0.3, shared "el" and "vattenfall" +0.2.
    auto o1 = Bill("A", "el Vattenfall", 100.0, "2025-11-10");
    assert(std::abs(matcher.score(o1, tx) - 0.5) < 1e-9);

    // 10% band +0.2, one shared token +0.1, account +0.4.
    auto o2 = Bill("B", "Vattenfall AB", 96.0, "2025-11-10", "5-5-5");
    assert(std::abs(matcher.score(o2, tx) - 0.7) < 1e-9);

    // Category +0.1 on top of an exact amount.
    auto o3 = Bill("C", "", 104.0, "2025-11-10");
    o3.category = "Housing";
    tx.category = "housing";
    assert(std::abs(matcher.score(o3, tx) - 0.6) < 1e-9);

    // An account without digits is no identifier.
    auto o4 = Bill("D", "", 500.0, "2025-11-10", "n/a");
    auto noAccount = Tx("T2", "x", -500.0, "2025-11-10", "none");
    assert(std::abs(matcher.score(o4, noAccount) - 0.5) < 1e-9);

    assert(application::NormalizeAccount("SE12 3456-78") == "12345678");
    std::cout << "[PASS] Weights add up as expected." << std::endl;
}

void TestAmountBandEdges() {
    std::cout << "[Test] Amount band edges..." << std::endl;
    ReconciliationMatcher matcher;
    auto bill = Bill("OB-1", "Vattenfall", 1000.0, "2025-11-10");

    // Substring +0.3 in every case; only the amount band changes.
    auto justInside = Tx("TX-1", "Vattenfall AB", -951.0, "2025-11-10");
    assert(std::abs(matcher.score(bill, justInside) - 0.6) < 1e-9);

    auto atFive = Tx("TX-2", "Vattenfall AB", -950.0, "2025-11-10");
    assert(std::abs(matcher.score(bill, atFive) - 0.5) < 1e-9);

    auto atTen = Tx("TX-3", "Vattenfall AB", -900.0, "2025-11-10");
    assert(std::abs(matcher.score(bill, atTen) - 0.3) < 1e-9);

    // At exactly 5% a category match is not enough to accept.
    std::vector<domain::Obligation> obligations = {bill};
    obligations[0].category = "Utilities";
    std::vector<domain::Transaction> transactions = {atFive};
    transactions[0].category = "Utilities";
    assert(std::abs(matcher.score(obligations[0], transactions[0]) - 0.6) < 1e-9);
    assert(matcher.reconcile(obligations, transactions).empty());
    assert(obligations[0].status == ObligationStatus::Scheduled);
    std::cout << "[PASS] 5% and 10% are exclusive bounds." << std::endl;
}

void TestOneTransactionPerPass() {
    std::cout << "[Test] Transaction used once..." << std::endl;
    ReconciliationMatcher matcher;
    std::vector<domain::Obligation> obligations = {
        Bill("OB-1", "Netflix", 129.0, "2025-11-05"),
        Bill("OB-2", "Netflix", 129.0, "2025-11-05")
    };
    std::vector<domain::Transaction> transactions = {Tx("TX-1", "NETFLIX.COM", -129.0, "2025-11-05")};

    auto matches = matcher.reconcile(obligations, transactions);
    assert(matches.size() == 1);
    assert(matches[0].obligationRef == "OB-1");
    assert(obligations[1].status == ObligationStatus::Scheduled);

    // Second pass: nothing left to link.
    assert(matcher.reconcile(obligations, transactions).empty());

    std::set<std::string> linked;
    for (const auto& m : matches) assert(linked.insert(m.transactionRef).second);
    std::cout << "[PASS] No transaction linked twice." << std::endl;
}

void TestTieGoesToFirstTransaction() {
    std::cout << "[Test] Ties..." << std::endl;
    ReconciliationMatcher matcher;
    std::vector<domain::Obligation> obligations = {Bill("OB-1", "Gym", 399.0, "2025-11-01")};
    std::vector<domain::Transaction> transactions = {
        Tx("TX-A", "Gym membership", -399.0, "2025-11-01"),
        Tx("TX-B", "Gym membership", -399.0, "2025-11-01")
    };
    auto matches = matcher.reconcile(obligations, transactions);
    assert(matches.size() == 1 && matches[0].transactionRef == "TX-A");
    assert(!transactions[1].reconciled);
    std::cout << "[PASS] First in input order wins." << std::endl;
}

void TestCandidateFilters() {
    std::cout << "[Test] Candidate filters..." << std::endl;
    ReconciliationMatcher matcher;

    // Outside the date window.
    std::vector<domain::Obligation> late = {Bill("OB-1", "Insurance", 300.0, "2025-11-01")};
    std::vector<domain::Transaction> farAway = {Tx("TX-1", "Insurance", -300.0, "2025-11-20")};
    assert(matcher.reconcile(late, farAway).empty());
    assert(matcher.reconcile(late, farAway, 30, 5.0).size() == 1);

    // Wrong direction.
    std::vector<domain::Obligation> bills = {Bill("OB-2", "Insurance", 300.0, "2025-11-01")};
    std::vector<domain::Transaction> refund = {Tx("TX-2", "Insurance", 300.0, "2025-11-01")};
    assert(matcher.reconcile(bills, refund).empty());

    // Paid obligations and reconciled transactions are skipped.
    std::vector<domain::Obligation> paid = {Bill("OB-3", "Insurance", 300.0, "2025-11-01")};
    paid[0].status = ObligationStatus::Paid;
    std::vector<domain::Transaction> open = {Tx("TX-3", "Insurance", -300.0, "2025-11-01")};
    assert(matcher.reconcile(paid, open).empty());

    std::vector<domain::Obligation> overdue = {Bill("OB-4", "Insurance", 300.0, "2025-11-01")};
    overdue[0].status = ObligationStatus::Overdue;
    assert(matcher.reconcile(overdue, open).size() == 1);

    // Unparseable dates never match.
    std::vector<domain::Obligation> undated = {Bill("OB-5", "Insurance", 300.0, "soon")};
    std::vector<domain::Transaction> fresh = {Tx("TX-5", "Insurance", -300.0, "2025-11-01")};
    assert(matcher.reconcile(undated, fresh).empty());

    std::vector<domain::Obligation> none;
    assert(matcher.reconcile(none, fresh).empty());
    std::cout << "[PASS] Filters respected." << std::endl;
}

void TestAcceptedMatchesRespectThreshold() {
    std::cout << "[Test] Accepted confidences..." << std::endl;
    application::ReconciliationSettings settings;
    settings.acceptanceThreshold = 0.75;
    ReconciliationMatcher matcher(settings);

    std::vector<domain::Obligation> obligations = {
        Bill("OB-1", "Telia", 399.0, "2025-11-10"),
        Bill("OB-2", "Water", 250.0, "2025-11-12", "9999"),
        Bill("OB-3", "Parking permit", 700.0, "2025-11-20")
    };
    std::vector<domain::Transaction> transactions = {
        Tx("TX-1", "TELIA SVERIGE", -399.0, "2025-11-09"),
        Tx("TX-2", "Kommun water", -262.0, "2025-11-12", "9999"),
        Tx("TX-3", "Parking", -650.0, "2025-11-21")
    };

    auto matches = matcher.reconcile(obligations, transactions);
    assert(!matches.empty());
    for (const auto& m : matches) {
        assert(m.confidence >= 0.75 && m.confidence <= 1.0);
    }
    std::cout << "[PASS] " << matches.size() << " accepted, all within bounds." << std::endl;
}

void TestOverdueAndManualMatch() {
    std::cout << "[Test] Overdue and manual matching..." << std::endl;
    ReconciliationMatcher matcher;
    std::vector<domain::Obligation> obligations = {
        Bill("OB-1", "Rent", 8000.0, "2025-10-28"),
        Bill("OB-2", "Phone", 299.0, "2025-11-30"),
        Bill("OB-3", "Gym", 399.0, "2025-10-01")
    };
    obligations[2].status = ObligationStatus::Paid;

    auto today = *domain::CalendarDate::Parse("2025-11-02");
    assert(matcher.markOverdue(obligations, today) == 1);
    assert(obligations[0].status == ObligationStatus::Overdue);
    assert(obligations[1].status == ObligationStatus::Scheduled);
    assert(obligations[2].status == ObligationStatus::Paid);

    auto open = matcher.unmatched(obligations);
    assert(open.size() == 2);

    auto tx = Tx("TX-9", "Transfer to landlord", -8000.0, "2025-11-02");
    auto manual = matcher.manualMatch(obligations[0], tx);
    assert(manual && manual->confidence == 1.0);
    assert(obligations[0].status == ObligationStatus::Paid);
    assert(tx.reconciled);

    assert(!matcher.manualMatch(obligations[1], tx));  // transaction already used
    auto other = Tx("TX-10", "Gym", -399.0, "2025-10-01");
    assert(!matcher.manualMatch(obligations[2], other)); // obligation already paid
    assert(matcher.unmatched(obligations).size() == 1);
    std::cout << "[PASS] Lifecycle transitions applied." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] ReconciliationMatcher suite" << std::endl;
    TestElectricityScenario();
    TestPoorMatchRejected();
    TestScoreComponents();
    TestAmountBandEdges();
    TestOneTransactionPerPass();
    TestTieGoesToFirstTransaction();
    TestCandidateFilters();
    TestAcceptedMatchesRespectThreshold();
    TestOverdueAndManualMatch();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
