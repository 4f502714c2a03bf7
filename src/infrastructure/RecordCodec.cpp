/**
 * @file RecordCodec.cpp
 * @brief Implementation of RecordCodec.
 */

#include "infrastructure/RecordCodec.hpp"
#include <iostream>

namespace ledgerwise::infrastructure {

using json = nlohmann::json;

namespace {

std::optional<std::string> OptionalString(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

template <typename T>
void PutOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

json PaymentsToJson(const std::vector<domain::LoanPayment>& payments) {
    json arr = json::array();
    for (const auto& p : payments) {
        arr.push_back({{"date", p.date}, {"amount", p.amount}, {"transaction_ref", p.transactionRef}});
    }
    return arr;
}

std::vector<domain::LoanPayment> PaymentsFromJson(const json& j, const char* key) {
    std::vector<domain::LoanPayment> payments;
    if (!j.contains(key) || !j[key].is_array()) return payments;
    for (const auto& item : j[key]) {
        domain::LoanPayment p;
        p.date = item.value("date", "");
        p.amount = item.value("amount", 0.0);
        p.transactionRef = item.value("transaction_ref", "");
        payments.push_back(p);
    }
    return payments;
}

/** @brief The list itself, or the array under the plural key. */
std::optional<json> ListIn(const std::string& text, const char* key) {
    try {
        json j = json::parse(text);
        if (j.is_array()) return j;
        if (j.is_object() && j.contains(key) && j[key].is_array()) return j[key];
        std::cerr << "[RecordCodec] Expected an array or an object with '" << key << "'" << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "[RecordCodec] Parse error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

template <typename T, typename Fn>
std::vector<T> ParseList(const std::string& text, const char* key, Fn fromJson) {
    std::vector<T> out;
    auto list = ListIn(text, key);
    if (!list) return out;
    for (const auto& item : *list) {
        auto record = fromJson(item);
        if (record) {
            out.push_back(std::move(*record));
        } else {
            std::cerr << "[RecordCodec] Skipping malformed entry in '" << key << "'" << std::endl;
        }
    }
    return out;
}

} // namespace

json RecordCodec::ToJson(const domain::Transaction& tx) {
    json j;
    j["id"] = tx.id;
    j["description"] = tx.description;
    j["amount"] = tx.amount;
    j["date"] = tx.date;
    j["account_ref"] = tx.accountRef;
    j["merchant"] = tx.merchant;
    j["category"] = tx.category;
    j["subcategory"] = tx.subcategory;
    j["confidence_score"] = tx.confidenceScore;
    j["classification_source"] = domain::SourceToString(tx.classificationSource);
    PutOptional(j, "matched_obligation_ref", tx.matchedObligationRef);
    j["reconciled"] = tx.reconciled;
    return j;
}

json RecordCodec::ToJson(const domain::Obligation& o) {
    json j;
    j["id"] = o.id;
    j["kind"] = o.kind == domain::ObligationKind::LoanPayment ? "loan_payment" : "bill";
    j["name"] = o.name;
    j["amount"] = o.amount;
    j["due_date"] = o.dueDate;
    PutOptional(j, "account_ref", o.accountRef);
    PutOptional(j, "category", o.category);
    j["status"] = domain::StatusToString(o.status);
    PutOptional(j, "matched_transaction_ref", o.matchedTransactionRef);
    PutOptional(j, "loan_ref", o.loanRef);
    j["expects_debit"] = o.expectsDebit;
    return j;
}

json RecordCodec::ToJson(const domain::Loan& loan) {
    json j;
    j["id"] = loan.id;
    j["name"] = loan.name;
    PutOptional(j, "loan_number", loan.loanNumber);
    j["principal"] = loan.principal;
    j["current_balance"] = loan.currentBalance;
    PutOptional(j, "payment_account", loan.paymentAccount);
    j["status"] = loan.status == domain::LoanStatus::PaidOff ? "paid_off" : "active";
    j["payments"] = PaymentsToJson(loan.payments);
    j["interest_payments"] = PaymentsToJson(loan.interestPayments);
    return j;
}

json RecordCodec::ToJson(const domain::MatchCandidate& match) {
    return {
        {"obligation_ref", match.obligationRef},
        {"transaction_ref", match.transactionRef},
        {"confidence", match.confidence},
        {"amount_diff", match.amountDiff}
    };
}

json RecordCodec::ToJson(const domain::LoanPaymentMatch& match) {
    json j = ToJson(match.match);
    j["loan_ref"] = match.loanRef;
    j["kind"] = domain::PaymentKindToString(match.kind);
    j["amount"] = match.amount;
    return j;
}

std::optional<domain::Transaction> RecordCodec::TransactionFromJson(const json& j) {
    if (!j.is_object()) return std::nullopt;
    try {
        domain::Transaction tx;
        tx.id = j.value("id", "");
        tx.description = j.value("description", "");
        tx.amount = j.value("amount", 0.0);
        tx.date = j.value("date", "");
        tx.accountRef = j.value("account_ref", "");
        tx.merchant = OptionalString(j, "merchant").value_or("");
        tx.category = OptionalString(j, "category").value_or("");
        tx.subcategory = OptionalString(j, "subcategory").value_or("");
        tx.confidenceScore = j.value("confidence_score", 0.0);
        tx.classificationSource = domain::SourceFromString(OptionalString(j, "classification_source").value_or(""));
        tx.matchedObligationRef = OptionalString(j, "matched_obligation_ref");
        tx.reconciled = j.value("reconciled", false);
        if (tx.description.empty() && tx.merchant.empty()) return std::nullopt;
        return tx;
    } catch (const json::exception& e) {
        std::cerr << "[RecordCodec] Bad transaction: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<domain::Obligation> RecordCodec::ObligationFromJson(const json& j) {
    if (!j.is_object()) return std::nullopt;
    try {
        domain::Obligation o;
        o.id = j.value("id", "");
        o.kind = j.value("kind", "bill") == "loan_payment" ? domain::ObligationKind::LoanPayment
                                                            : domain::ObligationKind::Bill;
        o.name = j.value("name", "");
        o.amount = j.value("amount", 0.0);
        o.dueDate = j.value("due_date", "");
        o.accountRef = OptionalString(j, "account_ref");
        o.category = OptionalString(j, "category");
        o.status = domain::StatusFromString(j.value("status", "scheduled"));
        o.matchedTransactionRef = OptionalString(j, "matched_transaction_ref");
        o.loanRef = OptionalString(j, "loan_ref");
        if (o.loanRef) o.kind = domain::ObligationKind::LoanPayment;
        o.expectsDebit = j.value("expects_debit", true);
        if (o.dueDate.empty()) return std::nullopt;
        return o;
    } catch (const json::exception& e) {
        std::cerr << "[RecordCodec] Bad obligation: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<domain::Loan> RecordCodec::LoanFromJson(const json& j) {
    if (!j.is_object()) return std::nullopt;
    try {
        domain::Loan loan;
        loan.id = j.value("id", "");
        loan.name = j.value("name", "");
        loan.loanNumber = OptionalString(j, "loan_number");
        loan.principal = j.value("principal", 0.0);
        loan.currentBalance = j.value("current_balance", loan.principal);
        loan.paymentAccount = OptionalString(j, "payment_account");
        loan.status = j.value("status", "active") == "paid_off" ? domain::LoanStatus::PaidOff
                                                                : domain::LoanStatus::Active;
        loan.payments = PaymentsFromJson(j, "payments");
        loan.interestPayments = PaymentsFromJson(j, "interest_payments");
        if (loan.id.empty()) return std::nullopt;
        return loan;
    } catch (const json::exception& e) {
        std::cerr << "[RecordCodec] Bad loan: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::vector<domain::Transaction> RecordCodec::ParseTransactions(const std::string& text) {
    return ParseList<domain::Transaction>(text, "transactions", &RecordCodec::TransactionFromJson);
}

std::vector<domain::Obligation> RecordCodec::ParseObligations(const std::string& text) {
    return ParseList<domain::Obligation>(text, "obligations", &RecordCodec::ObligationFromJson);
}

std::vector<domain::Loan> RecordCodec::ParseLoans(const std::string& text) {
    return ParseList<domain::Loan>(text, "loans", &RecordCodec::LoanFromJson);
}

} // namespace ledgerwise::infrastructure
