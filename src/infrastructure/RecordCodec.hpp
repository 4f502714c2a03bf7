/**
 * @file RecordCodec.hpp
 * @brief JSON mapping for transactions, obligations and loans exchanged with callers.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Loan.hpp"
#include "domain/Obligation.hpp"
#include "domain/Transaction.hpp"

namespace ledgerwise::infrastructure {

/**
 * @class RecordCodec
 * @brief Static converters between domain records and snake_case JSON objects.
 *
 * Lists are accepted either as a bare array or wrapped in an object under the
 * plural key ("transactions", "obligations", "loans"). Malformed entries are
 * skipped with a log line.
 */
class RecordCodec {
public:
    static nlohmann::json ToJson(const domain::Transaction& transaction);
    static nlohmann::json ToJson(const domain::Obligation& obligation);
    static nlohmann::json ToJson(const domain::Loan& loan);
    static nlohmann::json ToJson(const domain::MatchCandidate& match);
    static nlohmann::json ToJson(const domain::LoanPaymentMatch& match);

    static std::optional<domain::Transaction> TransactionFromJson(const nlohmann::json& j);
    static std::optional<domain::Obligation> ObligationFromJson(const nlohmann::json& j);
    static std::optional<domain::Loan> LoanFromJson(const nlohmann::json& j);

    static std::vector<domain::Transaction> ParseTransactions(const std::string& text);
    static std::vector<domain::Obligation> ParseObligations(const std::string& text);
    static std::vector<domain::Loan> ParseLoans(const std::string& text);
};

} // namespace ledgerwise::infrastructure
