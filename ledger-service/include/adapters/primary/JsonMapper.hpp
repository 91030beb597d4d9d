#pragma once

#include "domain/Account.hpp"
#include "domain/AccountBalance.hpp"
#include "domain/BitcoinLot.hpp"
#include "domain/GainsSummary.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/LotDisposal.hpp"
#include "domain/TransactionRecord.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace btctax::adapters::primary {

/**
 * @brief Преобразования между JSON и доменными типами
 *
 * Десятичные значения выводятся строками, чтобы не терять точность.
 * На входе принимаются строки и целые числа; дробные JSON-числа
 * допускаются, если их запись не экспоненциальная.
 */
class JsonMapper {
public:
    /**
     * @throws ValidationError при неверной структуре или значении
     */
    static domain::TransactionRecord recordFromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw domain::ValidationError("Transaction must be a JSON object");
        }

        try {
            domain::TransactionRecord r;
            if (!j.contains("type") || !j["type"].is_string()) {
                throw domain::ValidationError("Field 'type' is required");
            }
            r.type = j["type"].get<std::string>();

            r.id = optionalInt<domain::TransactionId>(j, "id");
            if (auto ts = optionalString(j, "timestamp")) {
                r.timestamp = domain::Timestamp::fromString(*ts);
            }
            r.fromAccountId = optionalInt<domain::AccountId>(j, "from_account_id");
            r.toAccountId = optionalInt<domain::AccountId>(j, "to_account_id");
            r.amount = optionalDecimal(j, "amount");
            r.feeAmount = optionalDecimal(j, "fee_amount");
            r.feeCurrency = optionalString(j, "fee_currency");
            r.costBasisUsd = optionalDecimal(j, "cost_basis_usd");
            r.proceedsUsd = optionalDecimal(j, "proceeds_usd");
            r.fmvUsd = optionalDecimal(j, "fmv_usd");
            r.feeValueUsd = optionalDecimal(j, "fee_value_usd");
            r.purpose = optionalString(j, "purpose").value_or("");
            r.source = optionalString(j, "source").value_or("");
            r.isLocked = j.value("is_locked", false);
            r.groupId = optionalInt<int64_t>(j, "group_id");
            r.externalRef = optionalString(j, "external_ref").value_or("");
            return r;
        } catch (const nlohmann::json::exception& e) {
            throw domain::ValidationError(std::string("Malformed transaction JSON: ") + e.what());
        } catch (const std::logic_error& e) {
            throw domain::ValidationError(e.what());
        }
    }

    static std::vector<domain::TransactionRecord> recordsFromJson(const nlohmann::json& j) {
        if (!j.is_array()) {
            throw domain::ValidationError("Expected a JSON array of transactions");
        }
        std::vector<domain::TransactionRecord> records;
        for (const auto& item : j) {
            records.push_back(recordFromJson(item));
        }
        return records;
    }

    static nlohmann::json toJson(const domain::Transaction& tx) {
        domain::TransactionRecord r = domain::toRecord(tx);

        nlohmann::json j;
        j["id"] = tx.id;
        j["type"] = r.type;
        j["timestamp"] = tx.timestamp.toString();
        j["from_account_id"] = tx.fromAccountId();
        j["to_account_id"] = tx.toAccountId();
        j["amount"] = tx.amount().toString();
        j["fee_amount"] = decimalOrNull(r.feeAmount);
        j["fee_currency"] = r.feeCurrency ? nlohmann::json(*r.feeCurrency) : nlohmann::json(nullptr);
        j["cost_basis_usd"] = decimalOrNull(r.costBasisUsd);
        j["proceeds_usd"] = decimalOrNull(r.proceedsUsd);
        j["fmv_usd"] = decimalOrNull(r.fmvUsd);
        j["fee_value_usd"] = decimalOrNull(r.feeValueUsd);
        j["purpose"] = r.purpose.empty() ? nlohmann::json(nullptr) : nlohmann::json(r.purpose);
        j["source"] = r.source.empty() ? nlohmann::json(nullptr) : nlohmann::json(r.source);
        j["is_locked"] = tx.isLocked;
        j["group_id"] = tx.groupId ? nlohmann::json(*tx.groupId) : nlohmann::json(nullptr);
        j["external_ref"] = tx.externalRef;
        j["created_at"] = tx.createdAt.toString();
        j["updated_at"] = tx.updatedAt.toString();

        if (tx.summary) {
            j["realized_gain_usd"] = tx.summary->realizedGainUsd.toString();
            j["holding_period"] = domain::toString(tx.summary->holdingPeriod);
            j["disposal"] = {
                {"cost_basis_usd", tx.summary->costBasisUsd.toString()},
                {"proceeds_usd", tx.summary->proceedsUsd.toString()},
                {"mixed_holding_periods", tx.summary->mixedHoldingPeriods}
            };
        } else {
            j["realized_gain_usd"] = nullptr;
            j["holding_period"] = nullptr;
        }
        return j;
    }

    static nlohmann::json toJson(const domain::Account& account) {
        std::string role = account.isExternal() ? "external" : (account.isHolding() ? "holding" : "fees");
        return {
            {"id", account.id},
            {"name", account.name},
            {"currency", account.isExternal() ? nlohmann::json(nullptr) : nlohmann::json(domain::toString(account.currency))},
            {"role", role}
        };
    }

    static nlohmann::json toJson(const domain::AccountBalance& balance) {
        return {
            {"account_id", balance.accountId},
            {"name", balance.name},
            {"currency", domain::toString(balance.currency)},
            {"balance", balance.balance.toString(domain::displayScale(balance.currency))}
        };
    }

    static nlohmann::json toJson(const domain::LedgerEntry& entry) {
        return {
            {"id", entry.id},
            {"transaction_id", entry.transactionId},
            {"account_id", entry.accountId},
            {"amount", entry.amount.toString()},
            {"currency", domain::toString(entry.currency)},
            {"entry_type", domain::toString(entry.entryType)}
        };
    }

    static nlohmann::json toJson(const domain::BitcoinLot& lot) {
        return {
            {"id", lot.id},
            {"created_txn_id", lot.createdTxnId},
            {"acquired_date", lot.acquiredDate.toString()},
            {"total_btc", lot.totalBtc.toString()},
            {"remaining_btc", lot.remainingBtc.toString()},
            {"cost_basis_usd", lot.costBasisUsd.toString()}
        };
    }

    static nlohmann::json toJson(const domain::LotDisposal& d) {
        return {
            {"id", d.id},
            {"lot_id", d.lotId},
            {"transaction_id", d.transactionId},
            {"disposed_btc", d.disposedBtc.toString()},
            {"disposal_basis_usd", d.disposalBasisUsd.toString(domain::Decimal::USD_SCALE)},
            {"proceeds_usd_for_that_portion", d.proceedsUsd.toString(domain::Decimal::USD_SCALE)},
            {"fmv_usd", decimalOrNull(d.fmvUsd)},
            {"realized_gain_usd", d.realizedGainUsd.toString(domain::Decimal::USD_SCALE)},
            {"holding_period", domain::toString(d.holdingPeriod)}
        };
    }

    static nlohmann::json toJson(const domain::GainsSummary& s) {
        auto usd = [](const domain::Decimal& v) { return v.toString(domain::Decimal::USD_SCALE); };
        auto btc = [](const domain::Decimal& v) { return v.toString(domain::Decimal::BTC_SCALE); };
        return {
            {"year", s.year ? nlohmann::json(*s.year) : nlohmann::json(nullptr)},
            {"short_term_gains", usd(s.shortTermGains)},
            {"short_term_losses", usd(s.shortTermLosses)},
            {"short_term_net", usd(s.shortTermNet)},
            {"long_term_gains", usd(s.longTermGains)},
            {"long_term_losses", usd(s.longTermLosses)},
            {"long_term_net", usd(s.longTermNet)},
            {"total_net_capital_gain_loss", usd(s.totalNetCapitalGainLoss)},
            {"sells_proceeds", usd(s.sellsProceedsUsd)},
            {"withdrawals_spent", usd(s.withdrawalsSpentUsd)},
            {"income_earned", usd(s.incomeEarnedUsd)},
            {"income_btc", btc(s.incomeBtc)},
            {"interest_earned", usd(s.interestEarnedUsd)},
            {"interest_btc", btc(s.interestBtc)},
            {"rewards_earned", usd(s.rewardsEarnedUsd)},
            {"rewards_btc", btc(s.rewardsBtc)},
            {"gifts_received", usd(s.giftsReceivedUsd)},
            {"gifts_received_btc", btc(s.giftsReceivedBtc)},
            {"fees", {{"USD", usd(s.feesUsd)}, {"BTC", btc(s.feesBtc)}}}
        };
    }

    template <typename T>
    static nlohmann::json toJsonArray(const std::vector<T>& items) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& item : items) {
            array.push_back(toJson(item));
        }
        return array;
    }

private:
    static bool present(const nlohmann::json& j, const char* key) {
        return j.contains(key) && !j[key].is_null();
    }

    static std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
        if (!present(j, key)) {
            return std::nullopt;
        }
        return j[key].get<std::string>();
    }

    template <typename T>
    static std::optional<T> optionalInt(const nlohmann::json& j, const char* key) {
        if (!present(j, key)) {
            return std::nullopt;
        }
        if (j[key].is_string()) {
            return static_cast<T>(std::stoll(j[key].get<std::string>()));
        }
        return j[key].get<T>();
    }

    static std::optional<domain::Decimal> optionalDecimal(const nlohmann::json& j, const char* key) {
        if (!present(j, key)) {
            return std::nullopt;
        }
        const auto& value = j[key];
        if (value.is_string()) {
            return domain::Decimal::fromString(value.get<std::string>());
        }
        if (value.is_number_integer()) {
            return domain::Decimal::fromString(value.dump());
        }
        if (value.is_number_float()) {
            throw domain::ValidationError(std::string("Field '") + key +
                                          "' must be a decimal string, got " + value.dump());
        }
        throw domain::ValidationError(std::string("Field '") + key + "' must be an integer or decimal string");
    }

    static nlohmann::json decimalOrNull(const std::optional<domain::Decimal>& value) {
        return value ? nlohmann::json(value->toString()) : nlohmann::json(nullptr);
    }
};

} // namespace btctax::adapters::primary
