#pragma once

#include "domain/AccountDirectory.hpp"
#include "domain/BitcoinLot.hpp"
#include "domain/Transaction.hpp"
#include <optional>

namespace btctax::engine {

/**
 * @brief Создаёт лот для транзакции, увеличивающей BTC на своих счетах
 *
 * Лот создают Deposit на BTC-счёт и любой Buy. Transfer лот не создаёт:
 * лот сохраняет идентичность и дату приобретения при переводах.
 */
class LotManager {
public:
    explicit LotManager(domain::AccountDirectory accounts = domain::AccountDirectory())
        : accounts_(std::move(accounts)) {}

    /**
     * @brief Лот для транзакции (ID = 0, назначается движком) или nullopt
     *
     * Базис Buy включает USD-комиссию, базис Deposit равен cost_basis_usd.
     */
    std::optional<domain::BitcoinLot> createLot(const domain::Transaction& transaction) const {
        std::optional<domain::Decimal> basis;

        if (const auto* d = transaction.as<domain::Deposit>()) {
            if (accounts_.isHolding(d->to) && accounts_.currencyOf(d->to) == domain::Currency::BTC) {
                basis = d->costBasisUsd;
            }
        } else if (const auto* b = transaction.as<domain::Buy>()) {
            basis = b->costBasisUsd + transaction.feeIn(domain::Currency::USD);
        }

        if (!basis) {
            return std::nullopt;
        }

        domain::BitcoinLot lot;
        lot.createdTxnId = transaction.id;
        lot.acquiredDate = transaction.timestamp;
        lot.totalBtc = transaction.amount();
        lot.remainingBtc = transaction.amount();
        lot.costBasisUsd = *basis;
        return lot;
    }

private:
    domain::AccountDirectory accounts_;
};

} // namespace btctax::engine
