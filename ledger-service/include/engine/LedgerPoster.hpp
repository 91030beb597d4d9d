#pragma once

#include "domain/AccountDirectory.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/Transaction.hpp"
#include <vector>

namespace btctax::engine {

/**
 * @brief Переводит транзакцию в сбалансированный набор проводок
 *
 * Комиссию платит счёт-источник сверх amount. Обмен валют (Buy/Sell)
 * проводится через External, чтобы каждая валюта сходилась в ноль.
 * ID проводок назначает RecalculationEngine.
 */
class LedgerPoster {
public:
    explicit LedgerPoster(domain::AccountDirectory accounts = domain::AccountDirectory())
        : accounts_(std::move(accounts)) {}

    /**
     * @brief Построить проводки транзакции
     *
     * @throws ValidationError если счёт неизвестен или комиссия в чужой валюте
     * @throws ConsistencyError если проводки не сходятся в ноль
     */
    std::vector<domain::LedgerEntry> post(const domain::Transaction& transaction) const;

    /**
     * @brief Проверить, что по каждой валюте сумма проводок равна нулю
     * @throws ConsistencyError при нарушении баланса
     */
    static void verifyBalanced(domain::TransactionId transactionId,
                               const std::vector<domain::LedgerEntry>& entries);

private:
    domain::AccountDirectory accounts_;

    void postDeposit(const domain::Transaction& tx, const domain::Deposit& d,
                     std::vector<domain::LedgerEntry>& out) const;
    void postWithdrawal(const domain::Transaction& tx, const domain::Withdrawal& w,
                        std::vector<domain::LedgerEntry>& out) const;
    void postTransfer(const domain::Transaction& tx, const domain::Transfer& t,
                      std::vector<domain::LedgerEntry>& out) const;
    void postBuy(const domain::Transaction& tx, const domain::Buy& b,
                 std::vector<domain::LedgerEntry>& out) const;
    void postSell(const domain::Transaction& tx, const domain::Sell& s,
                  std::vector<domain::LedgerEntry>& out) const;
};

} // namespace btctax::engine
