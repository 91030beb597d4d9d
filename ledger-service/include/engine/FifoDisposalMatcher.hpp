#pragma once

#include "EngineOptions.hpp"
#include "domain/AccountDirectory.hpp"
#include "domain/BitcoinLot.hpp"
#include "domain/LotDisposal.hpp"
#include "domain/Transaction.hpp"
#include <optional>
#include <vector>

namespace btctax::engine {

/**
 * @brief Запрос на выбытие BTC, выведенный из транзакции
 */
struct DisposalRequest {
    domain::Decimal quantityBtc;                ///< Сколько BTC списать из лотов
    domain::Decimal totalProceedsUsd;           ///< Делится между фрагментами пропорционально
    std::optional<domain::Decimal> totalFmvUsd; ///< Справочная стоимость (безвозмездное выбытие)
    bool forceZeroGain = false;                 ///< Gift/Donation/Lost
};

/**
 * @brief FIFO-сопоставление выбытий с открытыми лотами
 *
 * Лоты расходуются в порядке (acquiredDate, createdTxnId). На каждый
 * затронутый лот выпускается один фрагмент. Базис и выручка фрагмента
 * округляются HALF_DOWN до центов, внутренние доли точные.
 */
class FifoDisposalMatcher {
public:
    explicit FifoDisposalMatcher(domain::AccountDirectory accounts = domain::AccountDirectory(),
                                 EngineOptions options = EngineOptions())
        : accounts_(std::move(accounts)), options_(options) {}

    /**
     * @brief Вывести запрос на выбытие или nullopt, если транзакция BTC не расходует
     *
     * - Sell: amount, выручка за вычетом USD-комиссии
     * - Withdrawal с BTC-счёта: amount + BTC-комиссия
     * - Transfer с BTC-комиссией: только комиссия (если включено политикой)
     */
    std::optional<DisposalRequest> requestFor(const domain::Transaction& transaction) const;

    /**
     * @brief Израсходовать лоты под запрос
     *
     * Достаточность проверяется до изменения лотов, поэтому при ошибке
     * lots остаются нетронутыми. ID фрагментов назначает движок.
     *
     * @throws InsufficientFundsError если открытых BTC не хватает
     * @throws ConsistencyError если остаток лота ушёл бы в минус
     */
    std::vector<domain::LotDisposal> match(const domain::Transaction& transaction,
                                           const DisposalRequest& request,
                                           std::vector<domain::BitcoinLot>& lots) const;

    /**
     * @brief Итог по фрагментам транзакции
     *
     * Фрагменты должны идти в порядке FIFO: период владения берётся
     * у первого (самого старого лота).
     */
    static domain::DisposalSummary summarize(const std::vector<domain::LotDisposal>& fragments);

    domain::HoldingPeriod classify(const domain::Timestamp& acquired,
                                   const domain::Timestamp& disposed) const;

private:
    domain::AccountDirectory accounts_;
    EngineOptions options_;
};

} // namespace btctax::engine
