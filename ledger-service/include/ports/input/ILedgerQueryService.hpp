#pragma once

#include "domain/Account.hpp"
#include "domain/AccountBalance.hpp"
#include "domain/BitcoinLot.hpp"
#include "domain/DisposalFilter.hpp"
#include "domain/GainsSummary.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/LotDisposal.hpp"
#include <optional>
#include <vector>

namespace btctax::ports::input {

/**
 * @brief Интерфейс чтения леджера (балансы, лоты, доходы)
 *
 * Input Port. Только чтение последнего зафиксированного состояния,
 * может выполняться параллельно с записью.
 */
class ILedgerQueryService {
public:
    virtual ~ILedgerQueryService() = default;

    virtual std::vector<domain::Account> accounts() = 0;

    /**
     * @brief Балансы всех счетов, External по каждой валюте отдельно
     */
    virtual std::vector<domain::AccountBalance> accountBalances() = 0;

    /**
     * @brief Баланс счёта в его валюте
     *
     * @return AccountBalance или nullopt для неизвестного счёта
     */
    virtual std::optional<domain::AccountBalance> accountBalance(domain::AccountId id) = 0;

    virtual std::vector<domain::LedgerEntry> ledgerEntries() = 0;

    /**
     * @brief Все лоты в порядке FIFO
     */
    virtual std::vector<domain::BitcoinLot> lots() = 0;

    virtual std::vector<domain::BitcoinLot> openLots() = 0;

    virtual std::vector<domain::LotDisposal> disposals(const domain::DisposalFilter& filter) = 0;

    /**
     * @brief Открытые лоты на момент cutoff (например, на 1 января)
     *
     * @note Вычисляется в памяти, зафиксированное состояние не меняется
     */
    virtual std::vector<domain::BitcoinLot> openLotsAsOf(const domain::Timestamp& cutoff) = 0;

    /**
     * @brief Сводка доходов за год или за всю историю
     */
    virtual domain::GainsSummary gainsSummary(std::optional<int> year) = 0;

    /**
     * @brief Средняя стоимость 1 BTC по открытым лотам (0 если BTC нет)
     */
    virtual domain::Decimal averageCostBasis() = 0;
};

} // namespace btctax::ports::input
