#pragma once

#include "Decimal.hpp"
#include <optional>

namespace btctax::domain {

/**
 * @brief Сводка доходов и убытков (за год или за всю историю)
 *
 * Доходы и убытки считаются только по фрагментам выбытия.
 */
struct GainsSummary {
    std::optional<int> year;

    Decimal shortTermGains;
    Decimal shortTermLosses;            ///< Положительное число
    Decimal shortTermNet;
    Decimal longTermGains;
    Decimal longTermLosses;
    Decimal longTermNet;
    Decimal totalNetCapitalGainLoss;

    Decimal sellsProceedsUsd;
    Decimal withdrawalsSpentUsd;

    Decimal incomeEarnedUsd;
    Decimal incomeBtc;
    Decimal interestEarnedUsd;
    Decimal interestBtc;
    Decimal rewardsEarnedUsd;
    Decimal rewardsBtc;
    Decimal giftsReceivedUsd;
    Decimal giftsReceivedBtc;

    Decimal feesUsd;
    Decimal feesBtc;
};

} // namespace btctax::domain
