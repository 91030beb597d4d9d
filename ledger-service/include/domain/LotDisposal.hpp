#pragma once

#include "Decimal.hpp"
#include "Identifiers.hpp"
#include "enums/HoldingPeriod.hpp"
#include <optional>

namespace btctax::domain {

/**
 * @brief Фрагмент выбытия: часть одного лота, израсходованная транзакцией
 *
 * Фрагменты являются источником истины для налоговой отчётности.
 */
struct LotDisposal {
    DisposalId id = 0;
    LotId lotId = 0;
    TransactionId transactionId = 0;
    Decimal disposedBtc;
    Decimal disposalBasisUsd;
    Decimal proceedsUsd;                ///< Доля выручки транзакции
    std::optional<Decimal> fmvUsd;      ///< Справочно, для Gift/Donation/Lost
    Decimal realizedGainUsd;
    HoldingPeriod holdingPeriod = HoldingPeriod::SHORT;

    bool operator==(const LotDisposal& other) const = default;
};

} // namespace btctax::domain
