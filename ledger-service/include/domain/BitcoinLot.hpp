#pragma once

#include "Decimal.hpp"
#include "Identifiers.hpp"
#include "Timestamp.hpp"

namespace btctax::domain {

/**
 * @brief Лот: партия BTC, приобретённая одной транзакцией
 *
 * acquiredDate служит якорем FIFO и периода владения. Лот не привязан
 * к счёту: переводы между своими счетами его не меняют.
 */
struct BitcoinLot {
    LotId id = 0;
    TransactionId createdTxnId = 0;
    Timestamp acquiredDate;
    Decimal totalBtc;
    Decimal remainingBtc;       ///< Не возрастает, >= 0
    Decimal costBasisUsd;       ///< На весь лот

    bool isOpen() const { return remainingBtc.isPositive(); }

    bool operator==(const BitcoinLot& other) const = default;
};

/**
 * @brief Порядок FIFO: (acquiredDate, createdTxnId) по возрастанию
 */
inline bool fifoLess(const BitcoinLot& a, const BitcoinLot& b) {
    if (a.acquiredDate != b.acquiredDate) {
        return a.acquiredDate < b.acquiredDate;
    }
    return a.createdTxnId < b.createdTxnId;
}

} // namespace btctax::domain
