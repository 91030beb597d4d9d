#pragma once

#include "domain/BitcoinLot.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/LotDisposal.hpp"
#include "domain/Transaction.hpp"
#include <map>
#include <optional>
#include <vector>

namespace btctax::engine {

/**
 * @brief Производное состояние леджера: результат воспроизведения истории
 *
 * Проводки, лоты и фрагменты хранятся в порядке воспроизведения,
 * их ID последовательны. Итоги выбытия индексируются ID транзакции.
 */
struct LedgerState {
    std::vector<domain::LedgerEntry> entries;
    std::vector<domain::BitcoinLot> lots;
    std::vector<domain::LotDisposal> disposals;
    std::map<domain::TransactionId, domain::DisposalSummary> summaries;

    bool empty() const {
        return entries.empty() && lots.empty() && disposals.empty();
    }

    std::vector<domain::LedgerEntry> entriesFor(domain::TransactionId transactionId) const {
        std::vector<domain::LedgerEntry> result;
        for (const auto& entry : entries) {
            if (entry.transactionId == transactionId) {
                result.push_back(entry);
            }
        }
        return result;
    }

    std::vector<domain::LotDisposal> disposalsFor(domain::TransactionId transactionId) const {
        std::vector<domain::LotDisposal> result;
        for (const auto& disposal : disposals) {
            if (disposal.transactionId == transactionId) {
                result.push_back(disposal);
            }
        }
        return result;
    }

    std::vector<domain::LotDisposal> disposalsOfLot(domain::LotId lotId) const {
        std::vector<domain::LotDisposal> result;
        for (const auto& disposal : disposals) {
            if (disposal.lotId == lotId) {
                result.push_back(disposal);
            }
        }
        return result;
    }

    std::optional<domain::BitcoinLot> lotCreatedBy(domain::TransactionId transactionId) const {
        for (const auto& lot : lots) {
            if (lot.createdTxnId == transactionId) {
                return lot;
            }
        }
        return std::nullopt;
    }

    std::optional<domain::DisposalSummary> summaryFor(domain::TransactionId transactionId) const {
        auto it = summaries.find(transactionId);
        if (it == summaries.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool operator==(const LedgerState& other) const = default;
};

} // namespace btctax::engine
