#include "engine/RecalculationEngine.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>

namespace btctax::engine {

using namespace btctax::domain;

RecalculationEngine::RecalculationEngine(AccountDirectory accounts, EngineOptions options)
    : poster_(accounts)
    , lotManager_(accounts)
    , matcher_(accounts, options)
    , options_(options)
{
}

std::vector<Transaction> RecalculationEngine::chronological(std::vector<Transaction> transactions) {
    std::sort(transactions.begin(), transactions.end(), chronologicalLess);
    return transactions;
}

LedgerState RecalculationEngine::replay(const std::vector<Transaction>& transactions) const {
    std::cout << "[RecalculationEngine] Full replay of " << transactions.size()
              << " transactions" << std::endl;

    LedgerState state;
    IdSequence ids;
    for (const auto& tx : chronological(transactions)) {
        apply(state, ids, tx);
    }

    std::cout << "[RecalculationEngine] Replay done: " << state.entries.size() << " entries, "
              << state.lots.size() << " lots, " << state.disposals.size() << " disposals" << std::endl;
    return state;
}

LedgerState RecalculationEngine::replayFrom(const LedgerState& committed,
                                            const std::vector<Transaction>& transactions,
                                            const Timestamp& cutoff) const {
    std::set<TransactionId> survivors;
    std::vector<Transaction> tail;
    for (const auto& tx : transactions) {
        if (tx.timestamp < cutoff) {
            survivors.insert(tx.id);
        } else {
            tail.push_back(tx);
        }
    }

    std::cout << "[RecalculationEngine] Partial replay from " << cutoff.toString() << ": "
              << survivors.size() << " kept, " << tail.size() << " replayed" << std::endl;

    LedgerState state;
    for (const auto& entry : committed.entries) {
        if (survivors.count(entry.transactionId)) {
            state.entries.push_back(entry);
        }
    }

    std::set<LotId> keptLots;
    for (const auto& lot : committed.lots) {
        if (survivors.count(lot.createdTxnId)) {
            state.lots.push_back(lot);
            keptLots.insert(lot.id);
        }
    }

    std::map<LotId, Decimal> consumed;
    for (const auto& disposal : committed.disposals) {
        if (survivors.count(disposal.transactionId) && keptLots.count(disposal.lotId)) {
            state.disposals.push_back(disposal);
            consumed[disposal.lotId] += disposal.disposedBtc;
        }
    }

    // Остаток переносится: total минус выжившие фрагменты
    for (auto& lot : state.lots) {
        lot.remainingBtc = lot.totalBtc - consumed[lot.id];
        if (lot.remainingBtc.isNegative()) {
            throw ConsistencyError("Lot " + std::to_string(lot.id) +
                                   " is over-consumed in committed state", lot.createdTxnId);
        }
    }

    for (const auto& [txId, summary] : committed.summaries) {
        if (survivors.count(txId)) {
            state.summaries.emplace(txId, summary);
        }
    }

    IdSequence ids = continueAfter(state);
    for (const auto& tx : chronological(std::move(tail))) {
        apply(state, ids, tx);
    }
    return state;
}

std::vector<BitcoinLot> RecalculationEngine::openLotsAsOf(const std::vector<Transaction>& transactions,
                                                          const Timestamp& cutoff) const {
    std::vector<Transaction> before;
    std::copy_if(transactions.begin(), transactions.end(), std::back_inserter(before),
        [&cutoff](const Transaction& tx) { return tx.timestamp < cutoff; });

    LedgerState snapshot = replay(before);

    std::vector<BitcoinLot> open;
    std::copy_if(snapshot.lots.begin(), snapshot.lots.end(), std::back_inserter(open),
        [](const BitcoinLot& lot) { return lot.isOpen(); });
    std::sort(open.begin(), open.end(), fifoLess);
    return open;
}

void RecalculationEngine::apply(LedgerState& state, IdSequence& ids, const Transaction& transaction) const {
    ReplayStage stage = ReplayStage::PENDING;
    try {
        auto entries = poster_.post(transaction);
        for (auto& entry : entries) {
            entry.id = ids.nextEntry++;
            state.entries.push_back(entry);
        }
        stage = ReplayStage::POSTED;

        if (auto lot = lotManager_.createLot(transaction)) {
            lot->id = ids.nextLot++;
            state.lots.push_back(*lot);
        }
        stage = ReplayStage::LOT_CREATED;

        if (auto request = matcher_.requestFor(transaction)) {
            auto fragments = matcher_.match(transaction, *request, state.lots);
            for (auto& fragment : fragments) {
                fragment.id = ids.nextDisposal++;
                state.disposals.push_back(fragment);
            }
            state.summaries[transaction.id] = FifoDisposalMatcher::summarize(fragments);
        }
        stage = ReplayStage::DISPOSED;
        stage = ReplayStage::FINALIZED;
    } catch (const LedgerError& e) {
        std::cerr << "[RecalculationEngine] Transaction " << transaction.id << " failed after stage "
                  << toString(stage) << ": " << e.what() << std::endl;
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[RecalculationEngine] Transaction " << transaction.id << " failed after stage "
                  << toString(stage) << ": " << e.what() << std::endl;
        throw ReplayError(transaction.id, stage, e.what());
    }
}

RecalculationEngine::IdSequence RecalculationEngine::continueAfter(const LedgerState& state) {
    IdSequence ids;
    for (const auto& entry : state.entries) {
        ids.nextEntry = std::max(ids.nextEntry, entry.id + 1);
    }
    for (const auto& lot : state.lots) {
        ids.nextLot = std::max(ids.nextLot, lot.id + 1);
    }
    for (const auto& disposal : state.disposals) {
        ids.nextDisposal = std::max(ids.nextDisposal, disposal.id + 1);
    }
    return ids;
}

} // namespace btctax::engine
