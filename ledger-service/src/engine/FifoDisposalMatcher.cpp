#include "engine/FifoDisposalMatcher.hpp"
#include "domain/LedgerErrors.hpp"

#include <algorithm>
#include <numeric>

namespace btctax::engine {

using namespace btctax::domain;

std::optional<DisposalRequest> FifoDisposalMatcher::requestFor(const Transaction& transaction) const {
    if (const auto* s = transaction.as<Sell>()) {
        DisposalRequest request;
        request.quantityBtc = s->amount;
        request.totalProceedsUsd = s->proceedsUsd - transaction.feeIn(Currency::USD);
        return request;
    }

    if (const auto* w = transaction.as<Withdrawal>()) {
        if (accounts_.currencyOf(w->from) != Currency::BTC) {
            return std::nullopt;
        }
        DisposalRequest request;
        request.quantityBtc = w->amount + transaction.feeIn(Currency::BTC);
        if (isNonSaleDisposition(w->purpose)) {
            request.totalProceedsUsd = Decimal(0);
            request.totalFmvUsd = w->fmvUsd;
            request.forceZeroGain = true;
        } else {
            request.totalProceedsUsd = w->proceedsUsd.value_or(Decimal(0));
        }
        return request;
    }

    if (const auto* t = transaction.as<Transfer>()) {
        Decimal fee = transaction.feeIn(Currency::BTC);
        if (!options_.transferFeeIsDisposal || !fee.isPositive() ||
            accounts_.currencyOf(t->from) != Currency::BTC) {
            return std::nullopt;
        }
        DisposalRequest request;
        request.quantityBtc = fee;
        request.totalProceedsUsd = t->feeValueUsd.value_or(Decimal(0));
        return request;
    }

    return std::nullopt;
}

std::vector<LotDisposal> FifoDisposalMatcher::match(const Transaction& transaction,
                                                    const DisposalRequest& request,
                                                    std::vector<BitcoinLot>& lots) const {
    if (!request.quantityBtc.isPositive()) {
        throw ConsistencyError("Transaction " + std::to_string(transaction.id) +
                               ": disposal quantity must be positive", transaction.id);
    }

    std::vector<BitcoinLot*> open;
    for (auto& lot : lots) {
        if (lot.isOpen()) {
            open.push_back(&lot);
        }
    }

    Decimal available = std::accumulate(open.begin(), open.end(), Decimal(0),
        [](const Decimal& sum, const BitcoinLot* lot) { return sum + lot->remainingBtc; });
    if (available < request.quantityBtc) {
        throw InsufficientFundsError(transaction.id, request.quantityBtc, available);
    }

    std::sort(open.begin(), open.end(),
        [](const BitcoinLot* a, const BitcoinLot* b) { return fifoLess(*a, *b); });

    std::vector<LotDisposal> fragments;
    Decimal required = request.quantityBtc;

    for (BitcoinLot* lot : open) {
        if (!required.isPositive()) {
            break;
        }

        Decimal consumed = Decimal::min(required, lot->remainingBtc);
        Decimal shareOfLot = consumed / lot->totalBtc;
        Decimal shareOfRequest = consumed / request.quantityBtc;

        LotDisposal fragment;
        fragment.lotId = lot->id;
        fragment.transactionId = transaction.id;
        fragment.disposedBtc = consumed;
        fragment.disposalBasisUsd = (lot->costBasisUsd * shareOfLot).roundUsd();
        fragment.proceedsUsd = (request.totalProceedsUsd * shareOfRequest).roundUsd();
        if (request.totalFmvUsd) {
            fragment.fmvUsd = (*request.totalFmvUsd * shareOfRequest).roundUsd();
        }
        fragment.realizedGainUsd = request.forceZeroGain
            ? Decimal(0)
            : fragment.proceedsUsd - fragment.disposalBasisUsd;
        fragment.holdingPeriod = classify(lot->acquiredDate, transaction.timestamp);

        lot->remainingBtc -= consumed;
        if (lot->remainingBtc.isNegative()) {
            throw ConsistencyError("Lot " + std::to_string(lot->id) + " remaining BTC went negative",
                                   transaction.id);
        }
        required -= consumed;
        fragments.push_back(fragment);
    }

    if (!required.isZero()) {
        throw ConsistencyError("Transaction " + std::to_string(transaction.id) +
                               ": " + required.toString() + " BTC left unmatched", transaction.id);
    }
    return fragments;
}

DisposalSummary FifoDisposalMatcher::summarize(const std::vector<LotDisposal>& fragments) {
    DisposalSummary summary;
    if (fragments.empty()) {
        return summary;
    }

    summary.holdingPeriod = fragments.front().holdingPeriod;
    for (const auto& fragment : fragments) {
        summary.costBasisUsd += fragment.disposalBasisUsd;
        summary.proceedsUsd += fragment.proceedsUsd;
        summary.realizedGainUsd += fragment.realizedGainUsd;
        if (fragment.holdingPeriod != summary.holdingPeriod) {
            summary.mixedHoldingPeriods = true;
        }
    }
    return summary;
}

HoldingPeriod FifoDisposalMatcher::classify(const Timestamp& acquired, const Timestamp& disposed) const {
    return disposed.wholeDaysSince(acquired) > options_.longTermThresholdDays
        ? HoldingPeriod::LONG
        : HoldingPeriod::SHORT;
}

} // namespace btctax::engine
