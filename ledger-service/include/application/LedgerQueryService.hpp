#pragma once

#include "engine/RecalculationEngine.hpp"
#include "ports/input/ILedgerQueryService.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "settings/ILedgerSettings.hpp"
#include <algorithm>
#include <map>
#include <memory>

namespace btctax::application {

/**
 * @brief Сервис чтения леджера: балансы, лоты, выбытия и сводки доходов
 *
 * Работает только с последним зафиксированным состоянием и блокировку
 * записи не берёт. Запросы, которым нужны и транзакции, и состояние,
 * читают их одним снимком.
 */
class LedgerQueryService : public ports::input::ILedgerQueryService {
public:
    LedgerQueryService(
        std::shared_ptr<ports::output::ILedgerRepository> repository,
        std::shared_ptr<settings::ILedgerSettings> settings
    ) : repository_(std::move(repository))
      , engine_(accounts_, settings->getEngineOptions())
    {}

    std::vector<domain::Account> accounts() override {
        return accounts_.all();
    }

    std::vector<domain::AccountBalance> accountBalances() override {
        auto totals = sumEntries(repository_->loadState());

        std::vector<domain::AccountBalance> result;
        for (const auto& account : accounts_.all()) {
            if (account.isExternal()) {
                for (auto currency : {domain::Currency::USD, domain::Currency::BTC}) {
                    result.push_back(makeBalance(account, currency, totals));
                }
            } else {
                result.push_back(makeBalance(account, account.currency, totals));
            }
        }
        return result;
    }

    std::optional<domain::AccountBalance> accountBalance(domain::AccountId id) override {
        auto account = accounts_.find(id);
        if (!account) {
            return std::nullopt;
        }
        return makeBalance(*account, account->currency, sumEntries(repository_->loadState()));
    }

    std::vector<domain::LedgerEntry> ledgerEntries() override {
        return repository_->loadState().entries;
    }

    std::vector<domain::BitcoinLot> lots() override {
        auto lots = repository_->loadState().lots;
        std::sort(lots.begin(), lots.end(), domain::fifoLess);
        return lots;
    }

    std::vector<domain::BitcoinLot> openLots() override {
        auto all = lots();
        std::vector<domain::BitcoinLot> open;
        std::copy_if(all.begin(), all.end(), std::back_inserter(open),
            [](const domain::BitcoinLot& lot) { return lot.isOpen(); });
        return open;
    }

    std::vector<domain::LotDisposal> disposals(const domain::DisposalFilter& filter) override {
        return disposalsIn(repository_->loadSnapshot(), filter);
    }

    std::vector<domain::BitcoinLot> openLotsAsOf(const domain::Timestamp& cutoff) override {
        return engine_.openLotsAsOf(repository_->loadTransactions(), cutoff);
    }

    domain::GainsSummary gainsSummary(std::optional<int> year) override {
        domain::GainsSummary summary;
        summary.year = year;

        domain::DisposalFilter filter = year ? domain::DisposalFilter::forYear(*year) : domain::DisposalFilter{};
        auto snapshot = repository_->loadSnapshot();

        for (const auto& d : disposalsIn(snapshot, filter)) {
            bool isLong = d.holdingPeriod == domain::HoldingPeriod::LONG;
            if (d.realizedGainUsd.isPositive()) {
                (isLong ? summary.longTermGains : summary.shortTermGains) += d.realizedGainUsd;
            } else if (d.realizedGainUsd.isNegative()) {
                (isLong ? summary.longTermLosses : summary.shortTermLosses) += d.realizedGainUsd.abs();
            }
        }
        summary.shortTermNet = summary.shortTermGains - summary.shortTermLosses;
        summary.longTermNet = summary.longTermGains - summary.longTermLosses;
        summary.totalNetCapitalGainLoss = summary.shortTermNet + summary.longTermNet;

        for (const auto& tx : snapshot.transactions) {
            if (filter.inRange(tx.timestamp)) {
                addTransaction(summary, tx);
            }
        }
        return summary;
    }

    domain::Decimal averageCostBasis() override {
        domain::Decimal btc;
        domain::Decimal basis;
        for (const auto& lot : openLots()) {
            btc += lot.remainingBtc;
            basis += lot.costBasisUsd * (lot.remainingBtc / lot.totalBtc);
        }
        if (btc.isZero()) {
            return domain::Decimal(0);
        }
        return (basis / btc).roundUsd();
    }

private:
    using BalanceKey = std::pair<domain::AccountId, domain::Currency>;

    std::shared_ptr<ports::output::ILedgerRepository> repository_;
    domain::AccountDirectory accounts_;
    engine::RecalculationEngine engine_;

    static std::map<BalanceKey, domain::Decimal> sumEntries(const engine::LedgerState& state) {
        std::map<BalanceKey, domain::Decimal> totals;
        for (const auto& entry : state.entries) {
            totals[{entry.accountId, entry.currency}] += entry.amount;
        }
        return totals;
    }

    static domain::AccountBalance makeBalance(const domain::Account& account, domain::Currency currency,
                                              const std::map<BalanceKey, domain::Decimal>& totals) {
        domain::AccountBalance balance;
        balance.accountId = account.id;
        balance.name = account.name;
        balance.currency = currency;
        auto it = totals.find({account.id, currency});
        if (it != totals.end()) {
            balance.balance = it->second;
        }
        return balance;
    }

    static std::vector<domain::LotDisposal> disposalsIn(const ports::output::LedgerSnapshot& snapshot,
                                                        const domain::DisposalFilter& filter) {
        std::map<domain::TransactionId, domain::Timestamp> timestamps;
        for (const auto& tx : snapshot.transactions) {
            timestamps.emplace(tx.id, tx.timestamp);
        }

        std::vector<domain::LotDisposal> result;
        for (const auto& disposal : snapshot.state.disposals) {
            auto it = timestamps.find(disposal.transactionId);
            if (it != timestamps.end() && filter.matches(it->second, disposal.holdingPeriod)) {
                result.push_back(disposal);
            }
        }
        return result;
    }

    void addTransaction(domain::GainsSummary& summary, const domain::Transaction& tx) const {
        if (const auto& fee = tx.fee()) {
            (fee->currency == domain::Currency::USD ? summary.feesUsd : summary.feesBtc) += fee->amount;
        }

        if (const auto* s = tx.as<domain::Sell>()) {
            summary.sellsProceedsUsd += s->proceedsUsd;
        } else if (const auto* w = tx.as<domain::Withdrawal>()) {
            if (w->purpose == domain::TransactionPurpose::SPENT && w->proceedsUsd) {
                summary.withdrawalsSpentUsd += *w->proceedsUsd;
            }
        } else if (const auto* d = tx.as<domain::Deposit>()) {
            // Для BTC стоимость на дату получения хранится в cost_basis_usd
            bool isBtc = accounts_.currencyOf(d->to) == domain::Currency::BTC;
            domain::Decimal usd = isBtc ? d->costBasisUsd : d->amount;
            domain::Decimal btc = isBtc ? d->amount : domain::Decimal(0);

            switch (d->source) {
                case domain::TransactionSource::INCOME:
                    summary.incomeEarnedUsd += usd;
                    summary.incomeBtc += btc;
                    break;
                case domain::TransactionSource::INTEREST:
                    summary.interestEarnedUsd += usd;
                    summary.interestBtc += btc;
                    break;
                case domain::TransactionSource::REWARD:
                    summary.rewardsEarnedUsd += usd;
                    summary.rewardsBtc += btc;
                    break;
                case domain::TransactionSource::GIFT:
                    summary.giftsReceivedUsd += usd;
                    summary.giftsReceivedBtc += btc;
                    break;
                default:
                    break;
            }
        }
    }
};

} // namespace btctax::application
