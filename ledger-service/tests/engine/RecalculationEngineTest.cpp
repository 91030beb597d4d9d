/**
 * @file RecalculationEngineTest.cpp
 * @brief Unit tests for RecalculationEngine
 */

#include <gtest/gtest.h>
#include "domain/LedgerErrors.hpp"
#include "engine/RecalculationEngine.hpp"
#include "TestTransactions.hpp"

#include <algorithm>
#include <map>

using namespace btctax::domain;
using namespace btctax::engine;
using namespace btctax::tests;

class RecalculationEngineTest : public ::testing::Test {
protected:
    RecalculationEngine engine_;

    /// Две покупки и продажа: базовый сценарий FIFO
    static std::vector<Transaction> basicHistory() {
        return {
            makeTx(1, "2024-02-01", buy("1", "40000")),
            makeTx(2, "2024-03-01", buy("1", "50000")),
            makeTx(3, "2024-04-01", sell("1", "60000")),
        };
    }

    static Decimal openBtc(const LedgerState& state) {
        Decimal sum;
        for (const auto& lot : state.lots) {
            sum += lot.remainingBtc;
        }
        return sum;
    }

    static Decimal balanceOf(const LedgerState& state, AccountId account, Currency currency) {
        Decimal sum;
        for (const auto& e : state.entries) {
            if (e.accountId == account && e.currency == currency) {
                sum += e.amount;
            }
        }
        return sum;
    }
};

// ============================================================================
// FULL REPLAY
// ============================================================================

TEST_F(RecalculationEngineTest, Replay_Empty_EmptyState) {
    EXPECT_TRUE(engine_.replay({}).empty());
}

TEST_F(RecalculationEngineTest, Replay_BasicFifo_ConsumesOldestLot) {
    auto state = engine_.replay(basicHistory());

    ASSERT_EQ(state.disposals.size(), 1u);
    const auto& fragment = state.disposals[0];
    EXPECT_EQ(fragment.transactionId, 3);
    EXPECT_EQ(fragment.disposalBasisUsd, D("40000"));
    EXPECT_EQ(fragment.realizedGainUsd, D("20000"));
    EXPECT_EQ(fragment.holdingPeriod, HoldingPeriod::SHORT);

    auto summary = state.summaryFor(3);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->costBasisUsd, D("40000"));
    EXPECT_EQ(summary->realizedGainUsd, D("20000"));
}

TEST_F(RecalculationEngineTest, Replay_BackdatedBuy_BecomesFirstLot) {
    auto history = basicHistory();
    history.push_back(makeTx(4, "2024-01-15", buy("1", "30000")));

    auto state = engine_.replay(history);

    ASSERT_EQ(state.disposals.size(), 1u);
    EXPECT_EQ(state.disposals[0].disposalBasisUsd, D("30000"));
    EXPECT_EQ(state.disposals[0].realizedGainUsd, D("30000"));
    EXPECT_EQ(state.lotCreatedBy(4)->remainingBtc, D("0"));
    EXPECT_EQ(state.lotCreatedBy(1)->remainingBtc, D("1"));
}

TEST_F(RecalculationEngineTest, Replay_BackdatedInsert_SameAsChronologicalSubmission) {
    std::vector<Transaction> chronological{
        makeTx(4, "2024-01-15", buy("1", "30000")),
        makeTx(1, "2024-02-01", buy("1", "40000")),
        makeTx(2, "2024-03-01", buy("1", "50000")),
        makeTx(3, "2024-04-01", sell("1", "60000")),
    };
    auto backdated = basicHistory();
    backdated.push_back(chronological.front());

    EXPECT_EQ(engine_.replay(backdated), engine_.replay(chronological));
}

TEST_F(RecalculationEngineTest, Replay_SubmissionOrderIrrelevant) {
    auto history = basicHistory();
    auto reversed = history;
    std::reverse(reversed.begin(), reversed.end());

    EXPECT_EQ(engine_.replay(history), engine_.replay(reversed));
}

TEST_F(RecalculationEngineTest, Replay_Deterministic) {
    auto history = basicHistory();
    history.push_back(makeTx(4, "2024-05-01",
        transfer(accounts::EXCHANGE_BTC, accounts::WALLET, "0.5", btcFee("0.0001"), D("7"))));
    history.push_back(makeTx(5, "2024-06-01",
        withdrawal(accounts::WALLET, "0.2", TransactionPurpose::SPENT, D("13000"))));

    EXPECT_EQ(engine_.replay(history), engine_.replay(history));
}

TEST_F(RecalculationEngineTest, Replay_SameTimestamp_OrderedById) {
    std::vector<Transaction> history{
        makeTx(2, "2024-01-01", buy("1", "50000")),
        makeTx(1, "2024-01-01", buy("1", "40000")),
        makeTx(3, "2024-01-02", sell("0.5", "30000")),
    };

    auto state = engine_.replay(history);

    ASSERT_EQ(state.disposals.size(), 1u);
    EXPECT_EQ(state.disposals[0].disposalBasisUsd, D("20000"));
}

TEST_F(RecalculationEngineTest, Replay_AssignsSequentialIds) {
    auto state = engine_.replay(basicHistory());

    for (size_t i = 0; i < state.entries.size(); ++i) {
        EXPECT_EQ(state.entries[i].id, static_cast<LedgerEntryId>(i + 1));
    }
    ASSERT_EQ(state.lots.size(), 2u);
    EXPECT_EQ(state.lots[0].id, 1);
    EXPECT_EQ(state.lots[1].id, 2);
    EXPECT_EQ(state.disposals[0].id, 1);
}

// ============================================================================
// INVARIANTS
// ============================================================================

TEST_F(RecalculationEngineTest, Replay_EveryCurrencyNetsToZero) {
    auto history = basicHistory();
    history.push_back(makeTx(4, "2024-05-01", deposit(accounts::BANK, "1000", "0", usdFee("2"))));
    history.push_back(makeTx(5, "2024-05-02",
        transfer(accounts::EXCHANGE_BTC, accounts::WALLET, "0.5", btcFee("0.001"))));

    auto state = engine_.replay(history);

    for (const auto& tx : history) {
        std::map<Currency, Decimal> totals;
        for (const auto& e : state.entriesFor(tx.id)) {
            totals[e.currency] += e.amount;
        }
        EXPECT_FALSE(totals.empty()) << "transaction " << tx.id;
        for (const auto& [currency, total] : totals) {
            EXPECT_TRUE(total.isZero()) << "transaction " << tx.id << " " << toString(currency);
        }
    }
}

TEST_F(RecalculationEngineTest, Replay_OpenLotsMatchHoldingBalances) {
    auto history = basicHistory();
    history.push_back(makeTx(4, "2024-05-01",
        transfer(accounts::EXCHANGE_BTC, accounts::WALLET, "0.5", btcFee("0.001"))));
    history.push_back(makeTx(5, "2024-06-01",
        withdrawal(accounts::WALLET, "0.1", TransactionPurpose::GIFT, std::nullopt, btcFee("0.0002"))));

    auto state = engine_.replay(history);

    Decimal held = balanceOf(state, accounts::WALLET, Currency::BTC) +
                   balanceOf(state, accounts::EXCHANGE_BTC, Currency::BTC);
    EXPECT_EQ(openBtc(state), held);
    EXPECT_EQ(held, D("0.8988"));
}

TEST_F(RecalculationEngineTest, Replay_DisposedPlusRemainingEqualsTotal) {
    auto history = basicHistory();
    history.push_back(makeTx(4, "2024-05-01", sell("0.7", "42000")));

    auto state = engine_.replay(history);

    for (const auto& lot : state.lots) {
        Decimal disposed;
        for (const auto& d : state.disposalsOfLot(lot.id)) {
            disposed += d.disposedBtc;
        }
        EXPECT_EQ(disposed + lot.remainingBtc, lot.totalBtc);
    }
}

// ============================================================================
// TRANSFER FEE POLICY
// ============================================================================

TEST_F(RecalculationEngineTest, TransferFee_PolicyOn_CreatesDisposal) {
    std::vector<Transaction> history{
        makeTx(1, "2024-01-01", buy("1", "40000")),
        makeTx(2, "2024-02-01",
               transfer(accounts::EXCHANGE_BTC, accounts::WALLET, "0.5", btcFee("0.0001"), D("5"))),
    };

    auto state = engine_.replay(history);

    ASSERT_EQ(state.disposalsFor(2).size(), 1u);
    EXPECT_EQ(state.disposals[0].disposedBtc, D("0.0001"));
    EXPECT_EQ(state.disposals[0].disposalBasisUsd, D("4"));
    EXPECT_EQ(state.disposals[0].realizedGainUsd, D("1"));
    EXPECT_EQ(state.lots[0].remainingBtc, D("0.9999"));
}

TEST_F(RecalculationEngineTest, TransferFee_PolicyOff_NoDisposal) {
    EngineOptions options;
    options.transferFeeIsDisposal = false;
    RecalculationEngine engine(AccountDirectory(), options);
    std::vector<Transaction> history{
        makeTx(1, "2024-01-01", buy("1", "40000")),
        makeTx(2, "2024-02-01",
               transfer(accounts::EXCHANGE_BTC, accounts::WALLET, "0.5", btcFee("0.0001"))),
    };

    auto state = engine.replay(history);

    EXPECT_TRUE(state.disposals.empty());
    EXPECT_EQ(state.lots[0].remainingBtc, D("1"));
}

// ============================================================================
// ERRORS
// ============================================================================

TEST_F(RecalculationEngineTest, Replay_SellWithoutLots_ThrowsInsufficientFunds) {
    std::vector<Transaction> history{
        makeTx(1, "2024-01-01", buy("0.5", "20000")),
        makeTx(2, "2024-02-01", sell("1", "60000")),
    };

    EXPECT_THROW(engine_.replay(history), InsufficientFundsError);
}

TEST_F(RecalculationEngineTest, Replay_BackdatedSellBeforeBuy_ThrowsInsufficientFunds) {
    std::vector<Transaction> history{
        makeTx(1, "2024-02-01", buy("1", "40000")),
        makeTx(2, "2024-01-01", sell("0.5", "20000")),
    };

    EXPECT_THROW(engine_.replay(history), InsufficientFundsError);
}

TEST(ReplayErrorTest, Message_NamesTransactionAndStage) {
    ReplayError error(7, ReplayStage::LOT_CREATED, "boom");

    EXPECT_EQ(error.transactionId(), std::optional<TransactionId>(7));
    EXPECT_EQ(error.stage(), ReplayStage::LOT_CREATED);
    EXPECT_NE(std::string(error.what()).find("lot-created"), std::string::npos);
    EXPECT_NE(std::string(error.what()).find("boom"), std::string::npos);
}

// ============================================================================
// PARTIAL REPLAY
// ============================================================================

TEST_F(RecalculationEngineTest, ReplayFrom_MatchesFullReplay) {
    auto history = basicHistory();
    auto committed = engine_.replay(history);

    history.push_back(makeTx(4, "2024-03-15", buy("0.5", "26000")));
    history.push_back(makeTx(5, "2024-05-01", sell("0.8", "56000")));

    auto partial = engine_.replayFrom(committed, history, T("2024-03-15"));
    auto full = engine_.replay(history);

    EXPECT_EQ(partial.disposals.size(), full.disposals.size());
    EXPECT_EQ(openBtc(partial), openBtc(full));
    for (size_t i = 0; i < full.disposals.size(); ++i) {
        EXPECT_EQ(partial.disposals[i].lotId, full.disposals[i].lotId);
        EXPECT_EQ(partial.disposals[i].disposalBasisUsd, full.disposals[i].disposalBasisUsd);
        EXPECT_EQ(partial.disposals[i].realizedGainUsd, full.disposals[i].realizedGainUsd);
    }
    EXPECT_EQ(partial.summaries, full.summaries);
}

TEST_F(RecalculationEngineTest, ReplayFrom_RestoresRemainingFromSurvivingDisposals) {
    auto history = basicHistory();
    auto committed = engine_.replay(history);

    // Продажа удалена: лот снова полный
    history.pop_back();
    auto partial = engine_.replayFrom(committed, history, T("2024-04-01"));

    EXPECT_TRUE(partial.disposals.empty());
    EXPECT_FALSE(partial.summaryFor(3).has_value());
    EXPECT_EQ(openBtc(partial), D("2"));
}

// ============================================================================
// OPEN LOTS AS OF
// ============================================================================

TEST_F(RecalculationEngineTest, OpenLotsAsOf_ExcludesLaterActivity) {
    auto history = basicHistory();

    auto beforeSale = engine_.openLotsAsOf(history, T("2024-03-15"));
    ASSERT_EQ(beforeSale.size(), 2u);
    EXPECT_EQ(beforeSale[0].remainingBtc, D("1"));

    auto afterSale = engine_.openLotsAsOf(history, T("2024-12-31"));
    ASSERT_EQ(afterSale.size(), 1u);
    EXPECT_EQ(afterSale[0].createdTxnId, 2);

    EXPECT_TRUE(engine_.openLotsAsOf(history, T("2024-02-01")).empty());
}
