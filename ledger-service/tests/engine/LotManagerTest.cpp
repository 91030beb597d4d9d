/**
 * @file LotManagerTest.cpp
 * @brief Unit tests for LotManager
 */

#include <gtest/gtest.h>
#include "engine/LotManager.hpp"
#include "TestTransactions.hpp"

using namespace btctax::domain;
using namespace btctax::engine;
using namespace btctax::tests;

class LotManagerTest : public ::testing::Test {
protected:
    LotManager lotManager_;
};

TEST_F(LotManagerTest, Buy_CapitalizesUsdFeeIntoBasis) {
    auto lot = lotManager_.createLot(makeTx(5, "2024-02-01", buy("1", "40000", usdFee("25"))));

    ASSERT_TRUE(lot.has_value());
    EXPECT_EQ(lot->createdTxnId, 5);
    EXPECT_EQ(lot->acquiredDate, T("2024-02-01"));
    EXPECT_EQ(lot->totalBtc, D("1"));
    EXPECT_EQ(lot->remainingBtc, D("1"));
    EXPECT_EQ(lot->costBasisUsd, D("40025"));
}

TEST_F(LotManagerTest, BtcDeposit_UsesDeclaredBasis) {
    auto lot = lotManager_.createLot(makeTx(1, "2024-01-01", deposit(accounts::WALLET, "0.25", "7000")));

    ASSERT_TRUE(lot.has_value());
    EXPECT_EQ(lot->costBasisUsd, D("7000"));
}

TEST_F(LotManagerTest, GiftDeposit_WithoutBasis_ZeroBasisLot) {
    auto lot = lotManager_.createLot(makeTx(1, "2024-01-01", deposit(accounts::EXCHANGE_BTC, "0.1")));

    ASSERT_TRUE(lot.has_value());
    EXPECT_TRUE(lot->costBasisUsd.isZero());
}

TEST_F(LotManagerTest, UsdDeposit_NoLot) {
    EXPECT_FALSE(lotManager_.createLot(makeTx(1, "2024-01-01", deposit(accounts::BANK, "1000"))));
}

TEST_F(LotManagerTest, Transfer_NoLot) {
    EXPECT_FALSE(lotManager_.createLot(makeTx(1, "2024-01-01",
        transfer(accounts::EXCHANGE_BTC, accounts::WALLET, "1"))));
}

TEST_F(LotManagerTest, Sell_NoLot) {
    EXPECT_FALSE(lotManager_.createLot(makeTx(1, "2024-01-01", sell("1", "100"))));
}
