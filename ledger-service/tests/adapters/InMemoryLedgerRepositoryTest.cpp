/**
 * @file InMemoryLedgerRepositoryTest.cpp
 * @brief Unit tests for InMemoryLedgerRepository
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryLedgerRepository.hpp"
#include "engine/RecalculationEngine.hpp"
#include "TestTransactions.hpp"

#include <set>
#include <thread>

using namespace btctax;
using namespace btctax::domain;
using namespace btctax::tests;

class InMemoryLedgerRepositoryTest : public ::testing::Test {
protected:
    adapters::secondary::InMemoryLedgerRepository repository_;
};

TEST_F(InMemoryLedgerRepositoryTest, Empty_Initially) {
    EXPECT_TRUE(repository_.loadTransactions().empty());
    EXPECT_TRUE(repository_.loadState().empty());
    EXPECT_FALSE(repository_.findTransaction(1).has_value());
}

TEST_F(InMemoryLedgerRepositoryTest, Commit_ReplacesTransactionsAndState) {
    std::vector<Transaction> txs{makeTx(1, "2024-02-01", buy("1", "40000"))};
    auto state = engine::RecalculationEngine().replay(txs);

    repository_.commit(txs, state, 0);

    EXPECT_EQ(repository_.size(), 1u);
    EXPECT_EQ(repository_.loadState(), state);
    ASSERT_TRUE(repository_.findTransaction(1).has_value());
    EXPECT_EQ(repository_.findTransaction(1)->amount(), D("1"));
}

TEST_F(InMemoryLedgerRepositoryTest, NextTransactionId_NeverReused) {
    EXPECT_EQ(repository_.nextTransactionId(), 1);
    EXPECT_EQ(repository_.nextTransactionId(), 2);

    repository_.commit({}, engine::LedgerState{}, 0);
    EXPECT_EQ(repository_.nextTransactionId(), 3);
}

TEST_F(InMemoryLedgerRepositoryTest, NextTransactionId_SkipsCommittedIds) {
    repository_.commit({makeTx(10, "2024-02-01", buy("1", "40000"))}, engine::LedgerState{}, 0);

    EXPECT_EQ(repository_.nextTransactionId(), 11);
}

TEST_F(InMemoryLedgerRepositoryTest, Clear_ResetsEverything) {
    repository_.commit({makeTx(4, "2024-02-01", buy("1", "40000"))}, engine::LedgerState{}, 0);

    repository_.clear();

    EXPECT_EQ(repository_.size(), 0u);
    EXPECT_EQ(repository_.nextTransactionId(), 1);
    EXPECT_EQ(repository_.loadSnapshot().version, 0);
}

// ============================================================================
// SNAPSHOT AND VERSION
// ============================================================================

TEST_F(InMemoryLedgerRepositoryTest, Snapshot_CarriesTransactionsStateAndVersion) {
    std::vector<Transaction> txs{makeTx(1, "2024-02-01", buy("1", "40000"))};
    auto state = engine::RecalculationEngine().replay(txs);
    repository_.commit(txs, state, 0);

    auto snapshot = repository_.loadSnapshot();

    ASSERT_EQ(snapshot.transactions.size(), 1u);
    EXPECT_EQ(snapshot.transactions[0].id, 1);
    EXPECT_EQ(snapshot.state, state);
    EXPECT_EQ(snapshot.version, 1);
}

TEST_F(InMemoryLedgerRepositoryTest, Commit_StaleVersion_RejectedAndStateKept) {
    std::vector<Transaction> first{makeTx(1, "2024-02-01", buy("1", "40000"))};
    auto stale = repository_.loadSnapshot();
    repository_.commit(first, engine::RecalculationEngine().replay(first), stale.version);

    std::vector<Transaction> second{makeTx(2, "2024-03-01", buy("2", "90000"))};
    try {
        repository_.commit(second, engine::RecalculationEngine().replay(second), stale.version);
        FAIL() << "Expected ConcurrentModificationError";
    } catch (const ConcurrentModificationError& e) {
        EXPECT_EQ(e.expectedVersion(), 0);
        EXPECT_EQ(e.actualVersion(), 1);
    }

    auto snapshot = repository_.loadSnapshot();
    ASSERT_EQ(snapshot.transactions.size(), 1u);
    EXPECT_EQ(snapshot.transactions[0].id, 1);
    EXPECT_EQ(snapshot.version, 1);
}

TEST_F(InMemoryLedgerRepositoryTest, Commit_SequentialVersions_Accepted) {
    repository_.commit({}, engine::LedgerState{}, 0);
    repository_.commit({}, engine::LedgerState{}, 1);

    EXPECT_EQ(repository_.loadSnapshot().version, 2);
}

TEST_F(InMemoryLedgerRepositoryTest, ConcurrentIdReservation_Unique) {
    constexpr int threads = 4;
    constexpr int perThread = 250;
    std::vector<std::vector<TransactionId>> reserved(threads);

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([this, &reserved, t]() {
            for (int i = 0; i < perThread; ++i) {
                reserved[t].push_back(repository_.nextTransactionId());
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::set<TransactionId> unique;
    for (const auto& ids : reserved) {
        unique.insert(ids.begin(), ids.end());
    }
    EXPECT_EQ(unique.size(), static_cast<size_t>(threads * perThread));
}
