/**
 * @file TransactionServiceTest.cpp
 * @brief Unit tests for TransactionService
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "adapters/secondary/persistence/InMemoryLedgerRepository.hpp"
#include "application/TransactionService.hpp"
#include "mocks/InterleavingLedgerRepository.hpp"
#include "mocks/MockLedgerRepository.hpp"
#include "mocks/StubLedgerSettings.hpp"
#include "TestTransactions.hpp"

using namespace btctax;
using namespace btctax::domain;
using namespace btctax::tests;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class TransactionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<adapters::secondary::InMemoryLedgerRepository>();
        service_ = std::make_shared<application::TransactionService>(
            repository_, std::make_shared<StubLedgerSettings>());
    }

    /// Две покупки и продажа
    void seedBasicHistory() {
        service_->createTransaction(buyRecord("2024-02-01", "1", "40000"));
        service_->createTransaction(buyRecord("2024-03-01", "1", "50000"));
        service_->createTransaction(sellRecord("2024-04-01", "1", "60000"));
    }

    std::shared_ptr<adapters::secondary::InMemoryLedgerRepository> repository_;
    std::shared_ptr<application::TransactionService> service_;
};

// ============================================================================
// CREATE
// ============================================================================

TEST_F(TransactionServiceTest, Create_AssignsIdAndGroup) {
    auto tx = service_->createTransaction(buyRecord("2024-02-01", "1", "40000"));

    EXPECT_EQ(tx.id, 1);
    EXPECT_EQ(tx.groupId, std::optional<TransactionId>(1));
    EXPECT_FALSE(tx.isLocked);
    EXPECT_EQ(repository_->size(), 1u);
    EXPECT_EQ(repository_->loadState().lots.size(), 1u);
}

TEST_F(TransactionServiceTest, Create_Sell_ReturnsSummary) {
    seedBasicHistory();

    auto sell = service_->getTransaction(3);

    ASSERT_TRUE(sell.has_value());
    ASSERT_TRUE(sell->summary.has_value());
    EXPECT_EQ(sell->summary->costBasisUsd, D("40000"));
    EXPECT_EQ(sell->summary->realizedGainUsd, D("20000"));
    EXPECT_EQ(sell->summary->holdingPeriod, HoldingPeriod::SHORT);
}

TEST_F(TransactionServiceTest, Create_Backdated_ReshufflesExistingDisposals) {
    seedBasicHistory();

    service_->createTransaction(buyRecord("2024-01-15", "1", "30000"));

    auto sell = service_->getTransaction(3);
    ASSERT_TRUE(sell->summary.has_value());
    EXPECT_EQ(sell->summary->costBasisUsd, D("30000"));
    EXPECT_EQ(sell->summary->realizedGainUsd, D("30000"));
}

TEST_F(TransactionServiceTest, Create_InsufficientFunds_NoStateChange) {
    service_->createTransaction(buyRecord("2024-02-01", "0.5", "20000"));
    auto before = repository_->loadState();

    EXPECT_THROW(service_->createTransaction(sellRecord("2024-03-01", "1", "60000")),
                 InsufficientFundsError);

    EXPECT_EQ(repository_->size(), 1u);
    EXPECT_EQ(repository_->loadState(), before);
}

TEST_F(TransactionServiceTest, Create_Invalid_ThrowsValidationError) {
    auto record = buyRecord("2024-02-01", "1", "40000");
    record.toAccountId = accounts::WALLET;

    EXPECT_THROW(service_->createTransaction(record), ValidationError);
    EXPECT_EQ(repository_->size(), 0u);
}

TEST_F(TransactionServiceTest, Create_FailedId_NotReused) {
    service_->createTransaction(buyRecord("2024-02-01", "0.5", "20000"));
    EXPECT_THROW(service_->createTransaction(sellRecord("2024-03-01", "1", "60000")),
                 InsufficientFundsError);

    auto tx = service_->createTransaction(buyRecord("2024-03-01", "1", "50000"));
    EXPECT_EQ(tx.id, 3);
}

// ============================================================================
// IMPORT
// ============================================================================

TEST_F(TransactionServiceTest, Import_AllOrNothing) {
    std::vector<TransactionRecord> batch{
        buyRecord("2024-02-01", "1", "40000"),
        sellRecord("2024-03-01", "2", "120000"),
    };

    EXPECT_THROW(service_->importTransactions(batch), InsufficientFundsError);
    EXPECT_EQ(repository_->size(), 0u);
    EXPECT_TRUE(repository_->loadState().empty());
}

TEST_F(TransactionServiceTest, Import_OutOfOrderBatch_ReplayedChronologically) {
    std::vector<TransactionRecord> batch{
        sellRecord("2024-04-01", "1", "60000"),
        buyRecord("2024-02-01", "1", "40000"),
    };

    auto created = service_->importTransactions(batch);

    ASSERT_EQ(created.size(), 2u);
    ASSERT_TRUE(created[0].summary.has_value());
    EXPECT_EQ(created[0].summary->realizedGainUsd, D("20000"));
}

// ============================================================================
// UPDATE / DELETE
// ============================================================================

TEST_F(TransactionServiceTest, Update_ChangesBasisAndKeepsCreatedAt) {
    seedBasicHistory();
    auto original = service_->getTransaction(1);

    auto updated = service_->updateTransaction(1, buyRecord("2024-02-01", "1", "35000"));

    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->createdAt, original->createdAt);
    EXPECT_EQ(service_->getTransaction(3)->summary->realizedGainUsd, D("25000"));
}

TEST_F(TransactionServiceTest, Update_Missing_ReturnsNullopt) {
    EXPECT_FALSE(service_->updateTransaction(77, buyRecord("2024-02-01", "1", "1")).has_value());
}

TEST_F(TransactionServiceTest, Update_MakesLaterSellInfeasible_Rejected) {
    seedBasicHistory();
    auto before = repository_->loadState();

    EXPECT_THROW(service_->updateTransaction(3, sellRecord("2024-04-01", "3", "1")),
                 InsufficientFundsError);
    EXPECT_EQ(repository_->loadState(), before);
}

TEST_F(TransactionServiceTest, Delete_Buy_LaterSellUsesNextLot) {
    seedBasicHistory();

    EXPECT_TRUE(service_->deleteTransaction(1));

    EXPECT_EQ(repository_->size(), 2u);
    EXPECT_EQ(service_->getTransaction(3)->summary->costBasisUsd, D("50000"));
}

TEST_F(TransactionServiceTest, Delete_Missing_ReturnsFalse) {
    EXPECT_FALSE(service_->deleteTransaction(5));
}

TEST_F(TransactionServiceTest, DeleteAll_ClearsEverything) {
    seedBasicHistory();

    EXPECT_EQ(service_->deleteAllTransactions(), 3u);
    EXPECT_EQ(repository_->size(), 0u);
    EXPECT_TRUE(repository_->loadState().empty());
}

// ============================================================================
// LOCKING
// ============================================================================

TEST_F(TransactionServiceTest, Locked_RejectsUpdateAndDelete) {
    seedBasicHistory();
    ASSERT_TRUE(service_->setLocked(1, true).has_value());

    EXPECT_THROW(service_->updateTransaction(1, buyRecord("2024-02-01", "1", "1")), TransactionLockedError);
    EXPECT_THROW(service_->deleteTransaction(1), TransactionLockedError);

    service_->setLocked(1, false);
    EXPECT_TRUE(service_->deleteTransaction(1));
}

TEST_F(TransactionServiceTest, Locked_StillReplayed) {
    seedBasicHistory();
    service_->setLocked(1, true);

    service_->createTransaction(buyRecord("2024-01-15", "1", "30000"));

    EXPECT_EQ(service_->getTransaction(3)->summary->costBasisUsd, D("30000"));
    EXPECT_TRUE(service_->getTransaction(1)->isLocked);
}

TEST_F(TransactionServiceTest, SetLocked_Missing_ReturnsNullopt) {
    EXPECT_FALSE(service_->setLocked(9, true).has_value());
}

// ============================================================================
// QUERIES / RECALCULATION
// ============================================================================

TEST_F(TransactionServiceTest, GetAll_NewestFirst) {
    seedBasicHistory();

    auto all = service_->getAllTransactions();

    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, 3);
    EXPECT_EQ(all[2].id, 1);
}

TEST_F(TransactionServiceTest, RecalculateAll_Idempotent) {
    seedBasicHistory();
    auto before = repository_->loadState();

    EXPECT_EQ(service_->recalculateAll(), 3u);
    EXPECT_EQ(repository_->loadState(), before);
}

TEST_F(TransactionServiceTest, RecalculateFrom_CountsReplayedTail) {
    seedBasicHistory();
    auto before = repository_->loadState();

    EXPECT_EQ(service_->recalculateFrom(T("2024-03-01")), 2u);
    EXPECT_EQ(repository_->loadState().disposals, before.disposals);
}

// ============================================================================
// REPOSITORY FAILURES
// ============================================================================

TEST(TransactionServiceFailureTest, CommitFailure_Propagates) {
    auto repository = std::make_shared<MockLedgerRepository>();
    application::TransactionService service(repository, std::make_shared<StubLedgerSettings>());

    EXPECT_CALL(*repository, nextTransactionId()).WillOnce(Return(TransactionId{1}));
    EXPECT_CALL(*repository, loadSnapshot()).WillOnce(Return(ports::output::LedgerSnapshot{}));
    EXPECT_CALL(*repository, commit(_, _, 0)).WillOnce(Throw(std::runtime_error("disk full")));

    EXPECT_THROW(service.createTransaction(buyRecord("2024-02-01", "1", "40000")), std::runtime_error);
}

TEST(TransactionServiceFailureTest, ReplayFailure_NeverCommits) {
    auto repository = std::make_shared<MockLedgerRepository>();
    application::TransactionService service(repository, std::make_shared<StubLedgerSettings>());

    EXPECT_CALL(*repository, nextTransactionId()).WillOnce(Return(TransactionId{1}));
    EXPECT_CALL(*repository, loadSnapshot()).WillOnce(Return(ports::output::LedgerSnapshot{}));
    EXPECT_CALL(*repository, commit(_, _, _)).Times(0);

    EXPECT_THROW(service.createTransaction(sellRecord("2024-02-01", "1", "40000")), InsufficientFundsError);
}

// ============================================================================
// CONCURRENT WRITERS
// ============================================================================

TEST(TransactionServiceFailureTest, Commit_UsesSnapshotVersion) {
    auto repository = std::make_shared<MockLedgerRepository>();
    application::TransactionService service(repository, std::make_shared<StubLedgerSettings>());

    ports::output::LedgerSnapshot snapshot;
    snapshot.version = 7;
    EXPECT_CALL(*repository, nextTransactionId()).WillOnce(Return(TransactionId{1}));
    EXPECT_CALL(*repository, loadSnapshot()).WillOnce(Return(snapshot));
    EXPECT_CALL(*repository, commit(_, _, 7)).Times(1);

    service.createTransaction(buyRecord("2024-02-01", "1", "40000"));
}

TEST(TransactionServiceFailureTest, VersionConflict_PropagatesWithoutRetry) {
    auto repository = std::make_shared<MockLedgerRepository>();
    application::TransactionService service(repository, std::make_shared<StubLedgerSettings>());

    ports::output::LedgerSnapshot snapshot;
    snapshot.version = 7;
    EXPECT_CALL(*repository, nextTransactionId()).WillOnce(Return(TransactionId{1}));
    EXPECT_CALL(*repository, loadSnapshot()).WillOnce(Return(snapshot));
    EXPECT_CALL(*repository, commit(_, _, 7)).WillOnce(Throw(ConcurrentModificationError(7, 8)));

    EXPECT_THROW(service.createTransaction(buyRecord("2024-02-01", "1", "40000")), ConcurrentModificationError);
}

TEST(TransactionServiceConcurrencyTest, SecondWriterBetweenLoadAndCommit_NothingLost) {
    auto repository = std::make_shared<InterleavingLedgerRepository>();
    auto settings = std::make_shared<StubLedgerSettings>();
    application::TransactionService first(repository, settings);
    application::TransactionService second(repository, settings);

    first.createTransaction(buyRecord("2024-02-01", "1", "40000"));

    // Второй писатель (другой процесс) фиксирует после чтения первого
    repository->afterNextRead([&second]() {
        second.createTransaction(buyRecord("2024-03-01", "1", "50000"));
    });
    EXPECT_THROW(first.createTransaction(sellRecord("2024-04-01", "1", "60000")), ConcurrentModificationError);

    auto afterConflict = repository->loadSnapshot();
    ASSERT_EQ(afterConflict.transactions.size(), 2u);
    EXPECT_EQ(afterConflict.state.lots.size(), 2u);
    EXPECT_TRUE(afterConflict.state.disposals.empty());

    // Повтор на свежем снимке видит обе покупки
    first.createTransaction(sellRecord("2024-04-01", "1", "60000"));

    auto all = first.getAllTransactions();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(repository->loadSnapshot().state.disposals.size(), 1u);
}

TEST(TransactionServiceConcurrencyTest, GetAll_WriterBetweenReads_SummariesMatchTransactions) {
    auto repository = std::make_shared<InterleavingLedgerRepository>();
    auto settings = std::make_shared<StubLedgerSettings>();
    application::TransactionService service(repository, settings);
    application::TransactionService writer(repository, settings);

    service.createTransaction(buyRecord("2024-02-01", "1", "40000"));
    repository->afterNextRead([&writer]() {
        writer.createTransaction(sellRecord("2024-04-01", "1", "60000"));
    });

    auto before = service.getAllTransactions();
    ASSERT_EQ(before.size(), 1u);
    EXPECT_FALSE(before[0].summary.has_value());

    auto after = service.getAllTransactions();
    ASSERT_EQ(after.size(), 2u);
    ASSERT_EQ(after[0].type(), TransactionType::SELL);
    EXPECT_TRUE(after[0].summary.has_value());
}
