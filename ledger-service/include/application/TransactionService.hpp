#pragma once

#include "application/TransactionValidator.hpp"
#include "engine/RecalculationEngine.hpp"
#include "ports/input/ITransactionService.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "settings/ILedgerSettings.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>

namespace btctax::application {

/**
 * @brief Сервис управления транзакциями
 *
 * Реализует ITransactionService, координирует работу между:
 * - TransactionValidator (допустимость счетов и комиссий)
 * - RecalculationEngine (воспроизведение истории)
 * - ILedgerRepository (атомарная фиксация)
 *
 * Все изменяющие операции выполняются под одной эксклюзивной
 * блокировкой внутри процесса. Каждая строит новое состояние из одного
 * снимка и фиксирует его с версией этого снимка; если другой процесс
 * успел зафиксировать раньше, commit() отклоняется с
 * ConcurrentModificationError, и ничего не теряется.
 */
class TransactionService : public ports::input::ITransactionService {
public:
    TransactionService(
        std::shared_ptr<ports::output::ILedgerRepository> repository,
        std::shared_ptr<settings::ILedgerSettings> settings
    ) : repository_(std::move(repository))
      , engine_(domain::AccountDirectory(), settings->getEngineOptions())
    {}

    domain::Transaction createTransaction(const domain::TransactionRecord& record) override {
        std::lock_guard<std::mutex> lock(writeMutex_);

        try {
            domain::Transaction tx = prepareNew(record);

            auto snapshot = repository_->loadSnapshot();
            auto& transactions = snapshot.transactions;
            transactions.push_back(tx);

            auto state = engine_.replay(transactions);
            repository_->commit(transactions, state, snapshot.version);

            std::cout << "[TransactionService] Created " << domain::toString(tx.type())
                      << " #" << tx.id << std::endl;
            return withSummary(tx, state);
        } catch (const std::exception& e) {
            std::cerr << "[TransactionService] createTransaction() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Transaction> importTransactions(
        const std::vector<domain::TransactionRecord>& records
    ) override {
        std::lock_guard<std::mutex> lock(writeMutex_);

        try {
            std::vector<domain::Transaction> created;
            created.reserve(records.size());
            for (const auto& record : records) {
                created.push_back(prepareNew(record));
            }

            auto snapshot = repository_->loadSnapshot();
            auto& transactions = snapshot.transactions;
            transactions.insert(transactions.end(), created.begin(), created.end());

            auto state = engine_.replay(transactions);
            repository_->commit(transactions, state, snapshot.version);

            std::cout << "[TransactionService] Imported " << created.size() << " transactions" << std::endl;
            for (auto& tx : created) {
                tx.summary = state.summaryFor(tx.id);
            }
            return created;
        } catch (const std::exception& e) {
            std::cerr << "[TransactionService] importTransactions() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Transaction> updateTransaction(
        domain::TransactionId id,
        const domain::TransactionRecord& record
    ) override {
        std::lock_guard<std::mutex> lock(writeMutex_);

        auto snapshot = repository_->loadSnapshot();
        auto& transactions = snapshot.transactions;
        auto existing = findIn(transactions, id);
        if (existing == transactions.end()) {
            return std::nullopt;
        }
        if (existing->isLocked) {
            throw domain::TransactionLockedError(id);
        }

        try {
            domain::Transaction tx = domain::fromRecord(record);
            tx.id = id;
            validator_.validate(tx);

            tx.isLocked = existing->isLocked;
            tx.createdAt = existing->createdAt;
            tx.updatedAt = domain::Timestamp::now();
            if (!record.groupId) {
                tx.groupId = existing->groupId;
            }

            *existing = tx;

            auto state = engine_.replay(transactions);
            repository_->commit(transactions, state, snapshot.version);

            std::cout << "[TransactionService] Updated #" << id << std::endl;
            return withSummary(tx, state);
        } catch (const std::exception& e) {
            std::cerr << "[TransactionService] updateTransaction(" << id << ") failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool deleteTransaction(domain::TransactionId id) override {
        std::lock_guard<std::mutex> lock(writeMutex_);

        auto snapshot = repository_->loadSnapshot();
        auto& transactions = snapshot.transactions;
        auto existing = findIn(transactions, id);
        if (existing == transactions.end()) {
            return false;
        }
        if (existing->isLocked) {
            throw domain::TransactionLockedError(id);
        }

        try {
            transactions.erase(existing);

            auto state = engine_.replay(transactions);
            repository_->commit(transactions, state, snapshot.version);

            std::cout << "[TransactionService] Deleted #" << id << std::endl;
            return true;
        } catch (const std::exception& e) {
            std::cerr << "[TransactionService] deleteTransaction(" << id << ") failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Transaction> setLocked(domain::TransactionId id, bool locked) override {
        std::lock_guard<std::mutex> lock(writeMutex_);

        auto snapshot = repository_->loadSnapshot();
        auto it = findIn(snapshot.transactions, id);
        if (it == snapshot.transactions.end()) {
            return std::nullopt;
        }

        it->isLocked = locked;
        it->updatedAt = domain::Timestamp::now();

        // Блокировка не влияет на арифметику: состояние переносится без пересчёта
        repository_->commit(snapshot.transactions, snapshot.state, snapshot.version);

        std::cout << "[TransactionService] " << (locked ? "Locked" : "Unlocked") << " #" << id << std::endl;
        return withSummary(*it, snapshot.state);
    }

    std::size_t deleteAllTransactions() override {
        std::lock_guard<std::mutex> lock(writeMutex_);

        auto snapshot = repository_->loadSnapshot();
        std::size_t count = snapshot.transactions.size();
        repository_->commit({}, engine::LedgerState{}, snapshot.version);

        std::cout << "[TransactionService] Deleted all " << count << " transactions" << std::endl;
        return count;
    }

    std::optional<domain::Transaction> getTransaction(domain::TransactionId id) override {
        auto snapshot = repository_->loadSnapshot();
        auto it = findIn(snapshot.transactions, id);
        if (it == snapshot.transactions.end()) {
            return std::nullopt;
        }
        return withSummary(*it, snapshot.state);
    }

    std::vector<domain::Transaction> getAllTransactions() override {
        auto snapshot = repository_->loadSnapshot();
        auto& transactions = snapshot.transactions;
        for (auto& tx : transactions) {
            tx.summary = snapshot.state.summaryFor(tx.id);
        }

        std::sort(transactions.begin(), transactions.end(),
            [](const domain::Transaction& a, const domain::Transaction& b) {
                return domain::chronologicalLess(b, a);
            });
        return transactions;
    }

    std::size_t recalculateAll() override {
        std::lock_guard<std::mutex> lock(writeMutex_);

        auto snapshot = repository_->loadSnapshot();
        auto state = engine_.replay(snapshot.transactions);
        repository_->commit(snapshot.transactions, state, snapshot.version);
        return snapshot.transactions.size();
    }

    std::size_t recalculateFrom(const domain::Timestamp& cutoff) override {
        std::lock_guard<std::mutex> lock(writeMutex_);

        auto snapshot = repository_->loadSnapshot();
        const auto& transactions = snapshot.transactions;
        auto state = engine_.replayFrom(snapshot.state, transactions, cutoff);
        repository_->commit(transactions, state, snapshot.version);

        return static_cast<std::size_t>(std::count_if(transactions.begin(), transactions.end(),
            [&cutoff](const domain::Transaction& t) { return t.timestamp >= cutoff; }));
    }

private:
    std::shared_ptr<ports::output::ILedgerRepository> repository_;
    engine::RecalculationEngine engine_;
    TransactionValidator validator_;
    std::mutex writeMutex_;

    domain::Transaction prepareNew(const domain::TransactionRecord& record) {
        domain::Transaction tx = domain::fromRecord(record);
        validator_.validate(tx);

        tx.id = repository_->nextTransactionId();
        tx.createdAt = domain::Timestamp::now();
        tx.updatedAt = tx.createdAt;
        if (!tx.groupId) {
            tx.groupId = tx.id;
        }
        return tx;
    }

    static std::vector<domain::Transaction>::iterator findIn(std::vector<domain::Transaction>& transactions,
                                                             domain::TransactionId id) {
        return std::find_if(transactions.begin(), transactions.end(),
            [id](const domain::Transaction& t) { return t.id == id; });
    }

    static domain::Transaction withSummary(domain::Transaction tx, const engine::LedgerState& state) {
        tx.summary = state.summaryFor(tx.id);
        return tx;
    }
};

} // namespace btctax::application
