#pragma once

#include "domain/LedgerErrors.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include <algorithm>
#include <mutex>
#include <shared_mutex>

namespace btctax::adapters::secondary {

/**
 * @brief In-memory реализация хранилища леджера
 *
 * Чтения берут shared_lock и возвращают копии, commit() подменяет
 * транзакции и состояние под unique_lock, поэтому читатель никогда не
 * видит половину фиксации. Фиксация с устаревшей версией отклоняется.
 */
class InMemoryLedgerRepository : public ports::output::ILedgerRepository {
public:
    std::vector<domain::Transaction> loadTransactions() override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return transactions_;
    }

    std::optional<domain::Transaction> findTransaction(domain::TransactionId id) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = std::find_if(transactions_.begin(), transactions_.end(),
            [id](const domain::Transaction& t) { return t.id == id; });
        if (it == transactions_.end()) {
            return std::nullopt;
        }
        return *it;
    }

    domain::TransactionId nextTransactionId() override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return nextId_++;
    }

    engine::LedgerState loadState() override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return state_;
    }

    ports::output::LedgerSnapshot loadSnapshot() override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return ports::output::LedgerSnapshot{transactions_, state_, version_};
    }

    void commit(const std::vector<domain::Transaction>& transactions,
                const engine::LedgerState& state,
                int64_t expectedVersion) override {
        // Копируем до блокировки
        std::vector<domain::Transaction> newTransactions = transactions;
        engine::LedgerState newState = state;

        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (version_ != expectedVersion) {
            throw domain::ConcurrentModificationError(expectedVersion, version_);
        }
        ++version_;
        transactions_.swap(newTransactions);
        std::swap(state_, newState);
        for (const auto& tx : transactions_) {
            nextId_ = std::max(nextId_, tx.id + 1);
        }
    }

    /**
     * @brief Очистить репозиторий (для тестов)
     */
    void clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        transactions_.clear();
        state_ = engine::LedgerState{};
        nextId_ = 1;
        version_ = 0;
    }

    /**
     * @brief Количество транзакций
     */
    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return transactions_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::vector<domain::Transaction> transactions_;
    engine::LedgerState state_;
    domain::TransactionId nextId_ = 1;
    int64_t version_ = 0;
};

} // namespace btctax::adapters::secondary
