#pragma once

#include "domain/Transaction.hpp"
#include "domain/TransactionRecord.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace btctax::ports::input {

/**
 * @brief Интерфейс сервиса управления транзакциями
 *
 * Input Port. Каждая изменяющая операция проверяет ввод, заново
 * воспроизводит историю и фиксирует транзакции вместе с производным
 * состоянием. При любой ошибке ничего не сохраняется.
 */
class ITransactionService {
public:
    virtual ~ITransactionService() = default;

    /**
     * @brief Создать транзакцию
     *
     * @param record Поля транзакции (id игнорируется)
     * @return Сохранённая транзакция с итогом выбытия
     *
     * @throws ValidationError, InsufficientFundsError, ConsistencyError
     */
    virtual domain::Transaction createTransaction(const domain::TransactionRecord& record) = 0;

    /**
     * @brief Создать пакет транзакций за один пересчёт
     *
     * @note Используется при импорте: либо все, либо ни одной
     */
    virtual std::vector<domain::Transaction> importTransactions(
        const std::vector<domain::TransactionRecord>& records
    ) = 0;

    /**
     * @brief Заменить поля транзакции
     *
     * @return Обновлённая транзакция или nullopt, если не найдена
     * @throws TransactionLockedError если транзакция заблокирована
     */
    virtual std::optional<domain::Transaction> updateTransaction(
        domain::TransactionId id,
        const domain::TransactionRecord& record
    ) = 0;

    /**
     * @brief Удалить транзакцию
     *
     * @return true если удалена
     * @throws TransactionLockedError если транзакция заблокирована
     */
    virtual bool deleteTransaction(domain::TransactionId id) = 0;

    /**
     * @brief Заблокировать или разблокировать транзакцию (закрытый период)
     *
     * @return Транзакция или nullopt, если не найдена
     */
    virtual std::optional<domain::Transaction> setLocked(domain::TransactionId id, bool locked) = 0;

    /**
     * @brief Удалить все транзакции и производное состояние
     *
     * @return Количество удалённых транзакций
     */
    virtual std::size_t deleteAllTransactions() = 0;

    virtual std::optional<domain::Transaction> getTransaction(domain::TransactionId id) = 0;

    /**
     * @brief Все транзакции, новые первыми
     */
    virtual std::vector<domain::Transaction> getAllTransactions() = 0;

    /**
     * @brief Полное воспроизведение и фиксация
     *
     * @return Количество воспроизведённых транзакций
     */
    virtual std::size_t recalculateAll() = 0;

    /**
     * @brief Воспроизведение начиная с cutoff и фиксация
     *
     * @return Количество воспроизведённых транзакций
     */
    virtual std::size_t recalculateFrom(const domain::Timestamp& cutoff) = 0;
};

} // namespace btctax::ports::input
