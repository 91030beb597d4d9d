#pragma once

#include "Transaction.hpp"
#include <optional>
#include <string>

namespace btctax::domain {

/**
 * @brief Плоское представление транзакции
 *
 * Форма, в которой транзакции приходят извне (JSON, импорт, seed-скрипты)
 * и хранятся в БД. Все поля кроме type необязательны; какие из них
 * нужны, решает fromRecord() по типу.
 */
struct TransactionRecord {
    std::optional<TransactionId> id;
    std::string type;
    std::optional<Timestamp> timestamp;
    std::optional<AccountId> fromAccountId;
    std::optional<AccountId> toAccountId;
    std::optional<Decimal> amount;
    std::optional<Decimal> feeAmount;
    std::optional<std::string> feeCurrency;
    std::optional<Decimal> costBasisUsd;
    std::optional<Decimal> proceedsUsd;
    std::optional<Decimal> fmvUsd;
    std::optional<Decimal> feeValueUsd;
    std::string purpose;
    std::string source;
    bool isLocked = false;
    std::optional<int64_t> groupId;
    std::string externalRef;
    std::optional<Timestamp> createdAt;
    std::optional<Timestamp> updatedAt;

    // Вычисляемые поля (только для вывода)
    std::optional<Decimal> realizedGainUsd;
    std::optional<std::string> holdingPeriod;
};

/**
 * @brief Собрать типизированную транзакцию из плоской записи
 *
 * Проверяет обязательные поля для типа и отвергает поля, которые типу
 * не принадлежат. Счета и роли проверяет TransactionValidator.
 *
 * @throws ValidationError при отсутствии обязательного или лишнем поле
 */
Transaction fromRecord(const TransactionRecord& record);

/**
 * @brief Развернуть транзакцию в плоскую запись (включая итог выбытия)
 */
TransactionRecord toRecord(const Transaction& transaction);

} // namespace btctax::domain
