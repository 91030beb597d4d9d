#pragma once

#include "Decimal.hpp"
#include "Identifiers.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace btctax::domain {

/**
 * @brief Базовое исключение леджера
 *
 * Если ошибка относится к конкретной транзакции, её ID доступен
 * через transactionId().
 */
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& message,
                         std::optional<TransactionId> transactionId = std::nullopt)
        : std::runtime_error(message), transactionId_(transactionId) {}

    std::optional<TransactionId> transactionId() const { return transactionId_; }

private:
    std::optional<TransactionId> transactionId_;
};

/**
 * @brief Некорректные входные данные (ответственность вызывающего)
 */
class ValidationError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

/**
 * @brief Недостаточно BTC в открытых лотах для выбытия
 */
class InsufficientFundsError : public LedgerError {
public:
    InsufficientFundsError(TransactionId transactionId, const Decimal& required, const Decimal& available)
        : LedgerError("Transaction " + std::to_string(transactionId) + ": insufficient BTC, required " +
                      required.toString() + ", available " + available.toString(), transactionId)
        , required_(required)
        , available_(available) {}

    const Decimal& required() const { return required_; }
    const Decimal& available() const { return available_; }

private:
    Decimal required_;
    Decimal available_;
};

/**
 * @brief Нарушение внутренней согласованности (ошибка в коде, а не у пользователя)
 */
class ConsistencyError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

/**
 * @brief Попытка изменить заблокированную транзакцию
 */
class TransactionLockedError : public LedgerError {
public:
    explicit TransactionLockedError(TransactionId transactionId)
        : LedgerError("Transaction " + std::to_string(transactionId) + " is locked", transactionId) {}
};

/**
 * @brief Леджер изменён другим писателем после чтения снимка
 *
 * Фиксация отклонена целиком; операцию можно повторить на свежем снимке.
 */
class ConcurrentModificationError : public LedgerError {
public:
    ConcurrentModificationError(int64_t expectedVersion, int64_t actualVersion)
        : LedgerError("Ledger was modified concurrently: expected version " +
                      std::to_string(expectedVersion) + ", found " + std::to_string(actualVersion))
        , expectedVersion_(expectedVersion)
        , actualVersion_(actualVersion) {}

    int64_t expectedVersion() const { return expectedVersion_; }
    int64_t actualVersion() const { return actualVersion_; }

private:
    int64_t expectedVersion_;
    int64_t actualVersion_;
};

} // namespace btctax::domain
