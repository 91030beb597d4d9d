#pragma once

#include <string>
#include <stdexcept>

namespace btctax::domain {

/**
 * @brief Тип транзакции
 */
enum class TransactionType {
    DEPOSIT,      ///< Поступление извне (External -> счёт)
    WITHDRAWAL,   ///< Вывод наружу (счёт -> External)
    TRANSFER,     ///< Перевод между своими счетами одной валюты
    BUY,          ///< Покупка BTC за USD
    SELL          ///< Продажа BTC за USD
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::DEPOSIT:    return "Deposit";
        case TransactionType::WITHDRAWAL: return "Withdrawal";
        case TransactionType::TRANSFER:   return "Transfer";
        case TransactionType::BUY:        return "Buy";
        case TransactionType::SELL:       return "Sell";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionType transactionTypeFromString(const std::string& str) {
    if (str == "Deposit")    return TransactionType::DEPOSIT;
    if (str == "Withdrawal") return TransactionType::WITHDRAWAL;
    if (str == "Transfer")   return TransactionType::TRANSFER;
    if (str == "Buy")        return TransactionType::BUY;
    if (str == "Sell")       return TransactionType::SELL;
    throw std::invalid_argument("Unknown TransactionType: " + str);
}

} // namespace btctax::domain
