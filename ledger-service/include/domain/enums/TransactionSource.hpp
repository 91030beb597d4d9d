#pragma once

#include <string>
#include <stdexcept>

namespace btctax::domain {

/**
 * @brief Источник поступления (Deposit)
 */
enum class TransactionSource {
    NA,
    MY_BTC,
    GIFT,
    INCOME,
    INTEREST,
    REWARD
};

inline std::string toString(TransactionSource source) {
    switch (source) {
        case TransactionSource::NA:       return "N/A";
        case TransactionSource::MY_BTC:   return "My BTC";
        case TransactionSource::GIFT:     return "Gift";
        case TransactionSource::INCOME:   return "Income";
        case TransactionSource::INTEREST: return "Interest";
        case TransactionSource::REWARD:   return "Reward";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionSource transactionSourceFromString(const std::string& str) {
    if (str.empty() || str == "N/A") return TransactionSource::NA;
    if (str == "My BTC")   return TransactionSource::MY_BTC;
    if (str == "Gift")     return TransactionSource::GIFT;
    if (str == "Income")   return TransactionSource::INCOME;
    if (str == "Interest") return TransactionSource::INTEREST;
    if (str == "Reward")   return TransactionSource::REWARD;
    throw std::invalid_argument("Unknown TransactionSource: " + str);
}

} // namespace btctax::domain
