#pragma once

#include <string>
#include <stdexcept>

namespace btctax::domain {

/**
 * @brief Назначение вывода (Withdrawal)
 *
 * Не участвует в арифметике, кроме правил выручки: Spent требует
 * proceeds_usd, Gift/Donation/Lost дают нулевую выручку и нулевой доход.
 */
enum class TransactionPurpose {
    NA,
    SPENT,
    GIFT,
    DONATION,
    LOST
};

inline std::string toString(TransactionPurpose purpose) {
    switch (purpose) {
        case TransactionPurpose::NA:       return "N/A";
        case TransactionPurpose::SPENT:    return "Spent";
        case TransactionPurpose::GIFT:     return "Gift";
        case TransactionPurpose::DONATION: return "Donation";
        case TransactionPurpose::LOST:     return "Lost";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionPurpose transactionPurposeFromString(const std::string& str) {
    if (str.empty() || str == "N/A") return TransactionPurpose::NA;
    if (str == "Spent")    return TransactionPurpose::SPENT;
    if (str == "Gift")     return TransactionPurpose::GIFT;
    if (str == "Donation") return TransactionPurpose::DONATION;
    if (str == "Lost")     return TransactionPurpose::LOST;
    throw std::invalid_argument("Unknown TransactionPurpose: " + str);
}

/**
 * @brief Безвозмездное выбытие (выручка и доход всегда нулевые)
 */
inline bool isNonSaleDisposition(TransactionPurpose purpose) {
    return purpose == TransactionPurpose::GIFT ||
           purpose == TransactionPurpose::DONATION ||
           purpose == TransactionPurpose::LOST;
}

} // namespace btctax::domain
