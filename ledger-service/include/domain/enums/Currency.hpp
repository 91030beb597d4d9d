#pragma once

#include <string>
#include <stdexcept>

namespace btctax::domain {

/**
 * @brief Валюта счёта или суммы
 */
enum class Currency {
    USD,    ///< Доллары США (2 знака)
    BTC     ///< Биткоин (8 знаков)
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(Currency currency) {
    switch (currency) {
        case Currency::USD: return "USD";
        case Currency::BTC: return "BTC";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки (регистр не важен)
 * @throws std::invalid_argument если строка не распознана
 */
inline Currency currencyFromString(const std::string& str) {
    if (str == "USD" || str == "usd") return Currency::USD;
    if (str == "BTC" || str == "btc") return Currency::BTC;
    throw std::invalid_argument("Unknown Currency: " + str);
}

/**
 * @brief Количество знаков после запятой для отображения
 */
inline unsigned displayScale(Currency currency) {
    return currency == Currency::BTC ? 8u : 2u;
}

} // namespace btctax::domain
