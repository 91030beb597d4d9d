#pragma once

#include <string>
#include <stdexcept>

namespace btctax::domain {

/**
 * @brief Вид проводки
 */
enum class EntryType {
    TRANSFER,   ///< Основная сумма
    FEE         ///< Комиссия
};

inline std::string toString(EntryType type) {
    switch (type) {
        case EntryType::TRANSFER: return "transfer";
        case EntryType::FEE:      return "fee";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline EntryType entryTypeFromString(const std::string& str) {
    if (str == "transfer") return EntryType::TRANSFER;
    if (str == "fee")      return EntryType::FEE;
    throw std::invalid_argument("Unknown EntryType: " + str);
}

} // namespace btctax::domain
