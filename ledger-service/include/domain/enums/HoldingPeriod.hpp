#pragma once

#include <string>
#include <stdexcept>

namespace btctax::domain {

/**
 * @brief Период владения для налоговой классификации
 */
enum class HoldingPeriod {
    SHORT,  ///< Не более порога (по умолчанию 365 дней)
    LONG    ///< Больше порога
};

inline std::string toString(HoldingPeriod period) {
    switch (period) {
        case HoldingPeriod::SHORT: return "SHORT";
        case HoldingPeriod::LONG:  return "LONG";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline HoldingPeriod holdingPeriodFromString(const std::string& str) {
    if (str == "SHORT") return HoldingPeriod::SHORT;
    if (str == "LONG")  return HoldingPeriod::LONG;
    throw std::invalid_argument("Unknown HoldingPeriod: " + str);
}

} // namespace btctax::domain
