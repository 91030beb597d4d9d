#pragma once

#include <cstdint>

namespace btctax::engine {

/**
 * @brief Налоговая политика движка
 */
struct EngineOptions {
    /// BTC-комиссия перевода между своими счетами считается выбытием
    bool transferFeeIsDisposal = true;

    /// LONG, если полных суток владения строго больше порога
    int64_t longTermThresholdDays = 365;
};

} // namespace btctax::engine
