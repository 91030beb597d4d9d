#pragma once

#include "Timestamp.hpp"
#include "enums/HoldingPeriod.hpp"
#include <optional>

namespace btctax::domain {

/**
 * @brief Фильтр фрагментов выбытия для отчётов
 *
 * Даты относятся к транзакции выбытия: from включительно, to исключительно.
 */
struct DisposalFilter {
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;
    std::optional<HoldingPeriod> holdingPeriod;

    /**
     * @brief Фильтр на налоговый год [1 января, 1 января следующего)
     */
    static DisposalFilter forYear(int year) {
        DisposalFilter filter;
        filter.from = Timestamp::fromDate(year, 1, 1);
        filter.to = Timestamp::fromDate(year + 1, 1, 1);
        return filter;
    }

    bool inRange(const Timestamp& at) const {
        if (from && at < *from) return false;
        if (to && at >= *to) return false;
        return true;
    }

    bool matches(const Timestamp& disposedAt, HoldingPeriod period) const {
        if (holdingPeriod && period != *holdingPeriod) return false;
        return inRange(disposedAt);
    }
};

} // namespace btctax::domain
