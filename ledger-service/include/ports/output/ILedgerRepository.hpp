#pragma once

#include "domain/Transaction.hpp"
#include "engine/LedgerState.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace btctax::ports::output {

/**
 * @brief Согласованный снимок леджера
 *
 * Транзакции и производное состояние прочитаны одной операцией и
 * относятся к одной и той же фиксации. version растёт на 1 при каждом
 * успешном commit().
 */
struct LedgerSnapshot {
    std::vector<domain::Transaction> transactions;
    engine::LedgerState state;
    int64_t version = 0;
};

/**
 * @brief Интерфейс хранилища леджера
 *
 * Output Port. Хранит набор транзакций и производное состояние
 * (проводки, лоты, фрагменты). Обе части заменяются только вместе,
 * одной атомарной операцией commit().
 */
class ILedgerRepository {
public:
    virtual ~ILedgerRepository() = default;

    /**
     * @brief Все транзакции (без итогов выбытия)
     */
    virtual std::vector<domain::Transaction> loadTransactions() = 0;

    /**
     * @brief Найти транзакцию по ID
     *
     * @return Transaction или nullopt
     */
    virtual std::optional<domain::Transaction> findTransaction(domain::TransactionId id) = 0;

    /**
     * @brief Зарезервировать следующий ID транзакции
     *
     * ID не переиспользуются, даже если транзакция не была зафиксирована.
     */
    virtual domain::TransactionId nextTransactionId() = 0;

    /**
     * @brief Последнее зафиксированное производное состояние
     */
    virtual engine::LedgerState loadState() = 0;

    /**
     * @brief Транзакции, состояние и версия одной фиксации
     */
    virtual LedgerSnapshot loadSnapshot() = 0;

    /**
     * @brief Атомарно заменить набор транзакций и производное состояние
     *
     * Фиксация проходит, только если версия хранилища всё ещё равна
     * expectedVersion (версии снимка, на котором построено состояние).
     * При ошибке предыдущее состояние остаётся нетронутым.
     *
     * @throws domain::ConcurrentModificationError если леджер уже изменён
     */
    virtual void commit(const std::vector<domain::Transaction>& transactions,
                        const engine::LedgerState& state,
                        int64_t expectedVersion) = 0;
};

} // namespace btctax::ports::output
