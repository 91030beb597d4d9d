#pragma once

#include "EngineOptions.hpp"
#include "FifoDisposalMatcher.hpp"
#include "LedgerPoster.hpp"
#include "LedgerState.hpp"
#include "LotManager.hpp"
#include "domain/LedgerErrors.hpp"
#include <string>
#include <vector>

namespace btctax::engine {

/**
 * @brief Стадия обработки транзакции при воспроизведении
 */
enum class ReplayStage {
    PENDING,
    POSTED,
    LOT_CREATED,
    DISPOSED,
    FINALIZED
};

inline std::string toString(ReplayStage stage) {
    switch (stage) {
        case ReplayStage::PENDING:     return "pending";
        case ReplayStage::POSTED:      return "posted";
        case ReplayStage::LOT_CREATED: return "lot-created";
        case ReplayStage::DISPOSED:    return "disposed";
        case ReplayStage::FINALIZED:   return "finalized";
    }
    return "unknown";
}

/**
 * @brief Непредвиденный сбой при воспроизведении транзакции
 *
 * Ошибки леджера (LedgerError) пробрасываются как есть; в ReplayError
 * заворачивается всё остальное.
 */
class ReplayError : public domain::LedgerError {
public:
    ReplayError(domain::TransactionId transactionId, ReplayStage stage, const std::string& reason)
        : domain::LedgerError("Replay failed at transaction " + std::to_string(transactionId) +
                              " (stage after " + toString(stage) + "): " + reason, transactionId)
        , stage_(stage) {}

    ReplayStage stage() const { return stage_; }

private:
    ReplayStage stage_;
};

/**
 * @brief Оркестратор: детерминированное воспроизведение истории транзакций
 *
 * Чистая функция от набора транзакций: ничего не хранит и ничего не
 * записывает. Фиксацию результата выполняет вызывающий сервис одной
 * единицей работы. Транзакции обрабатываются в порядке (timestamp, id):
 * проводки, затем лот, затем выбытие.
 */
class RecalculationEngine {
public:
    explicit RecalculationEngine(domain::AccountDirectory accounts = domain::AccountDirectory(),
                                 EngineOptions options = EngineOptions());

    /**
     * @brief Полное воспроизведение (scorched earth)
     *
     * Порядок на входе не важен: транзакции сортируются по (timestamp, id).
     *
     * @throws InsufficientFundsError, ValidationError, ConsistencyError, ReplayError
     */
    LedgerState replay(const std::vector<domain::Transaction>& transactions) const;

    /**
     * @brief Воспроизведение хвоста истории начиная с cutoff
     *
     * Из committed удаляется всё, что принадлежит транзакциям с
     * timestamp >= cutoff, остатки выживших лотов восстанавливаются по
     * выжившим фрагментам, затем хвост воспроизводится заново. Если
     * committed получено полным воспроизведением той же истории,
     * результат совпадает с replay().
     */
    LedgerState replayFrom(const LedgerState& committed,
                           const std::vector<domain::Transaction>& transactions,
                           const domain::Timestamp& cutoff) const;

    /**
     * @brief Открытые лоты на момент cutoff (транзакции строго до cutoff)
     */
    std::vector<domain::BitcoinLot> openLotsAsOf(const std::vector<domain::Transaction>& transactions,
                                                 const domain::Timestamp& cutoff) const;

    /**
     * @brief Копия, упорядоченная по (timestamp, id)
     */
    static std::vector<domain::Transaction> chronological(std::vector<domain::Transaction> transactions);

    const EngineOptions& options() const { return options_; }

private:
    struct IdSequence {
        domain::LedgerEntryId nextEntry = 1;
        domain::LotId nextLot = 1;
        domain::DisposalId nextDisposal = 1;
    };

    LedgerPoster poster_;
    LotManager lotManager_;
    FifoDisposalMatcher matcher_;
    EngineOptions options_;

    void apply(LedgerState& state, IdSequence& ids, const domain::Transaction& transaction) const;

    static IdSequence continueAfter(const LedgerState& state);
};

} // namespace btctax::engine
