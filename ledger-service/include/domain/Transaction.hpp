#pragma once

#include "AccountDirectory.hpp"
#include "Decimal.hpp"
#include "Identifiers.hpp"
#include "Timestamp.hpp"
#include "enums/Currency.hpp"
#include "enums/HoldingPeriod.hpp"
#include "enums/TransactionPurpose.hpp"
#include "enums/TransactionSource.hpp"
#include "enums/TransactionType.hpp"
#include <optional>
#include <string>
#include <variant>

namespace btctax::domain {

/**
 * @brief Комиссия (сумма всегда положительна, нулевая комиссия = отсутствие комиссии)
 */
struct Fee {
    Decimal amount;
    Currency currency = Currency::USD;
};

/**
 * @brief Поступление извне на собственный счёт
 */
struct Deposit {
    AccountId to = 0;
    Decimal amount;                             ///< В валюте счёта `to`
    std::optional<Fee> fee;                     ///< Оплачивается внешней стороной
    Decimal costBasisUsd;                       ///< 0 если неизвестна (подарок)
    TransactionSource source = TransactionSource::NA;
};

/**
 * @brief Вывод с собственного счёта наружу
 */
struct Withdrawal {
    AccountId from = 0;
    Decimal amount;                             ///< В валюте счёта `from`
    std::optional<Fee> fee;                     ///< Сверх amount, в валюте счёта
    std::optional<Decimal> proceedsUsd;         ///< Обязательна для Spent
    std::optional<Decimal> fmvUsd;              ///< Справочная рыночная стоимость (Gift/Donation/Lost)
    TransactionPurpose purpose = TransactionPurpose::NA;
};

/**
 * @brief Перевод между собственными счетами одной валюты
 */
struct Transfer {
    AccountId from = 0;
    AccountId to = 0;
    Decimal amount;                             ///< Получает счёт `to`
    std::optional<Fee> fee;                     ///< Только BTC, сверх amount
    std::optional<Decimal> feeValueUsd;         ///< Рыночная стоимость BTC-комиссии
};

/**
 * @brief Покупка BTC за USD
 */
struct Buy {
    AccountId from = accounts::EXCHANGE_USD;
    AccountId to = accounts::EXCHANGE_BTC;
    Decimal amount;                             ///< BTC
    Decimal costBasisUsd;                       ///< Потрачено USD (без комиссии)
    std::optional<Fee> fee;                     ///< Только USD
};

/**
 * @brief Продажа BTC за USD
 */
struct Sell {
    AccountId from = accounts::EXCHANGE_BTC;
    AccountId to = accounts::EXCHANGE_USD;
    Decimal amount;                             ///< BTC
    Decimal proceedsUsd;                        ///< Валовая выручка USD
    std::optional<Fee> fee;                     ///< Только USD, вычитается из выручки
};

/**
 * @brief Закрытый набор вариантов транзакции, каждый несёт только свои поля
 */
using TransactionDetails = std::variant<Deposit, Withdrawal, Transfer, Buy, Sell>;

/**
 * @brief Итог выбытия, вычисляемый движком по фрагментам
 *
 * Хранится отдельно от входных полей: пересчёт не перезаписывает ввод.
 */
struct DisposalSummary {
    Decimal costBasisUsd;
    Decimal proceedsUsd;
    Decimal realizedGainUsd;
    HoldingPeriod holdingPeriod = HoldingPeriod::SHORT;    ///< По фрагменту самого старого лота
    bool mixedHoldingPeriods = false;                      ///< Фрагменты разных периодов

    bool operator==(const DisposalSummary& other) const = default;
};

/**
 * @brief Транзакция: единственная сущность, которую создаёт вызывающий код
 */
struct Transaction {
    TransactionId id = 0;
    Timestamp timestamp;                ///< Ключ упорядочивания (UTC)
    TransactionDetails details;
    bool isLocked = false;              ///< Запрет редактирования (закрытый период)
    std::optional<int64_t> groupId;     ///< Связь многоногих операций
    std::string externalRef;
    Timestamp createdAt;
    Timestamp updatedAt;
    std::optional<DisposalSummary> summary;     ///< Заполняется движком

    TransactionType type() const {
        return std::visit([](const auto& d) { return typeOf(d); }, details);
    }

    AccountId fromAccountId() const {
        return std::visit([](const auto& d) { return fromOf(d); }, details);
    }

    AccountId toAccountId() const {
        return std::visit([](const auto& d) { return toOf(d); }, details);
    }

    const Decimal& amount() const {
        return std::visit([](const auto& d) -> const Decimal& { return d.amount; }, details);
    }

    const std::optional<Fee>& fee() const {
        return std::visit([](const auto& d) -> const std::optional<Fee>& { return d.fee; }, details);
    }

    /**
     * @brief Сумма комиссии, если она в указанной валюте, иначе 0
     */
    Decimal feeIn(Currency currency) const {
        const auto& f = fee();
        return (f && f->currency == currency) ? f->amount : Decimal(0);
    }

    template <typename T>
    const T* as() const {
        return std::get_if<T>(&details);
    }

private:
    static TransactionType typeOf(const Deposit&)    { return TransactionType::DEPOSIT; }
    static TransactionType typeOf(const Withdrawal&) { return TransactionType::WITHDRAWAL; }
    static TransactionType typeOf(const Transfer&)   { return TransactionType::TRANSFER; }
    static TransactionType typeOf(const Buy&)        { return TransactionType::BUY; }
    static TransactionType typeOf(const Sell&)       { return TransactionType::SELL; }

    static AccountId fromOf(const Deposit&)      { return accounts::EXTERNAL; }
    static AccountId fromOf(const Withdrawal& d) { return d.from; }
    static AccountId fromOf(const Transfer& d)   { return d.from; }
    static AccountId fromOf(const Buy& d)        { return d.from; }
    static AccountId fromOf(const Sell& d)       { return d.from; }

    static AccountId toOf(const Deposit& d)      { return d.to; }
    static AccountId toOf(const Withdrawal&)     { return accounts::EXTERNAL; }
    static AccountId toOf(const Transfer& d)     { return d.to; }
    static AccountId toOf(const Buy& d)          { return d.to; }
    static AccountId toOf(const Sell& d)         { return d.to; }
};

/**
 * @brief Порядок воспроизведения: (timestamp, id) по возрастанию
 */
inline bool chronologicalLess(const Transaction& a, const Transaction& b) {
    if (a.timestamp != b.timestamp) {
        return a.timestamp < b.timestamp;
    }
    return a.id < b.id;
}

} // namespace btctax::domain
