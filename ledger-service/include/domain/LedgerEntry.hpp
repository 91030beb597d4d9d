#pragma once

#include "Decimal.hpp"
#include "Identifiers.hpp"
#include "enums/Currency.hpp"
#include "enums/EntryType.hpp"

namespace btctax::domain {

/**
 * @brief Проводка (одна сторона двойной записи)
 *
 * Принадлежит транзакции и пересоздаётся при каждом пересчёте.
 * Отрицательная сумма означает списание со счёта, положительная зачисление.
 */
struct LedgerEntry {
    LedgerEntryId id = 0;
    TransactionId transactionId = 0;
    AccountId accountId = 0;
    Decimal amount;
    Currency currency = Currency::USD;
    EntryType entryType = EntryType::TRANSFER;

    bool operator==(const LedgerEntry& other) const = default;
};

} // namespace btctax::domain
