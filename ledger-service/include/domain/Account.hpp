#pragma once

#include "enums/Currency.hpp"
#include "Identifiers.hpp"
#include <string>

namespace btctax::domain {

/**
 * @brief Роль счёта в системе
 */
enum class AccountRole {
    HOLDING,    ///< Собственный счёт пользователя (Bank, Wallet, Exchange)
    FEES,       ///< Счёт сбора комиссий (BTC Fees, USD Fees)
    EXTERNAL    ///< Виртуальный внешний мир
};

/**
 * @brief Счёт (неизменяемый, создаётся при инициализации)
 *
 * External (id 99) участвует в проводках, но никогда не держит лот.
 * Для External поле currency не имеет смысла: валюта проводки
 * определяется противоположной стороной.
 */
struct Account {
    AccountId id = 0;           ///< Фиксированный ID
    std::string name;           ///< "Bank", "Wallet", ...
    Currency currency = Currency::USD;
    AccountRole role = AccountRole::HOLDING;

    Account() = default;

    Account(AccountId id, const std::string& name, Currency currency, AccountRole role)
        : id(id), name(name), currency(currency), role(role) {}

    bool isInternal() const { return role != AccountRole::EXTERNAL; }
    bool isHolding() const { return role == AccountRole::HOLDING; }
    bool isExternal() const { return role == AccountRole::EXTERNAL; }
};

} // namespace btctax::domain
