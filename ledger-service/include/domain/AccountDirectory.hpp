#pragma once

#include "Account.hpp"
#include <optional>
#include <vector>

namespace btctax::domain {

namespace accounts {
    constexpr AccountId BANK = 1;
    constexpr AccountId WALLET = 2;
    constexpr AccountId EXCHANGE_USD = 3;
    constexpr AccountId EXCHANGE_BTC = 4;
    constexpr AccountId BTC_FEES = 5;
    constexpr AccountId USD_FEES = 6;
    constexpr AccountId EXTERNAL = 99;
}

/**
 * @brief Справочник счетов
 *
 * Фиксированный набор из 7 счетов. Чистые данные: движок и валидатор
 * только читают его.
 */
class AccountDirectory {
public:
    /**
     * @brief Стандартный набор счетов
     */
    AccountDirectory();

    explicit AccountDirectory(std::vector<Account> accounts);

    std::optional<Account> find(AccountId id) const;

    /**
     * @throws ValidationError если счёт не существует
     */
    const Account& require(AccountId id) const;

    bool contains(AccountId id) const { return find(id).has_value(); }
    bool isInternal(AccountId id) const;
    bool isHolding(AccountId id) const;
    bool isExternal(AccountId id) const { return id == accounts::EXTERNAL; }

    /**
     * @throws ValidationError если счёт не существует или это External
     */
    Currency currencyOf(AccountId id) const;

    /**
     * @brief Счёт сбора комиссий для валюты
     */
    AccountId feeAccountFor(Currency currency) const;

    const std::vector<Account>& all() const { return accounts_; }

private:
    std::vector<Account> accounts_;
};

} // namespace btctax::domain
