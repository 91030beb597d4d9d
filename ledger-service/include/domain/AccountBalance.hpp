#pragma once

#include "Decimal.hpp"
#include "Identifiers.hpp"
#include "enums/Currency.hpp"
#include <string>

namespace btctax::domain {

/**
 * @brief Баланс счёта в одной валюте (сумма проводок)
 */
struct AccountBalance {
    AccountId accountId = 0;
    std::string name;
    Currency currency = Currency::USD;
    Decimal balance;
};

} // namespace btctax::domain
