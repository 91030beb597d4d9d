#include "domain/AccountDirectory.hpp"
#include "domain/LedgerErrors.hpp"

#include <algorithm>

namespace btctax::domain {

AccountDirectory::AccountDirectory()
    : AccountDirectory(std::vector<Account>{
          {accounts::BANK,         "Bank",         Currency::USD, AccountRole::HOLDING},
          {accounts::WALLET,       "Wallet",       Currency::BTC, AccountRole::HOLDING},
          {accounts::EXCHANGE_USD, "Exchange USD", Currency::USD, AccountRole::HOLDING},
          {accounts::EXCHANGE_BTC, "Exchange BTC", Currency::BTC, AccountRole::HOLDING},
          {accounts::BTC_FEES,     "BTC Fees",     Currency::BTC, AccountRole::FEES},
          {accounts::USD_FEES,     "USD Fees",     Currency::USD, AccountRole::FEES},
          {accounts::EXTERNAL,     "External",     Currency::USD, AccountRole::EXTERNAL},
      })
{
}

AccountDirectory::AccountDirectory(std::vector<Account> accounts)
    : accounts_(std::move(accounts))
{
}

std::optional<Account> AccountDirectory::find(AccountId id) const {
    auto it = std::find_if(accounts_.begin(), accounts_.end(),
        [id](const Account& a) { return a.id == id; });
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return *it;
}

const Account& AccountDirectory::require(AccountId id) const {
    auto it = std::find_if(accounts_.begin(), accounts_.end(),
        [id](const Account& a) { return a.id == id; });
    if (it == accounts_.end()) {
        throw ValidationError("Unknown account id: " + std::to_string(id));
    }
    return *it;
}

bool AccountDirectory::isInternal(AccountId id) const {
    auto account = find(id);
    return account && account->isInternal();
}

bool AccountDirectory::isHolding(AccountId id) const {
    auto account = find(id);
    return account && account->isHolding();
}

Currency AccountDirectory::currencyOf(AccountId id) const {
    const Account& account = require(id);
    if (account.isExternal()) {
        throw ValidationError("External account has no currency of its own");
    }
    return account.currency;
}

AccountId AccountDirectory::feeAccountFor(Currency currency) const {
    return currency == Currency::BTC ? accounts::BTC_FEES : accounts::USD_FEES;
}

} // namespace btctax::domain
