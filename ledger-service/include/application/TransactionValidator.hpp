#pragma once

#include "domain/AccountDirectory.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/Transaction.hpp"

namespace btctax::application {

/**
 * @brief Проверка допустимости счетов, комиссий и сумм по типу транзакции
 *
 * Выполняется до движка: движок рассчитывает на структурно корректный ввод.
 */
class TransactionValidator {
public:
    explicit TransactionValidator(domain::AccountDirectory accounts = domain::AccountDirectory())
        : accounts_(std::move(accounts)) {}

    /**
     * @throws ValidationError с описанием первого нарушения
     */
    void validate(const domain::Transaction& tx) const {
        if (!tx.amount().isPositive()) {
            fail(tx, "amount must be > 0");
        }
        if (const auto& fee = tx.fee(); fee && !fee->amount.isPositive()) {
            fail(tx, "fee_amount must be > 0");
        }

        if (const auto* d = tx.as<domain::Deposit>()) {
            requireHolding(tx, d->to, "to");
            requireFeeCurrency(tx, accounts_.currencyOf(d->to));
            requireNonNegative(tx, d->costBasisUsd, "cost_basis_usd");
        } else if (const auto* w = tx.as<domain::Withdrawal>()) {
            requireHolding(tx, w->from, "from");
            requireFeeCurrency(tx, accounts_.currencyOf(w->from));
            if (w->purpose == domain::TransactionPurpose::SPENT && !w->proceedsUsd) {
                fail(tx, "purpose Spent requires proceeds_usd");
            }
            if (w->proceedsUsd) requireNonNegative(tx, *w->proceedsUsd, "proceeds_usd");
            if (w->fmvUsd) requireNonNegative(tx, *w->fmvUsd, "fmv_usd");
        } else if (const auto* t = tx.as<domain::Transfer>()) {
            requireHolding(tx, t->from, "from");
            requireHolding(tx, t->to, "to");
            if (t->from == t->to) {
                fail(tx, "from and to must differ");
            }
            if (accounts_.currencyOf(t->from) != accounts_.currencyOf(t->to)) {
                fail(tx, "accounts must share a currency");
            }
            requireFeeCurrency(tx, domain::Currency::BTC);
            if (tx.fee() && accounts_.currencyOf(t->from) != domain::Currency::BTC) {
                fail(tx, "a fee is only allowed on BTC transfers");
            }
            if (t->feeValueUsd) requireNonNegative(tx, *t->feeValueUsd, "fee_value_usd");
        } else if (const auto* b = tx.as<domain::Buy>()) {
            if (b->from != domain::accounts::BANK && b->from != domain::accounts::EXCHANGE_USD) {
                fail(tx, "from must be Bank (1) or Exchange USD (3)");
            }
            if (b->to != domain::accounts::EXCHANGE_BTC) {
                fail(tx, "to must be Exchange BTC (4)");
            }
            requireFeeCurrency(tx, domain::Currency::USD);
            requireNonNegative(tx, b->costBasisUsd, "cost_basis_usd");
        } else if (const auto* s = tx.as<domain::Sell>()) {
            if (s->from != domain::accounts::EXCHANGE_BTC) {
                fail(tx, "from must be Exchange BTC (4)");
            }
            if (s->to != domain::accounts::EXCHANGE_USD) {
                fail(tx, "to must be Exchange USD (3)");
            }
            requireFeeCurrency(tx, domain::Currency::USD);
            requireNonNegative(tx, s->proceedsUsd, "proceeds_usd");
            if (tx.feeIn(domain::Currency::USD) > s->proceedsUsd) {
                fail(tx, "fee exceeds proceeds_usd");
            }
        }
    }

private:
    domain::AccountDirectory accounts_;

    [[noreturn]] static void fail(const domain::Transaction& tx, const std::string& reason) {
        std::optional<domain::TransactionId> id;
        if (tx.id != 0) {
            id = tx.id;
        }
        throw domain::ValidationError(domain::toString(tx.type()) + ": " + reason, id);
    }

    void requireHolding(const domain::Transaction& tx, domain::AccountId id, const char* side) const {
        if (!accounts_.contains(id)) {
            fail(tx, std::string("unknown ") + side + " account " + std::to_string(id));
        }
        if (!accounts_.isHolding(id)) {
            fail(tx, std::string(side) + " must be a holding account, got " + accounts_.require(id).name);
        }
    }

    static void requireFeeCurrency(const domain::Transaction& tx, domain::Currency expected) {
        const auto& fee = tx.fee();
        if (fee && fee->currency != expected) {
            fail(tx, "fee must be in " + domain::toString(expected));
        }
    }

    static void requireNonNegative(const domain::Transaction& tx, const domain::Decimal& value, const char* field) {
        if (value.isNegative()) {
            fail(tx, std::string(field) + " must be >= 0");
        }
    }
};

} // namespace btctax::application
