#include "engine/LedgerPoster.hpp"
#include "domain/LedgerErrors.hpp"

#include <map>

namespace btctax::engine {

using namespace btctax::domain;

namespace {

void add(std::vector<LedgerEntry>& out, const Transaction& tx, AccountId account,
         const Decimal& amount, Currency currency, EntryType type) {
    LedgerEntry entry;
    entry.transactionId = tx.id;
    entry.accountId = account;
    entry.amount = amount;
    entry.currency = currency;
    entry.entryType = type;
    out.push_back(entry);
}

void requireFeeCurrency(const Transaction& tx, Currency expected) {
    const auto& fee = tx.fee();
    if (fee && fee->currency != expected) {
        throw ValidationError(toString(tx.type()) + " fee must be in " + toString(expected) +
                              ", got " + toString(fee->currency), tx.id);
    }
}

} // namespace

std::vector<LedgerEntry> LedgerPoster::post(const Transaction& transaction) const {
    std::vector<LedgerEntry> entries;

    if (const auto* d = transaction.as<Deposit>()) {
        postDeposit(transaction, *d, entries);
    } else if (const auto* w = transaction.as<Withdrawal>()) {
        postWithdrawal(transaction, *w, entries);
    } else if (const auto* t = transaction.as<Transfer>()) {
        postTransfer(transaction, *t, entries);
    } else if (const auto* b = transaction.as<Buy>()) {
        postBuy(transaction, *b, entries);
    } else if (const auto* s = transaction.as<Sell>()) {
        postSell(transaction, *s, entries);
    }

    verifyBalanced(transaction.id, entries);
    return entries;
}

void LedgerPoster::verifyBalanced(TransactionId transactionId, const std::vector<LedgerEntry>& entries) {
    std::map<Currency, Decimal> sums;
    for (const auto& entry : entries) {
        sums[entry.currency] += entry.amount;
    }
    for (const auto& [currency, sum] : sums) {
        if (!sum.isZero()) {
            throw ConsistencyError("Transaction " + std::to_string(transactionId) +
                                   ": ledger entries in " + toString(currency) +
                                   " sum to " + sum.toString() + ", expected 0", transactionId);
        }
    }
}

void LedgerPoster::postDeposit(const Transaction& tx, const Deposit& d, std::vector<LedgerEntry>& out) const {
    Currency currency = accounts_.currencyOf(d.to);
    add(out, tx, accounts::EXTERNAL, -d.amount, currency, EntryType::TRANSFER);
    add(out, tx, d.to, d.amount, currency, EntryType::TRANSFER);

    // Комиссию оплачивает внешняя сторона
    if (d.fee) {
        add(out, tx, accounts::EXTERNAL, -d.fee->amount, d.fee->currency, EntryType::FEE);
        add(out, tx, accounts_.feeAccountFor(d.fee->currency), d.fee->amount, d.fee->currency, EntryType::FEE);
    }
}

void LedgerPoster::postWithdrawal(const Transaction& tx, const Withdrawal& w, std::vector<LedgerEntry>& out) const {
    Currency currency = accounts_.currencyOf(w.from);
    add(out, tx, w.from, -w.amount, currency, EntryType::TRANSFER);
    add(out, tx, accounts::EXTERNAL, w.amount, currency, EntryType::TRANSFER);

    if (w.fee) {
        add(out, tx, w.from, -w.fee->amount, w.fee->currency, EntryType::FEE);
        add(out, tx, accounts_.feeAccountFor(w.fee->currency), w.fee->amount, w.fee->currency, EntryType::FEE);
    }
}

void LedgerPoster::postTransfer(const Transaction& tx, const Transfer& t, std::vector<LedgerEntry>& out) const {
    Currency currency = accounts_.currencyOf(t.from);
    requireFeeCurrency(tx, currency);

    Decimal fee = tx.feeIn(currency);
    add(out, tx, t.from, -(t.amount + fee), currency, EntryType::TRANSFER);
    add(out, tx, t.to, t.amount, currency, EntryType::TRANSFER);
    if (fee.isPositive()) {
        add(out, tx, accounts_.feeAccountFor(currency), fee, currency, EntryType::FEE);
    }
}

void LedgerPoster::postBuy(const Transaction& tx, const Buy& b, std::vector<LedgerEntry>& out) const {
    requireFeeCurrency(tx, Currency::USD);

    Decimal fee = tx.feeIn(Currency::USD);
    add(out, tx, b.from, -(b.costBasisUsd + fee), Currency::USD, EntryType::TRANSFER);
    add(out, tx, accounts::EXTERNAL, b.costBasisUsd, Currency::USD, EntryType::TRANSFER);
    add(out, tx, accounts::EXTERNAL, -b.amount, Currency::BTC, EntryType::TRANSFER);
    add(out, tx, b.to, b.amount, Currency::BTC, EntryType::TRANSFER);
    if (fee.isPositive()) {
        add(out, tx, accounts::USD_FEES, fee, Currency::USD, EntryType::FEE);
    }
}

void LedgerPoster::postSell(const Transaction& tx, const Sell& s, std::vector<LedgerEntry>& out) const {
    requireFeeCurrency(tx, Currency::USD);

    Decimal fee = tx.feeIn(Currency::USD);
    add(out, tx, s.from, -s.amount, Currency::BTC, EntryType::TRANSFER);
    add(out, tx, accounts::EXTERNAL, s.amount, Currency::BTC, EntryType::TRANSFER);
    add(out, tx, accounts::EXTERNAL, -s.proceedsUsd, Currency::USD, EntryType::TRANSFER);
    add(out, tx, s.to, s.proceedsUsd - fee, Currency::USD, EntryType::TRANSFER);
    if (fee.isPositive()) {
        add(out, tx, accounts::USD_FEES, fee, Currency::USD, EntryType::FEE);
    }
}

} // namespace btctax::engine
