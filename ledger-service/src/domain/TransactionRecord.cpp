#include "domain/TransactionRecord.hpp"
#include "domain/LedgerErrors.hpp"

namespace btctax::domain {

namespace {

template <typename T>
T requireField(const std::optional<T>& field, const char* name, const std::string& type) {
    if (!field) {
        throw ValidationError(type + " requires " + name);
    }
    return *field;
}

template <typename T>
void rejectField(const std::optional<T>& field, const char* name, const std::string& type) {
    if (field) {
        throw ValidationError(std::string(name) + " is not valid for " + type);
    }
}

std::optional<Fee> parseFee(const TransactionRecord& record) {
    if (!record.feeAmount) {
        return std::nullopt;
    }
    if (record.feeAmount->isNegative()) {
        throw ValidationError("fee_amount must be >= 0");
    }
    if (record.feeAmount->isZero()) {
        return std::nullopt;
    }
    if (!record.feeCurrency || record.feeCurrency->empty()) {
        throw ValidationError("fee_currency is required when fee_amount > 0");
    }
    return Fee{*record.feeAmount, currencyFromString(*record.feeCurrency)};
}

TransactionDetails buildDetails(const TransactionRecord& record) {
    const std::string& type = record.type;
    Decimal amount = requireField(record.amount, "amount", type);
    std::optional<Fee> fee = parseFee(record);

    switch (transactionTypeFromString(type)) {
        case TransactionType::DEPOSIT: {
            if (record.fromAccountId && *record.fromAccountId != accounts::EXTERNAL) {
                throw ValidationError("Deposit must come from External (99)");
            }
            rejectField(record.proceedsUsd, "proceeds_usd", type);
            rejectField(record.fmvUsd, "fmv_usd", type);
            rejectField(record.feeValueUsd, "fee_value_usd", type);
            Deposit d;
            d.to = requireField(record.toAccountId, "to_account_id", type);
            d.amount = amount;
            d.fee = fee;
            d.costBasisUsd = record.costBasisUsd.value_or(Decimal(0));
            d.source = transactionSourceFromString(record.source);
            return d;
        }
        case TransactionType::WITHDRAWAL: {
            if (record.toAccountId && *record.toAccountId != accounts::EXTERNAL) {
                throw ValidationError("Withdrawal must go to External (99)");
            }
            rejectField(record.costBasisUsd, "cost_basis_usd", type);
            rejectField(record.feeValueUsd, "fee_value_usd", type);
            Withdrawal w;
            w.from = requireField(record.fromAccountId, "from_account_id", type);
            w.amount = amount;
            w.fee = fee;
            w.proceedsUsd = record.proceedsUsd;
            w.fmvUsd = record.fmvUsd;
            w.purpose = transactionPurposeFromString(record.purpose);
            if (w.purpose == TransactionPurpose::SPENT && !w.proceedsUsd) {
                throw ValidationError("Withdrawal with purpose Spent requires proceeds_usd");
            }
            return w;
        }
        case TransactionType::TRANSFER: {
            rejectField(record.costBasisUsd, "cost_basis_usd", type);
            rejectField(record.proceedsUsd, "proceeds_usd", type);
            rejectField(record.fmvUsd, "fmv_usd", type);
            Transfer t;
            t.from = requireField(record.fromAccountId, "from_account_id", type);
            t.to = requireField(record.toAccountId, "to_account_id", type);
            t.amount = amount;
            t.fee = fee;
            t.feeValueUsd = record.feeValueUsd;
            return t;
        }
        case TransactionType::BUY: {
            rejectField(record.proceedsUsd, "proceeds_usd", type);
            rejectField(record.fmvUsd, "fmv_usd", type);
            rejectField(record.feeValueUsd, "fee_value_usd", type);
            Buy b;
            b.from = record.fromAccountId.value_or(accounts::EXCHANGE_USD);
            b.to = record.toAccountId.value_or(accounts::EXCHANGE_BTC);
            b.amount = amount;
            b.costBasisUsd = requireField(record.costBasisUsd, "cost_basis_usd", type);
            b.fee = fee;
            return b;
        }
        case TransactionType::SELL: {
            rejectField(record.costBasisUsd, "cost_basis_usd", type);
            rejectField(record.fmvUsd, "fmv_usd", type);
            rejectField(record.feeValueUsd, "fee_value_usd", type);
            Sell s;
            s.from = record.fromAccountId.value_or(accounts::EXCHANGE_BTC);
            s.to = record.toAccountId.value_or(accounts::EXCHANGE_USD);
            s.amount = amount;
            s.proceedsUsd = requireField(record.proceedsUsd, "proceeds_usd", type);
            s.fee = fee;
            return s;
        }
    }
    throw ValidationError("Unknown transaction type: " + type);
}

void writeFee(TransactionRecord& record, const std::optional<Fee>& fee) {
    if (fee) {
        record.feeAmount = fee->amount;
        record.feeCurrency = toString(fee->currency);
    }
}

} // namespace

Transaction fromRecord(const TransactionRecord& record) {
    Transaction tx;
    try {
        tx.details = buildDetails(record);
    } catch (const std::invalid_argument& e) {
        throw ValidationError(e.what());
    }

    tx.id = record.id.value_or(0);
    tx.timestamp = record.timestamp.value_or(Timestamp::now());
    tx.isLocked = record.isLocked;
    tx.groupId = record.groupId;
    tx.externalRef = record.externalRef;
    tx.createdAt = record.createdAt.value_or(Timestamp::now());
    tx.updatedAt = record.updatedAt.value_or(tx.createdAt);
    return tx;
}

TransactionRecord toRecord(const Transaction& tx) {
    TransactionRecord record;
    record.id = tx.id;
    record.type = toString(tx.type());
    record.timestamp = tx.timestamp;
    record.fromAccountId = tx.fromAccountId();
    record.toAccountId = tx.toAccountId();
    record.amount = tx.amount();
    writeFee(record, tx.fee());
    record.isLocked = tx.isLocked;
    record.groupId = tx.groupId;
    record.externalRef = tx.externalRef;
    record.createdAt = tx.createdAt;
    record.updatedAt = tx.updatedAt;

    if (const auto* d = tx.as<Deposit>()) {
        record.costBasisUsd = d->costBasisUsd;
        record.source = toString(d->source);
    } else if (const auto* w = tx.as<Withdrawal>()) {
        record.proceedsUsd = w->proceedsUsd;
        record.fmvUsd = w->fmvUsd;
        record.purpose = toString(w->purpose);
    } else if (const auto* t = tx.as<Transfer>()) {
        record.feeValueUsd = t->feeValueUsd;
    } else if (const auto* b = tx.as<Buy>()) {
        record.costBasisUsd = b->costBasisUsd;
    } else if (const auto* s = tx.as<Sell>()) {
        record.proceedsUsd = s->proceedsUsd;
    }

    if (tx.summary) {
        record.realizedGainUsd = tx.summary->realizedGainUsd;
        record.holdingPeriod = toString(tx.summary->holdingPeriod);
    }
    return record;
}

} // namespace btctax::domain
