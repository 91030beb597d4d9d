#pragma once

#include "domain/AccountDirectory.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/TransactionRecord.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace btctax::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища леджера
 *
 * Схема: accounts, transactions, ledger_entries, bitcoin_lots,
 * lot_disposals. Денежные значения хранятся как NUMERIC и передаются
 * строками, без потери точности. commit() выполняется в одной pqxx::work
 * и сверяет версию леджера (ledger_meta) под блокировкой строки, поэтому
 * писатели из разных процессов не затирают фиксации друг друга.
 */
class PostgresLedgerRepository : public ports::output::ILedgerRepository {
public:
    /**
     * @brief Конструктор с connection string
     *
     * Создаёт схему и справочник счетов, если их ещё нет.
     */
    explicit PostgresLedgerRepository(const std::string& connectionString)
    {
        std::cout << "[PostgresLedgerRepo] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(connectionString);
            std::cout << "[PostgresLedgerRepo] Connected successfully" << std::endl;
            initSchema();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresLedgerRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::vector<domain::Transaction> loadTransactions() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto transactions = readTransactions(txn);
            txn.commit();
            return transactions;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] loadTransactions() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Transaction> findTransaction(domain::TransactionId id) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(std::string(SELECT_TRANSACTIONS) + " WHERE id = $1", id);
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToTransaction(result[0]);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] findTransaction() failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::TransactionId nextTransactionId() override {
        std::lock_guard<std::mutex> lock(mutex_);

        pqxx::work txn(*connection_);
        auto id = txn.query_value<int64_t>("SELECT nextval('transaction_id_seq')");
        txn.commit();
        return id;
    }

    engine::LedgerState loadState() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            // Один снимок на всё состояние
            pqxx::transaction<pqxx::isolation_level::repeatable_read> txn(*connection_);
            auto state = readState(txn);
            txn.commit();
            return state;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] loadState() failed: " << e.what() << std::endl;
            throw;
        }
    }

    ports::output::LedgerSnapshot loadSnapshot() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::transaction<pqxx::isolation_level::repeatable_read> txn(*connection_);
            ports::output::LedgerSnapshot snapshot;
            snapshot.version = txn.query_value<int64_t>("SELECT version FROM ledger_meta WHERE id = 1");
            snapshot.transactions = readTransactions(txn);
            snapshot.state = readState(txn);
            txn.commit();
            return snapshot;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] loadSnapshot() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void commit(const std::vector<domain::Transaction>& transactions,
                const engine::LedgerState& state,
                int64_t expectedVersion) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            // Строка версии блокируется до конца транзакции: параллельный
            // писатель ждёт здесь и затем видит уже увеличенную версию
            auto version = txn.query_value<int64_t>("SELECT version FROM ledger_meta WHERE id = 1 FOR UPDATE");
            if (version != expectedVersion) {
                throw domain::ConcurrentModificationError(expectedVersion, version);
            }

            txn.exec("DELETE FROM lot_disposals");
            txn.exec("DELETE FROM bitcoin_lots");
            txn.exec("DELETE FROM ledger_entries");
            txn.exec("DELETE FROM transactions");

            for (const auto& tx : transactions) {
                insertTransaction(txn, tx, state.summaryFor(tx.id));
            }

            for (const auto& entry : state.entries) {
                txn.exec_params(
                    "INSERT INTO ledger_entries (id, transaction_id, account_id, amount, currency, entry_type) "
                    "VALUES ($1, $2, $3, $4::numeric, $5, $6)",
                    entry.id, entry.transactionId, entry.accountId, entry.amount.toString(),
                    domain::toString(entry.currency), domain::toString(entry.entryType));
            }

            for (const auto& lot : state.lots) {
                txn.exec_params(
                    "INSERT INTO bitcoin_lots (id, created_txn_id, acquired_date, total_btc, remaining_btc, cost_basis_usd) "
                    "VALUES ($1, $2, $3::timestamptz, $4::numeric, $5::numeric, $6::numeric)",
                    lot.id, lot.createdTxnId, lot.acquiredDate.toString(), lot.totalBtc.toString(),
                    lot.remainingBtc.toString(), lot.costBasisUsd.toString());
            }

            for (const auto& d : state.disposals) {
                txn.exec_params(
                    "INSERT INTO lot_disposals (id, lot_id, transaction_id, disposed_btc, disposal_basis_usd, "
                    "proceeds_usd, fmv_usd, realized_gain_usd, holding_period) "
                    "VALUES ($1, $2, $3, $4::numeric, $5::numeric, $6::numeric, $7::numeric, $8::numeric, $9)",
                    d.id, d.lotId, d.transactionId, d.disposedBtc.toString(), d.disposalBasisUsd.toString(),
                    d.proceedsUsd.toString(), optionalText(d.fmvUsd), d.realizedGainUsd.toString(),
                    domain::toString(d.holdingPeriod));
            }

            txn.exec("UPDATE ledger_meta SET version = version + 1 WHERE id = 1");

            txn.commit();
            std::cout << "[PostgresLedgerRepo] Committed version " << expectedVersion + 1 << ": "
                      << transactions.size() << " transactions, "
                      << state.entries.size() << " entries, " << state.lots.size() << " lots, "
                      << state.disposals.size() << " disposals" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] commit() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;

    static constexpr const char* SELECT_TRANSACTIONS =
        "SELECT id, type, to_char(timestamp AT TIME ZONE 'UTC', 'YYYY-MM-DD HH24:MI:SS') AS ts, "
        "from_account_id, to_account_id, amount::text, fee_amount::text, fee_currency, "
        "cost_basis_usd::text, proceeds_usd::text, fmv_usd::text, fee_value_usd::text, "
        "purpose, source, is_locked, group_id, external_ref, "
        "to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD HH24:MI:SS') AS created, "
        "to_char(updated_at AT TIME ZONE 'UTC', 'YYYY-MM-DD HH24:MI:SS') AS updated "
        "FROM transactions";

    static std::string utcText(const std::string& column) {
        return "to_char(" + column + " AT TIME ZONE 'UTC', 'YYYY-MM-DD HH24:MI:SS')";
    }

    static std::vector<domain::Transaction> readTransactions(pqxx::transaction_base& txn) {
        auto result = txn.exec(std::string(SELECT_TRANSACTIONS) + " ORDER BY timestamp, id");

        std::vector<domain::Transaction> transactions;
        transactions.reserve(result.size());
        for (const auto& row : result) {
            transactions.push_back(rowToTransaction(row));
        }
        return transactions;
    }

    static engine::LedgerState readState(pqxx::transaction_base& txn) {
        engine::LedgerState state;
        for (const auto& row : txn.exec(
                "SELECT id, transaction_id, account_id, amount::text, currency, entry_type "
                "FROM ledger_entries ORDER BY id")) {
            domain::LedgerEntry entry;
            entry.id = row["id"].as<int64_t>();
            entry.transactionId = row["transaction_id"].as<int64_t>();
            entry.accountId = row["account_id"].as<int>();
            entry.amount = domain::Decimal::fromString(row["amount"].as<std::string>());
            entry.currency = domain::currencyFromString(row["currency"].as<std::string>());
            entry.entryType = domain::entryTypeFromString(row["entry_type"].as<std::string>());
            state.entries.push_back(entry);
        }

        for (const auto& row : txn.exec(
                "SELECT id, created_txn_id, " + utcText("acquired_date") + " AS acquired_date, "
                "total_btc::text, remaining_btc::text, cost_basis_usd::text "
                "FROM bitcoin_lots ORDER BY id")) {
            domain::BitcoinLot lot;
            lot.id = row["id"].as<int64_t>();
            lot.createdTxnId = row["created_txn_id"].as<int64_t>();
            lot.acquiredDate = domain::Timestamp::fromString(row["acquired_date"].as<std::string>());
            lot.totalBtc = domain::Decimal::fromString(row["total_btc"].as<std::string>());
            lot.remainingBtc = domain::Decimal::fromString(row["remaining_btc"].as<std::string>());
            lot.costBasisUsd = domain::Decimal::fromString(row["cost_basis_usd"].as<std::string>());
            state.lots.push_back(lot);
        }

        for (const auto& row : txn.exec(
                "SELECT id, lot_id, transaction_id, disposed_btc::text, disposal_basis_usd::text, "
                "proceeds_usd::text, fmv_usd::text, realized_gain_usd::text, holding_period "
                "FROM lot_disposals ORDER BY id")) {
            domain::LotDisposal disposal;
            disposal.id = row["id"].as<int64_t>();
            disposal.lotId = row["lot_id"].as<int64_t>();
            disposal.transactionId = row["transaction_id"].as<int64_t>();
            disposal.disposedBtc = domain::Decimal::fromString(row["disposed_btc"].as<std::string>());
            disposal.disposalBasisUsd = domain::Decimal::fromString(row["disposal_basis_usd"].as<std::string>());
            disposal.proceedsUsd = domain::Decimal::fromString(row["proceeds_usd"].as<std::string>());
            disposal.fmvUsd = optionalDecimal(row["fmv_usd"]);
            disposal.realizedGainUsd = domain::Decimal::fromString(row["realized_gain_usd"].as<std::string>());
            disposal.holdingPeriod = domain::holdingPeriodFromString(row["holding_period"].as<std::string>());
            state.disposals.push_back(disposal);
        }

        for (const auto& row : txn.exec(
                "SELECT id, summary_cost_basis_usd::text, summary_proceeds_usd::text, "
                "realized_gain_usd::text, holding_period, mixed_holding_periods "
                "FROM transactions WHERE realized_gain_usd IS NOT NULL")) {
            domain::DisposalSummary summary;
            summary.costBasisUsd = domain::Decimal::fromString(row["summary_cost_basis_usd"].as<std::string>());
            summary.proceedsUsd = domain::Decimal::fromString(row["summary_proceeds_usd"].as<std::string>());
            summary.realizedGainUsd = domain::Decimal::fromString(row["realized_gain_usd"].as<std::string>());
            summary.holdingPeriod = domain::holdingPeriodFromString(row["holding_period"].as<std::string>());
            summary.mixedHoldingPeriods = row["mixed_holding_periods"].as<bool>();
            state.summaries.emplace(row["id"].as<int64_t>(), summary);
        }

        return state;
    }

    void initSchema() {
        pqxx::work txn(*connection_);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS accounts (
                id        INTEGER PRIMARY KEY,
                name      TEXT NOT NULL,
                currency  TEXT NOT NULL,
                role      TEXT NOT NULL
            );

            CREATE SEQUENCE IF NOT EXISTS transaction_id_seq;

            CREATE TABLE IF NOT EXISTS ledger_meta (
                id       INTEGER PRIMARY KEY CHECK (id = 1),
                version  BIGINT NOT NULL
            );

            INSERT INTO ledger_meta (id, version) VALUES (1, 0) ON CONFLICT (id) DO NOTHING;

            CREATE TABLE IF NOT EXISTS transactions (
                id                      BIGINT PRIMARY KEY,
                type                    TEXT NOT NULL,
                timestamp               TIMESTAMPTZ NOT NULL,
                from_account_id         INTEGER NOT NULL REFERENCES accounts(id),
                to_account_id           INTEGER NOT NULL REFERENCES accounts(id),
                amount                  NUMERIC NOT NULL,
                fee_amount              NUMERIC,
                fee_currency            TEXT,
                cost_basis_usd          NUMERIC,
                proceeds_usd            NUMERIC,
                fmv_usd                 NUMERIC,
                fee_value_usd           NUMERIC,
                purpose                 TEXT NOT NULL DEFAULT '',
                source                  TEXT NOT NULL DEFAULT '',
                is_locked               BOOLEAN NOT NULL DEFAULT FALSE,
                group_id                BIGINT,
                external_ref            TEXT NOT NULL DEFAULT '',
                created_at              TIMESTAMPTZ NOT NULL,
                updated_at              TIMESTAMPTZ NOT NULL,
                summary_cost_basis_usd  NUMERIC,
                summary_proceeds_usd    NUMERIC,
                realized_gain_usd       NUMERIC,
                holding_period          TEXT,
                mixed_holding_periods   BOOLEAN NOT NULL DEFAULT FALSE
            );

            CREATE INDEX IF NOT EXISTS idx_transactions_timestamp ON transactions(timestamp, id);

            CREATE TABLE IF NOT EXISTS ledger_entries (
                id              BIGINT PRIMARY KEY,
                transaction_id  BIGINT NOT NULL REFERENCES transactions(id),
                account_id      INTEGER NOT NULL REFERENCES accounts(id),
                amount          NUMERIC NOT NULL,
                currency        TEXT NOT NULL,
                entry_type      TEXT NOT NULL
            );

            CREATE TABLE IF NOT EXISTS bitcoin_lots (
                id              BIGINT PRIMARY KEY,
                created_txn_id  BIGINT NOT NULL REFERENCES transactions(id),
                acquired_date   TIMESTAMPTZ NOT NULL,
                total_btc       NUMERIC NOT NULL,
                remaining_btc   NUMERIC NOT NULL CHECK (remaining_btc >= 0),
                cost_basis_usd  NUMERIC NOT NULL
            );

            CREATE TABLE IF NOT EXISTS lot_disposals (
                id                  BIGINT PRIMARY KEY,
                lot_id              BIGINT NOT NULL REFERENCES bitcoin_lots(id),
                transaction_id      BIGINT NOT NULL REFERENCES transactions(id),
                disposed_btc        NUMERIC NOT NULL,
                disposal_basis_usd  NUMERIC NOT NULL,
                proceeds_usd        NUMERIC NOT NULL,
                fmv_usd             NUMERIC,
                realized_gain_usd   NUMERIC NOT NULL,
                holding_period      TEXT NOT NULL
            );
        )");

        for (const auto& account : domain::AccountDirectory().all()) {
            txn.exec_params(
                "INSERT INTO accounts (id, name, currency, role) VALUES ($1, $2, $3, $4) "
                "ON CONFLICT (id) DO NOTHING",
                account.id, account.name, domain::toString(account.currency), roleToString(account.role));
        }

        txn.commit();
        std::cout << "[PostgresLedgerRepo] Schema ready" << std::endl;
    }

    static void insertTransaction(pqxx::work& txn, const domain::Transaction& tx,
                                  const std::optional<domain::DisposalSummary>& summary) {
        domain::TransactionRecord r = domain::toRecord(tx);

        std::optional<std::string> summaryBasis;
        std::optional<std::string> summaryProceeds;
        std::optional<std::string> gain;
        std::optional<std::string> period;
        bool mixed = false;
        if (summary) {
            summaryBasis = summary->costBasisUsd.toString();
            summaryProceeds = summary->proceedsUsd.toString();
            gain = summary->realizedGainUsd.toString();
            period = domain::toString(summary->holdingPeriod);
            mixed = summary->mixedHoldingPeriods;
        }

        txn.exec_params(
            R"(
                INSERT INTO transactions (
                    id, type, timestamp, from_account_id, to_account_id, amount,
                    fee_amount, fee_currency, cost_basis_usd, proceeds_usd, fmv_usd, fee_value_usd,
                    purpose, source, is_locked, group_id, external_ref, created_at, updated_at,
                    summary_cost_basis_usd, summary_proceeds_usd, realized_gain_usd,
                    holding_period, mixed_holding_periods
                )
                VALUES ($1, $2, $3::timestamptz, $4, $5, $6::numeric,
                        $7::numeric, $8, $9::numeric, $10::numeric, $11::numeric, $12::numeric,
                        $13, $14, $15, $16, $17, $18::timestamptz, $19::timestamptz,
                        $20::numeric, $21::numeric, $22::numeric, $23, $24)
            )",
            tx.id, r.type, tx.timestamp.toString(), tx.fromAccountId(), tx.toAccountId(),
            tx.amount().toString(),
            optionalText(r.feeAmount), r.feeCurrency, optionalText(r.costBasisUsd),
            optionalText(r.proceedsUsd), optionalText(r.fmvUsd), optionalText(r.feeValueUsd),
            r.purpose, r.source, tx.isLocked, tx.groupId, tx.externalRef,
            tx.createdAt.toString(), tx.updatedAt.toString(),
            summaryBasis, summaryProceeds, gain, period, mixed);
    }

    static domain::Transaction rowToTransaction(const pqxx::row& row) {
        domain::TransactionRecord r;
        r.id = row["id"].as<int64_t>();
        r.type = row["type"].as<std::string>();
        r.timestamp = domain::Timestamp::fromString(row["ts"].as<std::string>());
        r.fromAccountId = row["from_account_id"].as<int>();
        r.toAccountId = row["to_account_id"].as<int>();
        r.amount = domain::Decimal::fromString(row["amount"].as<std::string>());
        r.feeAmount = optionalDecimal(row["fee_amount"]);
        if (!row["fee_currency"].is_null()) {
            r.feeCurrency = row["fee_currency"].as<std::string>();
        }
        r.costBasisUsd = optionalDecimal(row["cost_basis_usd"]);
        r.proceedsUsd = optionalDecimal(row["proceeds_usd"]);
        r.fmvUsd = optionalDecimal(row["fmv_usd"]);
        r.feeValueUsd = optionalDecimal(row["fee_value_usd"]);
        r.purpose = row["purpose"].as<std::string>();
        r.source = row["source"].as<std::string>();
        r.isLocked = row["is_locked"].as<bool>();
        if (!row["group_id"].is_null()) {
            r.groupId = row["group_id"].as<int64_t>();
        }
        r.externalRef = row["external_ref"].as<std::string>();
        r.createdAt = domain::Timestamp::fromString(row["created"].as<std::string>());
        r.updatedAt = domain::Timestamp::fromString(row["updated"].as<std::string>());
        return domain::fromRecord(r);
    }

    static std::optional<domain::Decimal> optionalDecimal(const pqxx::field& field) {
        if (field.is_null()) {
            return std::nullopt;
        }
        return domain::Decimal::fromString(field.as<std::string>());
    }

    static std::optional<std::string> optionalText(const std::optional<domain::Decimal>& value) {
        if (!value) {
            return std::nullopt;
        }
        return value->toString();
    }

    static std::string roleToString(domain::AccountRole role) {
        switch (role) {
            case domain::AccountRole::HOLDING:  return "HOLDING";
            case domain::AccountRole::FEES:     return "FEES";
            case domain::AccountRole::EXTERNAL: return "EXTERNAL";
        }
        return "UNKNOWN";
    }
};

} // namespace btctax::adapters::secondary
