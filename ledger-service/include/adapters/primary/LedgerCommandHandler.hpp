#pragma once

#include "adapters/primary/JsonMapper.hpp"
#include "ports/input/ILedgerQueryService.hpp"
#include "ports/input/ITransactionService.hpp"
#include <nlohmann/json.hpp>
#include <charconv>
#include <fstream>
#include <iostream>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace btctax::adapters::primary {

/**
 * @brief Обработчик команд CLI
 *
 * Команды (вывод всегда JSON):
 *   accounts | list | balances | entries | lots | open-lots [as-of]
 *   disposals [year [SHORT|LONG]] | gains [year] | add <json>
 *   update <id> <json> | delete <id|all>
 *   lock <id> | unlock <id> | recalculate [from] | import <file.json>
 *
 * Коды возврата: 0 успех, 1 неизвестная команда или аргументы,
 * 2 ошибка валидации, 3 ошибка движка, 4 не найдено,
 * 5 внутренняя ошибка (хранилище и прочее).
 */
class LedgerCommandHandler {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_USAGE = 1;
    static constexpr int EXIT_VALIDATION = 2;
    static constexpr int EXIT_LEDGER = 3;
    static constexpr int EXIT_NOT_FOUND = 4;
    static constexpr int EXIT_INTERNAL = 5;

    LedgerCommandHandler(
        std::shared_ptr<ports::input::ITransactionService> transactions,
        std::shared_ptr<ports::input::ILedgerQueryService> queries
    ) : transactions_(std::move(transactions))
      , queries_(std::move(queries))
    {
        std::cout << "[LedgerCommandHandler] Created" << std::endl;
    }

    int handle(const std::vector<std::string>& args, std::ostream& out) {
        if (args.empty()) {
            return usage(out, "no command given");
        }

        const std::string& command = args[0];
        try {
            if (command == "accounts")    return print(out, JsonMapper::toJsonArray(queries_->accounts()));
            if (command == "list")        return print(out, JsonMapper::toJsonArray(transactions_->getAllTransactions()));
            if (command == "balances")    return print(out, JsonMapper::toJsonArray(queries_->accountBalances()));
            if (command == "entries")     return print(out, JsonMapper::toJsonArray(queries_->ledgerEntries()));
            if (command == "lots")        return print(out, JsonMapper::toJsonArray(queries_->lots()));
            if (command == "open-lots")   return handleOpenLots(args, out);
            if (command == "disposals")   return handleDisposals(args, out);
            if (command == "gains")       return handleGains(args, out);
            if (command == "add")         return handleAdd(args, out);
            if (command == "update")      return handleUpdate(args, out);
            if (command == "delete")      return handleDelete(args, out);
            if (command == "lock")        return handleLock(args, out, true);
            if (command == "unlock")      return handleLock(args, out, false);
            if (command == "recalculate") return handleRecalculate(args, out);
            if (command == "import")      return handleImport(args, out);
            return usage(out, "unknown command '" + command + "'");
        } catch (const domain::ValidationError& e) {
            return error(out, EXIT_VALIDATION, "validation_error", e);
        } catch (const domain::TransactionLockedError& e) {
            return error(out, EXIT_VALIDATION, "transaction_locked", e);
        } catch (const domain::InsufficientFundsError& e) {
            return error(out, EXIT_LEDGER, "insufficient_funds", e);
        } catch (const domain::ConcurrentModificationError& e) {
            return error(out, EXIT_LEDGER, "concurrent_modification", e);
        } catch (const domain::LedgerError& e) {
            return error(out, EXIT_LEDGER, "ledger_error", e);
        } catch (const nlohmann::json::parse_error& e) {
            return print(out, {{"error", "invalid_json"}, {"message", e.what()}}, EXIT_VALIDATION);
        } catch (const std::invalid_argument& e) {
            return print(out, {{"error", "invalid_argument"}, {"message", e.what()}}, EXIT_USAGE);
        } catch (const std::exception& e) {
            std::cerr << "[LedgerCommandHandler] Internal error in '" << command << "': " << e.what() << std::endl;
            return print(out, {{"error", "internal_error"}, {"message", e.what()}}, EXIT_INTERNAL);
        }
    }

    /**
     * @brief Разбить строку скрипта на аргументы
     *
     * Для add и update хвост строки (JSON) остаётся одним аргументом.
     */
    static std::vector<std::string> splitCommandLine(const std::string& line) {
        std::istringstream stream(line);
        std::vector<std::string> args;

        std::string command;
        if (!(stream >> command)) {
            return args;
        }
        args.push_back(command);

        if (command == "update") {
            std::string id;
            if (stream >> id) {
                args.push_back(id);
            }
        }

        if (command == "add" || command == "update") {
            std::string rest;
            std::getline(stream >> std::ws, rest);
            if (!rest.empty()) {
                args.push_back(rest);
            }
            return args;
        }

        std::string token;
        while (stream >> token) {
            args.push_back(token);
        }
        return args;
    }

private:
    std::shared_ptr<ports::input::ITransactionService> transactions_;
    std::shared_ptr<ports::input::ILedgerQueryService> queries_;

    int handleOpenLots(const std::vector<std::string>& args, std::ostream& out) {
        if (args.size() > 1) {
            auto cutoff = domain::Timestamp::fromString(args[1]);
            return print(out, JsonMapper::toJsonArray(queries_->openLotsAsOf(cutoff)));
        }
        return print(out, JsonMapper::toJsonArray(queries_->openLots()));
    }

    int handleDisposals(const std::vector<std::string>& args, std::ostream& out) {
        domain::DisposalFilter filter;
        if (args.size() > 1) {
            filter = domain::DisposalFilter::forYear(parseInt(args[1], "year"));
        }
        if (args.size() > 2) {
            filter.holdingPeriod = domain::holdingPeriodFromString(args[2]);
        }
        return print(out, JsonMapper::toJsonArray(queries_->disposals(filter)));
    }

    int handleGains(const std::vector<std::string>& args, std::ostream& out) {
        std::optional<int> year;
        if (args.size() > 1) {
            year = parseInt(args[1], "year");
        }
        auto json = JsonMapper::toJson(queries_->gainsSummary(year));
        json["average_cost_basis"] = queries_->averageCostBasis().toString(domain::Decimal::USD_SCALE);
        return print(out, json);
    }

    int handleAdd(const std::vector<std::string>& args, std::ostream& out) {
        if (args.size() < 2) {
            return usage(out, "add <json>");
        }
        auto record = JsonMapper::recordFromJson(nlohmann::json::parse(args[1]));
        return print(out, JsonMapper::toJson(transactions_->createTransaction(record)));
    }

    int handleUpdate(const std::vector<std::string>& args, std::ostream& out) {
        if (args.size() < 3) {
            return usage(out, "update <id> <json>");
        }
        auto id = parseInt(args[1], "id");
        auto record = JsonMapper::recordFromJson(nlohmann::json::parse(args[2]));
        auto updated = transactions_->updateTransaction(id, record);
        if (!updated) {
            return notFound(out, id);
        }
        return print(out, JsonMapper::toJson(*updated));
    }

    int handleDelete(const std::vector<std::string>& args, std::ostream& out) {
        if (args.size() < 2) {
            return usage(out, "delete <id>");
        }
        if (args[1] == "all") {
            auto count = transactions_->deleteAllTransactions();
            return print(out, {{"deleted", count}});
        }
        auto id = parseInt(args[1], "id");
        if (!transactions_->deleteTransaction(id)) {
            return notFound(out, id);
        }
        return print(out, {{"deleted", id}});
    }

    int handleLock(const std::vector<std::string>& args, std::ostream& out, bool locked) {
        if (args.size() < 2) {
            return usage(out, locked ? "lock <id>" : "unlock <id>");
        }
        auto id = parseInt(args[1], "id");
        auto tx = transactions_->setLocked(id, locked);
        if (!tx) {
            return notFound(out, id);
        }
        return print(out, JsonMapper::toJson(*tx));
    }

    int handleRecalculate(const std::vector<std::string>& args, std::ostream& out) {
        std::size_t replayed = args.size() > 1
            ? transactions_->recalculateFrom(domain::Timestamp::fromString(args[1]))
            : transactions_->recalculateAll();
        return print(out, {{"replayed", replayed}});
    }

    int handleImport(const std::vector<std::string>& args, std::ostream& out) {
        if (args.size() < 2) {
            return usage(out, "import <file.json>");
        }
        std::ifstream file(args[1]);
        if (!file.is_open()) {
            throw std::invalid_argument("Cannot open " + args[1]);
        }
        auto records = JsonMapper::recordsFromJson(nlohmann::json::parse(file));
        auto created = transactions_->importTransactions(records);
        return print(out, {{"imported", created.size()}});
    }

    static int parseInt(const std::string& text, const char* what) {
        int value = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || end != text.data() + text.size()) {
            throw std::invalid_argument(std::string("Invalid ") + what + ": '" + text + "'");
        }
        return value;
    }

    static int print(std::ostream& out, const nlohmann::json& json, int code = EXIT_OK) {
        out << json.dump(2) << std::endl;
        return code;
    }

    static int usage(std::ostream& out, const std::string& message) {
        std::cerr << "[LedgerCommandHandler] Usage error: " << message << std::endl;
        return print(out, {{"error", "usage"}, {"message", message}}, EXIT_USAGE);
    }

    static int notFound(std::ostream& out, int64_t id) {
        return print(out, {{"error", "not_found"}, {"id", id}}, EXIT_NOT_FOUND);
    }

    static int error(std::ostream& out, int code, const std::string& kind, const domain::LedgerError& e) {
        std::cerr << "[LedgerCommandHandler] " << kind << ": " << e.what() << std::endl;
        nlohmann::json json = {{"error", kind}, {"message", e.what()}};
        if (auto id = e.transactionId()) {
            json["transaction_id"] = *id;
        }
        return print(out, json, code);
    }
};

} // namespace btctax::adapters::primary
