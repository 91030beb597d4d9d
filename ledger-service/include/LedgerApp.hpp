#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace btctax::settings {
    class Environment;
    class ILedgerSettings;
}

namespace btctax::ports::output {
    class ILedgerRepository;
}

namespace btctax::adapters::primary {
    class LedgerCommandHandler;
}

/**
 * @class LedgerApp
 * @brief Главное приложение btctax (CLI)
 *
 * Template Method:
 * 1. loadEnvironment() - разбор аргументов и загрузка config.json в Environment
 * 2. configureInjection() - настройка Boost.DI и создание обработчика команд
 * 3. execute() - выполнение команды из аргументов или построчно из stdin
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Primary Adapter: LedgerCommandHandler
 * - Secondary Adapters: InMemoryLedgerRepository / PostgresLedgerRepository
 */
class LedgerApp
{
public:
    LedgerApp();
    ~LedgerApp();

    /**
     * @return Код возврата последней команды
     */
    int run(int argc, char* argv[]);

protected:
    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();
    int execute();

private:
    std::shared_ptr<btctax::settings::Environment> env_;
    std::shared_ptr<btctax::adapters::primary::LedgerCommandHandler> handler_;
    std::vector<std::string> commandArgs_;
    std::string configPath_ = "config.json";
    std::string outputPath_;

    std::shared_ptr<btctax::ports::output::ILedgerRepository> createRepository(
        const btctax::settings::ILedgerSettings& settings);

    int executeScript(std::istream& in, std::ostream& out);
};
