#include "LedgerApp.hpp"

// Primary Adapters
#include "adapters/primary/LedgerCommandHandler.hpp"

// Application Services
#include "application/LedgerQueryService.hpp"
#include "application/TransactionService.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryLedgerRepository.hpp"
#include "adapters/secondary/persistence/PostgresLedgerRepository.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/Environment.hpp"
#include "settings/LedgerSettings.hpp"

#include <boost/di.hpp>
#include <fstream>
#include <iostream>

namespace di = boost::di;

using namespace btctax;

// ============================================================================
// LedgerApp Implementation
// ============================================================================

LedgerApp::LedgerApp()
{
    std::cout << "[LedgerApp] Application created" << std::endl;
}

LedgerApp::~LedgerApp()
{
    std::cout << "[LedgerApp] Application destroyed" << std::endl;
}

int LedgerApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    return execute();
}

void LedgerApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[LedgerApp] Loading environment..." << std::endl;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "--output") && i + 1 < argc)
        {
            (arg == "--config" ? configPath_ : outputPath_) = argv[++i];
        }
        else if (arg == "--config" || arg == "--output")
        {
            throw std::invalid_argument(arg + " requires a value");
        }
        else
        {
            commandArgs_.push_back(arg);
        }
    }

    env_ = settings::Environment::load(configPath_);

    std::cout << "[LedgerApp] Environment loaded successfully" << std::endl;
}

void LedgerApp::configureInjection()
{
    std::cout << "[LedgerApp] Configuring Boost.DI injection..." << std::endl;

    auto ledgerSettings = std::make_shared<settings::LedgerSettings>(env_);
    auto repository = createRepository(*ledgerSettings);

    // ========================================================================
    // Boost.DI Injector Configuration
    // ========================================================================

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings and Secondary Adapters
        // ====================================================================

        di::bind<settings::ILedgerSettings>().to(ledgerSettings),

        // Хранилище выбирается по storage.backend
        di::bind<ports::output::ILedgerRepository>().to(repository),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<ports::input::ITransactionService>()
            .to<application::TransactionService>()
            .in(di::singleton),

        di::bind<ports::input::ILedgerQueryService>()
            .to<application::LedgerQueryService>()
            .in(di::singleton));

    // ========================================================================
    // Layer 3: Primary Adapter (CLI)
    // ========================================================================

    handler_ = injector.create<std::shared_ptr<adapters::primary::LedgerCommandHandler>>();

    std::cout << "[LedgerApp] Injector configured (storage: "
              << ledgerSettings->getStorageBackend() << ")" << std::endl;
}

int LedgerApp::execute()
{
    std::ofstream file;
    if (!outputPath_.empty())
    {
        file.open(outputPath_);
        if (!file.is_open())
        {
            throw std::runtime_error("Cannot open output file " + outputPath_);
        }
    }
    std::ostream& out = outputPath_.empty() ? std::cout : file;

    if (commandArgs_.empty())
    {
        std::cout << "[LedgerApp] No command given, reading commands from stdin" << std::endl;
        return executeScript(std::cin, out);
    }
    return handler_->handle(commandArgs_, out);
}

std::shared_ptr<ports::output::ILedgerRepository> LedgerApp::createRepository(
    const settings::ILedgerSettings& ledgerSettings)
{
    if (ledgerSettings.getStorageBackend() == "postgres")
    {
        settings::DbSettings db(env_);
        std::cout << "[LedgerApp] Using PostgreSQL at " << db.getHost() << ":" << db.getPort() << std::endl;
        return std::make_shared<adapters::secondary::PostgresLedgerRepository>(db.getConnectionString());
    }

    std::cout << "[LedgerApp] Using in-memory storage" << std::endl;
    return std::make_shared<adapters::secondary::InMemoryLedgerRepository>();
}

int LedgerApp::executeScript(std::istream& in, std::ostream& out)
{
    int code = adapters::primary::LedgerCommandHandler::EXIT_OK;
    std::string line;
    while (std::getline(in, line))
    {
        auto args = adapters::primary::LedgerCommandHandler::splitCommandLine(line);
        if (args.empty() || args[0].front() == '#')
        {
            continue;
        }
        code = handler_->handle(args, out);
    }
    return code;
}
