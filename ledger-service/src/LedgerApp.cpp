#include "LedgerApp.hpp"

#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/StorageSettings.hpp"
#include "settings/SyncSettings.hpp"

// Application
#include "application/ImportService.hpp"
#include "application/LedgerReplayService.hpp"
#include "application/PortfolioQueryService.hpp"
#include "application/PriceBackfillService.hpp"
#include "application/QuoteSyncService.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryLedgerRepository.hpp"
#include "adapters/secondary/persistence/PostgresLedgerRepository.hpp"
#include "adapters/secondary/quotes/JsonFileQuoteProvider.hpp"

#include <fstream>
#include <iostream>

namespace di = boost::di;

namespace ledger
{

    LedgerApp::LedgerApp() { std::cerr << "[LedgerApp] Initializing..." << std::endl; }

    LedgerApp::~LedgerApp() { std::cerr << "[LedgerApp] Shutting down..." << std::endl; }

    int LedgerApp::run(int argc, char *argv[])
    {
        try
        {
            loadEnvironment(argc, argv);
        }
        catch (const CommandException &e)
        {
            std::cerr << "Error: " << e.what() << "\n\n" << adapters::primary::CliArguments::usage();
            return 2;
        }

        // stdout только для результата: справка по --help туда, остальное в stderr
        if (args_.help)
        {
            std::cout << adapters::primary::CliArguments::usage();
            return 0;
        }
        if (args_.command.empty() && !args_.importFile)
        {
            std::cerr << adapters::primary::CliArguments::usage();
            return 2;
        }

        try
        {
            configureInjection();
        }
        catch (const std::exception &e)
        {
            // Например, битый файл котировок
            std::cerr << "[LedgerApp] Setup failed: " << e.what() << std::endl;
            return reportSetupError(e.what());
        }
        return start();
    }

    int LedgerApp::reportSetupError(const std::string &message)
    {
        if (args_.outputFile.empty())
        {
            return adapters::primary::CliController::reportError(std::cout, message);
        }
        std::ofstream out(args_.outputFile);
        if (!out)
        {
            std::cerr << "[LedgerApp] Cannot write " << args_.outputFile << std::endl;
            return 1;
        }
        return adapters::primary::CliController::reportError(out, message);
    }

    void LedgerApp::loadEnvironment(int argc, char *argv[])
    {
        std::vector<std::string> args(argv + 1, argv + argc);
        args_ = adapters::primary::CliArguments::parse(args);
        std::cerr << "[LedgerApp] Environment loaded" << std::endl;
    }

    void LedgerApp::configureInjection()
    {
        std::cerr << "[LedgerApp] Configuring DI..." << std::endl;

        auto storageSettings = std::make_shared<settings::StorageSettings>();

        // Шаг 1: хранилище выбирается в рантайме, дальше идёт в DI как instance binding
        std::shared_ptr<ports::output::ILedgerRepository> repository;
        if (storageSettings->getBackend() == settings::StorageSettings::Backend::Postgres)
        {
            auto dbInjector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton));
            repository = dbInjector.create<std::shared_ptr<adapters::secondary::PostgresLedgerRepository>>();
        }
        else
        {
            repository = std::make_shared<adapters::secondary::InMemoryLedgerRepository>();
        }

        // Шаг 2: котировки из файла, путь известен только после разбора аргументов
        auto quoteProvider = std::make_shared<adapters::secondary::JsonFileQuoteProvider>(args_.quotesFile);

        // Шаг 3: основной injector
        auto injector = di::make_injector(
            di::bind<settings::StorageSettings>().to(storageSettings),
            di::bind<settings::ISyncSettings>().to<settings::SyncSettings>().in(di::singleton),

            di::bind<ports::output::ILedgerRepository>().to(repository),
            di::bind<ports::output::IQuoteProvider>().to(quoteProvider),

            di::bind<application::LedgerReplayService>().in(di::singleton),

            di::bind<ports::input::IImportService>().to<application::ImportService>().in(di::singleton),
            di::bind<ports::input::IPriceBackfillService>().to<application::PriceBackfillService>().in(di::singleton),
            di::bind<ports::input::IQuoteSyncService>().to<application::QuoteSyncService>().in(di::singleton),
            di::bind<ports::input::IPortfolioQueryService>().to<application::PortfolioQueryService>().in(di::singleton));

        controller_ = injector.create<std::shared_ptr<adapters::primary::CliController>>();

        std::cerr << "[LedgerApp] Ready (storage="
                  << (storageSettings->getBackend() == settings::StorageSettings::Backend::Postgres ? "postgres" : "memory")
                  << ", portfolio=" << args_.portfolio.value_or(storageSettings->getDefaultPortfolio())
                  << ")" << std::endl;
    }

    int LedgerApp::start()
    {
        if (args_.outputFile.empty())
        {
            return controller_->run(args_, std::cout, std::cerr);
        }

        std::ofstream out(args_.outputFile);
        if (!out)
        {
            std::cerr << "[LedgerApp] Cannot write " << args_.outputFile << std::endl;
            return 1;
        }
        return controller_->run(args_, out, std::cerr);
    }

} // namespace ledger
