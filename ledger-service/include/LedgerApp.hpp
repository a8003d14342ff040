// include/LedgerApp.hpp
#pragma once

#include "adapters/primary/CliArguments.hpp"
#include "adapters/primary/CliController.hpp"
#include <memory>
#include <vector>
#include <string>

namespace ledger
{

    /**
     * @brief Приложение ledger-cli
     *
     * Template Method:
     * 1. loadEnvironment()    - разбор аргументов
     * 2. configureInjection() - сборка портов и адаптеров через Boost.DI
     * 3. start()              - выполнение команды
     *
     * Хранилище выбирается по LEDGER_STORAGE: memory живёт один запуск,
     * поэтому с ним команды обычно идут вместе с --import.
     */
    class LedgerApp
    {
    public:
        LedgerApp();
        virtual ~LedgerApp();

        int run(int argc, char *argv[]);

    protected:
        virtual void loadEnvironment(int argc, char *argv[]);
        virtual void configureInjection();
        virtual int start();

        int reportSetupError(const std::string &message);

        adapters::primary::CliArguments args_;
        std::shared_ptr<adapters::primary::CliController> controller_;
    };

} // namespace ledger
