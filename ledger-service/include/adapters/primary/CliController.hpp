#pragma once

#include "adapters/primary/CliArguments.hpp"
#include "adapters/primary/LedgerCommands.hpp"
#include "ports/input/IImportService.hpp"
#include "ports/input/IPriceBackfillService.hpp"
#include "ports/input/IPortfolioQueryService.hpp"
#include "settings/StorageSettings.hpp"
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace ledger::adapters::primary {

/**
 * @brief Точка входа CLI: аргументы -> команды -> JSON
 *
 * Коды возврата: 0 - успех, 1 - ошибка данных (заголовок выгрузки,
 * битый CSV, файл не открылся), 2 - ошибка вызова. Логи идут в stderr,
 * в out пишется только JSON.
 */
class CliController {
public:
    CliController(
        std::shared_ptr<ports::input::IImportService> importService,
        std::shared_ptr<ports::input::IPriceBackfillService> backfillService,
        std::shared_ptr<ports::input::IPortfolioQueryService> queryService,
        std::shared_ptr<settings::StorageSettings> storageSettings
    );

    int run(const CliArguments& args, std::ostream& out, std::ostream& err);

    /// {"error": message} в out, код возврата 1
    static int reportError(std::ostream& out, const std::string& message);

    /**
     * @brief Собрать список команд
     *
     * --import FILE идёт первой командой, затем основная.
     * @throws CommandException
     */
    std::vector<std::shared_ptr<JsonCommand>> buildCommands(const CliArguments& args) const;

private:
    std::shared_ptr<JsonCommand> buildCommand(const CliArguments& args, const std::string& portfolioId) const;

    std::shared_ptr<ports::input::IImportService> importService_;
    std::shared_ptr<ports::input::IPriceBackfillService> backfillService_;
    std::shared_ptr<ports::input::IPortfolioQueryService> queryService_;
    std::shared_ptr<settings::StorageSettings> storageSettings_;
};

} // namespace ledger::adapters::primary
