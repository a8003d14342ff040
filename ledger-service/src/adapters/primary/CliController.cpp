#include "adapters/primary/CliController.hpp"
#include "domain/errors/LedgerErrors.hpp"

#include <cctype>
#include <iostream>

namespace ledger::adapters::primary {

CliController::CliController(
    std::shared_ptr<ports::input::IImportService> importService,
    std::shared_ptr<ports::input::IPriceBackfillService> backfillService,
    std::shared_ptr<ports::input::IPortfolioQueryService> queryService,
    std::shared_ptr<settings::StorageSettings> storageSettings
) : importService_(std::move(importService))
  , backfillService_(std::move(backfillService))
  , queryService_(std::move(queryService))
  , storageSettings_(std::move(storageSettings))
{
    std::cerr << "[CliController] Created" << std::endl;
}

int CliController::run(const CliArguments& args, std::ostream& out, std::ostream& err) {
    if (args.help) {
        out << CliArguments::usage();
        return 0;
    }

    try {
        auto commands = buildCommands(args);

        nlohmann::json output;
        for (const auto& command : commands) {
            std::cerr << "[CliController] Running " << command->name() << std::endl;
            command->execute();
        }

        if (commands.size() == 1) {
            output = commands.front()->result();
        } else {
            output["import"] = commands.front()->result();
            output["result"] = commands.back()->result();
        }
        out << output.dump(2) << std::endl;
        return 0;

    } catch (const CommandException& e) {
        err << "Error: " << e.what() << "\n\n" << CliArguments::usage();
        return 2;
    } catch (const domain::LedgerException& e) {
        std::cerr << "[CliController] " << e.what() << std::endl;
        return reportError(out, e.what());
    } catch (const std::ios_base::failure& e) {
        std::cerr << "[CliController] I/O error: " << e.what() << std::endl;
        return reportError(out, e.what());
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[CliController] JSON error: " << e.what() << std::endl;
        return reportError(out, e.what());
    } catch (const std::exception& e) {
        // Битый CSV, число вне диапазона и прочие ошибки входных данных
        std::cerr << "[CliController] Failed: " << e.what() << std::endl;
        return reportError(out, e.what());
    }
}

int CliController::reportError(std::ostream& out, const std::string& message) {
    out << nlohmann::json{{"error", message}}.dump(2) << std::endl;
    return 1;
}

std::vector<std::shared_ptr<JsonCommand>> CliController::buildCommands(const CliArguments& args) const {
    std::string portfolioId = args.portfolio.value_or(storageSettings_->getDefaultPortfolio());
    if (portfolioId.empty()) {
        throw CommandException("Portfolio id must not be empty");
    }

    std::vector<std::shared_ptr<JsonCommand>> commands;
    if (args.importFile) {
        commands.push_back(std::make_shared<ImportCommand>(importService_, portfolioId, *args.importFile));
    }
    if (!args.command.empty()) {
        commands.push_back(buildCommand(args, portfolioId));
    }
    if (commands.empty()) {
        throw CommandException("No command given");
    }
    return commands;
}

std::shared_ptr<JsonCommand> CliController::buildCommand(const CliArguments& args,
                                                         const std::string& portfolioId) const {
    const std::string& command = args.command;

    auto fileArgument = [&]() -> std::string {
        if (args.positional.size() != 1) {
            throw CommandException(command + " needs exactly one FILE argument");
        }
        return args.positional.front();
    };
    auto noArguments = [&]() {
        if (!args.positional.empty()) {
            throw CommandException(command + " takes no positional arguments");
        }
    };

    if (command == "import") {
        return std::make_shared<ImportCommand>(importService_, portfolioId, fileArgument());
    }
    if (command == "backfill") {
        return std::make_shared<BackfillCommand>(backfillService_, portfolioId, fileArgument());
    }

    if (command == "price") {
        if (args.positional.size() != 2) {
            throw CommandException("price needs SEQUENCE and PRICE arguments");
        }
        return std::make_shared<PriceCommand>(backfillService_, portfolioId,
            PriceCommand::buildEntry(args.positional[0], args.positional[1], args.option("--fees")));
    }

    noArguments();

    if (command == "holdings") {
        return std::make_shared<HoldingsCommand>(queryService_, portfolioId, args.flag("--live"));
    }
    if (command == "disposals") {
        auto symbol = args.option("--symbol");
        if (symbol) {
            for (auto& c : *symbol) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return std::make_shared<DisposalsCommand>(queryService_, portfolioId, symbol);
    }
    if (command == "summary") {
        return std::make_shared<SummaryCommand>(queryService_, portfolioId);
    }
    if (command == "pending") {
        return std::make_shared<PendingCommand>(queryService_, portfolioId);
    }
    if (command == "failures") {
        return std::make_shared<FailuresCommand>(queryService_, portfolioId);
    }
    if (command == "transactions") {
        auto filter = TransactionsCommand::buildFilter(
            portfolioId,
            args.option("--symbol"),
            args.option("--type"),
            args.option("--from"),
            args.option("--to"),
            args.option("--limit"),
            args.option("--offset"));
        return std::make_shared<TransactionsCommand>(queryService_, filter);
    }

    throw CommandException("Unknown command: " + command);
}

} // namespace ledger::adapters::primary
