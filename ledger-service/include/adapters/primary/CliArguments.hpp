#pragma once

#include <CommandException.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ledger::adapters::primary {

/**
 * @brief Разобранная командная строка ledger-cli
 *
 * ledger-cli [--portfolio ID] [--import FILE] [--quotes FILE] [--output FILE] <command> [args]
 *
 * Опции можно ставить до и после команды.
 */
class CliArguments {
public:
    std::optional<std::string> portfolio;
    std::optional<std::string> importFile;   ///< Импорт перед командой
    std::string quotesFile;                  ///< Пусто - котировок нет
    std::string outputFile;                  ///< Пусто - JSON в stdout

    std::string command;
    std::vector<std::string> positional;     ///< Аргументы после команды
    std::map<std::string, std::string> options;
    std::set<std::string> flags;
    bool help = false;

    static CliArguments parse(const std::vector<std::string>& args) {
        static const std::set<std::string> valueOptions = {
            "--symbol", "--type", "--from", "--to", "--limit", "--offset", "--fees"
        };
        static const std::set<std::string> flagOptions = { "--live" };

        CliArguments result;
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            auto value = [&]() -> std::string {
                if (i + 1 >= args.size()) {
                    throw CommandException("Option " + arg + " needs a value");
                }
                return args[++i];
            };

            if (arg == "--help" || arg == "-h") {
                result.help = true;
            } else if (arg == "--portfolio") {
                result.portfolio = value();
            } else if (arg == "--import") {
                result.importFile = value();
            } else if (arg == "--quotes") {
                result.quotesFile = value();
            } else if (arg == "--output") {
                result.outputFile = value();
            } else if (valueOptions.count(arg)) {
                result.options[arg] = value();
            } else if (flagOptions.count(arg)) {
                result.flags.insert(arg);
            } else if (arg.rfind("--", 0) == 0) {
                throw CommandException("Unknown option: " + arg);
            } else if (result.command.empty()) {
                result.command = arg;
            } else {
                result.positional.push_back(arg);
            }
        }
        return result;
    }

    std::optional<std::string> option(const std::string& name) const {
        auto it = options.find(name);
        if (it == options.end()) return std::nullopt;
        return it->second;
    }

    bool flag(const std::string& name) const {
        return flags.count(name) > 0;
    }

    static std::string usage() {
        return
            "Usage: ledger-cli [--portfolio ID] [--import FILE] [--quotes FILE]\n"
            "                  [--output FILE] <command>\n"
            "\n"
            "  --import FILE            import a history before running the command\n"
            "  --quotes FILE            JSON array of {symbol, price, asOf}\n"
            "  --output FILE            write JSON there instead of stdout\n"
            "\n"
            "Commands:\n"
            "  import FILE              import a depository transaction history (CSV)\n"
            "  backfill FILE            apply prices from a broker trade book (CSV)\n"
            "  price SEQ PRICE [--fees F]  price one pending transaction (IPO, DEMAT)\n"
            "  pending                  transactions still waiting for a price\n"
            "  holdings [--live]        open positions, --live adds market valuation\n"
            "  disposals [--symbol S]   realized disposals with lot linkage\n"
            "  summary                  portfolio totals (uses quotes)\n"
            "  failures                 symbols whose replay stopped on an invariant\n"
            "  transactions [--symbol S] [--type KIND] [--from DATE] [--to DATE]\n"
            "               [--limit N] [--offset N]\n"
            "\n"
            "Environment: LEDGER_STORAGE=memory|postgres, LEDGER_PORTFOLIO, LEDGER_DB_*,\n"
            "             QUOTE_SYNC_CONCURRENCY, QUOTE_SYNC_TIMEOUT_SECONDS\n";
    }
};

} // namespace ledger::adapters::primary
