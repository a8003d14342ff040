#pragma once

#include <ICommand.hpp>
#include <CommandException.hpp>
#include "adapters/primary/CsvReader.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "adapters/primary/TradeBookParser.hpp"
#include "ports/input/IImportService.hpp"
#include "ports/input/IPriceBackfillService.hpp"
#include "ports/input/IPortfolioQueryService.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace ledger::adapters::primary {

/**
 * @brief Команда CLI с результатом в JSON
 */
class JsonCommand : public ICommand {
public:
    const nlohmann::json& result() const { return result_; }

protected:
    nlohmann::json result_;
};

// ============================================
// ЗАПИСЬ
// ============================================

class ImportCommand : public JsonCommand {
public:
    ImportCommand(std::shared_ptr<ports::input::IImportService> service,
                  std::string portfolioId, std::string path)
        : service_(std::move(service)), portfolioId_(std::move(portfolioId)), path_(std::move(path)) {}

    std::string name() const override { return "import"; }

    void execute() override {
        auto table = CsvReader::readFile(path_);
        result_ = JsonMapper::importReport(service_->importTable(portfolioId_, table));
    }

private:
    std::shared_ptr<ports::input::IImportService> service_;
    std::string portfolioId_;
    std::string path_;
};

class BackfillCommand : public JsonCommand {
public:
    BackfillCommand(std::shared_ptr<ports::input::IPriceBackfillService> service,
                    std::string portfolioId, std::string path)
        : service_(std::move(service)), portfolioId_(std::move(portfolioId)), path_(std::move(path)) {}

    std::string name() const override { return "backfill"; }

    void execute() override {
        auto parsed = TradeBookParser::parse(CsvReader::readFile(path_));
        result_ = JsonMapper::backfillReport(service_->backfill(portfolioId_, parsed.entries));
        result_["unparsed_rows"] = parsed.skipped;
    }

private:
    std::shared_ptr<ports::input::IPriceBackfillService> service_;
    std::string portfolioId_;
    std::string path_;
};

/**
 * @brief Цена одной транзакции по её sequence
 *
 * Для строк, которых нет в торговом журнале брокера: IPO, DEMAT.
 * Sequence берётся из вывода pending.
 */
class PriceCommand : public JsonCommand {
public:
    PriceCommand(std::shared_ptr<ports::input::IPriceBackfillService> service,
                 std::string portfolioId, domain::PriceBackfillEntry entry)
        : service_(std::move(service)), portfolioId_(std::move(portfolioId)), entry_(std::move(entry)) {}

    std::string name() const override { return "price #" + std::to_string(*entry_.sequence); }

    void execute() override {
        result_ = JsonMapper::backfillReport(service_->backfill(portfolioId_, {entry_}));
    }

    /// @throws CommandException если sequence не число или цена не разбирается
    static domain::PriceBackfillEntry buildEntry(const std::string& sequence,
                                                 const std::string& price,
                                                 const std::optional<std::string>& fees) {
        domain::PriceBackfillEntry entry;
        try {
            size_t used = 0;
            entry.sequence = std::stoll(sequence, &used);
            if (used != sequence.size() || *entry.sequence <= 0) {
                throw CommandException("SEQUENCE must be a positive number: " + sequence);
            }
        } catch (const std::logic_error&) {
            throw CommandException("SEQUENCE must be a positive number: " + sequence);
        }

        try {
            entry.unitPrice = domain::Money::fromString(price);
            if (fees) entry.fees = domain::Money::fromString(*fees);
        } catch (const domain::MoneyFormatError& e) {
            throw CommandException(std::string("Bad amount: ") + e.what());
        }
        if (entry.fees && entry.fees->isNegative()) {
            throw CommandException("--fees must not be negative");
        }
        return entry;
    }

private:
    std::shared_ptr<ports::input::IPriceBackfillService> service_;
    std::string portfolioId_;
    domain::PriceBackfillEntry entry_;
};

// ============================================
// ЧТЕНИЕ
// ============================================

class HoldingsCommand : public JsonCommand {
public:
    HoldingsCommand(std::shared_ptr<ports::input::IPortfolioQueryService> service,
                    std::string portfolioId, bool live)
        : service_(std::move(service)), portfolioId_(std::move(portfolioId)), live_(live) {}

    std::string name() const override { return live_ ? "holdings --live" : "holdings"; }

    void execute() override {
        result_ = live_
            ? JsonMapper::valuations(service_->getValuedHoldings(portfolioId_))
            : JsonMapper::holdings(service_->getHoldings(portfolioId_));
    }

private:
    std::shared_ptr<ports::input::IPortfolioQueryService> service_;
    std::string portfolioId_;
    bool live_;
};

class DisposalsCommand : public JsonCommand {
public:
    DisposalsCommand(std::shared_ptr<ports::input::IPortfolioQueryService> service,
                     std::string portfolioId, std::optional<std::string> symbol)
        : service_(std::move(service)), portfolioId_(std::move(portfolioId)), symbol_(std::move(symbol)) {}

    std::string name() const override { return "disposals"; }

    void execute() override {
        result_ = JsonMapper::disposals(service_->getDisposals(portfolioId_, symbol_));
    }

private:
    std::shared_ptr<ports::input::IPortfolioQueryService> service_;
    std::string portfolioId_;
    std::optional<std::string> symbol_;
};

class SummaryCommand : public JsonCommand {
public:
    SummaryCommand(std::shared_ptr<ports::input::IPortfolioQueryService> service, std::string portfolioId)
        : service_(std::move(service)), portfolioId_(std::move(portfolioId)) {}

    std::string name() const override { return "summary"; }

    void execute() override {
        result_ = JsonMapper::summary(service_->getSummary(portfolioId_));
    }

private:
    std::shared_ptr<ports::input::IPortfolioQueryService> service_;
    std::string portfolioId_;
};

class PendingCommand : public JsonCommand {
public:
    PendingCommand(std::shared_ptr<ports::input::IPortfolioQueryService> service, std::string portfolioId)
        : service_(std::move(service)), portfolioId_(std::move(portfolioId)) {}

    std::string name() const override { return "pending"; }

    void execute() override {
        result_ = JsonMapper::events(service_->getPendingPrices(portfolioId_));
    }

private:
    std::shared_ptr<ports::input::IPortfolioQueryService> service_;
    std::string portfolioId_;
};

class FailuresCommand : public JsonCommand {
public:
    FailuresCommand(std::shared_ptr<ports::input::IPortfolioQueryService> service, std::string portfolioId)
        : service_(std::move(service)), portfolioId_(std::move(portfolioId)) {}

    std::string name() const override { return "failures"; }

    void execute() override {
        result_ = JsonMapper::failures(service_->getReplayFailures(portfolioId_));
    }

private:
    std::shared_ptr<ports::input::IPortfolioQueryService> service_;
    std::string portfolioId_;
};

class TransactionsCommand : public JsonCommand {
public:
    TransactionsCommand(std::shared_ptr<ports::input::IPortfolioQueryService> service,
                        domain::TransactionFilter filter)
        : service_(std::move(service)), filter_(std::move(filter)) {}

    std::string name() const override { return "transactions"; }

    void execute() override {
        if (filter_.limit <= 0 || filter_.offset < 0) {
            throw CommandException("--limit must be positive and --offset non-negative");
        }
        result_ = JsonMapper::page(service_->getTransactions(filter_));
    }

    /// Значения опций --type/--from/--to/--limit/--offset
    static domain::TransactionFilter buildFilter(
        const std::string& portfolioId,
        const std::optional<std::string>& symbol,
        const std::optional<std::string>& type,
        const std::optional<std::string>& from,
        const std::optional<std::string>& to,
        const std::optional<std::string>& limit,
        const std::optional<std::string>& offset
    ) {
        domain::TransactionFilter filter;
        filter.portfolioId = portfolioId;
        if (symbol) {
            filter.symbol = upper(*symbol);
        }
        if (type) {
            filter.kind = domain::parseEventKind(upper(*type));
            if (!filter.kind) {
                throw CommandException("Unknown transaction type: " + *type);
            }
        }
        if (from) {
            filter.from = domain::Date::parse(*from);
            if (!filter.from) throw CommandException("Bad --from date: " + *from);
        }
        if (to) {
            filter.to = domain::Date::parse(*to);
            if (!filter.to) throw CommandException("Bad --to date: " + *to);
        }
        if (limit) filter.limit = toInt("--limit", *limit);
        if (offset) filter.offset = toInt("--offset", *offset);
        return filter;
    }

private:
    static std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    static int toInt(const std::string& option, const std::string& value) {
        try {
            size_t used = 0;
            int parsed = std::stoi(value, &used);
            if (used != value.size()) {
                throw CommandException(option + " is not a number: " + value);
            }
            return parsed;
        } catch (const std::logic_error&) {
            throw CommandException(option + " is not a number: " + value);
        }
    }

    std::shared_ptr<ports::input::IPortfolioQueryService> service_;
    domain::TransactionFilter filter_;
};

} // namespace ledger::adapters::primary
