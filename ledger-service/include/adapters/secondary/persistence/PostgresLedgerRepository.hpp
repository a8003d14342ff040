#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "settings/DbSettings.hpp"
#include "domain/EventClassifier.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL хранилище журнала
 *
 * Схема создаётся в sql/init.sql, не здесь.
 * Деньги хранятся в пайсах (BIGINT), даты - текстом YYYY-MM-DD:
 * в выгрузках встречаются даты по Бикрам Самбат с 32-м днём.
 *
 * updatePortfolio выполняется одной pqxx::work: сначала
 * pg_advisory_xact_lock на портфель, затем чтение, расчёт и запись.
 * Два процесса не читают и не пишут один портфель одновременно.
 */
class PostgresLedgerRepository : public ports::output::ILedgerRepository {
public:
    explicit PostgresLedgerRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cerr << "[PostgresLedgerRepository] Connecting to " << settings_->getName() << "..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cerr << "[PostgresLedgerRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresLedgerRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::vector<domain::LedgerEvent> loadTransactions(const std::string& portfolioId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto events = selectTransactions(txn, portfolioId);
            txn.commit();
            return events;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepository] loadTransactions() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void updatePortfolio(const std::string& portfolioId,
                         const ports::output::PortfolioUpdateFn& update) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            // Блокировка до чтения: второй писатель увидит уже записанные sequence
            txn.exec_params("SELECT pg_advisory_xact_lock(hashtext($1))", portfolioId);

            auto result = update(selectTransactions(txn, portfolioId));
            if (!result) {
                txn.commit();
                return;
            }
            const auto& snapshot = result->snapshot;

            // Без ON CONFLICT: совпадение sequence - ошибка и откат
            for (const auto& e : result->inserted) {
                txn.exec_params(
                    R"(
                        INSERT INTO ledger_transactions
                            (portfolio_id, sequence, symbol, trade_date, kind, quantity,
                             unit_price, transferred_unit_cost, fees, description, balance_after)
                        VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11)
                    )",
                    portfolioId,
                    e.sequence,
                    e.symbol,
                    e.date.toString(),
                    domain::toString(e.kind),
                    e.quantity,
                    toMinor(e.unitPrice),
                    toMinor(e.transferredUnitCost),
                    toMinor(e.fees),
                    e.description,
                    e.balanceAfter
                );
            }

            for (const auto& e : result->repriced) {
                auto updated = txn.exec_params(
                    R"(
                        UPDATE ledger_transactions
                        SET unit_price = $3, transferred_unit_cost = $4, fees = $5
                        WHERE portfolio_id = $1 AND sequence = $2
                    )",
                    portfolioId,
                    e.sequence,
                    toMinor(e.unitPrice),
                    toMinor(e.transferredUnitCost),
                    toMinor(e.fees)
                );
                if (updated.affected_rows() != 1) {
                    throw std::runtime_error("Sequence " + std::to_string(e.sequence) +
                                             " not stored for " + portfolioId);
                }
            }

            // Производное состояние заменяется целиком
            txn.exec_params("DELETE FROM ledger_lots WHERE portfolio_id = $1", portfolioId);
            txn.exec_params("DELETE FROM ledger_disposals WHERE portfolio_id = $1", portfolioId);
            txn.exec_params("DELETE FROM ledger_holdings WHERE portfolio_id = $1", portfolioId);
            txn.exec_params("DELETE FROM ledger_replay_failures WHERE portfolio_id = $1", portfolioId);
            txn.exec_params("DELETE FROM ledger_balance_warnings WHERE portfolio_id = $1", portfolioId);

            for (const auto& lot : snapshot.lots) {
                txn.exec_params(
                    R"(
                        INSERT INTO ledger_lots
                            (portfolio_id, lot_id, symbol, opened_quantity, remaining_quantity,
                             unit_cost, opened_date, sequence, source)
                        VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9)
                    )",
                    portfolioId, lot.lotId, lot.symbol, lot.openedQuantity, lot.remainingQuantity,
                    lot.unitCost.minorUnits(), lot.openedDate.toString(), lot.sequence,
                    domain::toString(lot.source)
                );
            }

            int position = 0;
            for (const auto& d : snapshot.disposals) {
                txn.exec_params(
                    R"(
                        INSERT INTO ledger_disposals
                            (portfolio_id, position, symbol, disposal_sequence, disposal_date,
                             disposal_kind, lot_id, lot_opened_date, quantity,
                             proceeds, fees, cost_basis, gain)
                        VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13)
                    )",
                    portfolioId, position++, d.symbol, d.disposalSequence, d.disposalDate.toString(),
                    domain::toString(d.disposalKind), d.lotId, d.lotOpenedDate.toString(), d.quantity,
                    toMinor(d.proceeds), toMinor(d.fees), d.costBasis.minorUnits(), toMinor(d.gain)
                );
            }

            for (const auto& h : snapshot.holdings) {
                txn.exec_params(
                    R"(
                        INSERT INTO ledger_holdings
                            (portfolio_id, symbol, total_quantity, total_cost, realized_pnl, open_lots)
                        VALUES ($1, $2, $3, $4, $5, $6)
                    )",
                    portfolioId, h.symbol, h.totalQuantity, h.totalCost.minorUnits(),
                    h.realizedPnl.minorUnits(), h.openLots
                );
            }

            for (const auto& f : snapshot.failures) {
                txn.exec_params(
                    R"(
                        INSERT INTO ledger_replay_failures
                            (portfolio_id, symbol, sequence, error_type, message)
                        VALUES ($1, $2, $3, $4, $5)
                    )",
                    portfolioId, f.symbol, f.sequence, f.errorType, f.message
                );
            }

            for (const auto& w : snapshot.balanceWarnings) {
                txn.exec_params(
                    R"(
                        INSERT INTO ledger_balance_warnings
                            (portfolio_id, symbol, sequence, event_date, reported, computed)
                        VALUES ($1, $2, $3, $4, $5, $6)
                    )",
                    portfolioId, w.symbol, w.sequence, w.date.toString(), w.reported, w.computed
                );
            }

            txn.exec_params(
                R"(
                    INSERT INTO ledger_portfolios (portfolio_id, replayed_at)
                    VALUES ($1, NOW())
                    ON CONFLICT (portfolio_id) DO UPDATE SET replayed_at = NOW()
                )",
                portfolioId
            );

            txn.commit();
            std::cerr << "[PostgresLedgerRepository] " << portfolioId << ": inserted "
                      << result->inserted.size() << ", repriced " << result->repriced.size()
                      << ", " << snapshot.lots.size() << " lots" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepository] updatePortfolio() failed, rolled back: " << e.what() << std::endl;
            throw;
        }
    }

    domain::TransactionPage findTransactions(const domain::TransactionFilter& filter) override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::optional<std::string> kind;
        if (filter.kind) kind = domain::toString(*filter.kind);
        std::optional<std::string> from;
        if (filter.from) from = filter.from->toString();
        std::optional<std::string> to;
        if (filter.to) to = filter.to->toString();

        const std::string where =
            " WHERE portfolio_id = $1"
            " AND ($2::text IS NULL OR symbol = $2)"
            " AND ($3::text IS NULL OR kind = $3)"
            " AND ($4::text IS NULL OR trade_date >= $4)"
            " AND ($5::text IS NULL OR trade_date <= $5)";

        try {
            pqxx::work txn(*connection_);

            auto count = txn.exec_params(
                "SELECT COUNT(*) FROM ledger_transactions" + where,
                filter.portfolioId, filter.symbol, kind, from, to
            );
            auto result = txn.exec_params(
                "SELECT " + TRANSACTION_COLUMNS + " FROM ledger_transactions" + where +
                " ORDER BY trade_date, sequence LIMIT $6 OFFSET $7",
                filter.portfolioId, filter.symbol, kind, from, to, filter.limit, filter.offset
            );
            txn.commit();

            domain::TransactionPage page;
            page.total = count[0][0].as<int>();
            page.limit = filter.limit;
            page.offset = filter.offset;
            for (const auto& row : result) {
                page.items.push_back(rowToEvent(row));
            }
            return page;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepository] findTransactions() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::LedgerSnapshot> loadSnapshot(const std::string& portfolioId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto marker = txn.exec_params(
                "SELECT 1 FROM ledger_portfolios WHERE portfolio_id = $1", portfolioId);
            if (marker.empty()) {
                txn.commit();
                return std::nullopt;
            }

            domain::LedgerSnapshot snapshot;

            for (const auto& row : txn.exec_params(
                    "SELECT symbol, total_quantity, total_cost, realized_pnl, open_lots "
                    "FROM ledger_holdings WHERE portfolio_id = $1 ORDER BY symbol", portfolioId)) {
                snapshot.holdings.emplace_back(
                    row["symbol"].as<std::string>(),
                    row["total_quantity"].as<int64_t>(),
                    domain::Money::fromMinorUnits(row["total_cost"].as<int64_t>()),
                    domain::Money::fromMinorUnits(row["realized_pnl"].as<int64_t>()),
                    row["open_lots"].as<int>());
            }

            for (const auto& row : txn.exec_params(
                    "SELECT lot_id, symbol, opened_quantity, remaining_quantity, unit_cost, "
                    "       opened_date, sequence, source "
                    "FROM ledger_lots WHERE portfolio_id = $1 "
                    "ORDER BY symbol, opened_date, sequence", portfolioId)) {
                snapshot.lots.push_back(rowToLot(row));
            }

            for (const auto& row : txn.exec_params(
                    "SELECT symbol, disposal_sequence, disposal_date, disposal_kind, lot_id, "
                    "       lot_opened_date, quantity, proceeds, fees, cost_basis, gain "
                    "FROM ledger_disposals WHERE portfolio_id = $1 ORDER BY position", portfolioId)) {
                snapshot.disposals.push_back(rowToDisposal(row));
            }

            for (const auto& row : txn.exec_params(
                    "SELECT symbol, sequence, error_type, message "
                    "FROM ledger_replay_failures WHERE portfolio_id = $1 ORDER BY symbol", portfolioId)) {
                domain::ReplayFailure f;
                f.symbol = row["symbol"].as<std::string>();
                f.sequence = row["sequence"].as<int64_t>();
                f.errorType = row["error_type"].as<std::string>();
                f.message = row["message"].as<std::string>();
                snapshot.failures.push_back(f);
            }

            for (const auto& row : txn.exec_params(
                    "SELECT symbol, sequence, event_date, reported, computed "
                    "FROM ledger_balance_warnings WHERE portfolio_id = $1 "
                    "ORDER BY symbol, sequence", portfolioId)) {
                domain::BalanceWarning w;
                w.symbol = row["symbol"].as<std::string>();
                w.sequence = row["sequence"].as<int64_t>();
                w.date = parseDate(row["event_date"]);
                w.reported = row["reported"].as<int64_t>();
                w.computed = row["computed"].as<int64_t>();
                snapshot.balanceWarnings.push_back(w);
            }

            txn.commit();
            return snapshot;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepository] loadSnapshot() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    inline static const std::string TRANSACTION_COLUMNS =
        "sequence, symbol, trade_date, kind, quantity, unit_price, "
        "transferred_unit_cost, fees, description, balance_after";

    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    static std::optional<int64_t> toMinor(const std::optional<domain::Money>& value) {
        if (!value) return std::nullopt;
        return value->minorUnits();
    }

    static std::vector<domain::LedgerEvent> selectTransactions(pqxx::work& txn, const std::string& portfolioId) {
        auto result = txn.exec_params(
            "SELECT " + TRANSACTION_COLUMNS + " FROM ledger_transactions "
            "WHERE portfolio_id = $1 ORDER BY trade_date, sequence",
            portfolioId
        );

        std::vector<domain::LedgerEvent> events;
        events.reserve(result.size());
        for (const auto& row : result) {
            events.push_back(rowToEvent(row));
        }
        return events;
    }

    static std::optional<domain::Money> moneyOrNull(const pqxx::field& field) {
        if (field.is_null()) return std::nullopt;
        return domain::Money::fromMinorUnits(field.as<int64_t>());
    }

    static domain::Date parseDate(const pqxx::field& field) {
        auto text = field.as<std::string>();
        auto date = domain::Date::parse(text);
        if (!date) {
            throw std::runtime_error("Stored date is malformed: " + text);
        }
        return *date;
    }

    static domain::EventKind parseKind(const pqxx::field& field) {
        auto text = field.as<std::string>();
        auto kind = domain::parseEventKind(text);
        if (!kind) {
            throw std::runtime_error("Stored event kind is unknown: " + text);
        }
        return *kind;
    }

    static domain::LedgerEvent rowToEvent(const pqxx::row& row) {
        domain::LedgerEvent e(
            row["symbol"].as<std::string>(),
            parseDate(row["trade_date"]),
            parseKind(row["kind"]),
            row["quantity"].as<int64_t>());
        e.sequence = row["sequence"].as<int64_t>();
        e.unitPrice = moneyOrNull(row["unit_price"]);
        e.transferredUnitCost = moneyOrNull(row["transferred_unit_cost"]);
        e.fees = moneyOrNull(row["fees"]);
        e.description = row["description"].is_null() ? "" : row["description"].as<std::string>();
        e.memo = domain::EventClassifier::parseMemo(e.description);
        if (!row["balance_after"].is_null()) {
            e.balanceAfter = row["balance_after"].as<int64_t>();
        }
        return e;
    }

    static domain::Lot rowToLot(const pqxx::row& row) {
        domain::Lot lot(
            row["symbol"].as<std::string>(),
            row["opened_quantity"].as<int64_t>(),
            domain::Money::fromMinorUnits(row["unit_cost"].as<int64_t>()),
            parseDate(row["opened_date"]),
            row["sequence"].as<int64_t>(),
            parseKind(row["source"]));
        lot.lotId = row["lot_id"].as<std::string>();
        lot.remainingQuantity = row["remaining_quantity"].as<int64_t>();
        return lot;
    }

    static domain::RealizedDisposal rowToDisposal(const pqxx::row& row) {
        domain::RealizedDisposal d;
        d.symbol = row["symbol"].as<std::string>();
        d.disposalSequence = row["disposal_sequence"].as<int64_t>();
        d.disposalDate = parseDate(row["disposal_date"]);
        d.disposalKind = parseKind(row["disposal_kind"]);
        d.lotId = row["lot_id"].as<std::string>();
        d.lotOpenedDate = parseDate(row["lot_opened_date"]);
        d.quantity = row["quantity"].as<int64_t>();
        d.proceeds = moneyOrNull(row["proceeds"]);
        d.fees = moneyOrNull(row["fees"]);
        d.costBasis = domain::Money::fromMinorUnits(row["cost_basis"].as<int64_t>());
        d.gain = moneyOrNull(row["gain"]);
        return d;
    }
};

} // namespace ledger::adapters::secondary
