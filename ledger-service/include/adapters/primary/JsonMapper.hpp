#pragma once

#include "domain/ImportReport.hpp"
#include "domain/PriceBackfill.hpp"
#include "domain/Valuation.hpp"
#include "domain/PortfolioSummary.hpp"
#include "domain/TransactionFilter.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace ledger::adapters::primary {

/**
 * @brief Преобразование результатов в JSON для вывода CLI
 *
 * Деньги выводятся строкой "1234.50": точное значение, без double.
 * Отсутствующее значение (нет цены, нет котировки) - null или поле
 * не выводится, но никогда не 0.
 */
class JsonMapper {
public:
    static nlohmann::json money(const domain::Money& value) {
        return value.toDecimalString();
    }

    static nlohmann::json money(const std::optional<domain::Money>& value) {
        return value ? nlohmann::json(value->toDecimalString()) : nlohmann::json(nullptr);
    }

    static nlohmann::json event(const domain::LedgerEvent& e) {
        nlohmann::json j;
        j["sequence"] = e.sequence;
        j["symbol"] = e.symbol;
        j["date"] = e.date.toString();
        j["kind"] = domain::toString(e.kind);
        j["quantity"] = e.quantity;
        j["unit_price"] = money(e.unitPrice);
        if (e.fees) j["fees"] = money(*e.fees);
        if (e.transferredUnitCost) j["transferred_unit_cost"] = money(*e.transferredUnitCost);
        if (e.balanceAfter) j["balance_after"] = *e.balanceAfter;
        j["description"] = e.description;
        j["needs_price"] = e.needsPrice();

        if (!e.memo.empty()) {
            nlohmann::json memo;
            if (!e.memo.referenceId.empty()) memo["reference_id"] = e.memo.referenceId;
            if (!e.memo.tradeId.empty()) memo["trade_id"] = e.memo.tradeId;
            if (!e.memo.transactionId.empty()) memo["transaction_id"] = e.memo.transactionId;
            if (!e.memo.settlementCode.empty()) memo["settlement_code"] = e.memo.settlementCode;
            if (!e.memo.bonusRate.empty()) memo["bonus_rate"] = e.memo.bonusRate;
            if (!e.memo.rightsRate.empty()) memo["rights_rate"] = e.memo.rightsRate;
            if (e.memo.purchaseDate) memo["purchase_date"] = e.memo.purchaseDate->toString();
            j["memo"] = memo;
        }
        return j;
    }

    static nlohmann::json events(const std::vector<domain::LedgerEvent>& items) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& e : items) {
            j.push_back(event(e));
        }
        return j;
    }

    static nlohmann::json holding(const domain::Holding& h) {
        nlohmann::json j;
        j["symbol"] = h.symbol;
        j["quantity"] = h.totalQuantity;
        j["total_cost"] = money(h.totalCost);
        j["average_cost"] = money(h.averageCost);
        j["realized_pnl"] = money(h.realizedPnl);
        j["open_lots"] = h.openLots;
        return j;
    }

    static nlohmann::json holdings(const std::vector<domain::Holding>& items) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& h : items) {
            j.push_back(holding(h));
        }
        return j;
    }

    static nlohmann::json valuation(const domain::Valuation& v) {
        nlohmann::json j = holding(v.holding);
        j["price_available"] = v.priceAvailable();
        if (!v.priceAvailable()) {
            j["note"] = "price data unavailable";
            return j;
        }

        j["current_price"] = money(v.quote->price);
        j["as_of"] = v.quote->asOf.toString();
        j["current_value"] = money(v.currentValue);
        j["unrealized_pnl"] = money(v.unrealizedPnl);
        if (v.unrealizedPnlPercent) {
            j["unrealized_pnl_percent"] = *v.unrealizedPnlPercent;
        } else {
            j["unrealized_pnl_percent"] = nullptr;
        }
        return j;
    }

    static nlohmann::json valuations(const std::vector<domain::Valuation>& items) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& v : items) {
            j.push_back(valuation(v));
        }
        return j;
    }

    static nlohmann::json disposal(const domain::RealizedDisposal& d) {
        nlohmann::json j;
        j["symbol"] = d.symbol;
        j["disposal_sequence"] = d.disposalSequence;
        j["disposal_date"] = d.disposalDate.toString();
        j["disposal_kind"] = domain::toString(d.disposalKind);
        j["lot_id"] = d.lotId;
        j["lot_opened_date"] = d.lotOpenedDate.toString();
        j["quantity"] = d.quantity;
        j["proceeds"] = money(d.proceeds);
        j["fees"] = money(d.fees);
        j["cost_basis"] = money(d.costBasis);
        j["gain"] = money(d.gain);
        return j;
    }

    static nlohmann::json disposals(const std::vector<domain::RealizedDisposal>& items) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& d : items) {
            j.push_back(disposal(d));
        }
        return j;
    }

    static nlohmann::json summary(const domain::PortfolioSummary& s) {
        nlohmann::json j;
        j["total_investment"] = money(s.totalInvestment);
        j["priced_investment"] = money(s.pricedInvestment);
        j["current_value"] = money(s.currentValue);
        j["total_unrealized_pnl"] = money(s.totalUnrealizedPnl);
        if (s.totalUnrealizedPnlPercent) {
            j["total_unrealized_pnl_percent"] = *s.totalUnrealizedPnlPercent;
        } else {
            j["total_unrealized_pnl_percent"] = nullptr;
        }
        j["total_realized_pnl"] = money(s.totalRealizedPnl);
        j["holdings_count"] = s.holdingsCount;
        j["priced_count"] = s.pricedCount;
        j["fully_priced"] = s.fullyPriced();
        j["unpriced_symbols"] = s.unpricedSymbols;
        return j;
    }

    static nlohmann::json page(const domain::TransactionPage& p) {
        nlohmann::json j;
        j["total"] = p.total;
        j["limit"] = p.limit;
        j["offset"] = p.offset;
        j["items"] = events(p.items);
        return j;
    }

    static nlohmann::json failures(const std::vector<domain::ReplayFailure>& items) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& f : items) {
            j.push_back({
                {"symbol", f.symbol},
                {"sequence", f.sequence},
                {"error_type", f.errorType},
                {"message", f.message}
            });
        }
        return j;
    }

    static nlohmann::json balanceWarnings(const std::vector<domain::BalanceWarning>& items) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& w : items) {
            j.push_back({
                {"symbol", w.symbol},
                {"sequence", w.sequence},
                {"date", w.date.toString()},
                {"reported", w.reported},
                {"computed", w.computed}
            });
        }
        return j;
    }

    static nlohmann::json importReport(const domain::ImportReport& r) {
        nlohmann::json j;
        j["portfolio_id"] = r.portfolioId;
        j["rows_read"] = r.rowsRead;
        j["imported"] = r.imported;
        j["skipped"] = r.skipped();
        j["duplicates"] = r.duplicates;
        j["pending_price"] = r.pendingPrice;
        j["newest_first"] = r.newestFirst;

        nlohmann::json errors = nlohmann::json::array();
        for (const auto& e : r.rowErrors) {
            errors.push_back({
                {"row", e.rowNumber},
                {"code", domain::toString(e.code)},
                {"message", e.message}
            });
        }
        j["row_errors"] = errors;

        nlohmann::json unclassified = nlohmann::json::array();
        for (const auto& u : r.unclassified) {
            unclassified.push_back({
                {"row", u.rowNumber},
                {"symbol", u.symbol},
                {"description", u.description},
                {"treated_as", domain::toString(u.treatedAs)}
            });
        }
        j["unclassified"] = unclassified;
        j["replay_failures"] = failures(r.replayFailures);
        j["balance_warnings"] = balanceWarnings(r.balanceWarnings);
        return j;
    }

    static nlohmann::json backfillReport(const domain::BackfillReport& r) {
        nlohmann::json j;
        j["portfolio_id"] = r.portfolioId;
        j["entries"] = r.entries;
        j["applied"] = r.applied;
        j["already_priced"] = r.alreadyPriced;
        j["unmatched"] = r.unmatched;
        j["pending_price"] = r.pendingPrice;
        j["replay_failures"] = failures(r.replayFailures);
        return j;
    }
};

} // namespace ledger::adapters::primary
