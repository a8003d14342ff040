#pragma once

#include "PortfolioSummary.hpp"
#include "Valuation.hpp"
#include "ValuationEngine.hpp"
#include "RealizedDisposal.hpp"
#include <vector>

namespace ledger::domain {

/**
 * @brief Сводка по портфелю из оценённых позиций
 */
class PortfolioAggregator {
public:
    static PortfolioSummary summarize(const std::vector<Valuation>& valuations,
                                      const std::vector<RealizedDisposal>& disposals = {}) {
        PortfolioSummary summary;

        for (const auto& v : valuations) {
            summary.totalInvestment = summary.totalInvestment + v.holding.totalCost;
            summary.totalRealizedPnl = summary.totalRealizedPnl + v.holding.realizedPnl;
            ++summary.holdingsCount;

            if (!v.priceAvailable()) {
                summary.unpricedSymbols.push_back(v.holding.symbol);
                continue;
            }

            ++summary.pricedCount;
            summary.pricedInvestment = summary.pricedInvestment + v.holding.totalCost;
            summary.currentValue = summary.currentValue + *v.currentValue;
            summary.totalUnrealizedPnl = summary.totalUnrealizedPnl + *v.unrealizedPnl;
        }

        // Результат по полностью закрытым позициям в valuations уже не попадает
        if (!disposals.empty()) {
            summary.totalRealizedPnl = Money();
            for (const auto& d : disposals) {
                if (d.gain) {
                    summary.totalRealizedPnl = summary.totalRealizedPnl + *d.gain;
                }
            }
        }

        summary.totalUnrealizedPnlPercent =
            ValuationEngine::percentOf(summary.totalUnrealizedPnl, summary.pricedInvestment);
        return summary;
    }
};

} // namespace ledger::domain
