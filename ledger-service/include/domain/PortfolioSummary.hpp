#pragma once

#include "Money.hpp"
#include <string>
#include <vector>
#include <optional>

namespace ledger::domain {

/**
 * @brief Итоги по портфелю
 *
 * currentValue и totalUnrealizedPnl считаются только по позициям
 * с котировкой; процент берётся от себестоимости этих же позиций.
 */
class PortfolioSummary {
public:
    Money totalInvestment;          ///< Себестоимость всех открытых позиций
    Money pricedInvestment;         ///< Себестоимость позиций с котировкой
    Money currentValue;
    Money totalUnrealizedPnl;
    std::optional<double> totalUnrealizedPnlPercent;
    Money totalRealizedPnl;

    int holdingsCount = 0;
    int pricedCount = 0;
    std::vector<std::string> unpricedSymbols;

    bool fullyPriced() const { return unpricedSymbols.empty(); }
};

} // namespace ledger::domain
