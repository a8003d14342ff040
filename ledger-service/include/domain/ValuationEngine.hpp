#pragma once

#include "Valuation.hpp"
#include <optional>

namespace ledger::domain {

/**
 * @brief Рыночная оценка позиции
 *
 * Чистая функция от позиции и котировки; лоты не трогает.
 */
class ValuationEngine {
public:
    static Valuation value(const Holding& holding, const std::optional<Quote>& quote) {
        Valuation result;
        result.holding = holding;

        if (!quote) {
            return result;
        }

        result.quote = quote;
        result.currentValue = quote->price * holding.totalQuantity;
        result.unrealizedPnl = *result.currentValue - holding.totalCost;
        result.unrealizedPnlPercent = percentOf(*result.unrealizedPnl, holding.totalCost);
        return result;
    }

    /**
     * @brief pnl / base * 100, либо "нет процента" при нулевой базе
     *
     * double здесь только для отображения.
     */
    static std::optional<double> percentOf(const Money& pnl, const Money& base) {
        if (base.isZero()) {
            return std::nullopt;
        }
        return static_cast<double>(pnl.minorUnits()) /
               static_cast<double>(base.minorUnits()) * 100.0;
    }
};

} // namespace ledger::domain
