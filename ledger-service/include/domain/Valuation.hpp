#pragma once

#include "Holding.hpp"
#include "Quote.hpp"
#include <optional>

namespace ledger::domain {

/**
 * @brief Позиция вместе с рыночной оценкой
 *
 * Без котировки рыночные поля отсутствуют, а не равны себестоимости:
 * "нет данных" не должно выглядеть как "в ноль".
 */
class Valuation {
public:
    Holding holding;
    std::optional<Quote> quote;
    std::optional<Money> currentValue;
    std::optional<Money> unrealizedPnl;
    std::optional<double> unrealizedPnlPercent;  ///< Нет при нулевой себестоимости

    bool priceAvailable() const { return quote.has_value(); }
};

} // namespace ledger::domain
