#pragma once

#include "Money.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Текущая агрегированная позиция по тикеру
 *
 * Производное значение: считается из открытых лотов, отдельно не хранится
 * как источник правды.
 */
class Holding {
public:
    std::string symbol;
    int64_t totalQuantity = 0;
    Money totalCost;
    Money averageCost;     ///< totalCost / totalQuantity, округление Money
    Money realizedPnl;     ///< Накопленный результат по продажам
    int openLots = 0;

    Holding() = default;

    Holding(const std::string& sym, int64_t quantity, const Money& cost,
            const Money& realized, int lots)
        : symbol(sym)
        , totalQuantity(quantity)
        , totalCost(cost)
        , averageCost(quantity > 0 ? cost.divide(quantity) : Money())
        , realizedPnl(realized)
        , openLots(lots)
    {}

    bool isEmpty() const { return totalQuantity == 0; }
};

} // namespace ledger::domain
