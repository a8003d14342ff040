#pragma once

#include "Money.hpp"
#include "Date.hpp"
#include "enums/EventKind.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Партия бумаг одного тикера с одной себестоимостью
 *
 * Лот никогда не удаляется, только списывается до нуля, чтобы
 * реализованный результат оставался проверяемым.
 */
class Lot {
public:
    std::string lotId;            ///< "<SYMBOL>-<sequence>"
    std::string symbol;
    int64_t openedQuantity = 0;
    int64_t remainingQuantity = 0;
    Money unitCost;
    Date openedDate;
    int64_t sequence = 0;         ///< sequence открывшего события
    EventKind source = EventKind::BUY;

    Lot() = default;

    Lot(const std::string& sym, int64_t quantity, const Money& cost,
        const Date& opened, int64_t seq, EventKind src)
        : lotId(sym + "-" + std::to_string(seq))
        , symbol(sym)
        , openedQuantity(quantity)
        , remainingQuantity(quantity)
        , unitCost(cost)
        , openedDate(opened)
        , sequence(seq)
        , source(src)
    {}

    bool isOpen() const { return remainingQuantity > 0; }

    Money remainingCost() const { return unitCost * remainingQuantity; }

    /// FIFO-порядок: дата открытия, затем sequence
    bool openedBefore(const Lot& other) const {
        if (openedDate != other.openedDate) return openedDate < other.openedDate;
        return sequence < other.sequence;
    }
};

} // namespace ledger::domain
