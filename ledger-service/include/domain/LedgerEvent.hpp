#pragma once

#include "Money.hpp"
#include "Date.hpp"
#include "EventMemo.hpp"
#include "enums/EventKind.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Одно нормализованное экономическое событие по одному тикеру
 *
 * quantity - всегда модуль, направление задаёт kind.
 * unitPrice есть только у BUY/SELL/IPO (и может ещё отсутствовать до
 * бэкфилла цены); у BONUS цены нет совсем, это не покупка по нулю.
 */
class LedgerEvent {
public:
    std::string symbol;
    Date date;
    EventKind kind = EventKind::BUY;
    int64_t quantity = 0;

    std::optional<Money> unitPrice;
    std::optional<Money> transferredUnitCost;  ///< Себестоимость для MERGER_IN
    std::optional<Money> fees;                 ///< Комиссии по списанию, делятся по лотам

    int64_t sequence = 0;                      ///< Стабильный порядок внутри одной даты
    std::string description;
    EventMemo memo;
    std::optional<int64_t> balanceAfter;       ///< Остаток по выгрузке после строки

    LedgerEvent() = default;

    LedgerEvent(const std::string& sym, const Date& d, EventKind k, int64_t qty)
        : symbol(sym), date(d), kind(k), quantity(qty) {}

    /// Денежное событие без цены: ждёт бэкфилла
    bool needsPrice() const {
        return carriesCashFlow(kind) && !unitPrice.has_value();
    }

    /// Порядок воспроизведения (date, sequence)
    bool precedes(const LedgerEvent& other) const {
        if (date != other.date) return date < other.date;
        return sequence < other.sequence;
    }
};

} // namespace ledger::domain
