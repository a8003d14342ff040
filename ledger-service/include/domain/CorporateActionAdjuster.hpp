#pragma once

#include "LedgerEvent.hpp"
#include "Lot.hpp"
#include "errors/LedgerErrors.hpp"
#include <optional>

namespace ledger::domain {

/**
 * @brief Корпоративные действия без денежного потока
 *
 * BONUS и RIGHTS открывают лот с нулевой себестоимостью: количество
 * растёт, общая себестоимость позиции не меняется, средняя падает.
 * REARRANGEMENT - такой же лот без стоимости, но с датой исходной
 * покупки из описания (PUR ...), чтобы FIFO шёл по реальной дате.
 * MERGER_IN открывает лот по себестоимости, переданной снаружи.
 */
class CorporateActionAdjuster {
public:
    static bool handles(EventKind kind) {
        return kind == EventKind::BONUS
            || kind == EventKind::RIGHTS
            || kind == EventKind::REARRANGEMENT
            || kind == EventKind::MERGER_IN;
    }

    /**
     * @brief Лот, который открывает корпоративное действие
     * @throws MissingPriceError для MERGER_IN без переданной себестоимости
     */
    static Lot openLot(const LedgerEvent& event) {
        switch (event.kind) {
            case EventKind::BONUS:
            case EventKind::RIGHTS:
                return Lot(event.symbol, event.quantity, Money::zero(),
                           event.date, event.sequence, event.kind);

            case EventKind::REARRANGEMENT:
                return Lot(event.symbol, event.quantity, Money::zero(),
                           openedDateFor(event), event.sequence, event.kind);

            case EventKind::MERGER_IN:
                if (!event.transferredUnitCost) {
                    throw MissingPriceError(event.symbol, event.sequence, toString(event.kind));
                }
                return Lot(event.symbol, event.quantity, *event.transferredUnitCost,
                           event.date, event.sequence, event.kind);

            default:
                throw LedgerException("Not a corporate action: " + toString(event.kind));
        }
    }

    /// Дата открытия лота перестановки: дата покупки из описания, если она есть
    static Date openedDateFor(const LedgerEvent& event) {
        if (event.kind == EventKind::REARRANGEMENT && event.memo.purchaseDate) {
            return *event.memo.purchaseDate;
        }
        return event.date;
    }

    /**
     * @brief Себестоимость одной новой бумаги при слиянии
     *
     * Вся себестоимость, списанная со старых тикеров, делится на
     * количество новых бумаг по правилу округления Money.
     */
    static std::optional<Money> mergerUnitCost(const Money& transferredCost, int64_t newQuantity) {
        if (newQuantity <= 0) {
            return std::nullopt;
        }
        return transferredCost.divide(newQuantity);
    }
};

} // namespace ledger::domain
