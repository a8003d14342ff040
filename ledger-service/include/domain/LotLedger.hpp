#pragma once

#include "LedgerEvent.hpp"
#include "Lot.hpp"
#include "Holding.hpp"
#include "RealizedDisposal.hpp"
#include <map>
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief FIFO-журнал лотов
 *
 * Владеет очередями лотов по тикерам. Создаётся на один прогон
 * и передаётся явно; глобального состояния нет.
 *
 * Правила:
 * - BUY/IPO открывают лот по цене события;
 * - BONUS/RIGHTS/REARRANGEMENT/MERGER_IN - через CorporateActionAdjuster;
 * - SELL/MERGER_OUT/DEMAT списывают с самых старых лотов, последний
 *   затронутый лот дробится;
 * - событие применяется целиком или не применяется вовсе.
 *
 * Инвариант: сумма remainingQuantity по тикеру всегда равна чистому
 * количеству по всем применённым событиям.
 */
class LotLedger {
public:
    /**
     * @brief Применить одно событие
     * @throws UnsortedEventsError если событие раньше уже применённого по тикеру
     * @throws InsufficientSharesError при списании больше, чем есть
     * @throws MissingPriceError для денежного события без цены
     */
    void apply(const LedgerEvent& event);

    /**
     * @brief Применить пачку событий
     *
     * Порядок (date, sequence) по каждому тикеру - предусловие; он
     * проверяется до применения первого события, и при нарушении
     * журнал не меняется.
     */
    void applyEvents(const std::vector<LedgerEvent>& events);

    Holding holding(const std::string& symbol) const;

    /// Позиции с ненулевым остатком, по алфавиту тикеров
    std::vector<Holding> holdings() const;

    /// Все лоты тикера в FIFO-порядке, включая списанные до нуля
    std::vector<Lot> lots(const std::string& symbol) const;

    std::vector<RealizedDisposal> disposals() const;
    std::vector<RealizedDisposal> disposals(const std::string& symbol) const;

    int64_t remainingQuantity(const std::string& symbol) const;

    std::vector<std::string> symbols() const;

    /// Выбросить состояние тикера, воспроизведение которого упало
    void discard(const std::string& symbol);

private:
    struct SymbolBook {
        std::vector<Lot> lots;
        std::vector<RealizedDisposal> disposals;
        Money realizedPnl;
        bool started = false;
        Date lastDate;
        int64_t lastSequence = 0;
    };

    void openLot(SymbolBook& book, Lot lot);
    void consume(SymbolBook& book, const LedgerEvent& event);
    void checkOrder(const SymbolBook& book, const LedgerEvent& event) const;

    std::map<std::string, SymbolBook> books_;
};

} // namespace ledger::domain
