#pragma once

#include "domain/LedgerEvent.hpp"
#include "domain/LedgerSnapshot.hpp"
#include "domain/LotLedger.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace ledger::application {

/**
 * @brief Полное воспроизведение портфеля по всем транзакциям
 *
 * Отвечает за то, что журнал сам не делает:
 * - сортирует события по (date, sequence);
 * - изолирует тикеры: нарушение инварианта останавливает только свой тикер;
 * - переносит себестоимость при слиянии. Тикер с MERGER_IN
 *   воспроизводится после тикеров, чьи MERGER_OUT в ту же дату дают
 *   ему себестоимость;
 * - сверяет остаток с колонкой "Balance After Transaction".
 */
class LedgerReplayService {
public:
    LedgerReplayService();

    domain::LedgerSnapshot replay(const std::vector<domain::LedgerEvent>& events) const;

private:
    using EventsBySymbol = std::map<std::string, std::vector<domain::LedgerEvent>>;

    /// Тикеры в порядке, в котором источники слияний идут раньше получателей
    std::vector<std::string> replayOrder(const EventsBySymbol& bySymbol) const;

    /// Проставить transferredUnitCost событиям MERGER_IN тикера
    void assignMergerCost(std::vector<domain::LedgerEvent>& events,
                          const EventsBySymbol& bySymbol,
                          const domain::LotLedger& ledger) const;

    void replaySymbol(const std::string& symbol,
                      const std::vector<domain::LedgerEvent>& events,
                      domain::LotLedger& ledger,
                      domain::LedgerSnapshot& snapshot) const;

    void checkBalances(const std::vector<domain::LedgerEvent>& events,
                       domain::LedgerSnapshot& snapshot) const;
};

} // namespace ledger::application
