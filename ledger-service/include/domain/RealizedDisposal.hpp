#pragma once

#include "Money.hpp"
#include "Date.hpp"
#include "enums/EventKind.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Неизменяемая запись о списании части одного лота
 *
 * Одно событие списания даёт по записи на каждый затронутый лот.
 * У MERGER_OUT и DEMAT выручки нет: proceeds и gain отсутствуют,
 * себестоимость уходит из позиции без реализованного результата.
 */
class RealizedDisposal {
public:
    std::string symbol;
    int64_t disposalSequence = 0;
    Date disposalDate;
    EventKind disposalKind = EventKind::SELL;

    std::string lotId;
    Date lotOpenedDate;
    int64_t quantity = 0;

    std::optional<Money> proceeds;
    std::optional<Money> fees;
    Money costBasis;
    std::optional<Money> gain;
};

} // namespace ledger::domain
