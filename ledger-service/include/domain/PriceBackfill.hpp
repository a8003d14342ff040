#pragma once

#include "Money.hpp"
#include "Date.hpp"
#include "enums/EventKind.hpp"
#include "LedgerSnapshot.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Цена для ещё не оценённой транзакции
 *
 * Сопоставляется по sequence, по TX: из описания, либо по
 * (symbol, date, quantity).
 */
class PriceBackfillEntry {
public:
    std::optional<int64_t> sequence;
    std::string transactionId;
    std::string symbol;
    std::optional<Date> date;
    int64_t quantity = 0;
    std::optional<EventKind> kind;   ///< BUY или SELL, если известно
    Money unitPrice;
    std::optional<Money> fees;
};

class BackfillReport {
public:
    std::string portfolioId;
    int entries = 0;
    int applied = 0;
    int alreadyPriced = 0;
    std::vector<std::string> unmatched;   ///< Описание записей без пары
    int pendingPrice = 0;
    std::vector<ReplayFailure> replayFailures;
};

} // namespace ledger::domain
