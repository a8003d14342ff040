#pragma once

#include "Holding.hpp"
#include "Lot.hpp"
#include "RealizedDisposal.hpp"
#include "Date.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Тикер, воспроизведение которого остановилось на нарушении инварианта
 */
class ReplayFailure {
public:
    std::string symbol;
    int64_t sequence = 0;
    std::string errorType;   ///< InsufficientShares, MissingPrice, UnsortedEvents
    std::string message;
};

/**
 * @brief Расхождение остатка по выгрузке с остатком по журналу
 *
 * Не фатально: обычно значит пропущенную строку в выгрузке.
 */
class BalanceWarning {
public:
    std::string symbol;
    int64_t sequence = 0;
    Date date;
    int64_t reported = 0;
    int64_t computed = 0;
};

/**
 * @brief Результат полного воспроизведения портфеля
 *
 * Это то, что репозиторий сохраняет одной транзакцией вместе
 * с событиями.
 */
class LedgerSnapshot {
public:
    std::vector<Holding> holdings;
    std::vector<Lot> lots;
    std::vector<RealizedDisposal> disposals;
    std::vector<ReplayFailure> failures;
    std::vector<BalanceWarning> balanceWarnings;
};

} // namespace ledger::domain
