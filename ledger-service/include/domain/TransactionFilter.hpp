#pragma once

#include "LedgerEvent.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Фильтр списка сырых транзакций
 */
class TransactionFilter {
public:
    std::string portfolioId;
    std::optional<std::string> symbol;
    std::optional<EventKind> kind;
    std::optional<Date> from;    ///< Включительно
    std::optional<Date> to;      ///< Включительно
    int limit = 50;
    int offset = 0;

    bool matches(const LedgerEvent& event) const {
        if (symbol && event.symbol != *symbol) return false;
        if (kind && event.kind != *kind) return false;
        if (from && event.date < *from) return false;
        if (to && event.date > *to) return false;
        return true;
    }
};

class TransactionPage {
public:
    std::vector<LedgerEvent> items;
    int total = 0;    ///< Всего подходящих под фильтр, без учёта limit/offset
    int limit = 0;
    int offset = 0;
};

} // namespace ledger::domain
