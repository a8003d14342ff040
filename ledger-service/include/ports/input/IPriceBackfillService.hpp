#pragma once

#include "domain/PriceBackfill.hpp"
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Интерфейс дозаполнения цен
 */
class IPriceBackfillService {
public:
    virtual ~IPriceBackfillService() = default;

    /**
     * @brief Проставить цены транзакциям, у которых их ещё нет
     *
     * Уже оценённые транзакции не трогаются.
     */
    virtual domain::BackfillReport backfill(
        const std::string& portfolioId,
        const std::vector<domain::PriceBackfillEntry>& entries
    ) = 0;
};

} // namespace ledger::ports::input
