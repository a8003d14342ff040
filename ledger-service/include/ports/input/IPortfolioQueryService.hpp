#pragma once

#include "domain/Holding.hpp"
#include "domain/Valuation.hpp"
#include "domain/RealizedDisposal.hpp"
#include "domain/PortfolioSummary.hpp"
#include "domain/TransactionFilter.hpp"
#include "domain/LedgerSnapshot.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Интерфейс чтения портфеля
 */
class IPortfolioQueryService {
public:
    virtual ~IPortfolioQueryService() = default;

    /**
     * @brief Позиции по себестоимости, без котировок
     */
    virtual std::vector<domain::Holding> getHoldings(const std::string& portfolioId) = 0;

    /**
     * @brief Позиции с рыночной оценкой
     *
     * Позиция без котировки возвращается с priceAvailable() == false.
     */
    virtual std::vector<domain::Valuation> getValuedHoldings(const std::string& portfolioId) = 0;

    virtual std::vector<domain::RealizedDisposal> getDisposals(
        const std::string& portfolioId,
        const std::optional<std::string>& symbol
    ) = 0;

    virtual domain::PortfolioSummary getSummary(const std::string& portfolioId) = 0;

    virtual domain::TransactionPage getTransactions(const domain::TransactionFilter& filter) = 0;

    /**
     * @brief Денежные транзакции, которым ещё нужна цена
     */
    virtual std::vector<domain::LedgerEvent> getPendingPrices(const std::string& portfolioId) = 0;

    virtual std::vector<domain::ReplayFailure> getReplayFailures(const std::string& portfolioId) = 0;
};

} // namespace ledger::ports::input
