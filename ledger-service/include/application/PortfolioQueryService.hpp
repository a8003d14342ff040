#pragma once

#include "ports/input/IPortfolioQueryService.hpp"
#include "ports/input/IQuoteSyncService.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "domain/ValuationEngine.hpp"
#include "domain/PortfolioAggregator.hpp"
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Сервис чтения портфеля
 *
 * Позиции берёт из последнего сохранённого снимка, котировки -
 * через синхронизацию на каждый запрос с оценкой.
 */
class PortfolioQueryService : public ports::input::IPortfolioQueryService {
public:
    PortfolioQueryService(
        std::shared_ptr<ports::output::ILedgerRepository> repository,
        std::shared_ptr<ports::input::IQuoteSyncService> quoteSync
    ) : repository_(std::move(repository))
      , quoteSync_(std::move(quoteSync))
    {
        std::cerr << "[PortfolioQueryService] Created" << std::endl;
    }

    std::vector<domain::Holding> getHoldings(const std::string& portfolioId) override {
        auto snapshot = repository_->loadSnapshot(portfolioId);
        return snapshot ? snapshot->holdings : std::vector<domain::Holding>{};
    }

    std::vector<domain::Valuation> getValuedHoldings(const std::string& portfolioId) override {
        auto holdings = getHoldings(portfolioId);

        std::vector<std::string> symbols;
        for (const auto& h : holdings) {
            symbols.push_back(h.symbol);
        }
        auto synced = quoteSync_->sync(symbols);

        std::vector<domain::Valuation> result;
        result.reserve(holdings.size());
        for (const auto& h : holdings) {
            std::optional<domain::Quote> quote;
            auto it = synced.quotes.find(h.symbol);
            if (it != synced.quotes.end()) {
                quote = it->second;
            } else {
                std::cerr << "[PortfolioQueryService] " << h.symbol
                          << ": price data unavailable" << std::endl;
            }
            result.push_back(domain::ValuationEngine::value(h, quote));
        }
        return result;
    }

    std::vector<domain::RealizedDisposal> getDisposals(
        const std::string& portfolioId,
        const std::optional<std::string>& symbol
    ) override {
        std::vector<domain::RealizedDisposal> result;
        auto snapshot = repository_->loadSnapshot(portfolioId);
        if (!snapshot) {
            return result;
        }
        for (const auto& d : snapshot->disposals) {
            if (!symbol || d.symbol == *symbol) {
                result.push_back(d);
            }
        }
        return result;
    }

    domain::PortfolioSummary getSummary(const std::string& portfolioId) override {
        auto valuations = getValuedHoldings(portfolioId);
        auto disposals = getDisposals(portfolioId, std::nullopt);
        return domain::PortfolioAggregator::summarize(valuations, disposals);
    }

    domain::TransactionPage getTransactions(const domain::TransactionFilter& filter) override {
        return repository_->findTransactions(filter);
    }

    std::vector<domain::LedgerEvent> getPendingPrices(const std::string& portfolioId) override {
        std::vector<domain::LedgerEvent> result;
        for (const auto& e : repository_->loadTransactions(portfolioId)) {
            if (e.needsPrice()) {
                result.push_back(e);
            }
        }
        return result;
    }

    std::vector<domain::ReplayFailure> getReplayFailures(const std::string& portfolioId) override {
        auto snapshot = repository_->loadSnapshot(portfolioId);
        return snapshot ? snapshot->failures : std::vector<domain::ReplayFailure>{};
    }

private:
    std::shared_ptr<ports::output::ILedgerRepository> repository_;
    std::shared_ptr<ports::input::IQuoteSyncService> quoteSync_;
};

} // namespace ledger::application
