#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace ledger::adapters::secondary {

/**
 * @brief In-Memory хранилище журнала
 *
 * Состояние портфеля заменяется целиком: updatePortfolio собирает новую копию и
 * подменяет указатель в ThreadSafeMap. Читатель, уже получивший старое
 * состояние, видит его целиком, а не наполовину записанное.
 */
class InMemoryLedgerRepository : public ports::output::ILedgerRepository {
public:
    InMemoryLedgerRepository() {
        std::cerr << "[InMemoryLedgerRepository] Initialized" << std::endl;
    }

    std::vector<domain::LedgerEvent> loadTransactions(const std::string& portfolioId) override {
        auto state = portfolios_.find(portfolioId);
        if (!state) {
            return {};
        }
        std::vector<domain::LedgerEvent> result;
        result.reserve(state->transactions.size());
        for (const auto& [sequence, event] : state->transactions) {
            result.push_back(event);
        }
        std::stable_sort(result.begin(), result.end(),
            [](const domain::LedgerEvent& a, const domain::LedgerEvent& b) { return a.precedes(b); });
        return result;
    }

    void updatePortfolio(const std::string& portfolioId,
                         const ports::output::PortfolioUpdateFn& update) override {
        // Один писатель на портфель, разные портфели пишутся параллельно
        auto writeLock = writeLocks_.getOrCreate(portfolioId, []() {
            return std::make_shared<std::mutex>();
        });
        std::lock_guard<std::mutex> guard(*writeLock);

        auto result = update(loadTransactions(portfolioId));
        if (!result) {
            return;
        }

        auto current = portfolios_.find(portfolioId);
        auto next = current ? std::make_shared<PortfolioState>(*current)
                            : std::make_shared<PortfolioState>();

        for (const auto& event : result->inserted) {
            if (!next->transactions.emplace(event.sequence, event).second) {
                throw std::runtime_error("Sequence " + std::to_string(event.sequence) +
                                         " already stored for " + portfolioId);
            }
        }
        for (const auto& event : result->repriced) {
            auto it = next->transactions.find(event.sequence);
            if (it == next->transactions.end()) {
                throw std::runtime_error("Sequence " + std::to_string(event.sequence) +
                                         " not stored for " + portfolioId);
            }
            it->second.unitPrice = event.unitPrice;
            it->second.transferredUnitCost = event.transferredUnitCost;
            it->second.fees = event.fees;
        }
        next->snapshot = result->snapshot;

        portfolios_.insert(portfolioId, next);

        std::cerr << "[InMemoryLedgerRepository] " << portfolioId << ": inserted "
                  << result->inserted.size() << ", repriced " << result->repriced.size()
                  << ", " << result->snapshot.lots.size() << " lots" << std::endl;
    }

    domain::TransactionPage findTransactions(const domain::TransactionFilter& filter) override {
        domain::TransactionPage page;
        page.limit = filter.limit;
        page.offset = filter.offset;

        int index = 0;
        for (const auto& event : loadTransactions(filter.portfolioId)) {
            if (!filter.matches(event)) continue;
            if (index >= filter.offset && static_cast<int>(page.items.size()) < filter.limit) {
                page.items.push_back(event);
            }
            ++index;
        }
        page.total = index;
        return page;
    }

    std::optional<domain::LedgerSnapshot> loadSnapshot(const std::string& portfolioId) override {
        auto state = portfolios_.find(portfolioId);
        if (!state) {
            return std::nullopt;
        }
        return state->snapshot;
    }

    // Test helpers
    size_t transactionCount(const std::string& portfolioId) const {
        auto state = portfolios_.find(portfolioId);
        return state ? state->transactions.size() : 0;
    }

    void clear() {
        portfolios_.clear();
    }

private:
    struct PortfolioState {
        std::map<int64_t, domain::LedgerEvent> transactions;   ///< sequence -> событие
        std::optional<domain::LedgerSnapshot> snapshot;
    };

    ThreadSafeMap<std::string, PortfolioState> portfolios_;
    ThreadSafeMap<std::string, std::mutex> writeLocks_;
};

} // namespace ledger::adapters::secondary
