#pragma once

#include "ports/input/IPriceBackfillService.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "application/LedgerReplayService.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>

namespace ledger::application {

/**
 * @brief Дозаполнение цен BUY/SELL/IPO
 *
 * Запись сопоставляется так:
 * 1. по sequence, если задан;
 * 2. по TX:/TD: из описания, если задан transactionId;
 * 3. по (symbol, date, quantity[, kind]) среди транзакций без цены.
 *
 * Цена ставится только тем транзакциям, у которых её не было до
 * начала вызова. Несколько записей на одну транзакцию - побеждает
 * последняя.
 */
class PriceBackfillService : public ports::input::IPriceBackfillService {
public:
    PriceBackfillService(
        std::shared_ptr<ports::output::ILedgerRepository> repository,
        std::shared_ptr<LedgerReplayService> replay
    ) : repository_(std::move(repository))
      , replay_(std::move(replay))
    {
        std::cerr << "[PriceBackfillService] Created" << std::endl;
    }

    domain::BackfillReport backfill(
        const std::string& portfolioId,
        const std::vector<domain::PriceBackfillEntry>& entries
    ) override {
        domain::BackfillReport report;
        report.portfolioId = portfolioId;
        report.entries = static_cast<int>(entries.size());

        // Сопоставление идёт по состоянию, прочитанному под блокировкой портфеля
        repository_->updatePortfolio(portfolioId,
            [&](const std::vector<domain::LedgerEvent>& current) -> std::optional<ports::output::PortfolioUpdate> {
                std::vector<domain::LedgerEvent> transactions = current;

                std::vector<bool> unpricedAtStart;
                unpricedAtStart.reserve(transactions.size());
                for (const auto& t : transactions) {
                    unpricedAtStart.push_back(t.needsPrice());
                }

                std::map<size_t, int> assigned;   // индекс транзакции -> сколько раз назначена
                std::set<size_t> modified;

                for (const auto& entry : entries) {
                    if (!entry.unitPrice.isPositive()) {
                        report.unmatched.push_back(describe(entry) + ": non-positive price");
                        continue;
                    }

                    auto target = findExplicit(transactions, entry);
                    if (target) {
                        if (!domain::carriesCashFlow(transactions[*target].kind)) {
                            report.unmatched.push_back(describe(entry) + ": " +
                                domain::toString(transactions[*target].kind) + " carries no price");
                            continue;
                        }
                        if (!unpricedAtStart[*target]) {
                            ++report.alreadyPriced;
                            continue;
                        }
                    } else {
                        auto candidates = findByKey(transactions, entry, unpricedAtStart, true);
                        if (candidates.empty()) {
                            if (!findByKey(transactions, entry, unpricedAtStart, false).empty()) {
                                ++report.alreadyPriced;
                            } else {
                                report.unmatched.push_back(describe(entry));
                            }
                            continue;
                        }

                        auto unassigned = std::find_if(candidates.begin(), candidates.end(),
                            [&assigned](size_t idx) { return assigned.count(idx) == 0; });
                        target = unassigned != candidates.end() ? *unassigned : candidates.back();
                    }

                    auto& t = transactions[*target];
                    t.unitPrice = entry.unitPrice;
                    if (entry.fees && domain::isDisposal(t.kind)) {
                        t.fees = entry.fees;
                    }
                    ++assigned[*target];
                    modified.insert(*target);
                }

                report.applied = static_cast<int>(modified.size());
                report.pendingPrice = static_cast<int>(std::count_if(transactions.begin(), transactions.end(),
                    [](const domain::LedgerEvent& e) { return e.needsPrice(); }));

                if (modified.empty()) {
                    return std::nullopt;
                }

                ports::output::PortfolioUpdate update;
                for (size_t idx : modified) {
                    update.repriced.push_back(transactions[idx]);
                }
                update.snapshot = replay_->replay(transactions);
                report.replayFailures = update.snapshot.failures;
                return update;
            });

        std::cerr << "[PriceBackfillService] " << portfolioId << ": applied " << report.applied
                  << " of " << report.entries << ", already priced " << report.alreadyPriced
                  << ", unmatched " << report.unmatched.size()
                  << ", still pending " << report.pendingPrice << std::endl;

        return report;
    }

private:
    static std::optional<size_t> findExplicit(const std::vector<domain::LedgerEvent>& transactions,
                                              const domain::PriceBackfillEntry& entry) {
        for (size_t i = 0; i < transactions.size(); ++i) {
            const auto& t = transactions[i];
            if (entry.sequence && t.sequence == *entry.sequence) {
                return i;
            }
            if (!entry.sequence && !entry.transactionId.empty() &&
                (t.memo.transactionId == entry.transactionId || t.memo.tradeId == entry.transactionId) &&
                (entry.symbol.empty() || t.symbol == entry.symbol)) {
                return i;
            }
        }
        return std::nullopt;
    }

    static std::vector<size_t> findByKey(const std::vector<domain::LedgerEvent>& transactions,
                                         const domain::PriceBackfillEntry& entry,
                                         const std::vector<bool>& unpricedAtStart,
                                         bool unpriced) {
        std::vector<size_t> result;
        if (entry.symbol.empty() || entry.quantity <= 0) {
            return result;
        }
        for (size_t i = 0; i < transactions.size(); ++i) {
            const auto& t = transactions[i];
            if (unpricedAtStart[i] != unpriced) continue;
            if (!domain::carriesCashFlow(t.kind)) continue;
            if (t.symbol != entry.symbol || t.quantity != entry.quantity) continue;
            if (entry.date && t.date != *entry.date) continue;
            if (entry.kind && !kindMatches(*entry.kind, t.kind)) continue;
            result.push_back(i);
        }
        return result;
    }

    /// В торговом журнале брокера нет IPO: покупка там совпадает и с BUY, и с IPO
    static bool kindMatches(domain::EventKind wanted, domain::EventKind actual) {
        if (wanted == domain::EventKind::BUY) {
            return actual == domain::EventKind::BUY || actual == domain::EventKind::IPO;
        }
        return wanted == actual;
    }

    static std::string describe(const domain::PriceBackfillEntry& entry) {
        std::string text = entry.symbol.empty() ? "?" : entry.symbol;
        if (entry.sequence) text += " #" + std::to_string(*entry.sequence);
        if (!entry.transactionId.empty()) text += " tx " + entry.transactionId;
        if (entry.date) text += " " + entry.date->toString();
        text += " qty " + std::to_string(entry.quantity);
        return text;
    }

    std::shared_ptr<ports::output::ILedgerRepository> repository_;
    std::shared_ptr<LedgerReplayService> replay_;
};

} // namespace ledger::application
