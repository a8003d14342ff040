#include "application/LedgerReplayService.hpp"
#include "domain/CorporateActionAdjuster.hpp"
#include "domain/errors/LedgerErrors.hpp"

#include <algorithm>
#include <iostream>

namespace ledger::application {

namespace {

std::string errorTypeOf(const domain::ReplayError& error) {
    if (dynamic_cast<const domain::InsufficientSharesError*>(&error)) return "InsufficientShares";
    if (dynamic_cast<const domain::MissingPriceError*>(&error)) return "MissingPrice";
    if (dynamic_cast<const domain::UnsortedEventsError*>(&error)) return "UnsortedEvents";
    return "ReplayError";
}

std::set<int> mergerInDates(const std::vector<domain::LedgerEvent>& events) {
    std::set<int> dates;
    for (const auto& e : events) {
        if (e.kind == domain::EventKind::MERGER_IN) {
            dates.insert(e.date.toOrdinal());
        }
    }
    return dates;
}

} // namespace

LedgerReplayService::LedgerReplayService() {
    std::cerr << "[LedgerReplay] Created" << std::endl;
}

domain::LedgerSnapshot LedgerReplayService::replay(const std::vector<domain::LedgerEvent>& events) const {
    std::vector<domain::LedgerEvent> sorted = events;
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const domain::LedgerEvent& a, const domain::LedgerEvent& b) { return a.precedes(b); });

    EventsBySymbol bySymbol;
    for (const auto& e : sorted) {
        bySymbol[e.symbol].push_back(e);
    }

    domain::LotLedger ledger;
    domain::LedgerSnapshot snapshot;

    for (const auto& symbol : replayOrder(bySymbol)) {
        std::vector<domain::LedgerEvent> symbolEvents = bySymbol.at(symbol);
        assignMergerCost(symbolEvents, bySymbol, ledger);
        replaySymbol(symbol, symbolEvents, ledger, snapshot);
    }

    snapshot.holdings = ledger.holdings();
    for (const auto& symbol : ledger.symbols()) {
        auto lots = ledger.lots(symbol);
        snapshot.lots.insert(snapshot.lots.end(), lots.begin(), lots.end());
    }
    snapshot.disposals = ledger.disposals();

    std::cerr << "[LedgerReplay] Replayed " << sorted.size() << " events: "
              << snapshot.holdings.size() << " holdings, "
              << snapshot.disposals.size() << " disposals, "
              << snapshot.failures.size() << " failed symbols" << std::endl;

    return snapshot;
}

std::vector<std::string> LedgerReplayService::replayOrder(const EventsBySymbol& bySymbol) const {
    // Для каждого тикера - тикеры, чьи MERGER_OUT совпадают по дате с его MERGER_IN
    std::map<std::string, std::set<std::string>> sources;
    for (const auto& [symbol, events] : bySymbol) {
        auto dates = mergerInDates(events);
        if (dates.empty()) continue;

        for (const auto& [other, otherEvents] : bySymbol) {
            if (other == symbol) continue;
            for (const auto& e : otherEvents) {
                if (e.kind == domain::EventKind::MERGER_OUT && dates.count(e.date.toOrdinal())) {
                    sources[symbol].insert(other);
                    break;
                }
            }
        }
    }

    std::vector<std::string> order;
    std::set<std::string> done;
    std::vector<std::string> remaining;
    for (const auto& entry : bySymbol) {
        remaining.push_back(entry.first);
    }

    while (!remaining.empty()) {
        std::vector<std::string> blocked;
        for (const auto& symbol : remaining) {
            const auto& deps = sources[symbol];
            bool ready = std::all_of(deps.begin(), deps.end(),
                [&done](const std::string& dep) { return done.count(dep) > 0; });
            if (ready) {
                order.push_back(symbol);
                done.insert(symbol);
            } else {
                blocked.push_back(symbol);
            }
        }

        if (blocked.size() == remaining.size()) {
            // Цикл слияний: доигрываем как есть, недостающая себестоимость даст MissingPrice
            std::cerr << "[LedgerReplay] Merger dependency cycle among "
                      << blocked.size() << " symbols" << std::endl;
            order.insert(order.end(), blocked.begin(), blocked.end());
            break;
        }
        remaining = blocked;
    }

    return order;
}

void LedgerReplayService::assignMergerCost(std::vector<domain::LedgerEvent>& events,
                                           const EventsBySymbol& bySymbol,
                                           const domain::LotLedger& ledger) const {
    for (auto& event : events) {
        if (event.kind != domain::EventKind::MERGER_IN || event.transferredUnitCost) {
            continue;
        }

        domain::Money pool;
        bool hasSource = false;
        for (const auto& disposal : ledger.disposals()) {
            if (disposal.symbol != event.symbol &&
                disposal.disposalKind == domain::EventKind::MERGER_OUT &&
                disposal.disposalDate == event.date) {
                pool = pool + disposal.costBasis;
                hasSource = true;
            }
        }
        if (!hasSource) {
            std::cerr << "[LedgerReplay] " << event.symbol << " MERGER_IN on "
                      << event.date.toString() << " has no MERGER_OUT source" << std::endl;
            continue;
        }

        // Несколько получателей в одну дату делят себестоимость пропорционально количеству
        int64_t receivedTotal = 0;
        for (const auto& [symbol, symbolEvents] : bySymbol) {
            for (const auto& e : symbolEvents) {
                if (e.kind == domain::EventKind::MERGER_IN && e.date == event.date) {
                    receivedTotal += e.quantity;
                }
            }
        }

        domain::Money share = receivedTotal > event.quantity
            ? pool.prorate(event.quantity, receivedTotal)
            : pool;
        event.transferredUnitCost = domain::CorporateActionAdjuster::mergerUnitCost(share, event.quantity);

        std::cerr << "[LedgerReplay] " << event.symbol << " MERGER_IN " << event.quantity
                  << " @ " << event.transferredUnitCost->toString()
                  << " (transferred " << share.toString() << ")" << std::endl;
    }
}

void LedgerReplayService::replaySymbol(const std::string& symbol,
                                       const std::vector<domain::LedgerEvent>& events,
                                       domain::LotLedger& ledger,
                                       domain::LedgerSnapshot& snapshot) const {
    try {
        ledger.applyEvents(events);
        checkBalances(events, snapshot);
    } catch (const domain::ReplayError& e) {
        ledger.discard(symbol);

        domain::ReplayFailure failure;
        failure.symbol = symbol;
        failure.sequence = e.sequence();
        failure.errorType = errorTypeOf(e);
        failure.message = e.reason();
        snapshot.failures.push_back(failure);

        std::cerr << "[LedgerReplay] " << symbol << " failed at #" << e.sequence()
                  << ": " << e.what() << std::endl;
    }
}

void LedgerReplayService::checkBalances(const std::vector<domain::LedgerEvent>& events,
                                        domain::LedgerSnapshot& snapshot) const {
    int64_t running = 0;
    for (const auto& e : events) {
        running += domain::isAcquisition(e.kind) ? e.quantity : -e.quantity;

        if (e.balanceAfter && *e.balanceAfter != running) {
            domain::BalanceWarning warning;
            warning.symbol = e.symbol;
            warning.sequence = e.sequence;
            warning.date = e.date;
            warning.reported = *e.balanceAfter;
            warning.computed = running;
            snapshot.balanceWarnings.push_back(warning);

            std::cerr << "[LedgerReplay] Balance mismatch " << e.symbol << " #" << e.sequence
                      << ": export says " << *e.balanceAfter << ", ledger has " << running << std::endl;
        }
    }
}

} // namespace ledger::application
