#include "domain/LotLedger.hpp"
#include "domain/CorporateActionAdjuster.hpp"
#include "domain/errors/LedgerErrors.hpp"

#include <algorithm>

namespace ledger::domain {

namespace {

bool positionBefore(const Date& date, int64_t sequence, const LedgerEvent& event) {
    if (date != event.date) return date < event.date;
    return sequence < event.sequence;
}

} // namespace

// ============================================================================
// ПРИМЕНЕНИЕ СОБЫТИЙ
// ============================================================================

void LotLedger::apply(const LedgerEvent& event) {
    if (event.quantity <= 0) {
        throw ReplayError(event.symbol, event.sequence,
            "non-positive quantity " + std::to_string(event.quantity));
    }

    static const SymbolBook emptyBook;
    auto existing = books_.find(event.symbol);
    const SymbolBook& current = existing != books_.end() ? existing->second : emptyBook;

    checkOrder(current, event);

    if (isDisposal(event.kind)) {
        if (event.kind == EventKind::SELL && !event.unitPrice) {
            throw MissingPriceError(event.symbol, event.sequence, toString(event.kind));
        }
        int64_t available = 0;
        for (const auto& lot : current.lots) {
            available += lot.remainingQuantity;
        }
        if (available < event.quantity) {
            throw InsufficientSharesError(event.symbol, event.sequence, event.date,
                                          event.quantity, available);
        }
        consume(books_[event.symbol], event);
    } else {
        Lot lot;
        if (CorporateActionAdjuster::handles(event.kind)) {
            lot = CorporateActionAdjuster::openLot(event);
        } else {
            if (!event.unitPrice) {
                throw MissingPriceError(event.symbol, event.sequence, toString(event.kind));
            }
            lot = Lot(event.symbol, event.quantity, *event.unitPrice,
                      event.date, event.sequence, event.kind);
        }
        openLot(books_[event.symbol], std::move(lot));
    }

    SymbolBook& book = books_[event.symbol];
    book.started = true;
    book.lastDate = event.date;
    book.lastSequence = event.sequence;
}

void LotLedger::applyEvents(const std::vector<LedgerEvent>& events) {
    // Сначала проверяем порядок целиком, чтобы не применить половину пачки
    std::map<std::string, const LedgerEvent*> previous;
    for (const auto& event : events) {
        auto prev = previous.find(event.symbol);
        if (prev != previous.end()) {
            const LedgerEvent& before = *prev->second;
            if (!before.precedes(event)) {
                throw UnsortedEventsError(event.symbol, event.sequence,
                    "event " + event.date.toString() + " #" + std::to_string(event.sequence) +
                    " is not after " + before.date.toString() + " #" +
                    std::to_string(before.sequence));
            }
        } else {
            auto book = books_.find(event.symbol);
            if (book != books_.end()) {
                checkOrder(book->second, event);
            }
        }
        previous[event.symbol] = &event;
    }

    for (const auto& event : events) {
        apply(event);
    }
}

void LotLedger::checkOrder(const SymbolBook& book, const LedgerEvent& event) const {
    if (!book.started) {
        return;
    }
    if (!positionBefore(book.lastDate, book.lastSequence, event)) {
        throw UnsortedEventsError(event.symbol, event.sequence,
            "event " + event.date.toString() + " #" + std::to_string(event.sequence) +
            " is not after already applied " + book.lastDate.toString() + " #" +
            std::to_string(book.lastSequence));
    }
}

void LotLedger::openLot(SymbolBook& book, Lot lot) {
    auto position = std::upper_bound(book.lots.begin(), book.lots.end(), lot,
        [](const Lot& a, const Lot& b) { return a.openedBefore(b); });
    book.lots.insert(position, std::move(lot));
}

void LotLedger::consume(SymbolBook& book, const LedgerEvent& event) {
    int64_t left = event.quantity;
    Money feesCharged;

    for (auto& lot : book.lots) {
        if (left == 0) break;
        if (!lot.isOpen()) continue;

        int64_t take = std::min(left, lot.remainingQuantity);
        lot.remainingQuantity -= take;
        left -= take;

        RealizedDisposal disposal;
        disposal.symbol = event.symbol;
        disposal.disposalSequence = event.sequence;
        disposal.disposalDate = event.date;
        disposal.disposalKind = event.kind;
        disposal.lotId = lot.lotId;
        disposal.lotOpenedDate = lot.openedDate;
        disposal.quantity = take;
        disposal.costBasis = lot.unitCost * take;

        if (event.kind == EventKind::SELL) {
            Money feeShare;
            if (event.fees) {
                // Последний кусок забирает остаток, чтобы доли сходились точно
                feeShare = left == 0
                    ? *event.fees - feesCharged
                    : event.fees->prorate(take, event.quantity);
                feesCharged = feesCharged + feeShare;
                disposal.fees = feeShare;
            }
            disposal.proceeds = *event.unitPrice * take - feeShare;
            disposal.gain = *disposal.proceeds - disposal.costBasis;
            book.realizedPnl = book.realizedPnl + *disposal.gain;
        }

        book.disposals.push_back(disposal);
    }
}

// ============================================================================
// ЧТЕНИЕ СОСТОЯНИЯ
// ============================================================================

Holding LotLedger::holding(const std::string& symbol) const {
    auto it = books_.find(symbol);
    if (it == books_.end()) {
        return Holding(symbol, 0, Money(), Money(), 0);
    }

    int64_t quantity = 0;
    Money cost;
    int openLots = 0;
    for (const auto& lot : it->second.lots) {
        if (!lot.isOpen()) continue;
        quantity += lot.remainingQuantity;
        cost = cost + lot.remainingCost();
        ++openLots;
    }
    return Holding(symbol, quantity, cost, it->second.realizedPnl, openLots);
}

std::vector<Holding> LotLedger::holdings() const {
    std::vector<Holding> result;
    for (const auto& [symbol, book] : books_) {
        Holding h = holding(symbol);
        if (!h.isEmpty()) {
            result.push_back(h);
        }
    }
    return result;
}

std::vector<Lot> LotLedger::lots(const std::string& symbol) const {
    auto it = books_.find(symbol);
    return it != books_.end() ? it->second.lots : std::vector<Lot>{};
}

std::vector<RealizedDisposal> LotLedger::disposals() const {
    std::vector<RealizedDisposal> result;
    for (const auto& [symbol, book] : books_) {
        result.insert(result.end(), book.disposals.begin(), book.disposals.end());
    }
    return result;
}

std::vector<RealizedDisposal> LotLedger::disposals(const std::string& symbol) const {
    auto it = books_.find(symbol);
    return it != books_.end() ? it->second.disposals : std::vector<RealizedDisposal>{};
}

int64_t LotLedger::remainingQuantity(const std::string& symbol) const {
    return holding(symbol).totalQuantity;
}

std::vector<std::string> LotLedger::symbols() const {
    std::vector<std::string> result;
    for (const auto& entry : books_) {
        result.push_back(entry.first);
    }
    return result;
}

void LotLedger::discard(const std::string& symbol) {
    books_.erase(symbol);
}

} // namespace ledger::domain
