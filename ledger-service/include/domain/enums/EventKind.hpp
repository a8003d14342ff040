#pragma once

#include <string>
#include <optional>

namespace ledger::domain {

/**
 * @brief Тип события журнала
 *
 * Направление движения бумаг определяется типом, количество всегда
 * неотрицательное.
 */
enum class EventKind {
    BUY,
    SELL,
    BONUS,
    RIGHTS,
    MERGER_IN,
    MERGER_OUT,
    DEMAT,
    REARRANGEMENT,
    IPO
};

inline std::string toString(EventKind kind) {
    switch (kind) {
        case EventKind::BUY: return "BUY";
        case EventKind::SELL: return "SELL";
        case EventKind::BONUS: return "BONUS";
        case EventKind::RIGHTS: return "RIGHTS";
        case EventKind::MERGER_IN: return "MERGER_IN";
        case EventKind::MERGER_OUT: return "MERGER_OUT";
        case EventKind::DEMAT: return "DEMAT";
        case EventKind::REARRANGEMENT: return "REARRANGEMENT";
        case EventKind::IPO: return "IPO";
        default: return "UNKNOWN";
    }
}

inline std::optional<EventKind> parseEventKind(const std::string& str) {
    if (str == "BUY") return EventKind::BUY;
    if (str == "SELL") return EventKind::SELL;
    if (str == "BONUS") return EventKind::BONUS;
    if (str == "RIGHTS") return EventKind::RIGHTS;
    if (str == "MERGER_IN") return EventKind::MERGER_IN;
    if (str == "MERGER_OUT") return EventKind::MERGER_OUT;
    if (str == "DEMAT") return EventKind::DEMAT;
    if (str == "REARRANGEMENT") return EventKind::REARRANGEMENT;
    if (str == "IPO") return EventKind::IPO;
    return std::nullopt;
}

/// Событие открывает новый лот
inline bool isAcquisition(EventKind kind) {
    switch (kind) {
        case EventKind::BUY:
        case EventKind::IPO:
        case EventKind::BONUS:
        case EventKind::RIGHTS:
        case EventKind::MERGER_IN:
        case EventKind::REARRANGEMENT:
            return true;
        default:
            return false;
    }
}

/// Событие списывает бумаги из лотов по FIFO
inline bool isDisposal(EventKind kind) {
    return kind == EventKind::SELL
        || kind == EventKind::MERGER_OUT
        || kind == EventKind::DEMAT;
}

/// Событие с денежным потоком: без цены воспроизвести его нельзя
inline bool carriesCashFlow(EventKind kind) {
    return kind == EventKind::BUY
        || kind == EventKind::SELL
        || kind == EventKind::IPO;
}

} // namespace ledger::domain
