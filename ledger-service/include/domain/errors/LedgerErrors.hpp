#pragma once

#include "domain/Date.hpp"
#include <stdexcept>
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Базовое исключение предметной области
 */
class LedgerException : public std::runtime_error {
public:
    explicit LedgerException(const std::string& message)
        : std::runtime_error(message) {}
};

// ============================================
// ДЕНЕЖНАЯ АРИФМЕТИКА
// ============================================

/**
 * @brief Результат вычитания ушёл бы в минус там, где это запрещено
 *        (себестоимость, остаток по лоту)
 */
class MoneyUnderflowError : public LedgerException {
public:
    explicit MoneyUnderflowError(const std::string& message)
        : LedgerException("Money underflow: " + message) {}
};

class MoneyFormatError : public LedgerException {
public:
    explicit MoneyFormatError(const std::string& text)
        : LedgerException("Invalid money format: '" + text + "'") {}
};

class DivisionByZeroError : public LedgerException {
public:
    DivisionByZeroError() : LedgerException("Money division by zero") {}
};

// ============================================
// РАЗБОР СТРОК ВЫГРУЗКИ
// ============================================

/**
 * @brief Причина отказа в разборе одной строки выгрузки
 */
enum class RowErrorCode {
    MalformedDate,
    MissingSymbol,
    AmbiguousQuantity,
    MalformedQuantity,
    MalformedPrice,
    DirectionMismatch,
    ShortRow
};

inline std::string toString(RowErrorCode code) {
    switch (code) {
        case RowErrorCode::MalformedDate:     return "MalformedDate";
        case RowErrorCode::MissingSymbol:     return "MissingSymbol";
        case RowErrorCode::AmbiguousQuantity: return "AmbiguousQuantity";
        case RowErrorCode::MalformedQuantity: return "MalformedQuantity";
        case RowErrorCode::MalformedPrice:    return "MalformedPrice";
        case RowErrorCode::DirectionMismatch: return "DirectionMismatch";
        case RowErrorCode::ShortRow:          return "ShortRow";
    }
    return "Unknown";
}

/**
 * @brief Ошибка разбора строки
 *
 * Импорт ловит её построчно и складывает в отчёт; пакет не прерывается.
 */
class RowParseError : public LedgerException {
public:
    RowParseError(RowErrorCode code, const std::string& detail)
        : LedgerException(toString(code) + ": " + detail)
        , code_(code)
        , detail_(detail) {}

    RowErrorCode code() const { return code_; }
    const std::string& detail() const { return detail_; }

private:
    RowErrorCode code_;
    std::string detail_;
};

/**
 * @brief В заголовке выгрузки нет обязательной колонки
 */
class HeaderError : public LedgerException {
public:
    explicit HeaderError(const std::string& message)
        : LedgerException("Invalid export header: " + message) {}
};

// ============================================
// НАРУШЕНИЯ ИНВАРИАНТОВ ЖУРНАЛА
// ============================================

/**
 * @brief Базовая ошибка воспроизведения событий по одному тикеру
 *
 * Фатальна для тикера, но не для всего прогона. Несёт тикер и
 * sequence события, на котором воспроизведение остановилось.
 */
class ReplayError : public LedgerException {
public:
    ReplayError(const std::string& symbol, int64_t sequence, const std::string& message)
        : LedgerException(symbol + " #" + std::to_string(sequence) + ": " + message)
        , symbol_(symbol)
        , sequence_(sequence)
        , reason_(message) {}

    const std::string& symbol() const { return symbol_; }
    int64_t sequence() const { return sequence_; }
    const std::string& reason() const { return reason_; }

private:
    std::string symbol_;
    int64_t sequence_;
    std::string reason_;
};

/**
 * @brief Попытка списать больше бумаг, чем есть в открытых лотах
 */
class InsufficientSharesError : public ReplayError {
public:
    InsufficientSharesError(const std::string& symbol, int64_t sequence,
                            const Date& date, int64_t requested, int64_t available)
        : ReplayError(symbol, sequence,
                      "insufficient shares on " + date.toString() +
                      ": requested " + std::to_string(requested) +
                      ", available " + std::to_string(available))
        , requested_(requested)
        , available_(available) {}

    int64_t requested() const { return requested_; }
    int64_t available() const { return available_; }

private:
    int64_t requested_;
    int64_t available_;
};

/**
 * @brief Денежное событие (BUY/SELL/IPO/MERGER_IN) ещё без цены
 */
class MissingPriceError : public ReplayError {
public:
    MissingPriceError(const std::string& symbol, int64_t sequence, const std::string& kind)
        : ReplayError(symbol, sequence, kind + " event has no price yet") {}
};

/**
 * @brief События поданы не в порядке (date, sequence)
 */
class UnsortedEventsError : public ReplayError {
public:
    UnsortedEventsError(const std::string& symbol, int64_t sequence, const std::string& message)
        : ReplayError(symbol, sequence, message) {}
};

} // namespace ledger::domain
