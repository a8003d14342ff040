#pragma once

#include "domain/LedgerEvent.hpp"
#include "domain/LedgerSnapshot.hpp"
#include "domain/TransactionFilter.hpp"
#include <functional>
#include <string>
#include <vector>
#include <optional>

namespace ledger::ports::output {

/**
 * @brief Что записать по итогам одного прогона
 */
struct PortfolioUpdate {
    std::vector<domain::LedgerEvent> inserted;   ///< Новые транзакции
    std::vector<domain::LedgerEvent> repriced;   ///< Уже сохранённые, с новой ценой
    domain::LedgerSnapshot snapshot;
};

using PortfolioUpdateFn =
    std::function<std::optional<PortfolioUpdate>(const std::vector<domain::LedgerEvent>& current)>;

/**
 * @brief Хранилище транзакций и производного состояния портфеля
 *
 * Транзакция идентифицируется парой (portfolioId, sequence).
 */
class ILedgerRepository {
public:
    virtual ~ILedgerRepository() = default;

    /**
     * @brief Все транзакции портфеля в порядке (date, sequence)
     */
    virtual std::vector<domain::LedgerEvent> loadTransactions(const std::string& portfolioId) = 0;

    /**
     * @brief Прочитать транзакции и записать результат одним эксклюзивным шагом
     *
     * update получает текущие транзакции портфеля в порядке (date, sequence)
     * и возвращает, что записать, либо nullopt. Другой писатель того же
     * портфеля, в том числе из другого процесса, ждёт завершения вызова.
     *
     * Запись атомарна: новые транзакции вставляются (совпадение sequence
     * с уже сохранённой - ошибка), у repriced обновляются цена, комиссия и
     * перенесённая стоимость, производное состояние заменяется целиком.
     * При исключении хранилище остаётся в состоянии до вызова.
     */
    virtual void updatePortfolio(const std::string& portfolioId, const PortfolioUpdateFn& update) = 0;

    /**
     * @brief Страница транзакций по фильтру
     */
    virtual domain::TransactionPage findTransactions(const domain::TransactionFilter& filter) = 0;

    /**
     * @brief Последний сохранённый снимок, если портфель уже воспроизводился
     */
    virtual std::optional<domain::LedgerSnapshot> loadSnapshot(const std::string& portfolioId) = 0;
};

} // namespace ledger::ports::output
