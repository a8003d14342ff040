#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace ledger::domain {

/**
 * @brief Соответствие логических колонок выгрузки их индексам
 *
 * Заголовок сопоставляется без учёта регистра и порядка; лишние колонки
 * игнорируются. Количество задаётся либо парой credit/debit, либо одной
 * знаковой колонкой quantity.
 */
class ColumnMap {
public:
    std::optional<size_t> date;
    std::optional<size_t> symbol;
    std::optional<size_t> description;
    std::optional<size_t> credit;
    std::optional<size_t> debit;
    std::optional<size_t> quantity;
    std::optional<size_t> balanceAfter;
    std::optional<size_t> price;
    std::optional<size_t> fees;

    /**
     * @brief Построить карту по строке заголовка
     * @throws HeaderError если нет даты, тикера, описания или количества
     */
    static ColumnMap fromHeader(const std::vector<std::string>& header);

    /// Нормализованное имя колонки: нижний регистр, одиночные пробелы
    static std::string normalize(const std::string& name);

    bool hasSplitQuantity() const { return credit.has_value() && debit.has_value(); }

    /// Минимальная ширина строки, в которой есть все обязательные поля
    size_t requiredWidth() const;
};

} // namespace ledger::domain
