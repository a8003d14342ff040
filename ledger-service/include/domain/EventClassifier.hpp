#pragma once

#include "ColumnMap.hpp"
#include "LedgerEvent.hpp"
#include <string>
#include <vector>
#include <optional>

namespace ledger::domain {

/**
 * @brief Результат классификации одной строки
 */
class ClassifiedRow {
public:
    LedgerEvent event;
    bool unclassified = false;   ///< Описание не подошло ни под одно правило
};

/**
 * @brief Разбор строки выгрузки в типизированное событие
 *
 * Тип определяется упорядоченным списком правил по тексту описания:
 * IPO > BONUS > RIGHTS > MERGER > REARRANGEMENT > DEMAT > обычная сделка.
 * Более конкретное ключевое слово всегда проверяется раньше общего.
 * Неизвестное описание не роняет импорт: строка считается обычной
 * сделкой, направление берётся из колонок credit/debit, и это отдельно
 * логируется.
 *
 * Чистая функция: состояния нет, ошибки - RowParseError на строку.
 */
class EventClassifier {
public:
    enum class Category {
        Ipo,
        Bonus,
        Rights,
        Merger,
        Rearrangement,
        Demat,
        RegularCredit,
        RegularDebit,
        Regular
    };

    enum class Match {
        Contains,   ///< Подстрока в любом месте
        Prefix,     ///< Описание начинается с ключа
        Word        ///< Отдельное слово, либо слово с суффиксом через '-'
    };

    struct Rule {
        std::string keyword;
        Match match;
        Category category;
    };

    explicit EventClassifier(const ColumnMap& columns);

    /**
     * @brief Классифицировать строку
     * @param record поля строки
     * @param rowNumber номер строки в файле, только для логов
     * @throws RowParseError
     */
    ClassifiedRow classify(const std::vector<std::string>& record, int rowNumber = 0) const;

    /// Правила в порядке приоритета
    static const std::vector<Rule>& rules();

    /// Первое сработавшее правило для описания
    static std::optional<Category> categorize(const std::string& description);

    /// Достать TD:/TX:/SET:, ставки бонуса и прав, дату покупки
    static EventMemo parseMemo(const std::string& description);

    /**
     * @brief Количество из поля выгрузки
     *
     * "" и "-" означают ноль. Дробная часть допустима только нулевая.
     * @throws RowParseError(MalformedQuantity)
     */
    static int64_t parseQuantity(const std::string& field);

private:
    std::string field(const std::vector<std::string>& record, const std::optional<size_t>& index) const;

    ColumnMap columns_;
};

} // namespace ledger::domain
