#pragma once

#include <string>
#include <optional>

namespace ledger::domain {

/**
 * @brief Календарная дата без времени
 *
 * Выгрузки депозитария несут даты по Бикрам Самбат как есть, поэтому
 * проверяется только диапазон: месяц 1..12, день 1..32.
 */
class Date {
public:
    int year = 1970;
    int month = 1;
    int day = 1;

    Date() = default;

    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    /**
     * @brief Разобрать дату в одном из поддерживаемых форматов
     *
     * YYYY-MM-DD, YYYY/MM/DD, YYYY.MM.DD, YYYYMMDD, DD-MM-YYYY, DD/MM/YYYY
     */
    static std::optional<Date> parse(const std::string& text);

    static bool isValid(int y, int m, int d) {
        return y >= 1900 && y <= 2200 && m >= 1 && m <= 12 && d >= 1 && d <= 32;
    }

    /// YYYYMMDD как одно число, удобно для сравнения и ключей
    int toOrdinal() const { return year * 10000 + month * 100 + day; }

    /// ISO-формат YYYY-MM-DD
    std::string toString() const;

    bool operator==(const Date& other) const { return toOrdinal() == other.toOrdinal(); }
    bool operator!=(const Date& other) const { return toOrdinal() != other.toOrdinal(); }
    bool operator<(const Date& other) const { return toOrdinal() < other.toOrdinal(); }
    bool operator>(const Date& other) const { return toOrdinal() > other.toOrdinal(); }
    bool operator<=(const Date& other) const { return toOrdinal() <= other.toOrdinal(); }
    bool operator>=(const Date& other) const { return toOrdinal() >= other.toOrdinal(); }
};

} // namespace ledger::domain
