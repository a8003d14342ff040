#pragma once

#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Денежное значение в минорных единицах (пайсы, 1/100 рупии)
 *
 * Неизменяемое: каждая операция возвращает новое значение.
 * Вся арифметика целочисленная. Единственное правило округления
 * для деления: половина округляется от нуля (round-half-away-from-zero),
 * т.е. для неотрицательных сумм это round-half-up.
 */
class Money {
public:
    static constexpr int64_t MINOR_PER_MAJOR = 100;

    Money() = default;

    static Money zero() { return Money(); }

    static Money fromMinorUnits(int64_t minor) { return Money(minor); }

    /**
     * @brief Разобрать десятичную строку ("1,234.50", "-12.3", "295")
     *
     * Разбор точный, без double. Более двух знаков после точки
     * округляются по общему правилу.
     * @throws MoneyFormatError если строка не число
     */
    static Money fromString(const std::string& text);

    int64_t minorUnits() const { return minor_; }

    /// Только для отображения процентов и сводок, не для хранения
    double toDouble() const {
        return static_cast<double>(minor_) / MINOR_PER_MAJOR;
    }

    bool isZero() const { return minor_ == 0; }
    bool isNegative() const { return minor_ < 0; }
    bool isPositive() const { return minor_ > 0; }

    Money operator+(const Money& other) const { return Money(minor_ + other.minor_); }
    Money operator-(const Money& other) const { return Money(minor_ - other.minor_); }
    Money operator-() const { return Money(-minor_); }
    Money operator*(int64_t quantity) const { return Money(minor_ * quantity); }

    /**
     * @brief Вычитание, которое не может уйти в минус
     * @throws MoneyUnderflowError
     */
    Money subtractNonNegative(const Money& other) const;

    /**
     * @brief Деление на целое с единым правилом округления
     * @throws DivisionByZeroError
     */
    Money divide(int64_t divisor) const;

    /**
     * @brief Доля value * numerator / denominator, округлённая один раз
     */
    Money prorate(int64_t numerator, int64_t denominator) const;

    int compare(const Money& other) const {
        if (minor_ < other.minor_) return -1;
        if (minor_ > other.minor_) return 1;
        return 0;
    }

    bool operator==(const Money& other) const { return minor_ == other.minor_; }
    bool operator!=(const Money& other) const { return minor_ != other.minor_; }
    bool operator<(const Money& other) const { return minor_ < other.minor_; }
    bool operator>(const Money& other) const { return minor_ > other.minor_; }
    bool operator<=(const Money& other) const { return minor_ <= other.minor_; }
    bool operator>=(const Money& other) const { return minor_ >= other.minor_; }

    /// "1234.50" - формат для хранения и JSON
    std::string toDecimalString() const;

    /// "Rs. 1,234.50" - формат для людей
    std::string toString() const;

private:
    explicit Money(int64_t minor) : minor_(minor) {}

    int64_t minor_ = 0;
};

} // namespace ledger::domain
