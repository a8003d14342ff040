#pragma once

#include "Money.hpp"
#include "Date.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Котировка инструмента на дату
 */
class Quote {
public:
    std::string symbol;
    Money price;
    Date asOf;

    Quote() = default;

    Quote(const std::string& s, const Money& p, const Date& d)
        : symbol(s), price(p), asOf(d)
    {}
};

} // namespace ledger::domain
