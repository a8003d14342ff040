#pragma once

#include "domain/Quote.hpp"
#include <string>
#include <optional>

namespace ledger::ports::output {

/**
 * @brief Источник рыночных котировок
 *
 * nullopt - котировки по тикеру нет. Недоступность источника
 * сообщается исключением; вызывающий изолирует её по тикеру.
 */
class IQuoteProvider {
public:
    virtual ~IQuoteProvider() = default;

    virtual std::optional<domain::Quote> getQuote(const std::string& symbol) = 0;
};

} // namespace ledger::ports::output
