#pragma once

#include "domain/Quote.hpp"
#include <map>
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Результат синхронизации котировок
 */
struct QuoteSyncResult {
    std::map<std::string, domain::Quote> quotes;
    std::map<std::string, std::string> failures;   ///< symbol -> причина
    bool timedOut = false;
};

/**
 * @brief Интерфейс синхронизации котировок
 */
class IQuoteSyncService {
public:
    virtual ~IQuoteSyncService() = default;

    /**
     * @brief Получить котировки пачкой
     *
     * Ошибка по одному тикеру записывается и пропускается.
     */
    virtual QuoteSyncResult sync(const std::vector<std::string>& symbols) = 0;
};

} // namespace ledger::ports::input
