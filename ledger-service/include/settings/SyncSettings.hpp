#pragma once

#include "settings/ISyncSettings.hpp"
#include <algorithm>
#include <cstdlib>
#include <string>

namespace ledger::settings {

/**
 * @brief Настройки синхронизации котировок
 *
 * Читает из ENV:
 * - QUOTE_SYNC_CONCURRENCY (default: 5, не меньше 1)
 * - QUOTE_SYNC_TIMEOUT_SECONDS (default: 30)
 */
class SyncSettings : public ISyncSettings {
public:
    SyncSettings() {
        if (const char* val = std::getenv("QUOTE_SYNC_CONCURRENCY")) {
            concurrency_ = std::max(1, std::stoi(val));
        }
        if (const char* val = std::getenv("QUOTE_SYNC_TIMEOUT_SECONDS")) {
            timeoutSeconds_ = std::max(1, std::stoi(val));
        }
    }

    int getConcurrency() const override { return concurrency_; }
    int getTimeoutSeconds() const override { return timeoutSeconds_; }

private:
    int concurrency_ = 5;
    int timeoutSeconds_ = 30;
};

} // namespace ledger::settings
