#pragma once

#include <cstdlib>
#include <string>
#include <stdexcept>

namespace ledger::settings {

/**
 * @brief Выбор хранилища и портфеля по умолчанию
 *
 * Читает из ENV:
 * - LEDGER_STORAGE: memory | postgres (default: memory)
 * - LEDGER_PORTFOLIO (default: default)
 */
class StorageSettings {
public:
    enum class Backend {
        Memory,
        Postgres
    };

    StorageSettings() {
        if (const char* val = std::getenv("LEDGER_STORAGE")) {
            std::string value(val);
            if (value == "postgres") {
                backend_ = Backend::Postgres;
            } else if (value != "memory") {
                throw std::invalid_argument("LEDGER_STORAGE must be 'memory' or 'postgres', got '" + value + "'");
            }
        }
        if (const char* val = std::getenv("LEDGER_PORTFOLIO")) {
            defaultPortfolio_ = val;
        }
    }

    Backend getBackend() const { return backend_; }
    std::string getDefaultPortfolio() const { return defaultPortfolio_; }

private:
    Backend backend_ = Backend::Memory;
    std::string defaultPortfolio_ = "default";
};

} // namespace ledger::settings
