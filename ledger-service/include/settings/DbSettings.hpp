#pragma once

#include <cstdlib>
#include <string>

namespace ledger::settings {

/**
 * @brief Подключение к PostgreSQL для LEDGER_STORAGE=postgres
 *
 * Читает из ENV:
 * - LEDGER_DB_URL: строка подключения libpq целиком, перекрывает остальные
 * - LEDGER_DB_HOST (default: localhost), LEDGER_DB_PORT (default: 5432)
 * - LEDGER_DB_NAME (default: ledger_db)
 * - LEDGER_DB_USER, LEDGER_DB_PASSWORD (не передаются, если не заданы)
 */
class DbSettings {
public:
    DbSettings() {
        if (const char* val = std::getenv("LEDGER_DB_URL")) {
            connectionString_ = val;
            name_ = "LEDGER_DB_URL";
            return;
        }

        name_ = envOr("LEDGER_DB_NAME", "ledger_db");
        connectionString_ = "host=" + envOr("LEDGER_DB_HOST", "localhost")
            + " port=" + envOr("LEDGER_DB_PORT", "5432")
            + " dbname=" + name_;
        if (const char* val = std::getenv("LEDGER_DB_USER")) {
            connectionString_ += std::string(" user=") + val;
        }
        if (const char* val = std::getenv("LEDGER_DB_PASSWORD")) {
            connectionString_ += std::string(" password=") + val;
        }
    }

    /// Для логов: имя базы или источник строки, без пароля
    const std::string& getName() const { return name_; }
    const std::string& getConnectionString() const { return connectionString_; }

private:
    static std::string envOr(const char* name, const char* fallback) {
        const char* val = std::getenv(name);
        return val ? val : fallback;
    }

    std::string name_;
    std::string connectionString_;
};

} // namespace ledger::settings
