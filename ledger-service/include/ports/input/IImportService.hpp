#pragma once

#include "domain/ImportReport.hpp"
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Интерфейс импорта выгрузки депозитария
 */
class IImportService {
public:
    virtual ~IImportService() = default;

    /**
     * @brief Импортировать таблицу: первая строка - заголовок
     *
     * Плохие строки попадают в отчёт, импорт не прерывают.
     * @throws HeaderError если заголовок не распознан
     */
    virtual domain::ImportReport importTable(
        const std::string& portfolioId,
        const std::vector<std::vector<std::string>>& table
    ) = 0;
};

} // namespace ledger::ports::input
