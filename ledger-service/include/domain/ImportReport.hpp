#pragma once

#include "LedgerSnapshot.hpp"
#include "errors/LedgerErrors.hpp"
#include <string>
#include <vector>

namespace ledger::domain {

class RowError {
public:
    int rowNumber = 0;
    RowErrorCode code = RowErrorCode::ShortRow;
    std::string message;
};

class UnclassifiedRow {
public:
    int rowNumber = 0;
    std::string symbol;
    std::string description;
    EventKind treatedAs = EventKind::BUY;
};

/**
 * @brief Итог импорта: "N импортировано / M пропущено (причины)"
 */
class ImportReport {
public:
    std::string portfolioId;
    int rowsRead = 0;
    int imported = 0;
    int duplicates = 0;
    int pendingPrice = 0;     ///< Денежные события портфеля без цены после импорта
    bool newestFirst = false; ///< Выгрузка шла от новых дат к старым

    std::vector<RowError> rowErrors;
    std::vector<UnclassifiedRow> unclassified;
    std::vector<ReplayFailure> replayFailures;
    std::vector<BalanceWarning> balanceWarnings;

    int skipped() const { return duplicates + static_cast<int>(rowErrors.size()); }
};

} // namespace ledger::domain
