#pragma once

#include "Date.hpp"
#include <string>
#include <optional>

namespace ledger::domain {

/**
 * @brief Структурированные поля из свободного текста описания
 *
 * "ON-CR TD:123456 TX:789012 1301020000003172 SET:1211002024015"
 * "CA-Bonus 00009001 B-13.33%-2023/24 CREDIT"
 * "CA-Rearrangement 00009000 PUR 09-04-2025 CREDIT"
 */
class EventMemo {
public:
    std::string referenceId;      ///< Номер корпоративного действия (00009001)
    std::string tradeId;          ///< TD:
    std::string transactionId;    ///< TX:
    std::string settlementCode;   ///< SET:
    std::string bonusRate;        ///< B-13.33%-2023/24
    std::string rightsRate;       ///< R-100%-2024
    std::optional<Date> purchaseDate;  ///< PUR 09-04-2025

    bool empty() const {
        return referenceId.empty() && tradeId.empty() && transactionId.empty()
            && settlementCode.empty() && bonusRate.empty() && rightsRate.empty()
            && !purchaseDate;
    }
};

} // namespace ledger::domain
