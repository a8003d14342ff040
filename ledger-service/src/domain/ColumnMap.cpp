#include "domain/ColumnMap.hpp"
#include "domain/errors/LedgerErrors.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace ledger::domain {

namespace {

enum class Column {
    Date,
    Symbol,
    Description,
    Credit,
    Debit,
    Quantity,
    BalanceAfter,
    Price,
    Fees
};

const std::map<std::string, Column>& aliases() {
    static const std::map<std::string, Column> table = {
        {"transaction date", Column::Date},
        {"txn date", Column::Date},
        {"trade date", Column::Date},
        {"date", Column::Date},

        {"scrip", Column::Symbol},
        {"symbol", Column::Symbol},
        {"stock symbol", Column::Symbol},
        {"ticker", Column::Symbol},

        {"history description", Column::Description},
        {"description", Column::Description},
        {"particulars", Column::Description},
        {"remarks", Column::Description},
        {"transaction type", Column::Description},
        {"type", Column::Description},

        {"credit quantity", Column::Credit},
        {"credit qty", Column::Credit},
        {"credit", Column::Credit},

        {"debit quantity", Column::Debit},
        {"debit qty", Column::Debit},
        {"debit", Column::Debit},

        {"quantity", Column::Quantity},
        {"qty", Column::Quantity},

        {"balance after transaction", Column::BalanceAfter},
        {"balance", Column::BalanceAfter},

        {"price", Column::Price},
        {"rate", Column::Price},
        {"unit price", Column::Price},

        {"fees", Column::Fees},
        {"commission", Column::Fees}
    };
    return table;
}

void assignOnce(std::optional<size_t>& slot, size_t index) {
    // Первая подходящая колонка выигрывает
    if (!slot) {
        slot = index;
    }
}

} // namespace

std::string ColumnMap::normalize(const std::string& name) {
    std::string result;
    bool pendingSpace = false;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        // BOM в начале файла и управляющие символы
        if (uc >= 0x80 && result.empty()) continue;
        if (std::isspace(uc) || c == '_') {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace) {
            result += ' ';
            pendingSpace = false;
        }
        result += static_cast<char>(std::tolower(uc));
    }
    return result;
}

ColumnMap ColumnMap::fromHeader(const std::vector<std::string>& header) {
    ColumnMap map;

    for (size_t i = 0; i < header.size(); ++i) {
        auto it = aliases().find(normalize(header[i]));
        if (it == aliases().end()) {
            continue;
        }
        switch (it->second) {
            case Column::Date:         assignOnce(map.date, i); break;
            case Column::Symbol:       assignOnce(map.symbol, i); break;
            case Column::Description:  assignOnce(map.description, i); break;
            case Column::Credit:       assignOnce(map.credit, i); break;
            case Column::Debit:        assignOnce(map.debit, i); break;
            case Column::Quantity:     assignOnce(map.quantity, i); break;
            case Column::BalanceAfter: assignOnce(map.balanceAfter, i); break;
            case Column::Price:        assignOnce(map.price, i); break;
            case Column::Fees:         assignOnce(map.fees, i); break;
        }
    }

    if (!map.date) throw HeaderError("no date column");
    if (!map.symbol) throw HeaderError("no symbol column");
    if (!map.description) throw HeaderError("no description column");
    if (!map.hasSplitQuantity() && !map.quantity) {
        throw HeaderError("no quantity column (expected credit/debit pair or signed quantity)");
    }

    return map;
}

size_t ColumnMap::requiredWidth() const {
    size_t width = std::max({*date, *symbol, *description}) + 1;
    if (hasSplitQuantity()) {
        width = std::max(width, std::max(*credit, *debit) + 1);
    } else {
        width = std::max(width, *quantity + 1);
    }
    return width;
}

} // namespace ledger::domain
