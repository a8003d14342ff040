#pragma once

#include "domain/PriceBackfill.hpp"
#include "domain/EventClassifier.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ledger::adapters::primary {

/**
 * @brief Торговый журнал брокера (TMS) -> записи для бэкфилла цен
 *
 * Колонки: CLIENT, CLIENT NAME, SYMBOL, EXCHANGE TRADE ID, TRADE DATE,
 * TRADE TIME, BUY/SELL, TRADE QTY, PRICE, Value.
 * Дата берётся из TRADE DATE, а если её нет - из первых восьми цифр
 * номера сделки (YYYYMMDD...).
 */
class TradeBookParser {
public:
    struct Result {
        std::vector<domain::PriceBackfillEntry> entries;
        std::vector<std::string> skipped;   ///< "row N: причина"
    };

    static Result parse(const std::vector<std::vector<std::string>>& table) {
        if (table.empty()) {
            throw domain::HeaderError("trade book is empty");
        }

        std::map<std::string, size_t> header;
        for (size_t i = 0; i < table[0].size(); ++i) {
            header.emplace(normalize(table[0][i]), i);
        }

        auto symbolCol = column(header, "SYMBOL");
        auto qtyCol = column(header, "TRADE QTY");
        auto priceCol = column(header, "PRICE");
        if (!symbolCol || !qtyCol || !priceCol) {
            throw domain::HeaderError("trade book needs SYMBOL, TRADE QTY and PRICE columns");
        }
        auto tradeIdCol = column(header, "EXCHANGE TRADE ID");
        auto dateCol = column(header, "TRADE DATE");
        auto sideCol = column(header, "BUY/SELL");

        Result result;
        for (size_t i = 1; i < table.size(); ++i) {
            const auto& row = table[i];
            std::string rowLabel = "row " + std::to_string(i + 1);

            std::string symbol = upper(trim(at(row, symbolCol)));
            if (symbol.empty()) {
                continue;
            }

            try {
                domain::PriceBackfillEntry entry;
                entry.symbol = symbol;
                entry.transactionId = trim(at(row, tradeIdCol));
                entry.quantity = domain::EventClassifier::parseQuantity(trim(at(row, qtyCol)));
                entry.unitPrice = domain::Money::fromString(at(row, priceCol));
                entry.date = tradeDate(trim(at(row, dateCol)), entry.transactionId);

                std::string side = upper(trim(at(row, sideCol)));
                if (side == "BUY" || side == "B") {
                    entry.kind = domain::EventKind::BUY;
                } else if (side == "SELL" || side == "S") {
                    entry.kind = domain::EventKind::SELL;
                }

                if (entry.quantity <= 0) {
                    result.skipped.push_back(rowLabel + ": non-positive quantity");
                    continue;
                }
                result.entries.push_back(entry);
            } catch (const domain::LedgerException& e) {
                result.skipped.push_back(rowLabel + ": " + e.what());
            }
        }

        std::cerr << "[TradeBookParser] Parsed " << result.entries.size()
                  << " trades, skipped " << result.skipped.size() << std::endl;
        return result;
    }

private:
    static std::optional<domain::Date> tradeDate(const std::string& text, const std::string& tradeId) {
        if (!text.empty()) {
            if (auto date = domain::Date::parse(text)) {
                return date;
            }
        }
        if (tradeId.size() >= 8) {
            return domain::Date::parse(tradeId.substr(0, 8));
        }
        return std::nullopt;
    }

    static std::optional<size_t> column(const std::map<std::string, size_t>& header, const std::string& name) {
        auto it = header.find(name);
        if (it == header.end()) return std::nullopt;
        return it->second;
    }

    static std::string at(const std::vector<std::string>& row, const std::optional<size_t>& index) {
        if (!index || *index >= row.size()) return "";
        return row[*index];
    }

    static std::string normalize(const std::string& name) {
        return upper(trim(name));
    }

    static std::string trim(const std::string& s) {
        auto begin = s.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(begin, end - begin + 1);
    }

    static std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }
};

} // namespace ledger::adapters::primary
