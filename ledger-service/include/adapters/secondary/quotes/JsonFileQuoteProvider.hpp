#pragma once

#include "ports/output/IQuoteProvider.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace ledger::adapters::secondary {

/**
 * @brief Котировки из JSON-файла
 *
 * Формат: [{"symbol": "NABIL", "price": "512.30", "asOf": "2024-07-15"}, ...]
 * price может быть строкой или числом. Пустой путь - котировок нет,
 * любой тикер вернёт nullopt.
 */
class JsonFileQuoteProvider : public ports::output::IQuoteProvider {
public:
    explicit JsonFileQuoteProvider(const std::string& path) : path_(path) {
        if (path_.empty()) {
            std::cerr << "[JsonFileQuoteProvider] No quotes file, valuation disabled" << std::endl;
            return;
        }

        std::ifstream in(path_);
        if (!in) {
            throw std::runtime_error("Cannot open quotes file: " + path_);
        }
        load(nlohmann::json::parse(in));
    }

    /// Котировки из уже разобранного JSON
    static std::shared_ptr<JsonFileQuoteProvider> fromJson(const nlohmann::json& quotes) {
        auto provider = std::shared_ptr<JsonFileQuoteProvider>(new JsonFileQuoteProvider());
        provider->load(quotes);
        return provider;
    }

    std::optional<domain::Quote> getQuote(const std::string& symbol) override {
        auto it = quotes_.find(symbol);
        if (it == quotes_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    size_t size() const { return quotes_.size(); }

private:
    JsonFileQuoteProvider() = default;

    void load(const nlohmann::json& quotes) {
        if (!quotes.is_array()) {
            throw std::runtime_error("Quotes file must hold a JSON array");
        }

        for (const auto& item : quotes) {
            std::string symbol = item.at("symbol").get<std::string>();

            // Число берётся в десятичной записи JSON, без double
            const auto& rawPrice = item.at("price");
            if (!rawPrice.is_string() && !rawPrice.is_number()) {
                throw std::runtime_error("Price of " + symbol + " must be a string or a number");
            }
            domain::Money price = domain::Money::fromString(
                rawPrice.is_string() ? rawPrice.get<std::string>() : rawPrice.dump());

            domain::Date asOf;
            if (item.contains("asOf")) {
                auto parsed = domain::Date::parse(item["asOf"].get<std::string>());
                if (!parsed) {
                    throw std::runtime_error("Bad asOf date for " + symbol);
                }
                asOf = *parsed;
            }

            quotes_[symbol] = domain::Quote(symbol, price, asOf);
        }

        std::cerr << "[JsonFileQuoteProvider] Loaded " << quotes_.size() << " quotes" << std::endl;
    }

    std::string path_;
    std::map<std::string, domain::Quote> quotes_;
};

} // namespace ledger::adapters::secondary
