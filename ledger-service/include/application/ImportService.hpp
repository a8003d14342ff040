#pragma once

#include "ports/input/IImportService.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "application/LedgerReplayService.hpp"
#include "domain/EventClassifier.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <tuple>

namespace ledger::application {

/**
 * @brief Сервис импорта выгрузки
 *
 * Поток: строки -> классификатор -> дедупликация -> sequence ->
 * полное воспроизведение -> одна атомарная запись в хранилище.
 *
 * Повторный импорт той же выгрузки ничего не добавляет: дубликат
 * определяется по (symbol, date, description, quantity, kind).
 */
class ImportService : public ports::input::IImportService {
public:
    ImportService(
        std::shared_ptr<ports::output::ILedgerRepository> repository,
        std::shared_ptr<LedgerReplayService> replay
    ) : repository_(std::move(repository))
      , replay_(std::move(replay))
    {
        std::cerr << "[ImportService] Created" << std::endl;
    }

    domain::ImportReport importTable(
        const std::string& portfolioId,
        const std::vector<std::vector<std::string>>& table
    ) override {
        if (table.empty()) {
            throw domain::HeaderError("export is empty");
        }

        domain::ImportReport report;
        report.portfolioId = portfolioId;

        domain::EventClassifier classifier(domain::ColumnMap::fromHeader(table[0]));

        // ====================================================================
        // Разбор строк: ошибки собираются, импорт не прерывается
        // ====================================================================
        std::vector<domain::LedgerEvent> parsed;
        for (size_t i = 1; i < table.size(); ++i) {
            const auto& row = table[i];
            if (isBlank(row)) continue;

            int rowNumber = static_cast<int>(i) + 1;
            ++report.rowsRead;

            try {
                auto classified = classifier.classify(row, rowNumber);
                if (classified.unclassified) {
                    domain::UnclassifiedRow u;
                    u.rowNumber = rowNumber;
                    u.symbol = classified.event.symbol;
                    u.description = classified.event.description;
                    u.treatedAs = classified.event.kind;
                    report.unclassified.push_back(u);
                }
                parsed.push_back(std::move(classified.event));
            } catch (const domain::RowParseError& e) {
                domain::RowError error;
                error.rowNumber = rowNumber;
                error.code = e.code();
                error.message = e.what();
                report.rowErrors.push_back(error);
                std::cerr << "[ImportService] Row " << rowNumber << " skipped: " << e.what() << std::endl;
            }
        }

        report.newestFirst = isNewestFirst(parsed);
        if (report.newestFirst) {
            std::reverse(parsed.begin(), parsed.end());
        }

        // ====================================================================
        // Запись: дедупликация и sequence под блокировкой портфеля,
        // иначе параллельный импорт раздаст те же sequence
        // ====================================================================
        repository_->updatePortfolio(portfolioId,
            [&](const std::vector<domain::LedgerEvent>& existing) -> std::optional<ports::output::PortfolioUpdate> {
                std::set<DedupKey> seen;
                int64_t nextSequence = 1;
                for (const auto& e : existing) {
                    seen.insert(keyOf(e));
                    nextSequence = std::max(nextSequence, e.sequence + 1);
                }

                ports::output::PortfolioUpdate update;
                for (auto e : parsed) {
                    if (!seen.insert(keyOf(e)).second) {
                        ++report.duplicates;
                        continue;
                    }
                    e.sequence = nextSequence++;
                    update.inserted.push_back(std::move(e));
                }

                std::vector<domain::LedgerEvent> all = existing;
                all.insert(all.end(), update.inserted.begin(), update.inserted.end());
                update.snapshot = replay_->replay(all);

                report.imported = static_cast<int>(update.inserted.size());
                report.pendingPrice = static_cast<int>(std::count_if(all.begin(), all.end(),
                    [](const domain::LedgerEvent& e) { return e.needsPrice(); }));
                report.replayFailures = update.snapshot.failures;
                report.balanceWarnings = update.snapshot.balanceWarnings;
                return update;
            });

        std::cerr << "[ImportService] " << portfolioId << ": imported " << report.imported
                  << " / skipped " << report.skipped()
                  << " (duplicates " << report.duplicates
                  << ", errors " << report.rowErrors.size() << ")"
                  << ", pending price " << report.pendingPrice << std::endl;

        return report;
    }

private:
    using DedupKey = std::tuple<std::string, int, std::string, int64_t, int>;

    static DedupKey keyOf(const domain::LedgerEvent& e) {
        return DedupKey(e.symbol, e.date.toOrdinal(), e.description, e.quantity,
                        static_cast<int>(e.kind));
    }

    static bool isBlank(const std::vector<std::string>& row) {
        return std::all_of(row.begin(), row.end(), [](const std::string& field) {
            return field.find_first_not_of(" \t\r\n") == std::string::npos;
        });
    }

    /**
     * @brief Выгрузка идёт от новых дат к старым
     *
     * Meroshare отдаёт историю новыми сверху; тогда sequence назначается
     * с конца файла, чтобы события одного дня шли в порядке совершения.
     */
    static bool isNewestFirst(const std::vector<domain::LedgerEvent>& events) {
        int descending = 0;
        int ascending = 0;
        for (size_t i = 1; i < events.size(); ++i) {
            if (events[i].date < events[i - 1].date) ++descending;
            if (events[i].date > events[i - 1].date) ++ascending;
        }
        return descending > ascending;
    }

    std::shared_ptr<ports::output::ILedgerRepository> repository_;
    std::shared_ptr<LedgerReplayService> replay_;
};

} // namespace ledger::application
