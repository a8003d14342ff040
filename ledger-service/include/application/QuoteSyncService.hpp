#pragma once

#include "ports/input/IQuoteSyncService.hpp"
#include "ports/output/IQuoteProvider.hpp"
#include "settings/ISyncSettings.hpp"
#include <ThreadSafeMap.hpp>
#include <ThreadSafeQueue.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

namespace ledger::application {

/**
 * @brief Синхронизация котировок ограниченным пулом воркеров
 *
 * Тикеры раздаются через ThreadSafeQueue, результаты собираются
 * в ThreadSafeMap. Ошибка провайдера по тикеру записывается в failures
 * и не прерывает пачку. По истечении общего таймаута воркеры больше не
 * берут задачи; тикеры без ответа помечаются как "timed out".
 */
class QuoteSyncService : public ports::input::IQuoteSyncService {
public:
    QuoteSyncService(
        std::shared_ptr<ports::output::IQuoteProvider> provider,
        std::shared_ptr<settings::ISyncSettings> settings
    ) : provider_(std::move(provider))
      , settings_(std::move(settings))
    {
        std::cerr << "[QuoteSyncService] Created (concurrency="
                  << settings_->getConcurrency() << ", timeout="
                  << settings_->getTimeoutSeconds() << "s)" << std::endl;
    }

    ports::input::QuoteSyncResult sync(const std::vector<std::string>& symbols) override {
        ports::input::QuoteSyncResult result;

        std::set<std::string> unique(symbols.begin(), symbols.end());
        if (unique.empty()) {
            return result;
        }

        // Состояние пачки в shared_ptr: воркер, зависший в провайдере
        // после таймаута, держит его сам
        auto batch = std::make_shared<Batch>();
        batch->remaining = static_cast<int>(unique.size());
        for (const auto& symbol : unique) {
            batch->pending.push(symbol);
        }
        batch->pending.shutdown();

        int workerCount = std::min(std::max(1, settings_->getConcurrency()),
                                   static_cast<int>(unique.size()));
        std::vector<std::thread> workers;
        workers.reserve(workerCount);
        for (int i = 0; i < workerCount; ++i) {
            workers.emplace_back(&QuoteSyncService::work, provider_, batch);
        }

        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::seconds(settings_->getTimeoutSeconds());
        bool completed;
        {
            std::unique_lock<std::mutex> lock(batch->mutex);
            completed = batch->finished.wait_until(lock, deadline,
                [&batch]() { return batch->remaining == 0; });
        }

        if (completed) {
            for (auto& t : workers) {
                t.join();
            }
        } else {
            batch->cancelled = true;
            result.timedOut = true;
            for (auto& t : workers) {
                t.detach();
            }
            std::cerr << "[QuoteSyncService] Batch timed out after "
                      << settings_->getTimeoutSeconds() << "s" << std::endl;
        }

        for (const auto& [symbol, quote] : batch->quotes.getAll()) {
            result.quotes[symbol] = *quote;
        }
        for (const auto& [symbol, reason] : batch->failures.getAll()) {
            result.failures[symbol] = *reason;
        }
        for (const auto& symbol : unique) {
            if (!result.quotes.count(symbol) && !result.failures.count(symbol)) {
                result.failures[symbol] = "timed out";
            }
        }

        std::cerr << "[QuoteSyncService] Synced " << result.quotes.size() << " of "
                  << unique.size() << " symbols, " << result.failures.size()
                  << " failed" << std::endl;

        return result;
    }

private:
    struct Batch {
        ThreadSafeQueue<std::string> pending;
        ThreadSafeMap<std::string, domain::Quote> quotes;
        ThreadSafeMap<std::string, std::string> failures;

        std::mutex mutex;
        std::condition_variable finished;
        int remaining = 0;
        std::atomic<bool> cancelled{false};
    };

    static void work(std::shared_ptr<ports::output::IQuoteProvider> provider,
                     std::shared_ptr<Batch> batch) {
        while (auto symbol = batch->pending.pop()) {
            if (batch->cancelled) {
                return;
            }

            try {
                auto quote = provider->getQuote(*symbol);
                if (quote) {
                    batch->quotes.insert(*symbol, std::make_shared<domain::Quote>(*quote));
                } else {
                    batch->failures.insert(*symbol, std::make_shared<std::string>("not found"));
                }
            } catch (const std::exception& e) {
                std::cerr << "[QuoteSyncService] " << *symbol << " failed: " << e.what() << std::endl;
                batch->failures.insert(*symbol, std::make_shared<std::string>(e.what()));
            }

            {
                std::lock_guard<std::mutex> lock(batch->mutex);
                --batch->remaining;
            }
            batch->finished.notify_all();
        }
    }

    std::shared_ptr<ports::output::IQuoteProvider> provider_;
    std::shared_ptr<settings::ISyncSettings> settings_;
};

} // namespace ledger::application
