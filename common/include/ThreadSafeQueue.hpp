#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <utility>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Потокобезопасная очередь заданий
 * @details
 * Блокирующий pop() с поддержкой закрытия. После shutdown() очередь
 * перестаёт принимать элементы, но уже положенные элементы всё ещё
 * выдаются; pop() возвращает nullopt только когда очередь закрыта и пуста.
 * Так пул воркеров дорабатывает весь пакет и затем завершается.
 */
template <typename T>
class ThreadSafeQueue {
private:
    std::queue<T> queue_;                  ///< Внутренняя очередь
    mutable std::mutex mutex_;             ///< Мьютекс для синхронизации
    std::condition_variable condVar_;      ///< Условная переменная для ожидания
    bool shutdown_ = false;                ///< Флаг завершения работы очереди

public:
    ThreadSafeQueue() = default;

    ~ThreadSafeQueue() {
        shutdown();
    }

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Добавить элемент в очередь
     * @return false, если очередь уже закрыта и элемент отброшен
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) return false;
            queue_.push(std::move(item));
        }

        condVar_.notify_one();
        return true;
    }

    /**
     * @brief Извлечь элемент (блокирующий вызов)
     * @return элемент, либо nullopt, если очередь закрыта и пуста
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        condVar_.wait(lock, [this]() { return !queue_.empty() || shutdown_; });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Закрыть очередь и пробудить все ожидающие потоки
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        condVar_.notify_all();
    }

    bool isShutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    bool isEmpty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }
};
