#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <functional>
#include <vector>
#include <utility>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасный словарь ключ -> shared_ptr<V>
 *
 * Чтение под shared_lock, запись под unique_lock. Значения отдаются
 * наружу как shared_ptr, поэтому замена значения по ключу не инвалидирует
 * ссылки, уже полученные читателями (copy-on-write на стороне вызывающего).
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Найти значение или атомарно создать его фабрикой
     *
     * Два потока, одновременно запросившие отсутствующий ключ, получат
     * один и тот же объект.
     */
    std::shared_ptr<V> getOrCreate(const K &key, const std::function<std::shared_ptr<V>()> &factory)
    {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end())
            {
                return it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end())
        {
            return it->second;
        }
        auto created = factory();
        map_[key] = created;
        return created;
    }

    bool remove(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * @brief Снимок всех пар на момент вызова
     */
    std::vector<std::pair<K, std::shared_ptr<V>>> getAll() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return std::vector<std::pair<K, std::shared_ptr<V>>>(map_.begin(), map_.end());
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
