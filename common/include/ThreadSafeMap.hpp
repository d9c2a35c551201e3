#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <optional>
#include <vector>
#include <functional>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасный ассоциативный контейнер значений
 * @details
 * Много читателей / один писатель: чтение под shared_lock, запись под unique_lock.
 * Значения хранятся копиями, find() возвращает снимок.
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, V value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = std::move(value);
    }

    std::optional<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end())
            return std::nullopt;
        return it->second;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Атомарно изменить значение по ключу
     *
     * mutator получает текущее значение (nullopt, если ключа нет) и возвращает новое.
     * Если mutator вернул nullopt, запись удаляется.
     */
    void update(const K &key, const std::function<std::optional<V>(const std::optional<V> &)> &mutator)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        std::optional<V> current;
        if (it != map_.end())
            current = it->second;

        auto next = mutator(current);
        if (next)
            map_[key] = std::move(*next);
        else if (it != map_.end())
            map_.erase(it);
    }

    bool erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    std::vector<V> values() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<V> result;
        result.reserve(map_.size());
        for (const auto &[key, value] : map_)
            result.push_back(value);
        return result;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, V, Hash> map_;
};
