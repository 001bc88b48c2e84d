#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>
#include <functional>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасный словарь shared_ptr-значений
 * @details
 * Чтение под shared_lock, запись под unique_lock.
 * compute() выполняет read-modify-write атомарно относительно других операций.
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class ThreadSafeMap
{
public:
    using Mutator = std::function<std::shared_ptr<V>(std::shared_ptr<V>)>;

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

    bool erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * @brief Атомарно заменить значение по ключу
     *
     * mutator получает текущее значение (или nullptr) и возвращает новое.
     * nullptr в ответе удаляет ключ.
     *
     * @return Новое значение (или nullptr, если ключ удалён)
     */
    std::shared_ptr<V> compute(const K &key, const Mutator &mutator)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        std::shared_ptr<V> current = (it != map_.end()) ? it->second : nullptr;

        auto updated = mutator(current);
        if (updated) {
            map_[key] = updated;
        } else if (it != map_.end()) {
            map_.erase(it);
        }
        return updated;
    }

    /**
     * @brief Снимок всех значений (порядок не определён)
     */
    std::vector<std::shared_ptr<V>> values() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<V>> result;
        result.reserve(map_.size());
        for (const auto &entry : map_) {
            result.push_back(entry.second);
        }
        return result;
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
    std::unordered_map<K, std::shared_ptr<V>, Hash> map_;
};
