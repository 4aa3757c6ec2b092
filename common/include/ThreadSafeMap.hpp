#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <utility>

/**
 * @brief Потокобезопасная таблица key -> shared_ptr<V>
 *
 * Чтения идут под shared_lock, записи под unique_lock.
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

    /**
     * @brief Атомарно вставить значение, если ключа ещё нет
     *
     * factory вызывается под эксклюзивной блокировкой и только если ключ
     * отсутствует, поэтому побочные эффекты factory (например, выдача ID)
     * происходят ровно для выигравшей вставки.
     *
     * @return вставленное значение или nullptr, если ключ уже занят
     */
    template <typename Factory>
    std::shared_ptr<V> insertIfAbsent(const K &key, Factory &&factory)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (map_.find(key) != map_.end())
        {
            return nullptr;
        }
        std::shared_ptr<V> value = std::forward<Factory>(factory)();
        map_.emplace(key, value);
        return value;
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
