#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасная шардированная map
 * @details
 * Ключи распределяются по шардам (hash(key) % shardCount), у каждого шарда
 * свой std::shared_mutex. Операции над ключами из разных шардов не блокируют
 * друг друга.
 *
 * Значения хранятся как std::shared_ptr<V> и считаются неизменяемыми:
 * запись подменяет указатель целиком, поэтому читатель всегда видит
 * согласованный снимок.
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class ThreadSafeMap
{
public:
    explicit ThreadSafeMap(size_t shardCount = 16)
        : shards_(shardCount == 0 ? 1 : shardCount)
    {
    }

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        auto &shard = shardFor(key);
        std::unique_lock<std::shared_mutex> lock(shard.mutex); // ← UNIQUE_LOCK для WRITE!
        shard.map[key] = value;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        const auto &shard = shardFor(key);
        std::shared_lock<std::shared_mutex> lock(shard.mutex); // ← shared_lock для READ
        auto it = shard.map.find(key);
        return (it != shard.map.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        const auto &shard = shardFor(key);
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        return shard.map.find(key) != shard.map.end();
    }

    bool erase(const K &key)
    {
        auto &shard = shardFor(key);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        return shard.map.erase(key) > 0;
    }

    /**
     * @brief Удалить ключ, только если текущее значение удовлетворяет предикату
     *
     * Проверка и удаление выполняются под одной блокировкой шарда:
     * значение, записанное конкурентно между find() и eraseIf(), не будет
     * удалено по устаревшему снимку.
     */
    template <typename Pred>
    bool eraseIf(const K &key, Pred pred)
    {
        auto &shard = shardFor(key);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end() || !pred(*it->second))
            return false;
        shard.map.erase(it);
        return true;
    }

    /**
     * @brief Атомарно заменить существующее значение
     *
     * @param fn Функция (const V&) -> std::shared_ptr<V>. nullptr = не менять.
     * @return true, если ключ существовал и значение было подменено
     */
    template <typename Fn>
    bool update(const K &key, Fn fn)
    {
        auto &shard = shardFor(key);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end())
            return false;

        auto next = fn(static_cast<const V &>(*it->second));
        if (!next)
            return false;
        it->second = std::move(next);
        return true;
    }

    /**
     * @brief Удалить все значения, удовлетворяющие предикату
     * @return Количество удалённых элементов
     */
    template <typename Pred>
    size_t eraseAll(Pred pred)
    {
        size_t removed = 0;
        for (auto &shard : shards_)
        {
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            for (auto it = shard.map.begin(); it != shard.map.end();)
            {
                if (pred(*it->second))
                {
                    it = shard.map.erase(it);
                    ++removed;
                }
                else
                {
                    ++it;
                }
            }
        }
        return removed;
    }

    size_t size() const
    {
        size_t total = 0;
        for (const auto &shard : shards_)
        {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            total += shard.map.size();
        }
        return total;
    }

    size_t shardCount() const { return shards_.size(); }

private:
    struct Shard
    {
        mutable std::shared_mutex mutex;
        std::unordered_map<K, std::shared_ptr<V>, Hash> map;
    };

    std::vector<Shard> shards_;

    Shard &shardFor(const K &key)
    {
        return shards_[Hash{}(key) % shards_.size()];
    }

    const Shard &shardFor(const K &key) const
    {
        return shards_[Hash{}(key) % shards_.size()];
    }
};
