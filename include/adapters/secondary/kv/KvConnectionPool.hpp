#pragma once

#include "ports/output/IKvConnection.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace websession::adapters::secondary {

using KvConnectionFactory = std::function<std::unique_ptr<ports::output::IKvConnection>()>;

/**
 * @brief Ограниченный пул соединений с KV хранилищем
 *
 * Соединения создаются лениво через фабрику, не более maxSize одновременно.
 * Если все заняты, acquire() ждёт до acquireTimeout, затем бросает
 * domain::StoreUnavailableError. Ошибка фабрики (backend не поднят)
 * тоже превращается в StoreUnavailableError.
 *
 * Аренда возвращает соединение в пул в деструкторе. Соединение, на котором
 * случилась ошибка ввода-вывода, помечается invalidate() и закрывается,
 * освобождая место для нового.
 *
 * @example
 * ```cpp
 * KvConnectionPool pool(factory, 8, 500ms);
 * {
 *     auto lease = pool.acquire();
 *     lease->set("session:abc", "{}", 2h);
 * }  // соединение вернулось в пул
 * ```
 */
class KvConnectionPool {
public:
    /**
     * @brief RAII-аренда соединения
     */
    class Lease {
    public:
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        ports::output::IKvConnection* operator->() const { return connection_.get(); }
        ports::output::IKvConnection& operator*() const { return *connection_; }

        /// Не возвращать соединение в пул
        void invalidate() { valid_ = false; }

    private:
        friend class KvConnectionPool;
        Lease(KvConnectionPool* pool, std::unique_ptr<ports::output::IKvConnection> connection);

        KvConnectionPool* pool_;
        std::unique_ptr<ports::output::IKvConnection> connection_;
        bool valid_ = true;
    };

    KvConnectionPool(KvConnectionFactory factory,
                     size_t maxSize,
                     std::chrono::milliseconds acquireTimeout);
    ~KvConnectionPool();

    KvConnectionPool(const KvConnectionPool&) = delete;
    KvConnectionPool& operator=(const KvConnectionPool&) = delete;

    /**
     * @brief Взять соединение из пула
     * @throws domain::StoreUnavailableError пул исчерпан или backend недоступен
     */
    Lease acquire();

    size_t maxSize() const { return maxSize_; }

    /// Сколько соединений открыто сейчас (свободные + арендованные)
    size_t size() const;

    /// Сколько свободных соединений лежит в пуле
    size_t idle() const;

private:
    KvConnectionFactory factory_;
    size_t maxSize_;
    std::chrono::milliseconds acquireTimeout_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<ports::output::IKvConnection>> idle_;
    size_t opened_ = 0;

    void release(std::unique_ptr<ports::output::IKvConnection> connection, bool valid);
};

} // namespace websession::adapters::secondary
