#pragma once

#include "adapters/secondary/kv/KvConnectionPool.hpp"
#include "domain/errors/SessionErrors.hpp"
#include "ports/output/ISessionStore.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace websession::adapters::secondary {

/**
 * @brief Хранилище сессий в сетевом key-value backend через пул соединений
 *
 * Ключ: prefix + id, значение: сериализованный payload, TTL выставляет
 * сам backend (SET ... PX), поэтому истёкшие сессии исчезают без нашего
 * участия. Время создания в backend не хранится: у загруженной записи
 * createdAt/expiresAt не заполнены.
 *
 * Любая ошибка соединения или протокола закрывает соединение и
 * поднимается как domain::StoreUnavailableError.
 */
class PooledKvSessionStore : public ports::output::ISessionStore {
public:
    PooledKvSessionStore(std::shared_ptr<KvConnectionPool> pool,
                         std::chrono::milliseconds ttl,
                         std::string keyPrefix = "session:")
        : pool_(std::move(pool))
        , ttl_(ttl)
        , keyPrefix_(std::move(keyPrefix))
    {
        if (!pool_) {
            throw std::invalid_argument("PooledKvSessionStore requires a connection pool");
        }
        if (ttl_.count() <= 0) {
            throw std::invalid_argument("PooledKvSessionStore TTL must be positive");
        }
        std::cout << "[PooledKvSessionStore] Created, prefix='" << keyPrefix_
                  << "', ttl=" << ttl_.count() << "ms" << std::endl;
    }

    std::optional<domain::SessionRecord> load(const domain::SessionId& id) override {
        auto payload = execute("GET", [&](ports::output::IKvConnection& kv) {
            return kv.get(keyFor(id));
        });
        if (!payload) {
            return std::nullopt;
        }
        domain::SessionRecord record(id, std::move(*payload));
        record.createdAt = {};
        record.expiresAt = {};
        return record;
    }

    domain::SessionRecord save(const domain::SessionRecord& record) override {
        execute("SET", [&](ports::output::IKvConnection& kv) {
            return kv.set(keyFor(record.id), record.payload, ttl_);
        });
        domain::SessionRecord stored = record;
        stored.expiresAt = std::chrono::system_clock::now() + ttl_;
        return stored;
    }

    bool replace(const domain::SessionRecord& record) override {
        return execute("SET XX", [&](ports::output::IKvConnection& kv) {
            return kv.set(keyFor(record.id), record.payload, ttl_,
                          ports::output::SetCondition::IF_EXISTS);
        });
    }

    void remove(const domain::SessionId& id) override {
        execute("DEL", [&](ports::output::IKvConnection& kv) {
            return kv.del(keyFor(id));
        });
    }

    bool touch(const domain::SessionId& id) override {
        return execute("PEXPIRE", [&](ports::output::IKvConnection& kv) {
            return kv.pexpire(keyFor(id), ttl_);
        });
    }

    std::chrono::milliseconds ttl() const override { return ttl_; }

    const std::string& keyPrefix() const { return keyPrefix_; }

    std::string keyFor(const domain::SessionId& id) const {
        return keyPrefix_ + id.str();
    }

private:
    std::shared_ptr<KvConnectionPool> pool_;
    std::chrono::milliseconds ttl_;
    std::string keyPrefix_;

    template <typename Operation>
    std::invoke_result_t<Operation&, ports::output::IKvConnection&> execute(const char* command, Operation&& operation) {
        auto lease = pool_->acquire();  // StoreUnavailableError при исчерпании пула
        try {
            return operation(*lease);
        } catch (const std::exception& e) {
            lease.invalidate();
            std::cerr << "[PooledKvSessionStore] " << command << " failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(std::string("KV ") + command + " failed: " + e.what());
        }
    }
};

} // namespace websession::adapters::secondary
