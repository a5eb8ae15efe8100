#pragma once

#include "ports/output/ISessionStore.hpp"
#include <ThreadSafeMap.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace websession::adapters::secondary {

/**
 * @brief In-Memory хранилище сессий
 *
 * Шардированная map: сессии из разных шардов не конкурируют за блокировку.
 * Записи неизменяемы, каждая запись подменяет snapshot целиком
 * (last-writer-wins без частичных обновлений).
 *
 * Истечение ленивое: load() считает истёкшую запись отсутствующей и удаляет
 * её. Сессии, которые больше никто не загружает, чистит purgeExpired()
 * (см. ExpirySweeper).
 *
 * Данные теряются при рестарте процесса.
 */
class MemorySessionStore : public ports::output::ISessionStore {
public:
    explicit MemorySessionStore(std::chrono::milliseconds ttl, size_t shardCount = 16)
        : ttl_(ttl)
        , sessions_(shardCount)
    {
        if (ttl_.count() <= 0) {
            throw std::invalid_argument("MemorySessionStore TTL must be positive");
        }
        std::cout << "[MemorySessionStore] Created with " << sessions_.shardCount()
                  << " shards, ttl=" << ttl_.count() << "ms" << std::endl;
    }

    std::optional<domain::SessionRecord> load(const domain::SessionId& id) override {
        auto record = sessions_.find(id.str());
        if (!record) {
            return std::nullopt;
        }

        if (record->isExpired()) {
            // Удаляем только если за это время никто не записал свежую версию
            sessions_.eraseIf(id.str(), [&record](const domain::SessionRecord& current) {
                return &current == record.get();
            });
            return std::nullopt;
        }

        return *record;
    }

    domain::SessionRecord save(const domain::SessionRecord& record) override {
        auto stored = refreshed(record);
        sessions_.insert(record.id.str(), stored);
        return *stored;
    }

    bool replace(const domain::SessionRecord& record) override {
        return sessions_.update(record.id.str(),
            [this, &record](const domain::SessionRecord& current) -> std::shared_ptr<domain::SessionRecord> {
                if (current.isExpired()) {
                    return nullptr;
                }
                auto next = refreshed(record);
                next->createdAt = current.createdAt;
                return next;
            });
    }

    void remove(const domain::SessionId& id) override {
        sessions_.erase(id.str());
    }

    bool touch(const domain::SessionId& id) override {
        return sessions_.update(id.str(),
            [this](const domain::SessionRecord& current) -> std::shared_ptr<domain::SessionRecord> {
                if (current.isExpired()) {
                    return nullptr;
                }
                auto next = std::make_shared<domain::SessionRecord>(current);
                next->expiresAt = std::chrono::system_clock::now() + ttl_;
                return next;
            });
    }

    std::chrono::milliseconds ttl() const override { return ttl_; }

    /**
     * @brief Удалить все истёкшие записи
     * @return Количество удалённых
     */
    size_t purgeExpired() {
        auto now = std::chrono::system_clock::now();
        return sessions_.eraseAll([now](const domain::SessionRecord& record) {
            return record.isExpired(now);
        });
    }

    /**
     * @brief Количество записей (включая ещё не вычищенные истёкшие)
     */
    size_t size() const {
        return sessions_.size();
    }

private:
    std::chrono::milliseconds ttl_;
    ThreadSafeMap<std::string, domain::SessionRecord> sessions_;

    std::shared_ptr<domain::SessionRecord> refreshed(const domain::SessionRecord& record) const {
        auto stored = std::make_shared<domain::SessionRecord>(record);
        auto now = std::chrono::system_clock::now();
        if (stored->createdAt == std::chrono::system_clock::time_point{}) {
            stored->createdAt = now;
        }
        stored->expiresAt = now + ttl_;
        return stored;
    }
};

} // namespace websession::adapters::secondary
