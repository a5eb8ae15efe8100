#pragma once

#include "domain/SessionId.hpp"
#include <string>
#include <chrono>

namespace websession::domain {

/**
 * @brief Запись сессии в хранилище
 *
 * Принадлежит backend'у хранилища. Между запросами приложение её не держит.
 * payload: сериализованные данные сессии (JSON-объект), для хранилища это
 * непрозрачные байты.
 *
 * @note KV backend сам управляет TTL, поэтому у загруженной из него записи
 *       createdAt/expiresAt не заполняются.
 */
struct SessionRecord {
    SessionId id;
    std::string payload;
    std::chrono::system_clock::time_point createdAt;   ///< Время создания
    std::chrono::system_clock::time_point expiresAt;   ///< Время истечения

    SessionRecord() = default;

    SessionRecord(SessionId id, std::string payload)
        : id(std::move(id))
        , payload(std::move(payload))
        , createdAt(std::chrono::system_clock::now())
        , expiresAt(createdAt)
    {}

    /**
     * @brief Проверить, истекла ли запись
     */
    bool isExpired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const {
        return now >= expiresAt;
    }
};

} // namespace websession::domain
