#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include "settings/EnvParsing.hpp"

namespace websession::settings {

/**
 * @brief Настройки сетевого KV хранилища (Redis)
 *
 * Читает из ENV:
 * - KV_HOST (default: "redis")
 * - KV_PORT (default: 6379)
 * - KV_PASSWORD (default: пусто, без AUTH)
 * - KV_DB (default: 0)
 * - KV_POOL_SIZE (default: 8)
 * - KV_TIMEOUT_MS (default: 500) - connect/IO и ожидание свободного соединения
 * - KV_KEY_PREFIX (default: "session:")
 *
 * @throws std::invalid_argument если число не разбирается или вне диапазона
 */
class KvSettings {
public:
    KvSettings() {
        if (const char* host = std::getenv("KV_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("KV_PORT")) {
            port_ = static_cast<uint16_t>(parseIntInRange("KV_PORT", port, 1, 65535));
        }
        if (const char* password = std::getenv("KV_PASSWORD")) {
            password_ = password;
        }
        if (const char* db = std::getenv("KV_DB")) {
            db_ = static_cast<int>(parseIntInRange("KV_DB", db, 0, 65535));
        }
        if (const char* poolSize = std::getenv("KV_POOL_SIZE")) {
            poolSize_ = static_cast<size_t>(parseIntInRange("KV_POOL_SIZE", poolSize, 1, 1024));
        }
        if (const char* timeout = std::getenv("KV_TIMEOUT_MS")) {
            timeout_ = std::chrono::milliseconds(parseIntInRange("KV_TIMEOUT_MS", timeout, 1, 60000));
        }
        if (const char* prefix = std::getenv("KV_KEY_PREFIX")) {
            keyPrefix_ = prefix;
        }
    }

    std::string getHost() const { return host_; }
    uint16_t getPort() const { return port_; }
    std::string getPassword() const { return password_; }
    int getDb() const { return db_; }
    size_t getPoolSize() const { return poolSize_; }
    std::chrono::milliseconds getTimeout() const { return timeout_; }
    std::string getKeyPrefix() const { return keyPrefix_; }

private:
    std::string host_ = "redis";
    uint16_t port_ = 6379;
    std::string password_;
    int db_ = 0;
    size_t poolSize_ = 8;
    std::chrono::milliseconds timeout_{500};
    std::string keyPrefix_ = "session:";
};

} // namespace websession::settings
