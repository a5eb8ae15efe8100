#pragma once

#include "domain/SessionId.hpp"
#include "domain/enums/SameSite.hpp"
#include <string>
#include <chrono>
#include <stdexcept>

namespace websession::domain {

/**
 * @brief Конфигурация сессий и session cookie
 *
 * Фиксируется при создании SessionMiddleware. От ответа к ответу меняются
 * только значение cookie и Max-Age/Expires.
 */
struct SessionConfig {
    std::string cookieName = "sid";                ///< Имя cookie
    std::string cookiePath = "/";                  ///< Path
    std::string cookieDomain;                      ///< Domain (пусто = host-only)
    bool secure = true;                            ///< Secure
    bool httpOnly = true;                          ///< HttpOnly
    SameSite sameSite = SameSite::LAX;             ///< SameSite
    std::chrono::seconds ttl{2 * 60 * 60};         ///< Время жизни сессии
    bool slidingExpiry = false;                    ///< Продлевать TTL на каждый запрос
    size_t idByteLength = SessionId::DEFAULT_BYTE_LENGTH;  ///< Энтропия id в байтах
    bool persistentCookie = true;                  ///< false = cookie живёт до закрытия браузера

    /**
     * @brief Валидация конфигурации
     * @throws std::invalid_argument при некорректных значениях
     */
    void validate() const {
        if (cookieName.empty()) {
            throw std::invalid_argument("Session cookie name must not be empty");
        }
        for (char c : cookieName) {
            if (c <= 0x20 || c >= 0x7f || c == '=' || c == ';' || c == ',') {
                throw std::invalid_argument("Invalid character in session cookie name: " + cookieName);
            }
        }
        if (ttl.count() <= 0) {
            throw std::invalid_argument("Session TTL must be positive");
        }
        if (idByteLength < SessionId::MIN_BYTE_LENGTH) {
            throw std::invalid_argument("Session id must have at least 16 random bytes");
        }
        if (sameSite == SameSite::NONE && !secure) {
            throw std::invalid_argument("SameSite=None requires the Secure attribute");
        }
    }
};

} // namespace websession::domain
