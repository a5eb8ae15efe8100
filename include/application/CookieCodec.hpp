#pragma once

#include "domain/SessionId.hpp"
#include "domain/SessionConfig.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace websession::application {

/**
 * @brief Кодирование/декодирование session cookie
 *
 * encode() строит значение заголовка Set-Cookie с атрибутами из конфигурации,
 * decode() достаёт идентификатор из заголовка Cookie.
 *
 * @example
 * ```cpp
 * CookieCodec codec(config);
 * auto id = codec.decode("theme=dark; sid=Q2xhdWRl...");
 * res.setHeader("Set-Cookie", codec.encode(*id, config.ttl, false));
 * ```
 */
class CookieCodec {
public:
    explicit CookieCodec(domain::SessionConfig config);

    /**
     * @brief Построить значение Set-Cookie
     *
     * @param id Идентификатор (игнорируется при destroy)
     * @param ttl Время жизни cookie; nullopt = cookie до закрытия браузера
     * @param destroy true = пустое значение и Expires в прошлом
     */
    std::string encode(const domain::SessionId& id,
                       std::optional<std::chrono::seconds> ttl,
                       bool destroy) const;

    /**
     * @brief Cookie, удаляющая сессию на клиенте
     */
    std::string removal() const;

    /**
     * @brief Найти идентификатор в заголовке Cookie
     *
     * Берётся первое вхождение cookie с нужным именем. Некорректное значение
     * равносильно отсутствию cookie.
     */
    std::optional<domain::SessionId> decode(const std::string& cookieHeader) const;

    const domain::SessionConfig& config() const { return config_; }

    /**
     * @brief Форматировать время в IMF-fixdate ("Thu, 01 Jan 1970 00:00:00 GMT")
     */
    static std::string formatHttpDate(std::chrono::system_clock::time_point time);

private:
    domain::SessionConfig config_;

    void appendAttributes(std::string& out) const;
};

} // namespace websession::application
