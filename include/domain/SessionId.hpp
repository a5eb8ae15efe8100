#pragma once

#include <string>
#include <optional>
#include <functional>
#include <cstddef>

namespace websession::domain {

/**
 * @brief Идентификатор сессии
 *
 * Текстовая форма: base64url без паддинга (алфавит A-Z a-z 0-9 - _).
 * Создаётся только IdentifierGenerator'ом или через parse() из cookie.
 */
class SessionId {
public:
    static constexpr size_t MIN_BYTE_LENGTH = 16;      ///< 128 бит
    static constexpr size_t DEFAULT_BYTE_LENGTH = 32;  ///< 256 бит

    SessionId() = default;

    /**
     * @brief Обернуть уже провалидированный токен
     */
    explicit SessionId(std::string token) : token_(std::move(token)) {}

    /**
     * @brief Длина токена для заданного количества случайных байт
     *
     * base64url без паддинга: ceil(bytes * 4 / 3)
     */
    static size_t tokenLength(size_t byteLength) {
        return (byteLength * 4 + 2) / 3;
    }

    /**
     * @brief Проверить и разобрать токен из cookie
     * @return nullopt, если длина или алфавит не подходят
     */
    static std::optional<SessionId> parse(const std::string& token, size_t byteLength) {
        if (token.size() != tokenLength(byteLength)) {
            return std::nullopt;
        }
        for (char c : token) {
            if (!isTokenChar(c)) {
                return std::nullopt;
            }
        }
        return SessionId(token);
    }

    static bool isTokenChar(char c) {
        return (c >= 'A' && c <= 'Z') ||
               (c >= 'a' && c <= 'z') ||
               (c >= '0' && c <= '9') ||
               c == '-' || c == '_';
    }

    const std::string& str() const { return token_; }
    bool empty() const { return token_.empty(); }

    /**
     * @brief Маскированная форма для логов: "abcd...wxyz"
     */
    std::string masked() const {
        if (token_.size() < 16) {
            return "***";
        }
        return token_.substr(0, 4) + "..." + token_.substr(token_.size() - 4);
    }

    bool operator==(const SessionId& other) const { return token_ == other.token_; }
    bool operator!=(const SessionId& other) const { return token_ != other.token_; }

private:
    std::string token_;
};

} // namespace websession::domain

namespace std {

template <>
struct hash<websession::domain::SessionId> {
    size_t operator()(const websession::domain::SessionId& id) const noexcept {
        return hash<string>{}(id.str());
    }
};

} // namespace std
