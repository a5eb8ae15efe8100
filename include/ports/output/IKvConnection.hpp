#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <stdexcept>

namespace websession::ports::output {

/**
 * @brief Условие записи для SET
 */
enum class SetCondition {
    ALWAYS,     ///< Безусловный upsert
    IF_EXISTS,  ///< Только поверх существующего ключа (XX)
    IF_ABSENT   ///< Только если ключа нет (NX)
};

/**
 * @brief Ошибка ввода-вывода соединения с KV хранилищем
 *
 * После неё соединение считается сломанным и в пул не возвращается.
 */
class KvConnectionError : public std::runtime_error {
public:
    explicit KvConnectionError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Backend отклонил команду (ответ-ошибка)
 */
class KvCommandError : public std::runtime_error {
public:
    explicit KvCommandError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Одно соединение с сетевым key-value хранилищем
 *
 * Не потокобезопасно: соединением владеет тот, кто арендовал его из пула.
 */
class IKvConnection {
public:
    virtual ~IKvConnection() = default;

    /// GET key
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * @brief SET key value PX ttl [XX|NX]
     * @return false, если условие не выполнено и запись не произошла
     */
    virtual bool set(const std::string& key,
                     const std::string& value,
                     std::chrono::milliseconds ttl,
                     SetCondition condition = SetCondition::ALWAYS) = 0;

    /// DEL key, true если ключ существовал
    virtual bool del(const std::string& key) = 0;

    /// PEXPIRE key ttl, false если ключа нет
    virtual bool pexpire(const std::string& key, std::chrono::milliseconds ttl) = 0;

    /// Проверка соединения
    virtual bool ping() = 0;
};

} // namespace websession::ports::output
