#pragma once

#include "adapters/secondary/kv/RespCodec.hpp"
#include "ports/output/IKvConnection.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace websession::adapters::secondary {

/**
 * @brief Блокирующее соединение с Redis поверх boost::asio
 *
 * Каждая операция (connect, запись команды, чтение ответа) ограничена
 * таймаутом: async-операция запускается через io_context::run_for, по
 * истечении времени сокет закрывается и бросается KvConnectionError.
 * После любой ошибки ввода-вывода соединение считается сломанным.
 *
 * Не потокобезопасно, используется через KvConnectionPool.
 *
 * @example
 * ```cpp
 * RedisConnection redis("localhost", 6379, 500ms);
 * redis.set("session:abc", "{}", 2h);
 * auto value = redis.get("session:abc");
 * ```
 */
class RedisConnection : public ports::output::IKvConnection {
public:
    /**
     * @param password Пароль для AUTH (пусто = без AUTH)
     * @param db Номер базы для SELECT (0 = без SELECT)
     * @throws ports::output::KvConnectionError если не удалось подключиться
     * @throws ports::output::KvCommandError если AUTH/SELECT отклонены
     */
    RedisConnection(const std::string& host,
                    uint16_t port,
                    std::chrono::milliseconds timeout,
                    const std::string& password = "",
                    int db = 0);
    ~RedisConnection() override;

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key,
             const std::string& value,
             std::chrono::milliseconds ttl,
             ports::output::SetCondition condition = ports::output::SetCondition::ALWAYS) override;
    bool del(const std::string& key) override;
    bool pexpire(const std::string& key, std::chrono::milliseconds ttl) override;
    bool ping() override;

    bool isBroken() const { return broken_; }

private:
    boost::asio::io_context ioContext_;
    boost::asio::ip::tcp::socket socket_;
    std::chrono::milliseconds timeout_;
    std::string readBuffer_;
    bool broken_ = false;

    void connect(const std::string& host, uint16_t port);

    /// Отправить команду и дождаться ответа. Ответ-ошибка -> KvCommandError.
    RespReply execute(const std::vector<std::string>& args);

    void writeAll(const std::string& data);
    RespReply readReply();

    /// Прокрутить io_context до завершения операции или таймаута
    void runUntilComplete(const char* operation);

    [[noreturn]] void fail(const std::string& message);
};

} // namespace websession::adapters::secondary
