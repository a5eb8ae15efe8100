#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace websession::adapters::secondary {

/**
 * @brief Ответ Redis (RESP2)
 */
struct RespReply {
    enum class Type {
        SIMPLE_STRING,  ///< +OK
        ERROR,          ///< -ERR ...
        INTEGER,        ///< :1
        BULK_STRING,    ///< $3 foo
        NIL,            ///< $-1 / *-1
        ARRAY           ///< *2 ...
    };

    Type type = Type::NIL;
    std::string text;                  ///< SIMPLE_STRING, ERROR, BULK_STRING
    int64_t integer = 0;               ///< INTEGER
    std::vector<RespReply> elements;   ///< ARRAY

    bool isNil() const { return type == Type::NIL; }
    bool isError() const { return type == Type::ERROR; }
};

/**
 * @brief Кодирование команд и разбор ответов протокола RESP2
 *
 * Без состояния и без ввода-вывода: RedisConnection накапливает байты
 * из сокета и вызывает parse(), пока ответ не будет собран целиком.
 */
class RespCodec {
public:
    /**
     * @brief Команда как массив bulk-строк
     *
     * encodeCommand({"SET", "k", "v"}) == "*3\r\n$3\r\nSET\r\n$1\r\nk\r\n$1\r\nv\r\n"
     */
    static std::string encodeCommand(const std::vector<std::string>& args);

    /**
     * @brief Разобрать один ответ из начала буфера
     * @param buffer Накопленные байты
     * @param consumed Сколько байт занял ответ (заполняется при успехе)
     * @return nullopt, если ответ ещё не пришёл целиком
     * @throws ports::output::KvConnectionError при нарушении протокола
     */
    static std::optional<RespReply> parse(const std::string& buffer, size_t& consumed);

private:
    static std::optional<RespReply> parseAt(const std::string& buffer, size_t& pos, int depth);
    static std::optional<std::string> readLine(const std::string& buffer, size_t& pos);
    static int64_t toInteger(const std::string& text);
};

} // namespace websession::adapters::secondary
