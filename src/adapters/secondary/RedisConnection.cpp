#include "adapters/secondary/kv/RedisConnection.hpp"
#include <array>
#include <iostream>

namespace websession::adapters::secondary {

using boost::asio::ip::tcp;
using ports::output::KvCommandError;
using ports::output::KvConnectionError;
using ports::output::SetCondition;

RedisConnection::RedisConnection(const std::string& host,
                                 uint16_t port,
                                 std::chrono::milliseconds timeout,
                                 const std::string& password,
                                 int db)
    : socket_(ioContext_)
    , timeout_(timeout)
{
    connect(host, port);

    if (!password.empty()) {
        execute({"AUTH", password});
    }
    if (db != 0) {
        execute({"SELECT", std::to_string(db)});
    }

    std::cout << "[RedisConnection] Connected to " << host << ":" << port
              << " db=" << db << std::endl;
}

RedisConnection::~RedisConnection() {
    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

std::optional<std::string> RedisConnection::get(const std::string& key) {
    auto reply = execute({"GET", key});
    if (reply.isNil()) {
        return std::nullopt;
    }
    if (reply.type != RespReply::Type::BULK_STRING) {
        fail("Unexpected reply type for GET");
    }
    return std::move(reply.text);
}

bool RedisConnection::set(const std::string& key,
                          const std::string& value,
                          std::chrono::milliseconds ttl,
                          SetCondition condition) {
    std::vector<std::string> args{"SET", key, value, "PX", std::to_string(ttl.count())};
    if (condition == SetCondition::IF_EXISTS) {
        args.emplace_back("XX");
    } else if (condition == SetCondition::IF_ABSENT) {
        args.emplace_back("NX");
    }

    auto reply = execute(args);
    // NIL: условие XX/NX не выполнено
    return !reply.isNil();
}

bool RedisConnection::del(const std::string& key) {
    auto reply = execute({"DEL", key});
    return reply.type == RespReply::Type::INTEGER && reply.integer > 0;
}

bool RedisConnection::pexpire(const std::string& key, std::chrono::milliseconds ttl) {
    auto reply = execute({"PEXPIRE", key, std::to_string(ttl.count())});
    return reply.type == RespReply::Type::INTEGER && reply.integer == 1;
}

bool RedisConnection::ping() {
    auto reply = execute({"PING"});
    return reply.type == RespReply::Type::SIMPLE_STRING && reply.text == "PONG";
}

void RedisConnection::connect(const std::string& host, uint16_t port) {
    tcp::resolver resolver(ioContext_);
    boost::system::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        fail("Cannot resolve " + host + ": " + ec.message());
    }

    boost::system::error_code result = boost::asio::error::would_block;
    boost::asio::async_connect(socket_, endpoints,
        [&result](const boost::system::error_code& error, const tcp::endpoint&) {
            result = error;
        });
    runUntilComplete("connect");

    if (result) {
        fail("Cannot connect to " + host + ":" + std::to_string(port) + ": " + result.message());
    }

    socket_.set_option(tcp::no_delay(true), ec);
}

RespReply RedisConnection::execute(const std::vector<std::string>& args) {
    if (broken_) {
        throw KvConnectionError("Redis connection is broken");
    }

    writeAll(RespCodec::encodeCommand(args));
    auto reply = readReply();

    if (reply.isError()) {
        throw KvCommandError("Redis " + args.front() + " error: " + reply.text);
    }
    return reply;
}

void RedisConnection::writeAll(const std::string& data) {
    boost::system::error_code result = boost::asio::error::would_block;
    boost::asio::async_write(socket_, boost::asio::buffer(data),
        [&result](const boost::system::error_code& error, std::size_t) {
            result = error;
        });
    runUntilComplete("write");

    if (result) {
        fail("Redis write failed: " + result.message());
    }
}

RespReply RedisConnection::readReply() {
    std::array<char, 4096> chunk{};

    while (true) {
        size_t consumed = 0;
        std::optional<RespReply> reply;
        try {
            reply = RespCodec::parse(readBuffer_, consumed);
        } catch (const KvConnectionError& e) {
            // Поток рассинхронизирован, дальше читать нельзя
            fail(e.what());
        }
        if (reply) {
            readBuffer_.erase(0, consumed);
            return std::move(*reply);
        }

        boost::system::error_code result = boost::asio::error::would_block;
        std::size_t received = 0;
        socket_.async_read_some(boost::asio::buffer(chunk),
            [&result, &received](const boost::system::error_code& error, std::size_t n) {
                result = error;
                received = n;
            });
        runUntilComplete("read");

        if (result) {
            fail("Redis read failed: " + result.message());
        }
        readBuffer_.append(chunk.data(), received);
    }
}

void RedisConnection::runUntilComplete(const char* operation) {
    ioContext_.restart();
    ioContext_.run_for(timeout_);

    if (!ioContext_.stopped()) {
        // Операция не успела: закрываем сокет, отменённый handler добегает в run()
        boost::system::error_code ignored;
        socket_.close(ignored);
        ioContext_.run();
        fail(std::string("Redis ") + operation + " timed out after " +
             std::to_string(timeout_.count()) + "ms");
    }
}

void RedisConnection::fail(const std::string& message) {
    broken_ = true;
    std::cerr << "[RedisConnection] " << message << std::endl;
    throw KvConnectionError(message);
}

} // namespace websession::adapters::secondary
