#include "adapters/secondary/kv/RespCodec.hpp"
#include "ports/output/IKvConnection.hpp"
#include <charconv>

namespace websession::adapters::secondary {

namespace {

constexpr int MAX_NESTING = 8;
constexpr int64_t MAX_BULK_LENGTH = 512 * 1024 * 1024;

} // namespace

std::string RespCodec::encodeCommand(const std::vector<std::string>& args) {
    std::string out;
    out += "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& arg : args) {
        out += "$" + std::to_string(arg.size()) + "\r\n";
        out += arg;
        out += "\r\n";
    }
    return out;
}

std::optional<RespReply> RespCodec::parse(const std::string& buffer, size_t& consumed) {
    size_t pos = 0;
    auto reply = parseAt(buffer, pos, 0);
    if (reply) {
        consumed = pos;
    }
    return reply;
}

std::optional<RespReply> RespCodec::parseAt(const std::string& buffer, size_t& pos, int depth) {
    if (depth > MAX_NESTING) {
        throw ports::output::KvConnectionError("RESP reply nested too deeply");
    }
    if (pos >= buffer.size()) {
        return std::nullopt;
    }

    char marker = buffer[pos];
    size_t cursor = pos + 1;
    auto line = readLine(buffer, cursor);
    if (!line) {
        return std::nullopt;
    }

    RespReply reply;
    switch (marker) {
        case '+':
            reply.type = RespReply::Type::SIMPLE_STRING;
            reply.text = std::move(*line);
            break;

        case '-':
            reply.type = RespReply::Type::ERROR;
            reply.text = std::move(*line);
            break;

        case ':':
            reply.type = RespReply::Type::INTEGER;
            reply.integer = toInteger(*line);
            break;

        case '$': {
            int64_t length = toInteger(*line);
            if (length == -1) {
                reply.type = RespReply::Type::NIL;
                break;
            }
            if (length < 0 || length > MAX_BULK_LENGTH) {
                throw ports::output::KvConnectionError("Invalid RESP bulk length: " + *line);
            }
            auto size = static_cast<size_t>(length);
            if (buffer.size() < cursor + size + 2) {
                return std::nullopt;
            }
            if (buffer.compare(cursor + size, 2, "\r\n") != 0) {
                throw ports::output::KvConnectionError("RESP bulk string is not terminated");
            }
            reply.type = RespReply::Type::BULK_STRING;
            reply.text = buffer.substr(cursor, size);
            cursor += size + 2;
            break;
        }

        case '*': {
            int64_t count = toInteger(*line);
            if (count == -1) {
                reply.type = RespReply::Type::NIL;
                break;
            }
            if (count < 0) {
                throw ports::output::KvConnectionError("Invalid RESP array length: " + *line);
            }
            reply.type = RespReply::Type::ARRAY;
            for (int64_t i = 0; i < count; ++i) {
                auto element = parseAt(buffer, cursor, depth + 1);
                if (!element) {
                    return std::nullopt;
                }
                reply.elements.push_back(std::move(*element));
            }
            break;
        }

        default:
            throw ports::output::KvConnectionError(
                std::string("Unexpected RESP type marker: '") + marker + "'");
    }

    pos = cursor;
    return reply;
}

std::optional<std::string> RespCodec::readLine(const std::string& buffer, size_t& pos) {
    auto end = buffer.find("\r\n", pos);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    std::string line = buffer.substr(pos, end - pos);
    pos = end + 2;
    return line;
}

int64_t RespCodec::toInteger(const std::string& text) {
    int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || text.empty()) {
        throw ports::output::KvConnectionError("Invalid RESP integer: '" + text + "'");
    }
    return value;
}

} // namespace websession::adapters::secondary
