#include "application/CookieCodec.hpp"
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace websession::application {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && (s[begin] == ' ' || s[begin] == '\t')) ++begin;
    while (end > begin && (s[end - 1] == ' ' || s[end - 1] == '\t')) --end;
    return s.substr(begin, end - begin);
}

} // namespace

CookieCodec::CookieCodec(domain::SessionConfig config)
    : config_(std::move(config))
{
    config_.validate();
}

std::string CookieCodec::encode(const domain::SessionId& id,
                                std::optional<std::chrono::seconds> ttl,
                                bool destroy) const
{
    std::string out = config_.cookieName + "=";

    if (destroy) {
        // Пустое значение + дата в прошлом: браузер удаляет cookie
        out += "; Max-Age=0; Expires=";
        out += formatHttpDate(std::chrono::system_clock::time_point{});
    } else {
        out += id.str();
        if (ttl) {
            out += "; Max-Age=" + std::to_string(ttl->count());
            out += "; Expires=" + formatHttpDate(std::chrono::system_clock::now() + *ttl);
        }
    }

    appendAttributes(out);
    return out;
}

std::string CookieCodec::removal() const {
    return encode(domain::SessionId{}, std::nullopt, true);
}

std::optional<domain::SessionId> CookieCodec::decode(const std::string& cookieHeader) const {
    size_t start = 0;
    while (start <= cookieHeader.size()) {
        auto end = cookieHeader.find(';', start);
        if (end == std::string::npos) {
            end = cookieHeader.size();
        }

        std::string pair = trim(cookieHeader.substr(start, end - start));
        auto eq = pair.find('=');
        if (eq != std::string::npos && trim(pair.substr(0, eq)) == config_.cookieName) {
            std::string value = trim(pair.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            // Первое вхождение решает: дубликаты дальше не смотрим
            return domain::SessionId::parse(value, config_.idByteLength);
        }

        start = end + 1;
    }
    return std::nullopt;
}

std::string CookieCodec::formatHttpDate(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

void CookieCodec::appendAttributes(std::string& out) const {
    if (!config_.cookiePath.empty()) {
        out += "; Path=" + config_.cookiePath;
    }
    if (!config_.cookieDomain.empty()) {
        out += "; Domain=" + config_.cookieDomain;
    }
    if (config_.secure) {
        out += "; Secure";
    }
    if (config_.httpOnly) {
        out += "; HttpOnly";
    }
    out += "; SameSite=" + domain::toString(config_.sameSite);
}

} // namespace websession::application
