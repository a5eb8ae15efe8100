#pragma once

#include "domain/SessionConfig.hpp"
#include "domain/enums/SameSite.hpp"
#include "settings/EnvParsing.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace websession::settings {

/**
 * @brief Настройки сессий
 *
 * Читает из ENV:
 * - SESSION_COOKIE_NAME (default: "sid")
 * - SESSION_COOKIE_PATH (default: "/")
 * - SESSION_COOKIE_DOMAIN (default: пусто)
 * - SESSION_COOKIE_SECURE (default: true)
 * - SESSION_COOKIE_HTTP_ONLY (default: true)
 * - SESSION_COOKIE_SAME_SITE (default: "Lax")
 * - SESSION_TTL_SECONDS (default: 7200)
 * - SESSION_SLIDING_EXPIRY (default: false)
 * - SESSION_ID_BYTES (default: 32)
 * - SESSION_PERSISTENT_COOKIE (default: true)
 * - SESSION_STORE (default: "memory") - memory | redis | postgres
 * - SESSION_SWEEP_INTERVAL_SECONDS (default: 60) - очистка memory/postgres
 *
 * @throws std::invalid_argument при некорректных значениях
 */
class SessionSettings {
public:
    SessionSettings() {
        if (const char* name = std::getenv("SESSION_COOKIE_NAME")) {
            config_.cookieName = name;
        }
        if (const char* path = std::getenv("SESSION_COOKIE_PATH")) {
            config_.cookiePath = path;
        }
        if (const char* domain = std::getenv("SESSION_COOKIE_DOMAIN")) {
            config_.cookieDomain = domain;
        }
        if (const char* secure = std::getenv("SESSION_COOKIE_SECURE")) {
            config_.secure = parseBool("SESSION_COOKIE_SECURE", secure);
        }
        if (const char* httpOnly = std::getenv("SESSION_COOKIE_HTTP_ONLY")) {
            config_.httpOnly = parseBool("SESSION_COOKIE_HTTP_ONLY", httpOnly);
        }
        if (const char* sameSite = std::getenv("SESSION_COOKIE_SAME_SITE")) {
            config_.sameSite = domain::sameSiteFromString(sameSite);
        }
        if (const char* ttl = std::getenv("SESSION_TTL_SECONDS")) {
            config_.ttl = std::chrono::seconds(parseIntInRange("SESSION_TTL_SECONDS", ttl, 1, 400LL * 24 * 60 * 60));
        }
        if (const char* sliding = std::getenv("SESSION_SLIDING_EXPIRY")) {
            config_.slidingExpiry = parseBool("SESSION_SLIDING_EXPIRY", sliding);
        }
        if (const char* idBytes = std::getenv("SESSION_ID_BYTES")) {
            config_.idByteLength = static_cast<size_t>(parseIntInRange("SESSION_ID_BYTES", idBytes, 16, 256));
        }
        if (const char* persistent = std::getenv("SESSION_PERSISTENT_COOKIE")) {
            config_.persistentCookie = parseBool("SESSION_PERSISTENT_COOKIE", persistent);
        }
        if (const char* store = std::getenv("SESSION_STORE")) {
            store_ = store;
        }
        if (const char* sweep = std::getenv("SESSION_SWEEP_INTERVAL_SECONDS")) {
            sweepInterval_ = std::chrono::seconds(parseIntInRange("SESSION_SWEEP_INTERVAL_SECONDS", sweep, 1, 24 * 60 * 60));
        }

        config_.validate();
        if (store_ != "memory" && store_ != "redis" && store_ != "postgres") {
            throw std::invalid_argument("Unknown SESSION_STORE: " + store_);
        }
    }

    const domain::SessionConfig& getConfig() const { return config_; }
    std::string getStore() const { return store_; }
    std::chrono::seconds getSweepInterval() const { return sweepInterval_; }

private:
    domain::SessionConfig config_;
    std::string store_ = "memory";
    std::chrono::seconds sweepInterval_{60};

    static bool parseBool(const char* name, const std::string& value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
        if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
        throw std::invalid_argument(std::string(name) + " must be a boolean, got: " + value);
    }
};

} // namespace websession::settings
