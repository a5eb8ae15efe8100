// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include "settings/EnvParsing.hpp"

namespace websession::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL (backend сессий "postgres")
     *
     * Читает параметры из переменных окружения (K8s ENV).
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("SESSION_DB_HOST", "session-postgres");
            port_ = static_cast<int>(parseIntInRange("SESSION_DB_PORT", getEnvOrDefault("SESSION_DB_PORT", "5432"), 1, 65535));
            name_ = getEnvOrDefault("SESSION_DB_NAME", "session_db");
            user_ = getEnvOrDefault("SESSION_DB_USER", "session_user");
            password_ = getEnvOrDefault("SESSION_DB_PASSWORD", "session_password");
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace websession::settings
