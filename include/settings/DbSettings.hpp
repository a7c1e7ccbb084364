// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace bank::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения:
     * - BANK_DB_HOST (default: localhost)
     * - BANK_DB_PORT (default: 5432)
     * - BANK_DB_NAME (default: simple_bank)
     * - BANK_DB_USER (default: root)
     * - BANK_DB_PASSWORD (обязательна)
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("BANK_DB_HOST", "localhost");
            port_ = std::stoi(getEnvOrDefault("BANK_DB_PORT", "5432"));
            name_ = getEnvOrDefault("BANK_DB_NAME", "simple_bank");
            user_ = getEnvOrDefault("BANK_DB_USER", "root");
            password_ = getEnvOrThrow("BANK_DB_PASSWORD");
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }

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

        static std::string getEnvOrThrow(const char *name)
        {
            const char *value = std::getenv(name);
            if (!value)
            {
                throw std::runtime_error(std::string("Required env variable not set: ") + name);
            }
            return value;
        }
    };

} // namespace bank::settings
