// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>

namespace trader::settings
{

    /**
     * @brief Настройки хранилища вселенных
     *
     * TRADER_UNIVERSE_STORE: "memory" (default) или "postgres".
     * Параметры PostgreSQL читаются из TRADER_DB_*.
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            store_ = getEnvOrDefault("TRADER_UNIVERSE_STORE", "memory");
            host_ = getEnvOrDefault("TRADER_DB_HOST", "localhost");
            port_ = std::stoi(getEnvOrDefault("TRADER_DB_PORT", "5432"));
            name_ = getEnvOrDefault("TRADER_DB_NAME", "trader_db");
            user_ = getEnvOrDefault("TRADER_DB_USER", "trader");
            password_ = getEnvOrDefault("TRADER_DB_PASSWORD", "trader");
        }

        bool usePostgres() const { return store_ == "postgres"; }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string store_;
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

} // namespace trader::settings
