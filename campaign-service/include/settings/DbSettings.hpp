// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace campaign::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL (журнал, чекпоинты, read model)
     *
     * Читает из ENV:
     * - CAMPAIGN_DB_HOST (default: campaign-postgres)
     * - CAMPAIGN_DB_PORT (default: 5432)
     * - CAMPAIGN_DB_NAME (default: campaign_db)
     * - CAMPAIGN_DB_USER (default: campaign_user)
     * - CAMPAIGN_DB_PASSWORD
     * - CAMPAIGN_DB_SSLMODE (default: prefer)
     *
     * Все адаптеры открывают соединение на операцию по getConnectionString().
     */
    class DbSettings
    {
    public:
        DbSettings()
            : host_(envOr("CAMPAIGN_DB_HOST", "campaign-postgres"))
            , name_(envOr("CAMPAIGN_DB_NAME", "campaign_db"))
            , user_(envOr("CAMPAIGN_DB_USER", "campaign_user"))
            , password_(envOr("CAMPAIGN_DB_PASSWORD", "campaign_secret_password"))
            , sslMode_(envOr("CAMPAIGN_DB_SSLMODE", "prefer"))
        {
            const std::string port = envOr("CAMPAIGN_DB_PORT", "5432");
            try
            {
                port_ = std::stoi(port);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument("Invalid CAMPAIGN_DB_PORT: " + port);
            }
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }

        /**
         * @brief libpq connection string (key=value)
         *
         * application_name виден в pg_stat_activity.
         */
        std::string getConnectionString() const
        {
            if (!connectionOverride_.empty())
                return connectionOverride_;
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_ +
                   " sslmode=" + sslMode_ + " application_name=campaign-service";
        }

        // Для интеграционных тестов: готовая строка из CAMPAIGN_TEST_DB
        void setConnectionString(const std::string &connectionString) { connectionOverride_ = connectionString; }

    private:
        static std::string envOr(const char *name, const char *fallback)
        {
            const char *value = std::getenv(name);
            return value && *value ? std::string(value) : std::string(fallback);
        }

        std::string host_;
        int port_ = 5432;
        std::string name_;
        std::string user_;
        std::string password_;
        std::string sslMode_;
        std::string connectionOverride_;
    };

} // namespace campaign::settings
