#pragma once

#include "settings/EnvReader.hpp"
#include <string>

namespace portal::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL журнала гостевых сессий
     *
     * Читает параметры из переменных окружения AUDIT_DB_*.
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = EnvReader::getString("AUDIT_DB_HOST", "portal-postgres");
            port_ = EnvReader::getInt("AUDIT_DB_PORT", 5432);
            name_ = EnvReader::getString("AUDIT_DB_NAME", "guest_portal");
            user_ = EnvReader::getString("AUDIT_DB_USER", "portal_user");
            password_ = EnvReader::getString("AUDIT_DB_PASSWORD", "portal_password");
        }

        std::string getName() const { return name_; }

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
    };

} // namespace portal::settings
