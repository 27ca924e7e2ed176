#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <cstdlib>

namespace inventory::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения, секция "db" конфига их перекрывает.
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("INVENTORY_DB_HOST", "inventory-postgres");
            port_ = std::stoi(getEnvOrDefault("INVENTORY_DB_PORT", "5432"));
            name_ = getEnvOrDefault("INVENTORY_DB_NAME", "inventory_db");
            user_ = getEnvOrDefault("INVENTORY_DB_USER", "inventory_user");
            password_ = getEnvOrDefault("INVENTORY_DB_PASSWORD", "inventory_secret_password");
        }

        /// Перекрыть значения из секции "db" JSON-конфига
        void applyJson(const nlohmann::json &config)
        {
            if (!config.contains("db"))
                return;
            const auto &db = config.at("db");
            host_ = db.value("host", host_);
            port_ = db.value("port", port_);
            name_ = db.value("name", name_);
            user_ = db.value("user", user_);
            password_ = db.value("password", password_);
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
    };

} // namespace inventory::settings
