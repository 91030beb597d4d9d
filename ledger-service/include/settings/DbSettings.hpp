#pragma once

#include "settings/Environment.hpp"
#include <memory>
#include <string>

namespace btctax::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Ключи db.host, db.port, db.name, db.user, db.password
     * (переопределяются BTCTAX_DB_HOST и т.д.).
     */
    class DbSettings
    {
    public:
        explicit DbSettings(std::shared_ptr<Environment> env)
            : host_(env->get<std::string>("db.host", "localhost"))
            , port_(env->get<int>("db.port", 5432))
            , name_(env->get<std::string>("db.name", "btctax"))
            , user_(env->get<std::string>("db.user", "btctax"))
            , password_(env->get<std::string>("db.password", ""))
        {
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }

        std::string getConnectionString() const
        {
            std::string result = "host=" + host_ + " port=" + std::to_string(port_) +
                                 " dbname=" + name_ + " user=" + user_;
            if (!password_.empty())
            {
                result += " password=" + password_;
            }
            return result;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
    };

} // namespace btctax::settings
