#pragma once

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace btctax::settings {

/**
 * @brief Конфигурация приложения: config.json + переменные окружения
 *
 * Ключ "db.host" ищется сначала в переменной BTCTAX_DB_HOST, затем в
 * JSON (плоский ключ "db.host" или вложенный {"db": {"host": ...}}),
 * иначе возвращается значение по умолчанию.
 */
class Environment {
public:
    Environment() : config_(nlohmann::json::object()) {}

    explicit Environment(nlohmann::json config, std::string envPrefix = "BTCTAX")
        : config_(std::move(config))
        , envPrefix_(std::move(envPrefix))
    {
        if (!config_.is_object()) {
            throw std::invalid_argument("Configuration root must be a JSON object");
        }
    }

    /**
     * @brief Загрузить config.json
     *
     * Отсутствующий файл означает конфигурацию по умолчанию.
     *
     * @throws std::invalid_argument если файл не является корректным JSON
     */
    static std::shared_ptr<Environment> load(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cout << "[Environment] " << path << " not found, using defaults" << std::endl;
            return std::make_shared<Environment>();
        }

        try {
            auto config = nlohmann::json::parse(file);
            std::cout << "[Environment] Loaded " << path << std::endl;
            return std::make_shared<Environment>(std::move(config));
        } catch (const nlohmann::json::parse_error& e) {
            throw std::invalid_argument("Invalid config " + path + ": " + e.what());
        }
    }

    template <typename T>
    T get(const std::string& key, const T& defaultValue) const {
        if (auto fromEnv = envValue(key)) {
            return convert<T>(key, *fromEnv);
        }
        if (auto node = jsonValue(key)) {
            try {
                return node->get<T>();
            } catch (const nlohmann::json::exception& e) {
                throw std::invalid_argument("Config key '" + key + "' has wrong type: " + e.what());
            }
        }
        return defaultValue;
    }

    bool has(const std::string& key) const {
        return envValue(key).has_value() || jsonValue(key).has_value();
    }

    /**
     * @brief Имя переменной окружения для ключа: "db.host" -> "BTCTAX_DB_HOST"
     */
    std::string envName(const std::string& key) const {
        std::string name = envPrefix_ + "_";
        for (char c : key) {
            name += (c == '.') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return name;
    }

private:
    nlohmann::json config_;
    std::string envPrefix_ = "BTCTAX";

    std::optional<std::string> envValue(const std::string& key) const {
        const char* value = std::getenv(envName(key).c_str());
        return value ? std::optional<std::string>(value) : std::nullopt;
    }

    std::optional<nlohmann::json> jsonValue(const std::string& key) const {
        if (config_.contains(key)) {
            return config_.at(key);
        }

        const nlohmann::json* node = &config_;
        std::size_t start = 0;
        while (start <= key.size()) {
            std::size_t dot = key.find('.', start);
            std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
            if (!node->is_object() || !node->contains(part)) {
                return std::nullopt;
            }
            node = &node->at(part);
            if (dot == std::string::npos) {
                return *node;
            }
            start = dot + 1;
        }
        return std::nullopt;
    }

    template <typename T>
    static T convert(const std::string& key, const std::string& raw) {
        if constexpr (std::is_same_v<T, std::string>) {
            return raw;
        } else if constexpr (std::is_same_v<T, bool>) {
            std::string lower = raw;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lower == "true" || lower == "1" || lower == "yes") return true;
            if (lower == "false" || lower == "0" || lower == "no") return false;
            throw std::invalid_argument("Environment override for '" + key + "' is not a boolean: " + raw);
        } else {
            static_assert(std::is_integral_v<T>, "unsupported configuration type");
            try {
                std::size_t used = 0;
                long long value = std::stoll(raw, &used);
                if (used != raw.size()) {
                    throw std::invalid_argument(raw);
                }
                return static_cast<T>(value);
            } catch (const std::exception&) {
                throw std::invalid_argument("Environment override for '" + key + "' is not an integer: " + raw);
            }
        }
    }
};

} // namespace btctax::settings
