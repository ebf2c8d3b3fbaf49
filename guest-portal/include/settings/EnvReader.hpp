#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace portal::settings {

/**
 * @brief Чтение переменных окружения с значениями по умолчанию
 *
 * Ошибка разбора числа считается ошибкой конфигурации при старте,
 * поэтому getInt бросает std::invalid_argument.
 */
class EnvReader {
public:
    static std::string getString(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return (value && *value) ? std::string(value) : defaultValue;
    }

    static int getInt(const char* name, int defaultValue) {
        const char* value = std::getenv(name);
        if (!value || !*value) {
            return defaultValue;
        }
        std::string raw(value);
        int parsed = 0;
        size_t consumed = 0;
        try {
            parsed = std::stoi(raw, &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string(name) + " is not an integer: '" + raw + "'");
        }
        if (consumed != raw.size()) {
            throw std::invalid_argument(std::string(name) + " is not an integer: '" + raw + "'");
        }
        return parsed;
    }

    /**
     * @brief true/false/1/0/yes/no без учёта регистра
     *
     * Нераспознанное значение даёт defaultValue с предупреждением.
     */
    static bool getBool(const char* name, bool defaultValue) {
        const char* value = std::getenv(name);
        if (!value || !*value) {
            return defaultValue;
        }

        std::string v(value);
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (v == "true" || v == "1" || v == "t" || v == "yes") return true;
        if (v == "false" || v == "0" || v == "f" || v == "no") return false;

        std::cerr << "[EnvReader] " << name << "='" << value
                  << "' is not a boolean, using default" << std::endl;
        return defaultValue;
    }
};

} // namespace portal::settings
