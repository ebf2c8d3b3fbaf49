#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace portal::utils {

/**
 * @brief Cookie одной сессии контроллера
 *
 * Принимает значение заголовка Set-Cookie. Несколько cookie приходят
 * отдельными строками (через '\n'), атрибуты (Path, Expires, HttpOnly...)
 * отбрасываются. Результат подставляется в заголовок Cookie запроса.
 */
class CookieJar {
public:
    void addSetCookieHeader(const std::string& headerValue) {
        std::istringstream lines(headerValue);
        std::string line;
        while (std::getline(lines, line)) {
            addSetCookieLine(line);
        }
    }

    /**
     * @brief Значение для заголовка Cookie: "a=1; b=2"
     */
    std::string toCookieHeader() const {
        std::string result;
        for (const auto& [name, value] : cookies_) {
            if (!result.empty()) result += "; ";
            result += name + "=" + value;
        }
        return result;
    }

    bool empty() const { return cookies_.empty(); }
    size_t size() const { return cookies_.size(); }

private:
    std::vector<std::pair<std::string, std::string>> cookies_;

    void addSetCookieLine(const std::string& line) {
        std::string pair = trim(line.substr(0, line.find(';')));
        auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            return;
        }

        std::string name = trim(pair.substr(0, eq));
        std::string value = trim(pair.substr(eq + 1));

        auto it = std::find_if(cookies_.begin(), cookies_.end(),
                               [&name](const auto& c) { return c.first == name; });
        if (it != cookies_.end()) {
            it->second = value;
        } else {
            cookies_.emplace_back(std::move(name), std::move(value));
        }
    }

    static std::string trim(const std::string& s) {
        auto begin = std::find_if_not(s.begin(), s.end(),
                                      [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(s.rbegin(), s.rend(),
                                    [](unsigned char c) { return std::isspace(c); }).base();
        return (begin < end) ? std::string(begin, end) : std::string();
    }
};

} // namespace portal::utils
