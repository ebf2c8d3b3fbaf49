#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

namespace portal::utils {

/**
 * @brief Content-Type по расширению файла фронтенда
 */
inline std::string contentTypeFor(const std::string& path) {
    static const std::map<std::string, std::string> types = {
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"js", "application/javascript"},
        {"mjs", "application/javascript"},
        {"json", "application/json"},
        {"map", "application/json"},
        {"svg", "image/svg+xml"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"ico", "image/x-icon"},
        {"woff", "font/woff"},
        {"woff2", "font/woff2"},
        {"ttf", "font/ttf"},
        {"txt", "text/plain"}
    };

    auto slash = path.find_last_of('/');
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "application/octet-stream";
    }

    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

inline bool isHtml(const std::string& path) {
    return contentTypeFor(path) == "text/html";
}

} // namespace portal::utils
