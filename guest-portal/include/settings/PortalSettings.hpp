#pragma once

#include "settings/EnvReader.hpp"
#include <string>

namespace portal::settings {

/**
 * @brief Настройки раздачи страниц портала
 *
 * Читает из ENV:
 * - FRONTEND_DIR: каталог собранного фронтенда (default: "./", при DEBUG_MODE=true: "dist")
 * - VITE_PAGE_TITLE: заголовок страниц (default: "Unifi Guest Portal")
 */
class PortalSettings {
public:
    PortalSettings() {
        std::string defaultDir = EnvReader::getBool("DEBUG_MODE", false) ? "dist" : "./";
        frontendDir_ = EnvReader::getString("FRONTEND_DIR", defaultDir);
        pageTitle_ = EnvReader::getString("VITE_PAGE_TITLE", pageTitle_);
    }

    std::string getFrontendDir() const { return frontendDir_; }
    std::string getPageTitle() const { return pageTitle_; }

private:
    std::string frontendDir_;
    std::string pageTitle_ = "Unifi Guest Portal";
};

} // namespace portal::settings
