#pragma once

#include "settings/PortalSettings.hpp"
#include <memory>
#include <string>

namespace portal::application {

/**
 * @brief Подстановки в HTML страницы портала
 *
 * - %VITE_PAGE_TITLE% заменяется на заголовок из настроек (все вхождения)
 * - токен ожидающего входа встраивается перед первым </body>
 */
class PageRenderer {
public:
    static constexpr const char* TITLE_PLACEHOLDER = "%VITE_PAGE_TITLE%";

    explicit PageRenderer(std::shared_ptr<settings::PortalSettings> settings)
        : pageTitle_(settings->getPageTitle())
    {}

    std::string render(std::string html, const std::string& token = "") const {
        if (!token.empty()) {
            html = embedToken(std::move(html), token);
        }
        return replaceTitle(std::move(html));
    }

    const std::string& pageTitle() const { return pageTitle_; }

private:
    std::string pageTitle_;

    static std::string embedToken(std::string html, const std::string& token) {
        auto pos = html.find("</body>");
        if (pos == std::string::npos) {
            return html;
        }
        html.insert(pos, "<script>window.cacheId = \"" + token + "\";</script>");
        return html;
    }

    std::string replaceTitle(std::string html) const {
        const std::string placeholder = TITLE_PLACEHOLDER;
        size_t pos = 0;
        while ((pos = html.find(placeholder, pos)) != std::string::npos) {
            html.replace(pos, placeholder.size(), pageTitle_);
            pos += pageTitle_.size();
        }
        return html;
    }
};

} // namespace portal::application
