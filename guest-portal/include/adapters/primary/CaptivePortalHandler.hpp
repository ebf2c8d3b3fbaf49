#pragma once

#include <IHttpHandler.hpp>
#include "ports/output/IPendingLoginStore.hpp"
#include "ports/output/IAssetStore.hpp"
#include "application/PageRenderer.hpp"
#include "utils/ContentType.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <optional>

namespace portal::adapters::primary {

/**
 * @brief Точка входа captive portal и раздача статики
 *
 * GET /?id=<mac>&ap=<ap_mac>[&cacheId=<token>]
 * GET /guest/s/default/?id=...&ap=...
 * GET /<asset>
 *
 * На страницах входа при наличии id создаётся ожидающий вход, токен
 * встраивается в index.html. Если пришёл cacheId, который ещё есть
 * в хранилище и принадлежит тому же устройству (перезагрузка страницы),
 * встраивается он же.
 * Остальные пути отдаются как файлы фронтенда, иначе 404.
 */
class CaptivePortalHandler : public IHttpHandler {
public:
    CaptivePortalHandler(
        std::shared_ptr<ports::output::IPendingLoginStore> store,
        std::shared_ptr<ports::output::IAssetStore> assets,
        std::shared_ptr<application::PageRenderer> renderer
    ) : store_(std::move(store))
      , assets_(std::move(assets))
      , renderer_(std::move(renderer))
    {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            std::string path = stripQuery(req.getPath());

            if (isLoginPage(path)) {
                serveLoginPage(req, res);
                return;
            }
            serveAsset(path, res);

        } catch (const std::exception& e) {
            std::cerr << "[CaptivePortalHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::output::IPendingLoginStore> store_;
    std::shared_ptr<ports::output::IAssetStore> assets_;
    std::shared_ptr<application::PageRenderer> renderer_;

    static bool isLoginPage(const std::string& path) {
        return path.empty() || path == "/" || path == "/guest/s/default/"
            || path == "/guest/s/default";
    }

    static std::string stripQuery(const std::string& path) {
        auto q = path.find('?');
        return q == std::string::npos ? path : path.substr(0, q);
    }

    static bool hasParentSegment(const std::string& path) {
        size_t start = 0;
        while (start <= path.size()) {
            auto end = path.find('/', start);
            if (end == std::string::npos) end = path.size();
            if (path.compare(start, end - start, "..") == 0) {
                return true;
            }
            start = end + 1;
        }
        return false;
    }

    void serveLoginPage(IRequest& req, IResponse& res) {
        auto page = assets_->read("index.html");
        if (!page) {
            std::cerr << "[CaptivePortalHandler] index.html not found" << std::endl;
            sendError(res, 404, "Not found");
            return;
        }

        std::string token;
        auto deviceId = req.getQueryParam("id").value_or("");
        if (!deviceId.empty()) {
            auto existing = req.getQueryParam("cacheId").value_or("");
            std::optional<domain::PendingLogin> pending;
            if (!existing.empty()) {
                pending = store_->resolve(existing);
            }
            // Токен чужого устройства не переиспользуется
            if (pending && pending->deviceId == deviceId) {
                token = existing;
            } else {
                auto apId = req.getQueryParam("ap").value_or("");
                token = store_->create(deviceId, apId);
                std::cout << "[CaptivePortalHandler] Pending login for " << deviceId
                          << " via " << apId << std::endl;
            }
        }

        res.setStatus(200);
        res.setHeader("Content-Type", "text/html");
        res.setBody(renderer_->render(*page, token));
    }

    void serveAsset(const std::string& path, IResponse& res) {
        std::string relative = path;
        while (!relative.empty() && relative.front() == '/') {
            relative.erase(0, 1);
        }

        if (hasParentSegment(relative)) {
            sendError(res, 404, "Not found");
            return;
        }

        auto content = assets_->read(relative);
        if (!content) {
            sendError(res, 404, "Not found");
            return;
        }

        std::string contentType = utils::contentTypeFor(relative);
        res.setStatus(200);
        res.setHeader("Content-Type", contentType);
        res.setBody(utils::isHtml(relative) ? renderer_->render(*content) : *content);
    }

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setStatus(status);
        res.setHeader("Content-Type", "application/json");
        res.setBody(error.dump());
    }
};

} // namespace portal::adapters::primary
