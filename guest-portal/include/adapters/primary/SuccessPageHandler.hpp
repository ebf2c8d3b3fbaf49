#pragma once

#include <IHttpHandler.hpp>
#include "ports/output/IAssetStore.hpp"
#include "application/PageRenderer.hpp"
#include <iostream>
#include <memory>

namespace portal::adapters::primary {

/**
 * @brief Страница подтверждения
 *
 * GET /success → success.html без встраивания токена
 */
class SuccessPageHandler : public IHttpHandler {
public:
    SuccessPageHandler(
        std::shared_ptr<ports::output::IAssetStore> assets,
        std::shared_ptr<application::PageRenderer> renderer
    ) : assets_(std::move(assets))
      , renderer_(std::move(renderer))
    {}

    void handle(IRequest& req, IResponse& res) override {
        auto page = assets_->read("success.html");
        if (!page) {
            std::cerr << "[SuccessPageHandler] success.html not found" << std::endl;
            res.setResult(404, "text/plain", "Not found");
            return;
        }
        res.setResult(200, "text/html", renderer_->render(*page));
    }

private:
    std::shared_ptr<ports::output::IAssetStore> assets_;
    std::shared_ptr<application::PageRenderer> renderer_;
};

} // namespace portal::adapters::primary
