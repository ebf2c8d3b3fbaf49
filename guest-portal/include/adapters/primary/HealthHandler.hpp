#pragma once

#include <IHttpHandler.hpp>
#include "ports/output/IPendingLoginStore.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace portal::adapters::primary {

/**
 * @brief Health check handler
 *
 * GET /health
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<ports::output::IPendingLoginStore> store)
        : store_(std::move(store)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "guest-portal";
        response["version"] = "1.0.0";
        response["pending_logins"] = store_->size();

        res.setStatus(200);
        res.setHeader("Content-Type", "application/json");
        res.setBody(response.dump());
    }

private:
    std::shared_ptr<ports::output::IPendingLoginStore> store_;
};

} // namespace portal::adapters::primary
