#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IGuestAuthorizationService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace portal::adapters::primary {

/**
 * @brief Отправка формы входа гостя
 *
 * POST /api/login
 * {
 *   "cacheId": "3f2c...",
 *   "username": "John",
 *   "email": "john@example.com"
 * }
 *
 * Response: 303 See Other, Location: /success (при любом исходе авторизации)
 *           400 при некорректном JSON
 */
class GuestLoginHandler : public IHttpHandler {
public:
    explicit GuestLoginHandler(
        std::shared_ptr<ports::input::IGuestAuthorizationService> service
    ) : service_(std::move(service)) {}

    void handle(IRequest& req, IResponse& res) override {
        domain::GuestLoginRequest request;
        try {
            auto body = nlohmann::json::parse(req.getBody());
            if (!body.is_object()) {
                sendError(res, 400, "Invalid JSON body");
                return;
            }
            request.token = body.value("cacheId", "");
            request.displayName = body.value("username", "");
            request.email = body.value("email", "");

        } catch (const nlohmann::json::exception&) {
            sendError(res, 400, "Invalid JSON body");
            return;
        }

        try {
            auto outcome = service_->completeLogin(request);
            std::cout << "[GuestLoginHandler] Login processed: " << domain::toString(outcome) << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[GuestLoginHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
            return;
        }

        res.setStatus(303);
        res.setHeader("Location", "/success");
        res.setBody("");
    }

private:
    std::shared_ptr<ports::input::IGuestAuthorizationService> service_;

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setStatus(status);
        res.setHeader("Content-Type", "application/json");
        res.setBody(error.dump());
    }
};

} // namespace portal::adapters::primary
