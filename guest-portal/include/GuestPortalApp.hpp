#pragma once

#include <BoostBeastApplication.hpp>
#include <PeriodicTask.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/ControllerSettings.hpp"
#include "settings/PortalSettings.hpp"
#include "settings/PendingLoginSettings.hpp"
#include "settings/DbSettings.hpp"

// Application
#include "application/GuestAuthorizationService.hpp"
#include "application/PageRenderer.hpp"
#include "application/PendingLoginSweepCommand.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryPendingLoginStore.hpp"
#include "adapters/secondary/UnifiControllerClient.hpp"
#include "adapters/secondary/ControllerHttpClient.hpp"
#include "adapters/secondary/PostgresAuditSink.hpp"
#include "adapters/secondary/FileSystemAssetStore.hpp"

// Primary Adapters
#include "adapters/primary/CaptivePortalHandler.hpp"
#include "adapters/primary/SuccessPageHandler.hpp"
#include "adapters/primary/GuestLoginHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

namespace di = boost::di;

namespace portal {

/**
 * @brief Guest Portal Application
 *
 * Captive portal для гостевой сети UniFi: выдаёт страницу входа,
 * авторизует гостя на контроллере и пишет журнал в PostgreSQL.
 * Фоновая очистка ожидающих входов живёт, пока живёт приложение.
 */
class GuestPortalApp : public BoostBeastApplication {
public:
    GuestPortalApp() {
        std::cout << "[GuestPortalApp] Initializing..." << std::endl;
    }

    ~GuestPortalApp() override {
        shutdownBackgroundTasks();
        std::cout << "[GuestPortalApp] Shutting down..." << std::endl;
    }

    /**
     * @brief Остановить очистку кэша (вызывается из main после run())
     */
    void shutdownBackgroundTasks() {
        if (janitor_) {
            janitor_->stop();
        }
    }

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        // Старое имя переменной порта; SERVER_PORT имеет приоритет
        if (const char* port = std::getenv("PORT")) {
            setenv("SERVER_PORT", port, 0);
        }
        setenv("SERVER_PORT", "3030", 0);
        setenv("SERVER_HOST", "0.0.0.0", 0);

        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[GuestPortalApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[GuestPortalApp] Configuring DI..." << std::endl;

        // Шаг 1: настройки (конструкторы бросают std::invalid_argument)
        auto controllerSettings = std::make_shared<settings::ControllerSettings>();
        auto pendingSettings = std::make_shared<settings::PendingLoginSettings>();

        // Шаг 2: транспорт к контроллеру (http и https, с таймаутом UNIFI_TIMEOUT_SECONDS)
        std::shared_ptr<IHttpClient> httpClient =
            std::make_shared<adapters::secondary::ControllerHttpClient>(controllerSettings);

        auto store = std::make_shared<adapters::secondary::InMemoryPendingLoginStore>();

        auto injector = di::make_injector(
            di::bind<settings::IControllerSettings>().to(
                std::static_pointer_cast<settings::IControllerSettings>(controllerSettings)),
            di::bind<settings::PortalSettings>().in(di::singleton),
            di::bind<settings::DbSettings>().in(di::singleton),

            di::bind<IHttpClient>().to(httpClient),
            di::bind<ports::output::IPendingLoginStore>().to(
                std::static_pointer_cast<ports::output::IPendingLoginStore>(store)),
            di::bind<ports::output::IControllerAuthClient>().to<adapters::secondary::UnifiControllerClient>().in(di::singleton),
            di::bind<ports::output::IAuditSink>().to<adapters::secondary::PostgresAuditSink>().in(di::singleton),
            di::bind<ports::output::IAssetStore>().to<adapters::secondary::FileSystemAssetStore>().in(di::singleton),

            di::bind<application::PageRenderer>().in(di::singleton),
            di::bind<ports::input::IGuestAuthorizationService>().to<application::GuestAuthorizationService>().in(di::singleton));

        // Шаг 3: HTTP handlers
        auto portalHandler = injector.create<std::shared_ptr<adapters::primary::CaptivePortalHandler>>();
        handlers_[getHandlerKey("GET", "/")] = portalHandler;
        handlers_[getHandlerKey("GET", "/guest/s/default/")] = portalHandler;
        handlers_[getHandlerKey("GET", "/*")] = portalHandler;
        handlers_[getHandlerKey("GET", "/assets/*")] = portalHandler;

        handlers_[getHandlerKey("GET", "/success")] = injector.create<std::shared_ptr<adapters::primary::SuccessPageHandler>>();
        handlers_[getHandlerKey("POST", "/api/login")] = injector.create<std::shared_ptr<adapters::primary::GuestLoginHandler>>();
        handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

        // Шаг 4: фоновая очистка просроченных ожидающих входов
        auto sweep = std::make_shared<application::PendingLoginSweepCommand>(store, pendingSettings->getMaxAge());
        janitor_ = std::make_unique<PeriodicTask>("pending-login-sweep", sweep, pendingSettings->getSweepInterval());
        janitor_->start();

        std::cout << "[GuestPortalApp] Ready, controller: " << controllerSettings->getUrl()
                  << ", site: " << controllerSettings->getSite() << std::endl;
    }

private:
    std::unique_ptr<PeriodicTask> janitor_;
};

} // namespace portal
