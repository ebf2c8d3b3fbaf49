#pragma once

#include "settings/IControllerSettings.hpp"

namespace portal::tests::mocks {

class StubControllerSettings : public settings::IControllerSettings {
public:
    std::string url = "https://unifi.local:8443";
    std::string site = "default";
    int durationMinutes = 480;
    bool tlsVerifyDisabled = true;
    std::chrono::seconds timeout{10};

    std::string getUrl() const override { return url; }
    std::string getSite() const override { return site; }
    std::string getUsername() const override { return "admin"; }
    std::string getPassword() const override { return "secret"; }
    int getDurationMinutes() const override { return durationMinutes; }
    bool isTlsVerifyDisabled() const override { return tlsVerifyDisabled; }
    std::chrono::seconds getTimeout() const override { return timeout; }
    std::string getCaFile() const override { return ""; }
};

} // namespace portal::tests::mocks
