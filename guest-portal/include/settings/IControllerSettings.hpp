#pragma once

#include <chrono>
#include <string>

namespace portal::settings {

class IControllerSettings {
public:
    virtual ~IControllerSettings() = default;

    virtual std::string getUrl() const = 0;
    virtual std::string getSite() const = 0;
    virtual std::string getUsername() const = 0;
    virtual std::string getPassword() const = 0;
    virtual int getDurationMinutes() const = 0;
    virtual bool isTlsVerifyDisabled() const = 0;
    virtual std::chrono::seconds getTimeout() const = 0;
    virtual std::string getCaFile() const = 0;
};

} // namespace portal::settings
