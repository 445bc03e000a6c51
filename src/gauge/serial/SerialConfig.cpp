#include "gauge/serial/SerialConfig.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace gauge::serial {

    SerialConfig SerialConfig::usbProfile() {
        SerialConfig config;
        config.name = "usb";
        config.baudrate = 256000;
        config.hardwareFlowControl = true;
        config.readTimeout = std::chrono::milliseconds(100);
        return config;
    }

    SerialConfig SerialConfig::rs232cProfile() {
        SerialConfig config;
        config.name = "rs232c";
        config.baudrate = 19200;
        config.hardwareFlowControl = false;
        config.readTimeout = std::chrono::milliseconds(100);
        return config;
    }

    SerialConfig SerialConfig::fromProfileName(const std::string &profile) {
        std::string key = profile;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (key == "usb") return usbProfile();
        if (key == "rs232c" || key == "serial") return rs232cProfile();

        throw std::invalid_argument("Unknown connection profile: " + profile);
    }

    std::string SerialConfig::describe() const {
        return name + " (" + std::to_string(baudrate) + " baud, flow control " +
               (hardwareFlowControl ? "on" : "off") + ", timeout " +
               std::to_string(readTimeout.count()) + "ms)";
    }

} // namespace gauge::serial
