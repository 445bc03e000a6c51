#include "gauge/discovery/DeviceDiscovery.hpp"
#include "logger/Logger.hpp"
#include <iostream>

int main() {
    try {
        Logger::setLevel(Logger::Level::Warning);

        auto devices = gauge::discovery::findDevices();

        if (devices.empty()) {
            std::cout << "Found no compatible device." << std::endl;
            return 0;
        }

        std::cout << "Found compatible devices:" << std::endl;
        for (const auto &device: devices) {
            std::cout << "- " << device.path << ": " << device.description << std::endl;
        }
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        return 1;
    }

    return 0;
}
