#include "application/config/ConfigManager.hpp"
#include "gauge/discovery/DeviceDiscovery.hpp"
#include "gauge/session/DeviceSession.hpp"
#include "gauge/types/Measurement.hpp"
#include "logger/Logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {
    std::atomic<bool> running{true};

    void handleSignal(int signal) {
        running = false;
        (void) signal;
    }

    std::string resolvePort(const gauge::config::ToolConfig &config) {
        if (!config.port.empty()) {
            return config.port;
        }

        auto devices = gauge::discovery::findDevices();
        if (devices.empty()) {
            throw std::runtime_error("Found no compatible device");
        }
        Logger::logInfo("Using first compatible device: " + devices.front().path +
                        " (" + devices.front().description + ")");
        return devices.front().path;
    }
}

int main(int argc, char *argv[]) {
    try {
        auto &configManager = gauge::config::ConfigManager::getInstance();
        configManager.loadFromFile(argc > 1 ? argv[1] : "gauge.json");
        configManager.loadFromEnv();

        auto validation = configManager.validate();
        if (!validation.isValid) {
            for (const auto &error: validation.errors) {
                Logger::logError("[Config] " + error);
            }
            return 1;
        }

        const auto config = configManager.getToolConfig();
        Logger::setLevel(config.logLevel);
        if (config.logToFile) {
            Logger::init(config.logFolder);
        }

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        const std::string port = resolvePort(config);

        auto values = gauge::session::withDeviceSession(
                port, config.connection,
                [&config](gauge::protocol::GaugeProtocolHandler &handler) {
                    handler.setUnit(config.unit);
                    handler.setMode(config.mode);
                    if (config.zeroBeforeMeasure) {
                        handler.zero();
                    }

                    std::vector<gauge::types::Decimal> measures;
                    const auto interval = std::chrono::milliseconds(config.intervalMs);
                    auto nextTime = std::chrono::steady_clock::now();

                    for (int i = 0; i < config.samples && running; ++i) {
                        nextTime += interval;

                        auto measure = handler.measure();
                        Logger::logDebug("Measure " + std::to_string(i + 1) + ": " + measure.toString());
                        measures.push_back(measure.value());

                        std::this_thread::sleep_until(nextTime);
                    }
                    return measures;
                });

        std::cout << "Measured data [";
        for (size_t i = 0; i < values.size(); ++i) {
            std::cout << (i ? ", " : "") << values[i].str();
        }
        std::cout << "]" << std::endl;

        Logger::shutdown();
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        Logger::shutdown();
        return 1;
    }

    return 0;
}
