#include "application/config/ConfigManager.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>

namespace gauge::config {
    namespace {
        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        // Accepts the wire code ("N") or the name ("newton")
        types::Unit parseUnitSetting(const std::string &value) {
            if (value.size() == 1) {
                auto unit = types::unitFromWireCode(static_cast<char>(std::toupper(static_cast<unsigned char>(value[0]))));
                if (unit) return *unit;
            }
            std::string key = toLower(value);
            if (key == "newton") return types::Unit::Newton;
            if (key == "kilograms" || key == "kg") return types::Unit::Kilograms;
            throw std::invalid_argument("Invalid gauge.unit: " + value);
        }

        types::Mode parseModeSetting(const std::string &value) {
            if (value.size() == 1) {
                auto mode = types::modeFromWireCode(static_cast<char>(std::toupper(static_cast<unsigned char>(value[0]))));
                if (mode) return *mode;
            }
            std::string key = toLower(value);
            if (key == "realtime") return types::Mode::Realtime;
            if (key == "peak") return types::Mode::Peak;
            throw std::invalid_argument("Invalid gauge.mode: " + value);
        }

        Logger::Level parseLogLevelSetting(const std::string &value) {
            std::string key = toLower(value);
            if (key == "debug") return Logger::Level::Debug;
            if (key == "info") return Logger::Level::Info;
            if (key == "warning") return Logger::Level::Warning;
            if (key == "error") return Logger::Level::Error;
            throw std::invalid_argument("Invalid log.level: " + value);
        }
    }

    ConfigManager &ConfigManager::getInstance() {
        static ConfigManager instance;
        return instance;
    }

    ConfigManager::ConfigManager() {
        setDefaults();
    }

    void ConfigManager::loadFromFile(const std::string &configPath) {
        std::lock_guard<std::mutex> lock(configMutex_);
        configPath_ = configPath;

        if (!std::filesystem::exists(configPath)) {
            Logger::logWarning("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            return;
        }

        try {
            std::ifstream file(configPath);
            nlohmann::json json;
            file >> json;

            std::unordered_map<std::string, std::string> loaded;

            // Flatten JSON into key-value pairs
            std::function<void(const nlohmann::json &, const std::string &)> flatten;
            flatten = [&](const nlohmann::json &obj, const std::string &prefix) {
                for (auto it = obj.begin(); it != obj.end(); ++it) {
                    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                    if (it.value().is_object()) {
                        flatten(it.value(), key);
                    } else if (it.value().is_string()) {
                        loaded[key] = it.value().get<std::string>();
                    } else {
                        loaded[key] = it.value().dump();
                    }
                }
            };

            if (!json.is_object()) {
                throw std::runtime_error("top level value is not an object");
            }
            flatten(json, "");

            for (auto &[key, value]: loaded) {
                config_[key] = std::move(value);
            }

            Logger::logInfo(
                    "[ConfigManager] Loaded " + std::to_string(loaded.size()) + " settings from " + configPath);
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Failed to load config " + configPath + ": " + e.what() +
                             ", using defaults");
            setDefaults();
        }
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        const char *envVars[] = {
                "GAUGE_PORT", "GAUGE_PROFILE", "GAUGE_SAMPLES", "GAUGE_INTERVAL_MS",
                "GAUGE_UNIT", "GAUGE_MODE", "GAUGE_ZERO",
                "LOG_FOLDER", "LOG_LEVEL", "LOG_FILE"
        };

        int loaded = 0;
        for (const char *envVar: envVars) {
            const char *value = std::getenv(envVar);
            if (value) {
                // Convert ENV_VAR_NAME to dot notation
                std::string key = toLower(envVar);
                std::replace(key.begin(), key.end(), '_', '.');

                config_[key] = value;
                loaded++;
            }
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    void ConfigManager::reset() {
        std::lock_guard<std::mutex> lock(configMutex_);
        configPath_.clear();
        setDefaults();
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_[key] = value;
    }

    ToolConfig ConfigManager::getToolConfig() const {
        ToolConfig config;
        config.port = get<std::string>("gauge.port", "");
        config.connection = serial::SerialConfig::fromProfileName(get<std::string>("gauge.profile", "usb"));
        config.samples = get<int>("gauge.samples", 10);
        config.intervalMs = get<int>("gauge.interval.ms", 100);
        config.unit = parseUnitSetting(get<std::string>("gauge.unit", "N"));
        config.mode = parseModeSetting(get<std::string>("gauge.mode", "T"));
        config.zeroBeforeMeasure = get<bool>("gauge.zero", false);
        config.logFolder = get<std::string>("log.folder", "logs");
        config.logToFile = get<bool>("log.file", false);
        config.logLevel = parseLogLevelSetting(get<std::string>("log.level", "info"));
        return config;
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;

        if (get<int>("gauge.samples", -1) < 1) {
            result.errors.push_back("gauge.samples must be >= 1");
        }

        if (get<int>("gauge.interval.ms", -1) < 0) {
            result.errors.push_back("gauge.interval.ms must be >= 0");
        }

        try {
            getToolConfig();
        } catch (const std::invalid_argument &e) {
            result.errors.emplace_back(e.what());
        }

        result.isValid = result.errors.empty();
        return result;
    }

    void ConfigManager::setDefaults() {
        config_.clear();

        // Gauge defaults
        config_["gauge.port"] = "";
        config_["gauge.profile"] = "usb";
        config_["gauge.samples"] = "10";
        config_["gauge.interval.ms"] = "100";
        config_["gauge.unit"] = "N";
        config_["gauge.mode"] = "T";
        config_["gauge.zero"] = "false";

        // Log defaults
        config_["log.folder"] = "logs";
        config_["log.file"] = "false";
        config_["log.level"] = "info";
    }
} // namespace gauge::config
