#pragma once

#include "gauge/serial/SerialConfig.hpp"
#include "gauge/types/WireCodes.hpp"
#include "logger/Logger.hpp"
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <stdexcept>

namespace gauge::config {
    /**
     * @brief Impostazioni degli strumenti a riga di comando.
     */
    struct ToolConfig {
        std::string port;                 // empty: first discovered device
        serial::SerialConfig connection = serial::SerialConfig::usbProfile();
        int samples = 10;
        int intervalMs = 100;
        types::Unit unit = types::Unit::Newton;
        types::Mode mode = types::Mode::Realtime;
        bool zeroBeforeMeasure = false;
        std::string logFolder = "logs";
        bool logToFile = false;
        Logger::Level logLevel = Logger::Level::Info;
    };

    class ConfigManager {
    public:
        static ConfigManager &getInstance();

        // Load configuration
        void loadFromFile(const std::string &configPath = "gauge.json");

        void loadFromEnv();

        /**
         * @brief Torna ai valori di default, dimenticando file e variabili lette.
         */
        void reset();

        void set(const std::string &key, const std::string &value);

        /**
         * @brief Configurazione tipizzata per gli strumenti.
         * @throws std::invalid_argument se un valore non è interpretabile.
         */
        ToolConfig getToolConfig() const;

        // Generic getters with defaults
        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        // Validation
        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

    private:
        ConfigManager();

        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;
        std::string configPath_;

        void setDefaults();
    };

    // Template specializations
    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stoi(it->second);
        } catch (const std::logic_error &) {
            return defaultValue;
        }
    }

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : defaultValue;
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        return it->second == "true" || it->second == "1";
    }
} // namespace gauge::config
