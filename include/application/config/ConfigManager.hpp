#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <mutex>
#include <vector>

namespace escpos::config {
    struct TransportConfig {
        std::string type = "serial"; // serial | tcp | file
        std::string serialDevice = "/dev/ttyUSB0";
        uint32_t serialBaudrate = 19200;
        std::string tcpHost = "192.168.1.100";
        uint16_t tcpPort = 9100;
        std::string filePath = "/dev/usb/lp0";
        bool fileReadable = true;
    };

    struct PrinterConfig {
        std::string charset = "GB18030";
        bool initOnStart = true;
    };

    struct LoggingConfig {
        std::string directory = "logs";
        std::string level = "info";
        bool fileEnabled = false;
    };

    class ConfigManager {
    public:
        static ConfigManager &getInstance();

        /**
         * @brief Restores defaults, then overlays the JSON file. Nested objects
         * become dotted keys ({"serial": {"device": ...}} -> "serial.device").
         * A missing or malformed file leaves the defaults in place.
         */
        void loadFromFile(const std::string &configPath = "config.json");

        /**
         * @brief Overlays ESCPOS_* variables, ESCPOS_SERIAL_DEVICE -> "serial.device".
         */
        void loadFromEnv();

        void set(const std::string &key, const std::string &value);

        TransportConfig getTransportConfig() const;

        PrinterConfig getPrinterConfig() const;

        LoggingConfig getLoggingConfig() const;

        // Generic getters with defaults
        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

    private:
        ConfigManager();

        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;

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
        } catch (const std::exception &) {
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
} // namespace escpos::config
