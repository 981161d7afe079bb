#include "application/config/ConfigManager.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>

extern char **environ;

namespace escpos::config {
    namespace {
        const std::string ENV_PREFIX = "ESCPOS_";
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
        setDefaults();

        if (!std::filesystem::exists(configPath)) {
            Logger::logWarning("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            return;
        }

        try {
            std::ifstream file(configPath);
            nlohmann::json json;
            file >> json;

            // Flatten JSON into key-value pairs
            std::function<void(const nlohmann::json &, const std::string &)> flatten;
            flatten = [&](const nlohmann::json &obj, const std::string &prefix) {
                for (auto it = obj.begin(); it != obj.end(); ++it) {
                    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                    if (it.value().is_object()) {
                        flatten(it.value(), key);
                    } else if (it.value().is_string()) {
                        config_[key] = it.value().get<std::string>();
                    } else {
                        config_[key] = it.value().dump();
                    }
                }
            };

            flatten(json, "");

            Logger::logInfo(
                "[ConfigManager] Loaded " + std::to_string(config_.size()) + " settings from " + configPath);
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Failed to load config: " + std::string(e.what()));
            setDefaults();
        }
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        int loaded = 0;
        for (char **env = environ; env && *env; ++env) {
            std::string entry = *env;
            if (entry.compare(0, ENV_PREFIX.size(), ENV_PREFIX) != 0) continue;

            auto eq = entry.find('=');
            if (eq == std::string::npos) continue;

            // Convert ESCPOS_SERIAL_DEVICE to serial.device
            std::string key = entry.substr(ENV_PREFIX.size(), eq - ENV_PREFIX.size());
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            std::replace(key.begin(), key.end(), '_', '.');

            config_[key] = entry.substr(eq + 1);
            loaded++;
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_[key] = value;
    }

    TransportConfig ConfigManager::getTransportConfig() const {
        TransportConfig config;
        config.type = get<std::string>("transport.type", config.type);
        config.serialDevice = get<std::string>("serial.device", config.serialDevice);
        config.serialBaudrate = static_cast<uint32_t>(get<int>("serial.baudrate", 19200));
        config.tcpHost = get<std::string>("tcp.host", config.tcpHost);
        config.tcpPort = static_cast<uint16_t>(get<int>("tcp.port", 9100));
        config.filePath = get<std::string>("file.path", config.filePath);
        config.fileReadable = get<bool>("file.readable", config.fileReadable);
        return config;
    }

    PrinterConfig ConfigManager::getPrinterConfig() const {
        PrinterConfig config;
        config.charset = get<std::string>("printer.charset", config.charset);
        config.initOnStart = get<bool>("printer.init.on.start", config.initOnStart);
        return config;
    }

    LoggingConfig ConfigManager::getLoggingConfig() const {
        LoggingConfig config;
        config.directory = get<std::string>("logging.directory", config.directory);
        config.level = get<std::string>("logging.level", config.level);
        config.fileEnabled = get<bool>("logging.file.enabled", config.fileEnabled);
        return config;
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;

        std::string type = get<std::string>("transport.type", "");
        if (type != "serial" && type != "tcp" && type != "file") {
            result.errors.push_back("transport.type must be one of serial, tcp, file");
        }

        if (get<int>("serial.baudrate", -1) <= 0) {
            result.errors.push_back("serial.baudrate must be > 0");
        }

        int port = get<int>("tcp.port", -1);
        if (port <= 0 || port > 65535) {
            result.errors.push_back("tcp.port must be in 1-65535");
        }

        if (get<std::string>("printer.charset", "").empty()) {
            result.errors.push_back("printer.charset must not be empty");
        }

        std::string level = get<std::string>("logging.level", "");
        if (level != "debug" && level != "info" && level != "warning" && level != "error") {
            result.errors.push_back("logging.level must be one of debug, info, warning, error");
        }

        result.isValid = result.errors.empty();
        return result;
    }

    void ConfigManager::setDefaults() {
        config_.clear();

        // Transport defaults
        config_["transport.type"] = "serial";
        config_["serial.device"] = "/dev/ttyUSB0";
        config_["serial.baudrate"] = "19200";
        config_["tcp.host"] = "192.168.1.100";
        config_["tcp.port"] = "9100";
        config_["file.path"] = "/dev/usb/lp0";
        config_["file.readable"] = "true";

        // Printer defaults
        config_["printer.charset"] = "GB18030";
        config_["printer.init.on.start"] = "true";

        // Logging defaults
        config_["logging.directory"] = "logs";
        config_["logging.level"] = "info";
        config_["logging.file.enabled"] = "false";
    }
} // namespace escpos::config
