#include "application/controllers/ApplicationController.hpp"
#include "escpos/command/barcode/BarcodeCommands.hpp"
#include "escpos/command/drawer/DrawerCommands.hpp"
#include "escpos/command/paper/PaperCommands.hpp"
#include "escpos/command/status/StatusCommands.hpp"
#include "escpos/transport/impl/FileTransport.hpp"
#include "escpos/transport/impl/SerialTransport.hpp"
#include "escpos/transport/impl/TcpTransport.hpp"
#include "escpos/types/Error.hpp"
#include "logger/Logger.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

ApplicationController::ApplicationController()
        : initializationComplete_(false) {
}

ApplicationController::~ApplicationController() {
    shutdown();
}

bool ApplicationController::initialize(const std::string &configPath) {
    auto &config = escpos::config::ConfigManager::getInstance();
    config.loadFromFile(configPath);
    config.loadFromEnv();

    initializeLogging(config.getLoggingConfig());

    auto validation = config.validate();
    if (!validation.isValid) {
        for (const auto &error: validation.errors) {
            Logger::logError("[ApplicationController] Invalid configuration: " + error);
        }
        return false;
    }

    if (!initializeTransport(config.getTransportConfig())) {
        return false;
    }

    auto printerConfig = config.getPrinterConfig();
    try {
        session_ = std::make_unique<escpos::PrinterSession>(*transport_, printerConfig.charset);
    } catch (const escpos::types::EncodingException &e) {
        Logger::logError("[ApplicationController] " + std::string(e.what()));
        return false;
    }

    if (printerConfig.initOnStart) {
        auto result = session_->init();
        if (result.isFailure()) {
            Logger::logError("[ApplicationController] Printer init failed: " + result.message);
            return false;
        }
    }

    Logger::logInfo("[ApplicationController] Session ready (charset " + session_->charset() + ")");
    initializationComplete_ = true;
    return true;
}

void ApplicationController::initializeLogging(const escpos::config::LoggingConfig &config) {
    Logger::setLevel(Logger::levelFromString(config.level));
    if (config.fileEnabled) {
        Logger::init(config.directory);
    }
}

bool ApplicationController::initializeTransport(const escpos::config::TransportConfig &config) {
    try {
        if (config.type == "serial") {
            transport_ = std::make_unique<escpos::transport::SerialTransport>(config.serialDevice,
                                                                             config.serialBaudrate);
        } else if (config.type == "tcp") {
            transport_ = std::make_unique<escpos::transport::TcpTransport>(config.tcpHost, config.tcpPort);
        } else {
            transport_ = std::make_unique<escpos::transport::FileTransport>(config.filePath, config.fileReadable);
        }
        return true;
    } catch (const escpos::types::TransportException &e) {
        Logger::logError("[ApplicationController] Transport initialization failed: " + std::string(e.what()));
        return false;
    }
}

int ApplicationController::run(const std::vector<std::string> &args) {
    if (!initializationComplete_) {
        Logger::logError("[ApplicationController] run() called before initialize()");
        return 1;
    }
    if (args.empty()) {
        printUsage();
        return 2;
    }

    const std::string &command = args[0];
    std::vector<std::string> params(args.begin() + 1, args.end());

    if (command == "print") {
        return runPrint(params);
    } else if (command == "cut") {
        auto option = (!params.empty() && params[0] == "feed") ? escpos::FeedOption::Feed
                                                               : escpos::FeedOption::NoFeed;
        return reportResult(command, session_->paper()->feedAndCut(option));
    } else if (command == "drawer") {
        return reportResult(command, session_->drawer()->openDrawer());
    } else if (command == "cash") {
        return reportResult(command, session_->drawer()->cash());
    } else if (command == "barcode") {
        return runBarcode(params);
    } else if (command == "status") {
        return runStatus(params);
    }

    Logger::logError("[ApplicationController] Unknown command: " + command);
    printUsage();
    return 2;
}

int ApplicationController::runPrint(const std::vector<std::string> &args) {
    std::string text;
    for (const auto &arg: args) {
        if (!text.empty()) text += ' ';
        text += arg;
    }

    auto result = session_->writeText(text);
    if (result.isFailure()) {
        return reportResult("print", result);
    }
    result.merge(session_->paper()->linefeed());
    if (result.isFailure()) {
        return reportResult("print", result);
    }
    return reportResult("print", result.merge(session_->paper()->feedAndCut(escpos::FeedOption::Feed)));
}

int ApplicationController::runBarcode(const std::vector<std::string> &args) {
    if (args.size() != 2) {
        printUsage();
        return 2;
    }

    int format = 0;
    try {
        format = std::stoi(args[1]);
    } catch (const std::exception &) {
        Logger::logError("[ApplicationController] Invalid barcode format: " + args[1]);
        return 2;
    }

    if (escpos::command::barcode::BarcodeCommands::typeCode(format).empty()) {
        Logger::logError("[ApplicationController] Unsupported barcode format: " + args[1]);
        return 2;
    }

    return reportResult("barcode", session_->barcode()->barcode(args[0], format));
}

int ApplicationController::runStatus(const std::vector<std::string> &args) {
    int n = 1;
    if (!args.empty()) {
        try {
            n = std::stoi(args[0]);
        } catch (const std::exception &) {
            Logger::logError("[ApplicationController] Invalid status type: " + args[0]);
            return 2;
        }
        if (n < 0 || n > 0xFF) {
            Logger::logError("[ApplicationController] Status type out of range: " + args[0]);
            return 2;
        }
    }

    try {
        uint8_t value = session_->status()->readStatus(static_cast<uint8_t>(n));
        std::ostringstream oss;
        oss << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << static_cast<int>(value);
        std::cout << oss.str() << std::endl;
        return 0;
    } catch (const escpos::types::TransportException &e) {
        Logger::logError("[ApplicationController] Status query failed: " + std::string(e.what()));
        return 1;
    }
}

int ApplicationController::reportResult(const std::string &command, const escpos::types::Result &result) {
    if (result.isFailure()) {
        Logger::logError("[ApplicationController] " + command + " failed: " + result.message);
        return 1;
    }
    if (result.isIgnored()) {
        Logger::logWarning("[ApplicationController] " + command + " ignored: " + result.message);
        return 0;
    }

    Logger::logInfo("[ApplicationController] " + command + " sent (" + std::to_string(result.bytesWritten) +
                    " bytes)");
    return 0;
}

void ApplicationController::shutdown() {
    if (!session_ && !transport_) {
        return;
    }

    session_.reset();
    transport_.reset();
    initializationComplete_ = false;
    Logger::shutdown();
}

void ApplicationController::printUsage() {
    std::cout << "Usage: escpos-cli [--config <file>] <command> [args]\n"
              << "Commands:\n"
              << "  print <text...>          print text, feed and cut\n"
              << "  cut [feed]               cut the paper, optionally feeding first\n"
              << "  drawer                   open the cash drawer\n"
              << "  cash                     cash drawer pulse\n"
              << "  barcode <value> <format> print a barcode (0-4, 73)\n"
              << "  status [n]               query printer status n (1-4)\n";
}
