#pragma once

#include <memory>
#include <string>
#include <vector>

#include "application/config/ConfigManager.hpp"
#include "escpos/PrinterSession.hpp"
#include "escpos/Transport.hpp"
#include "escpos/types/Result.hpp"

/**
 * @class ApplicationController
 * @brief Drives the escpos-cli tool
 *
 * - Loads configuration (file, then ESCPOS_* environment)
 * - Sets up logging
 * - Opens the configured transport (serial, tcp or file)
 * - Runs one printer command per invocation on a PrinterSession
 */
class ApplicationController {
public:
    ApplicationController();

    ~ApplicationController();

    /**
     * @brief Load configuration, open the transport and create the session
     * @return true if the printer is reachable and the session is ready
     */
    bool initialize(const std::string &configPath);

    /**
     * @brief Execute one command
     *
     * Supported commands:
     * - print <text...>        print text, feed and cut
     * - cut [feed]             cut, optionally feeding first
     * - drawer | cash          kick the cash drawer
     * - barcode <value> <fmt>  print a barcode (fmt: GS k number)
     * - status <n>             query DLE EOT n and print the byte
     *
     * @return Process exit code
     */
    int run(const std::vector<std::string> &args);

    /**
     * @brief Release session and transport
     */
    void shutdown();

    static void printUsage();

private:
    std::unique_ptr<escpos::Transport> transport_;
    std::unique_ptr<escpos::PrinterSession> session_;
    bool initializationComplete_;

    void initializeLogging(const escpos::config::LoggingConfig &config);

    bool initializeTransport(const escpos::config::TransportConfig &config);

    int runPrint(const std::vector<std::string> &args);

    int runBarcode(const std::vector<std::string> &args);

    int runStatus(const std::vector<std::string> &args);

    static int reportResult(const std::string &command, const escpos::types::Result &result);
};
