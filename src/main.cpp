#include "application/controllers/ApplicationController.hpp"
#include "logger/Logger.hpp"
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
    std::string configPath = "config.json";
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            ApplicationController::printUsage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    try {
        ApplicationController app;
        if (!app.initialize(configPath)) {
            Logger::logError("Application initialization failed");
            return 1;
        }

        int rc = app.run(args);
        app.shutdown();
        return rc;
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        return 1;
    }
}
