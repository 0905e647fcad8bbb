#include "cli.h"
#include "config_store.h"
#include "http_client.h"
#include "logger.h"
#include "notifier.h"
#include "service_installer.h"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

std::atomic<bool> shutdown_requested(false);

void signalHandler(int) {
    shutdown_requested = true;
}

int main(int argc, char** argv) {
    // Set up signal handlers for graceful shutdown
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        ConfigStore store;

        const char* mode = std::getenv("USAGE_DAEMON_MODE");
        bool daemon_mode = mode && std::string(mode) == "1";
        initLogging(store.getErrorLogPath(), daemon_mode);

        CurlGlobal curl;
        CurlHttpClient http;
        DesktopNotifier notifier;
        ServiceInstaller installer(store);

        Cli cli(store, http, notifier, installer, std::cin, std::cout, std::cerr);
        return cli.run(std::vector<std::string>(argv + 1, argv + argc), shutdown_requested);

    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
