#include "application/controllers/ApplicationController.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <csignal>
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace {
    // Global shutdown mechanism
    std::atomic<bool> running{true};
    std::condition_variable shutdownCondition;
    std::mutex shutdownMutex;

    void handleSignal(int) {
        running = false;
        shutdownCondition.notify_all();
    }

    void waitForShutdownSignal() {
        std::unique_lock<std::mutex> lock(shutdownMutex);
        // notify_all from a signal handler is not async-signal-safe, so poll as well
        while (running) {
            shutdownCondition.wait_for(lock, std::chrono::milliseconds(200));
        }
    }

    int exitCodeFor(core::types::ErrorKind kind) {
        switch (kind) {
            case core::types::ErrorKind::Configuration: return 2;
            case core::types::ErrorKind::NotFound: return 3;
            case core::types::ErrorKind::Connectivity: return 4;
            case core::types::ErrorKind::Transfer: return 5;
            default: return 1;
        }
    }

    void printUsage() {
        std::cerr << "Usage:\n"
                << "  printer_link discover [timeoutSeconds]\n"
                << "  printer_link status [waitSeconds]\n"
                << "  printer_link watch\n"
                << "  printer_link print <file> <printName>\n"
                << "  printer_link info\n";
    }

    int intArgument(const std::vector<std::string> &args, size_t index, int defaultValue) {
        if (args.size() <= index) return defaultValue;
        try {
            int value = std::stoi(args[index]);
            if (value > 0) return value;
        } catch (const std::exception &) {
        }
        throw std::invalid_argument("Expected a positive number, got '" + args[index] + "'");
    }
}

int main(int argc, char *argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        printUsage();
        return 1;
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    const std::string &command = args[0];
    try {
        ApplicationController app;
        app.initialize();

        if (command == "discover") {
            app.discover(intArgument(args, 1, app.discoveryTimeoutSeconds()));
        } else if (command == "status") {
            app.status(intArgument(args, 1, 5));
        } else if (command == "watch") {
            app.watch(waitForShutdownSignal);
        } else if (command == "print" && args.size() == 3) {
            app.print(args[1], args[2]);
        } else if (command == "info") {
            app.info();
        } else {
            printUsage();
            return 1;
        }

        app.shutdown();
    } catch (const core::types::PrinterLinkException &ex) {
        Logger::logError("[" + core::types::toString(ex.kind()) + "] " + ex.what());
        return exitCodeFor(ex.kind());
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        return 1;
    }

    return 0;
}
