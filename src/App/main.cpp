/**
 * @file main.cpp
 * @brief tether executable: keeps captive-portal sessions alive
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 *
 * Usage: tether <config-file>
 *
 * One session is started per configured account. SIGINT or SIGTERM stops
 * every session; each logs out before the process exits.
 */

#include <Tether/Core/Config.hpp>
#include <Tether/Core/Logger.hpp>
#include <Tether/Core/Types.hpp>
#include <Tether/Portal/SessionEngine.hpp>
#include <Tether/Portal/SessionRunner.hpp>

#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <pthread.h>
#include <signal.h>

using namespace Tether;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <config-file>\n"
              << "\n"
              << "Keeps captive-portal sessions authenticated.\n"
              << "\n"
              << "Options:\n"
              << "  --help     Show this message\n"
              << "  --version  Show version information\n";
}

std::string errorText(ErrorCode code) {
    return std::string(getErrorMessage(code));
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 2) {
        printUsage(argv[0]);
        return 1;
    }

    if (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0) {
        printUsage(argv[0]);
        return 0;
    }
    if (std::strcmp(argv[1], "--version") == 0) {
        std::cout << "tether " << VERSION_STRING << "\n";
        return 0;
    }

    // Block termination signals before any thread exists so every session
    // thread inherits the mask and sigwait() below receives them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        std::cerr << "tether: cannot block signals\n";
        return 1;
    }

    Config::ConfigLoader loader;
    auto map = loader.load(argv[1]);
    if (map.isFailure()) {
        std::cerr << "tether: " << argv[1] << ": " << errorText(map.error()) << "\n";
        return 1;
    }

    auto accounts = Config::KeeperConfig::accountsFromMap(map.value());
    if (accounts.isFailure()) {
        std::cerr << "tether: " << argv[1] << ": " << errorText(accounts.error()) << "\n";
        return 1;
    }

    // Logging settings are shared; every account inherits them
    const Config::KeeperConfig& first = accounts.value().front();
    Core::LogOutput outputs = Core::LogOutput::Console;
    if (!first.logFile.empty()) {
        outputs = outputs | Core::LogOutput::File;
    }
    if (!Core::Logger::Instance().Initialize(Core::parseLogLevel(first.logLevel), outputs, first.logFile)) {
        std::cerr << "tether: cannot initialize logging\n";
        return 1;
    }

    std::vector<std::unique_ptr<Portal::SessionEngine>> engines;
    for (const auto& account : accounts.value()) {
        auto engine = Portal::SessionEngine::create(account);
        if (engine.isFailure()) {
            TETHER_LOG_CRITICAL_F("cannot create session for %s: %s",
                                  account.username.empty() ? "<unset>" : account.username.c_str(),
                                  errorText(engine.error()).c_str());
            Core::Logger::Instance().Shutdown();
            return 1;
        }
        engines.push_back(std::move(engine.value()));
    }

    std::vector<std::unique_ptr<Portal::SessionRunner>> runners;
    for (auto& engine : engines) {
        auto runner = std::make_unique<Portal::SessionRunner>(std::move(engine));
        auto started = runner->start();
        if (started.isFailure()) {
            TETHER_LOG_CRITICAL_F("%scannot start session: %s", runner->engine().logPrefix().c_str(),
                                  errorText(started.error()).c_str());
            runners.clear();
            Core::Logger::Instance().Shutdown();
            return 1;
        }
        runners.push_back(std::move(runner));
    }

    int received = 0;
    if (sigwait(&signals, &received) != 0) {
        TETHER_LOG_ERROR("sigwait failed; stopping sessions");
    } else {
        TETHER_LOG_INFO_F("received %s, stopping %zu session(s)", strsignal(received), runners.size());
    }

    // Cancel everything first so the logouts run in parallel
    for (auto& runner : runners) {
        runner->engine().lifetime()->cancel();
    }
    for (auto& runner : runners) {
        runner->stop();
    }

    Core::Logger::Instance().Shutdown();
    return 0;
}
