// thermo_enforcer: runs a ThermodynamicEnforcer over the shard files named
// in a JSON configuration until SIGINT or SIGTERM.
// Run: ./thermo_enforcer enforcer.json [--log-level debug]

#include <iostream>
#include <string>
#include <sstream>
#include <stdexcept>
#include <csignal>
#include <pthread.h>

#include "AuditLog.h"
#include "EnforcerConfig.h"
#include "EnvironmentProbe.h"
#include "ShardStore.h"
#include "ThermodynamicEnforcer.h"

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <config.json> [--log-level debug|info|warning|error|critical]" << std::endl;
}

// Prints every alert to stdout as indented JSON. Runs on the cycle thread,
// so the block goes out in one locked write.
void printAlert(const Alert& alert) {
    std::ostringstream out;
    out << "!!! ALERT: " << alertKindName(alert.kind) << " !!!" << std::endl;
    out << alert.toJson().dump(2);
    if (alert.kind == AlertKind::CryptographicApoptosis) {
        out << std::endl << "Taking emergency measures to protect system integrity...";
    }
    AuditLog::print(out.str());
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string configPath = argv[1];
    std::string levelOverride;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            levelOverride = argv[++i];
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    EnforcerConfig config;
    try {
        config = EnforcerConfig::loadFromFile(configPath);
        if (!levelOverride.empty()) {
            config.logLevel = levelOverride;
        }
        AuditLog::setLevel(AuditLog::parseLevel(config.logLevel));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    if (!config.logFile.empty() && !AuditLog::setLogFile(config.logFile)) {
        std::cerr << "Continuing with console logging only." << std::endl;
    }

    // Block the termination signals before any thread starts so that only
    // sigwait() below receives them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        std::cerr << "Unable to block termination signals" << std::endl;
        return 1;
    }

    FileShardStore store;
    SimulatedTemperatureProbe probe;
    ThermodynamicEnforcer enforcer(config, store, probe);
    enforcer.registerAlertCallback(printAlert);

    if (!enforcer.start()) {
        return 1;
    }
    AuditLog::print("Monitoring started. Press Ctrl+C to stop...");

    int received = 0;
    if (sigwait(&signals, &received) != 0) {
        std::cerr << "sigwait failed" << std::endl;
    } else {
        AuditLog::info("thermo_enforcer", "Received signal " + std::to_string(received) + ", shutting down");
    }

    bool clean = enforcer.stop();
    AuditLog::print("Monitoring stopped.");
    return clean ? 0 : 1;
}
