#include "backup.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config <path>] [--check-config] [--once <source>] [--decrypt <in> <out>]" << std::endl;
}

int decryptFile(const std::string& input, const std::string& output) {
    const char* password = std::getenv("ENCRYPTION_PASSWORD");
    if (!password || *password == '\0') {
        std::cerr << "Error: ENCRYPTION_PASSWORD must be set to decrypt" << std::endl;
        return 1;
    }
    Aes256EncryptionStrategy strategy(password);
    auto result = strategy.decrypt(input, output);
    if (!result) {
        std::cerr << "Error: " << describeError(result.error()) << std::endl;
        return 1;
    }
    std::cout << "Decrypted " << input << " to " << output << std::endl;
    return 0;
}

}

int main(int argc, char* argv[]) {
    std::string configFile = "snapvault.json";
    std::string onceSource;
    std::string decryptIn;
    std::string decryptOut;
    bool checkOnly = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--check-config") {
            checkOnly = true;
        } else if (arg == "--once" && i + 1 < argc) {
            onceSource = argv[++i];
        } else if (arg == "--decrypt" && i + 2 < argc) {
            decryptIn = argv[++i];
            decryptOut = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (!decryptIn.empty()) {
        return decryptFile(decryptIn, decryptOut);
    }

    std::unique_ptr<BackupConfig> config;
    try {
        config = std::make_unique<BackupConfig>(configFile);
    } catch (const ConfigError& e) {
        std::cerr << "Error: Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    if (checkOnly) {
        std::cout << "Configuration OK: " << config->sources.size() << " source(s)" << std::endl;
        return 0;
    }

    Logger::configure(config->logFile, config->errorLogFile, config->debug);

    try {
        BackupService service(std::move(*config));
        if (!onceSource.empty()) {
            return service.runOnce(onceSource);
        }
        return service.runDaemon();
    } catch (const std::exception& e) {
        Logger::logError(std::format("Daemon failed to start: {}", e.what()));
        return 1;
    }
}
