#include "app/options.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>

namespace camilla_remote::app {
namespace {

constexpr const char* kVersion = "0.1.0";

std::string toLower(std::string_view s) {
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool applyEnvOverrides(Options& opt, ParseOptionsResult& result,
                       const std::function<const char*(const char*)>& getenvFn) {
    if (const char* config = getenvFn("CAMILLA_REMOTE_CONFIG")) {
        opt.configPath = config;
    }
    if (const char* logLevel = getenvFn("CAMILLA_REMOTE_LOG_LEVEL")) {
        if (!isValidLogLevel(logLevel)) {
            result.hasError = true;
            result.errorMessage =
                "Unsupported CAMILLA_REMOTE_LOG_LEVEL. Use one of: "
                "trace|debug|info|warn|error|critical|off";
            return false;
        }
        opt.logLevel = toLower(logLevel);
    }
    return true;
}

}  // namespace

bool isValidLogLevel(std::string_view value) {
    const std::string lower = toLower(value);
    return lower == "trace" || lower == "debug" || lower == "info" || lower == "warn" ||
           lower == "warning" || lower == "error" || lower == "critical" || lower == "off";
}

void printHelp(std::string_view programName) {
    std::cout << "Usage: " << programName
              << " [--config config.json] [--log-level info] [--write-configs DIR]"
              << " [--help] [--version]" << std::endl
              << std::endl
              << "Remote control daemon for a CamillaDSP engine:" << std::endl
              << "  -c, --config       JSON configuration file (default: config.json)"
              << std::endl
              << "  --log-level        trace | debug | info | warn | error | critical | off"
              << std::endl
              << "  --write-configs    Validate every menu combination, write it to DIR"
              << std::endl
              << "                     as <source>-<topology>.yml and exit" << std::endl
              << "  -h, --help         Show this help and exit" << std::endl
              << "  -V, --version      Show version and exit" << std::endl
              << std::endl
              << "Environment overrides: CAMILLA_REMOTE_CONFIG, CAMILLA_REMOTE_LOG_LEVEL"
              << std::endl;
}

ParseOptionsResult parseOptions(int argc, char** argv, std::string_view programName,
                                const std::function<const char*(const char*)>& getenvFn) {
    Options opt{};
    ParseOptionsResult result{};

    if (!applyEnvOverrides(opt, result, getenvFn)) {
        return result;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "-h" || arg == "--help") {
            printHelp(programName);
            result.showHelp = true;
            return result;
        } else if (arg == "-V" || arg == "--version") {
            printVersion(programName);
            result.showVersion = true;
            return result;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            opt.configPath = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            auto lvl = toLower(argv[++i]);
            if (!isValidLogLevel(lvl)) {
                result.hasError = true;
                result.errorMessage =
                    "Unsupported log level. Use one of: trace|debug|info|warn|error|critical|off";
                return result;
            }
            opt.logLevel = lvl;
        } else if (arg == "--write-configs" && i + 1 < argc) {
            opt.writeConfigsDir = std::string(argv[++i]);
        } else {
            result.hasError = true;
            result.errorMessage = std::string("Unknown argument: ") + std::string(arg);
            return result;
        }
    }

    result.options = opt;
    return result;
}

void printVersion(std::string_view programName) {
    std::cout << programName << " version " << kVersion << std::endl;
}

}  // namespace camilla_remote::app
