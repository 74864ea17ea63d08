#pragma once

#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace camilla_remote::app {

struct Options {
    std::string configPath{"config.json"};
    // Overrides the "logging.level" config key when set
    std::optional<std::string> logLevel;
    // Write every catalog entry as "<source>-<topology>.yml" into this directory and exit
    std::optional<std::string> writeConfigsDir;
};

struct ParseOptionsResult {
    std::optional<Options> options;
    bool showHelp{false};
    bool showVersion{false};
    bool hasError{false};
    std::string errorMessage;
};

bool isValidLogLevel(std::string_view value);

ParseOptionsResult parseOptions(
    int argc, char** argv, std::string_view programName,
    const std::function<const char*(const char*)>& getenvFn = ::getenv);
void printHelp(std::string_view programName);
void printVersion(std::string_view programName);

}  // namespace camilla_remote::app
