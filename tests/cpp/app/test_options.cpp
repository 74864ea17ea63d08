#include "app/options.h"

#include <functional>
#include <gtest/gtest.h>
#include <string>
#include <unordered_map>
#include <vector>

using namespace camilla_remote::app;

namespace {

std::vector<char*> makeArgv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return argv;
}

using EnvMap = std::unordered_map<std::string, std::string>;

std::function<const char*(const char*)> makeGetEnv(const EnvMap& env) {
    return [&env](const char* name) -> const char* {
        auto it = env.find(name ? std::string{name} : std::string{});
        if (it == env.end()) {
            return nullptr;
        }
        return it->second.c_str();
    };
}

ParseOptionsResult parse(const std::vector<std::string>& args, const EnvMap& env = {}) {
    auto argv = makeArgv(args);
    return parseOptions(static_cast<int>(argv.size()), argv.data(), "camilla_remote",
                        makeGetEnv(env));
}

}  // namespace

TEST(LogLevel, AcceptsSupportedValues) {
    EXPECT_TRUE(isValidLogLevel("debug"));
    EXPECT_TRUE(isValidLogLevel("WARN"));
    EXPECT_TRUE(isValidLogLevel("warning"));
    EXPECT_TRUE(isValidLogLevel("off"));
    EXPECT_FALSE(isValidLogLevel("verbose"));
    EXPECT_FALSE(isValidLogLevel(""));
}

TEST(ParseOptions, ReturnsDefaultsWhenNoArgs) {
    auto parsed = parse({"camilla_remote"});

    ASSERT_FALSE(parsed.hasError);
    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->configPath, "config.json");
    EXPECT_FALSE(parsed.options->logLevel.has_value());
    EXPECT_FALSE(parsed.options->writeConfigsDir.has_value());
}

TEST(ParseOptions, ParsesProvidedArguments) {
    auto parsed = parse({"camilla_remote", "-c", "/etc/camilla_remote.json", "--log-level",
                         "DEBUG", "--write-configs", "/tmp/out"});

    ASSERT_FALSE(parsed.hasError);
    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->configPath, "/etc/camilla_remote.json");
    EXPECT_EQ(parsed.options->logLevel, "debug");
    EXPECT_EQ(parsed.options->writeConfigsDir, "/tmp/out");
}

TEST(ParseOptions, EnvironmentProvidesDefaults) {
    EnvMap env{{"CAMILLA_REMOTE_CONFIG", "/srv/remote.json"},
               {"CAMILLA_REMOTE_LOG_LEVEL", "Trace"}};
    auto parsed = parse({"camilla_remote"}, env);

    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->configPath, "/srv/remote.json");
    EXPECT_EQ(parsed.options->logLevel, "trace");
}

TEST(ParseOptions, CommandLineOverridesEnvironment) {
    EnvMap env{{"CAMILLA_REMOTE_CONFIG", "/srv/remote.json"}};
    auto parsed = parse({"camilla_remote", "--config", "local.json"}, env);

    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->configPath, "local.json");
}

TEST(ParseOptions, RejectsInvalidEnvironmentLogLevel) {
    EnvMap env{{"CAMILLA_REMOTE_LOG_LEVEL", "chatty"}};
    auto parsed = parse({"camilla_remote"}, env);

    EXPECT_TRUE(parsed.hasError);
    EXPECT_FALSE(parsed.options.has_value());
    EXPECT_NE(parsed.errorMessage.find("CAMILLA_REMOTE_LOG_LEVEL"), std::string::npos);
}

TEST(ParseOptions, RejectsInvalidLogLevel) {
    auto parsed = parse({"camilla_remote", "--log-level", "loud"});
    EXPECT_TRUE(parsed.hasError);
}

TEST(ParseOptions, RejectsUnknownArgument) {
    auto parsed = parse({"camilla_remote", "--frobnicate"});
    EXPECT_TRUE(parsed.hasError);
    EXPECT_EQ(parsed.errorMessage, "Unknown argument: --frobnicate");
}

TEST(ParseOptions, FlagWithoutValueIsUnknown) {
    auto parsed = parse({"camilla_remote", "--config"});
    EXPECT_TRUE(parsed.hasError);
}

TEST(ParseOptions, HelpAndVersionShortCircuit) {
    auto help = parse({"camilla_remote", "--help", "--frobnicate"});
    EXPECT_TRUE(help.showHelp);
    EXPECT_FALSE(help.hasError);
    EXPECT_FALSE(help.options.has_value());

    auto version = parse({"camilla_remote", "-V"});
    EXPECT_TRUE(version.showVersion);
}
