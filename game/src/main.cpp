#include "App.hpp"
#include <JumpDash/Core/Logger.hpp>
#include <JumpDash/Core/Types.hpp>
#include <JumpDash/Game/GameConfig.hpp>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace {

constexpr const char* DEFAULT_CONFIG_PATH = "jumpdash.conf";

void InitializeLogging(const JumpDash::Game::GameConfig& config) {
    using namespace JumpDash::Core;

    LogSettings settings;
    if (!ParseLogLevel(config.logLevel, settings.level)) {
        settings.level = LogLevel::Info;
    }
    settings.filePath = config.logFile;

    auto& logger = Logger::Instance();
    if (!logger.Start(settings)) {
        // File sink could not be opened; keep going on the console
        settings.filePath.clear();
        logger.Start(settings);
        JUMPDASH_LOG_WARNING_F("Cannot log to %s", config.logFile.c_str());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace JumpDash;

    // Console logging until the config says otherwise
    Core::Logger::Instance().Start(Core::LogSettings{});

    std::string configPath = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;
    Game::GameConfig config;

    std::error_code ec;
    if (std::filesystem::exists(configPath, ec)) {
        auto loaded = Game::GameConfig::LoadFromFile(configPath);
        if (loaded.isSuccess()) {
            config = loaded.value();
        } else {
            JUMPDASH_LOG_ERROR_F("Config %s rejected (%s), using defaults", configPath.c_str(),
                                 std::string(getErrorMessage(loaded.error())).c_str());
        }
    } else if (argc > 1) {
        JUMPDASH_LOG_WARNING_F("Config %s not found, using defaults", configPath.c_str());
    }

    // Reopen with the configured level and sinks
    InitializeLogging(config);

    JUMPDASH_LOG_INFO_F("Jump Dash %s", VERSION_STRING);

    int status = EXIT_SUCCESS;
    {
        Frontend::App app(config);
        if (app.Initialize()) {
            app.Run();
        } else {
            JUMPDASH_LOG_CRITICAL("Failed to initialize game");
            status = EXIT_FAILURE;
        }
        app.Shutdown();
    }

    JUMPDASH_LOG_INFO("Game exited");
    Core::Logger::Instance().Stop();
    return status;
}
