#pragma once

#include "../config/NamingConfig.hpp"

#include <memory>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace namekit::utils
{

// Owns the plog appenders of the default logger instance. Library code
// logs through PLOG_* unconditionally; until Initialize() runs those
// records are dropped.
class LogManager
{
public:
    static bool Initialize(const config::LoggingSettings& settings);
    static void Shutdown();

    static bool IsInitialized();
    static plog::Severity GetLogLevel();
    static void SetLogLevel(plog::Severity level);

private:
    LogManager() = default;

    static bool PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
    static config::LoggingSettings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace namekit::utils
