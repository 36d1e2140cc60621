#include "LogManager.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <system_error>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace namekit::utils
{

bool LogManager::s_initialized = false;
config::LoggingSettings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const config::LoggingSettings& settings)
{
    if (s_initialized)
        return true;

    // plog keeps raw appender pointers for the life of the process, so a
    // logger that was shut down is re-enabled rather than re-created
    if (!s_appenders.empty())
    {
        SetLogLevel(settings.level);
        s_initialized = true;
        if (settings.file != s_settings.file || settings.console != s_settings.console)
        {
            PLOG_WARNING << "Logging re-initialized with different appender settings (file " << settings.file
                         << ", console " << (settings.console ? "on" : "off") << "); keeping " << s_settings.file
                         << ", console " << (s_settings.console ? "on" : "off");
        }
        return true;
    }

    if (!PrepareLogDirectory(settings.file))
        return false;

    try
    {
        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            settings.file.c_str(), settings.max_file_size, static_cast<int>(settings.backup_count));

        plog::Logger<PLOG_DEFAULT_INSTANCE_ID>& logger = plog::init(settings.level, file_appender.get());

        if (settings.console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        s_appenders.push_back(std::move(file_appender));
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Failed to initialize logging to " << settings.file << ": " << ex.what() << std::endl;
        return false;
    }

    s_settings = settings;
    s_initialized = true;
    PLOG_INFO << "Logging initialized (" << plog::severityToString(settings.level) << ") -> " << settings.file;
    return true;
}

void LogManager::Shutdown()
{
    SetLogLevel(plog::none);
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

plog::Severity LogManager::GetLogLevel()
{
    if (auto logger = plog::get())
        return logger->getMaxSeverity();
    return plog::none;
}

void LogManager::SetLogLevel(plog::Severity level)
{
    if (auto logger = plog::get())
        logger->setMaxSeverity(level);
}

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    std::filesystem::path dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        std::cerr << "Unable to prepare log directory " << dir.string() << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

} // namespace namekit::utils
