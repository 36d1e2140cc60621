#include "NamingConfig.hpp"
#include "../text/TextUtils.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <utility>

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace namekit::config
{

NamingConfig::NamingConfig(std::string path)
    : config_path_(std::move(path))
{
    reset();
}

void NamingConfig::reset()
{
    logging_ = LoggingSettings{};
    platform_ = text::Platform::Windows;
    charset_ = text::charset_for(platform_);
}

bool NamingConfig::load()
{
    last_error_.clear();
    reset();

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        std::error_code ec;
        if (fs::exists(config_path_, ec))
        {
            last_error_ = "config file exists but cannot be opened: " + config_path_;
            PLOG_WARNING << last_error_;
            return false;
        }
        return true;
    }

    try
    {
        apply(toml::parse(ifs, config_path_));
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        if (pe.source().begin.line > 0)
        {
            last_error_ += " (line " + std::to_string(pe.source().begin.line) + ")";
        }
        PLOG_WARNING << last_error_ << " in " << config_path_ << ", using defaults";
        reset();
        return false;
    }
}

bool NamingConfig::loadFromString(std::string_view toml_text)
{
    last_error_.clear();
    reset();

    try
    {
        apply(toml::parse(toml_text));
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_ << ", using defaults";
        reset();
        return false;
    }
}

void NamingConfig::apply(const toml::table& root)
{
    if (auto logging = root["logging"].as_table())
    {
        if (auto level = (*logging)["level"].value<int64_t>())
        {
            int level_int = static_cast<int>(*level);
            if (level_int >= 0 && level_int <= 6)
                logging_.level = static_cast<plog::Severity>(level_int);
            else
                PLOG_WARNING << "logging.level out of range: " << *level;
        }
        if (auto file = (*logging)["file"].value<std::string>())
        {
            if (!file->empty())
                logging_.file = *file;
        }
        if (auto console = (*logging)["console"].value<bool>())
        {
            logging_.console = *console;
        }
    }

    if (auto platform = root["platform"].as_table())
    {
        if (auto preset = (*platform)["preset"].value<std::string>())
        {
            text::Platform parsed;
            if (text::parse_platform(*preset, parsed))
                platform_ = parsed;
            else
                PLOG_WARNING << "Unknown platform preset '" << *preset << "', keeping " << text::to_string(platform_);
        }

        charset_ = text::charset_for(platform_);

        if (auto extra = (*platform)["extra_file_name_chars"].value<std::string>())
        {
            charset_.invalid_file_name_chars += text::utf8ToUtf32(*extra);
        }
        if (auto extra = (*platform)["extra_path_chars"].value<std::string>())
        {
            std::u32string chars = text::utf8ToUtf32(*extra);
            // a character that breaks a path also breaks a file name
            charset_.invalid_path_chars += chars;
            charset_.invalid_file_name_chars += chars;
        }
    }
}

} // namespace namekit::config
