#pragma once

#include "../text/PlatformCharset.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include <plog/Severity.h>
#include <toml++/toml.h>

namespace namekit::config
{

struct LoggingSettings
{
    plog::Severity level = plog::info;
    std::string file = "logs/namekit.log";
    bool console = false;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t backup_count = 3;
};

// Settings read from namekit.toml:
//
//   [logging]
//   level = 4                 # plog severity, 0 (none) .. 6 (verbose)
//   file = "logs/namekit.log"
//   console = false
//
//   [platform]
//   preset = "windows"        # or "posix"
//   extra_file_name_chars = ""
//   extra_path_chars = ""
//
// Unknown keys are ignored. Invalid values keep their defaults.
class NamingConfig
{
public:
    explicit NamingConfig(std::string path = "namekit.toml");

    // A missing file is not an error: defaults stay in place.
    bool load();
    bool loadFromString(std::string_view toml_text);

    const LoggingSettings& logging() const { return logging_; }
    text::Platform platform() const { return platform_; }
    const text::PlatformCharset& charset() const { return charset_; }

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    void apply(const toml::table& root);
    void reset();

    std::string config_path_;
    std::string last_error_;
    LoggingSettings logging_;
    text::Platform platform_ = text::Platform::Windows;
    text::PlatformCharset charset_;
};

} // namespace namekit::config
