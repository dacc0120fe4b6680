#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// plog instance that writes to stderr, chained behind the default file logger
inline constexpr int kConsoleLogInstance = 1;

/**
 * @brief Process logging setup on top of plog.
 *
 * Initialize() reads the defaults from config.toml:
 *   [global]    append_logs = true|false
 *   [app.debug] logging_level = 0..6 or a plog severity name ("debug", "warning", ...)
 *
 * Open() then creates the rolling file logger and, optionally, a stderr logger with its own
 * threshold so that stdout stays reserved for caption output. plog loggers are static, so
 * Open() succeeds at most once per process.
 */
class LogManager
{
public:
    struct Settings
    {
        std::string filepath = "logs/run.log";
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool console = true;
        plog::Severity console_level = plog::warning;
    };

    static bool Initialize(const std::string& config_path = "config.toml");
    static bool Open(const Settings& settings);
    static void Shutdown();

    static bool IsAppendMode();
    static plog::Severity GetDefaultLogLevel();

    // Creates the parent directory of a log file path
    static void PrepareLogDirectory(const std::string& filepath);

private:
    LogManager() = default;

    static void ReadConfig(const std::string& config_path);

    static bool s_initialized;
    static bool s_opened;
    static bool s_append_logs;
    static plog::Severity s_default_level;
    static std::unique_ptr<plog::IAppender> s_file_appender;
    static std::unique_ptr<plog::IAppender> s_console_appender;
};

} // namespace utils
