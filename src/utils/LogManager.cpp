#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <utility>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

namespace
{

// plog::severityFromString only inspects the first letter, so names are matched whole
std::optional<plog::Severity> SeverityFromName(std::string name)
{
    for (auto& c : name)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    static const std::pair<const char*, plog::Severity> kNames[] = {
        { "none", plog::none },       { "fatal", plog::fatal }, { "error", plog::error },
        { "warning", plog::warning }, { "warn", plog::warning }, { "info", plog::info },
        { "debug", plog::debug },     { "verbose", plog::verbose }, { "verb", plog::verbose },
    };
    for (const auto& [known, severity] : kNames)
    {
        if (name == known)
            return severity;
    }
    return std::nullopt;
}

// logging_level accepts the numeric plog severity or its name
std::optional<plog::Severity> ReadSeverity(toml::node_view<const toml::node> node)
{
    if (auto level = node.value<int64_t>())
    {
        if (*level >= plog::none && *level <= plog::verbose)
            return static_cast<plog::Severity>(*level);
        return std::nullopt;
    }

    if (auto name = node.value<std::string>())
        return SeverityFromName(*name);

    return std::nullopt;
}

} // namespace

bool LogManager::s_initialized = false;
bool LogManager::s_opened = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::unique_ptr<plog::IAppender> LogManager::s_file_appender;
std::unique_ptr<plog::IAppender> LogManager::s_console_appender;

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    ReadConfig(config_path);
    s_initialized = true;
    return true;
}

bool LogManager::Open(const Settings& settings)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "LogManager not initialized before opening logs",
                                   settings.filepath);
        return false;
    }
    if (s_opened)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Logging is already open", settings.filepath);
        return false;
    }

    try
    {
        PrepareLogDirectory(settings.filepath);

        if (!s_append_logs)
        {
            std::ofstream(settings.filepath, std::ios::trunc).close();
        }

        s_file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            settings.filepath.c_str(), settings.max_file_size, static_cast<int>(settings.backup_count));

        auto& logger = plog::init(s_default_level, s_file_appender.get());

        if (settings.console)
        {
            s_console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            logger.addAppender(&plog::init<kConsoleLogInstance>(settings.console_level, s_console_appender.get()));
        }

        s_opened = true;
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log file " + settings.filepath,
                                   ex.what());
        return false;
    }
}

void LogManager::Shutdown()
{
    // Loggers hold raw appender pointers; silence them before the appenders are destroyed
    if (auto logger = plog::get<PLOG_DEFAULT_INSTANCE_ID>())
        logger->setMaxSeverity(plog::none);
    if (auto console = plog::get<kConsoleLogInstance>())
        console->setMaxSeverity(plog::none);

    s_console_appender.reset();
    s_file_appender.reset();
    s_initialized = false;
}

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

void LogManager::PrepareLogDirectory(const std::string& filepath)
{
    auto dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

void LogManager::ReadConfig(const std::string& config_path)
{
    s_append_logs = true;
    s_default_level = plog::info;

    std::ifstream ifs(config_path, std::ios::binary);
    if (!ifs)
        return;

    toml::table cfg;
    try
    {
        cfg = toml::parse(ifs, config_path);
    }
    catch (const toml::parse_error&)
    {
        // Defaults stay in effect; ConfigManager reports the parse error once logging is up
        return;
    }

    if (auto append = cfg["global"]["append_logs"].value<bool>())
        s_append_logs = *append;

    const toml::table& root = cfg;
    auto node = root["app"]["debug"]["logging_level"];
    if (!node)
        return;

    if (auto level = ReadSeverity(node))
    {
        s_default_level = *level;
    }
    else
    {
        // Logging is not open yet; the queued report still reaches the exit summary
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unrecognised logging_level, using info",
                                     "[app.debug] logging_level in " + config_path);
    }
}

} // namespace utils
