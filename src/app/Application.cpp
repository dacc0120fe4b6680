#include "Application.hpp"
#include "config/ConfigManager.hpp"
#include "config/SettingsSerializer.hpp"
#include "processing/TextNormalizer.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/ProcessMemory.hpp"

#include <plog/Log.h>
#include <toml++/toml.h>

#include <charconv>
#include <iostream>

namespace
{

std::optional<std::size_t> parse_size(const std::string& text)
{
    std::size_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || text.empty())
        return std::nullopt;
    return value;
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    switch (parseCommandLineArgs())
    {
    case ParseOutcome::Help:
        printUsage(std::cout);
        return kExitOk;
    case ParseOutcome::Error:
        printUsage(std::cerr);
        return kExitUsage;
    case ParseOutcome::Run:
        break;
    }

    if (!initialize())
        return kExitInitFailed;

    mainLoop();
    cleanup();
    return kExitOk;
}

Application::ParseOutcome Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const std::string arg = argv_[i];
        const bool has_value = i + 1 < argc_;

        if (arg == "--help" || arg == "-h")
        {
            return ParseOutcome::Help;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            verbose_ = true;
        }
        else if (arg == "--no-trim")
        {
            trim_disabled_ = true;
        }
        else if (arg == "--config" && has_value)
        {
            config_path_ = argv_[++i];
        }
        else if (arg == "--log-file" && has_value)
        {
            log_path_ = argv_[++i];
        }
        else if ((arg == "--max-bytes" || arg == "--newline-threshold") && has_value)
        {
            auto value = parse_size(argv_[++i]);
            if (!value)
            {
                std::cerr << "invalid value for " << arg << ": " << argv_[i] << "\n";
                return ParseOutcome::Error;
            }
            if (arg == "--max-bytes")
                max_bytes_override_ = *value;
            else
                newline_threshold_override_ = *value;
        }
        else
        {
            std::cerr << "unknown or incomplete argument: " << arg << "\n";
            return ParseOutcome::Error;
        }
    }
    return ParseOutcome::Run;
}

void Application::printUsage(std::ostream& os) const
{
    os << "usage: caption_utility [options] < captions.txt\n"
       << "\n"
       << "Reads caption records separated by blank lines and prints each one joined into a\n"
       << "single display line.\n"
       << "\n"
       << "  --config PATH              TOML config file (default: config.toml)\n"
       << "  --log-file PATH            log file (default: logs/run.log)\n"
       << "  --max-bytes N              display budget in UTF-8 bytes\n"
       << "  --newline-threshold N      line length that earns a full stop instead of a dash\n"
       << "  --no-trim                  do not run the background memory trimmer\n"
       << "  -v, --verbose              echo debug logging to stderr\n"
       << "  -h, --help                 show this help\n";
}

bool Application::initialize()
{
    if (!initializeLogging())
        return false;

    initializeConfig();
    startMemoryTrimmer();
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(config_path_))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    if (!utils::LogManager::Open({ .filepath = log_path_,
                                   .console = true,
                                   .console_level = verbose_ ? plog::debug : plog::warning }))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Failed to open log file", log_path_);
        std::cerr << "failed to open log file " << log_path_ << "\n";
        return false;
    }

    logging_ready_ = true;
    PLOG_INFO << "caption_utility starting, config " << config_path_;
    return true;
}

void Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(config_path_);

    TableCallbacks memory_cb;
    memory_cb.load = [this](const toml::table& section) {
        SettingsSerializer::deserializeMemory(section, memory_config_);
    };
    config_->registerTable("memory", std::move(memory_cb),
                           { "enabled", "poll_interval_ms", "min_trim_interval_ms", "settle_delay_ms",
                             "medium_threshold_mb", "high_threshold_mb", "min_gc_gain_mb", "growth_factor" });

    TableCallbacks text_cb;
    text_cb.load = [this](const toml::table& section) {
        SettingsSerializer::deserializeText(section, text_config_);
    };
    config_->registerTable("text", std::move(text_cb), { "max_display_bytes", "newline_byte_threshold" });

    if (!config_->load())
    {
        PLOG_WARNING << "Continuing with default settings: " << config_->lastError();
    }

    applyOverrides();
}

void Application::applyOverrides()
{
    if (max_bytes_override_)
        text_config_.max_display_bytes = *max_bytes_override_;
    if (newline_threshold_override_)
        text_config_.newline_byte_threshold = *newline_threshold_override_;
    if (trim_disabled_)
        memory_config_.enabled = false;
}

void Application::startMemoryTrimmer()
{
    trimmer_ = std::make_unique<utils::MemoryTrimmer>(memory_config_, utils::CreatePlatformProcessMemory());
    trimmer_->Start();
}

std::string Application::formatCaption(const std::string& record) const
{
    std::string text = processing::normalize_line_endings(record);
    text = processing::replace_newlines(text, text_config_.newline_byte_threshold);
    return processing::shorten_display_sentence(text, text_config_.max_display_bytes);
}

void Application::mainLoop()
{
    std::string record;
    std::string line;

    while (std::getline(std::cin, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (line.empty())
        {
            flushRecord(record);
            handleConfigReload();
            continue;
        }

        if (!record.empty())
            record += '\n';
        record += line;
    }

    if (std::cin.bad())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Failed to read caption input",
                                          "stdin stream error");
    }

    flushRecord(record);
}

void Application::flushRecord(std::string& record)
{
    if (record.empty())
        return;

    std::cout << formatCaption(record) << '\n';
    std::cout.flush();
    record.clear();
}

void Application::handleConfigReload()
{
    if (!config_ || !config_->reloadIfChanged())
        return;

    applyOverrides();
    if (trimmer_)
    {
        trimmer_->UpdateConfig(memory_config_);
        if (memory_config_.enabled && !trimmer_->IsRunning())
            trimmer_->Start();
        else if (!memory_config_.enabled && trimmer_->IsRunning())
            trimmer_->Stop();
    }
}

void Application::cleanup()
{
    if (trimmer_)
    {
        trimmer_->Stop();
        PLOG_INFO << "Memory trimmer performed " << trimmer_->TrimCount() << " trims";
        trimmer_.reset();
    }

    const auto summary = utils::ErrorReporter::Summarize();
    if (summary.Total() > 0)
    {
        PLOG_WARNING << "Problems during this run: " << summary.warnings << " warning(s), " << summary.errors
                     << " error(s), " << summary.fatal << " fatal";
        for (const auto& report : utils::ErrorReporter::GetPendingErrors())
        {
            if (report.severity >= utils::ErrorSeverity::Error)
                std::cerr << utils::ErrorReporter::Describe(report) << "\n";
        }
    }

    if (logging_ready_)
    {
        PLOG_INFO << "caption_utility exiting";
        utils::LogManager::Shutdown();
        logging_ready_ = false;
    }
}
