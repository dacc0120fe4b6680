#pragma once

#include "state/TextDisplayConfig.hpp"
#include "utils/MemoryTrimmer.hpp"

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

class ConfigManager;

// Reads caption records from stdin and writes their display form to stdout while the
// memory trimmer runs in the background.
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

    // Display form of one caption record
    std::string formatCaption(const std::string& record) const;

    const TextDisplayConfig& textConfig() const { return text_config_; }

    static constexpr int kExitOk = 0;
    static constexpr int kExitInitFailed = 1;
    static constexpr int kExitUsage = 2;

private:
    enum class ParseOutcome
    {
        Run,
        Help,
        Error
    };

    ParseOutcome parseCommandLineArgs();
    void printUsage(std::ostream& os) const;

    bool initialize();
    bool initializeLogging();
    void initializeConfig();
    void applyOverrides();
    void startMemoryTrimmer();

    void mainLoop();
    void flushRecord(std::string& record);
    void handleConfigReload();
    void cleanup();

    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<utils::MemoryTrimmer> trimmer_;

    TextDisplayConfig text_config_;
    utils::MemoryTrimmerConfig memory_config_;

    std::string config_path_ = "config.toml";
    std::string log_path_ = "logs/run.log";
    std::optional<std::size_t> max_bytes_override_;
    std::optional<std::size_t> newline_threshold_override_;
    bool trim_disabled_ = false;
    bool verbose_ = false;
    bool logging_ready_ = false;

    int argc_ = 0;
    char** argv_ = nullptr;
};
