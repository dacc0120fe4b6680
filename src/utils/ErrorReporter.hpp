#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, startup
    Configuration,  // TOML parsing, invalid values
    Memory,         // working-set sampling and trimming
    Input,          // command line, caption stream
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // Degraded, keeps running
    Error,   // Operation failed, app continues
    Fatal    // App should exit
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;
    std::string technical_details;
    std::string timestamp;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

// Pending report counts by severity
struct ErrorSummary
{
    size_t warnings = 0;
    size_t errors = 0;
    size_t fatal = 0;
    size_t dropped = 0;

    size_t Total() const { return warnings + errors + fatal; }
};

/**
 * @brief Process-wide error sink.
 *
 * Every report is logged through plog right away and kept in a bounded queue until the
 * owner drains it. The config loader, the memory trimmer thread and the input loop all
 * report here; Application summarizes what is left at exit.
 *
 *   ErrorReporter::ReportWarning(ErrorCategory::Configuration,
 *                                "Configuration file has errors",
 *                                "line 3: expected '='");
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    // Moves the queued reports out, oldest first
    static std::vector<ErrorReport> GetPendingErrors();

    // Most recent queued report, or a default one when the queue is empty
    static ErrorReport GetLastError();

    static ErrorSummary Summarize();

    static void ClearErrors();

    // "[Category] Severity: message | details"
    static std::string Describe(const ErrorReport& report);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

    static constexpr size_t MAX_QUEUE_SIZE = 100;

private:
    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_error_queue;
    static size_t s_dropped;
};

} // namespace utils
