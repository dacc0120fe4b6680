#include "ErrorReporter.hpp"
#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace utils
{

namespace
{

plog::Severity ToPlogSeverity(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return plog::info;
    case ErrorSeverity::Warning:
        return plog::warning;
    case ErrorSeverity::Error:
        return plog::error;
    case ErrorSeverity::Fatal:
        return plog::fatal;
    }
    return plog::error;
}

} // namespace

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_error_queue;
size_t ErrorReporter::s_dropped = 0;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , user_message(std::move(user_msg))
    , technical_details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
{
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                                const std::string& technical_details)
{
    ErrorReport report(category, severity, user_message, technical_details);
    PLOG(ToPlogSeverity(severity)) << Describe(report);

    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.push_back(std::move(report));
    while (s_error_queue.size() > MAX_QUEUE_SIZE)
    {
        s_error_queue.pop_front();
        ++s_dropped;
    }
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Fatal, user_message, technical_details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, user_message, technical_details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_error_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> errors(std::make_move_iterator(s_error_queue.begin()),
                                    std::make_move_iterator(s_error_queue.end()));
    s_error_queue.clear();
    s_dropped = 0;
    return errors;
}

ErrorReport ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_error_queue.empty() ? ErrorReport() : s_error_queue.back();
}

ErrorSummary ErrorReporter::Summarize()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    ErrorSummary summary;
    summary.dropped = s_dropped;
    for (const auto& report : s_error_queue)
    {
        switch (report.severity)
        {
        case ErrorSeverity::Warning:
            ++summary.warnings;
            break;
        case ErrorSeverity::Error:
            ++summary.errors;
            break;
        case ErrorSeverity::Fatal:
            ++summary.fatal;
            break;
        case ErrorSeverity::Info:
            break;
        }
    }
    return summary;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
    s_dropped = 0;
}

std::string ErrorReporter::Describe(const ErrorReport& report)
{
    std::string text = "[" + CategoryToString(report.category) + "] " + SeverityToString(report.severity) + ": " +
                       report.user_message;
    if (!report.technical_details.empty())
        text += " | " + report.technical_details;
    return text;
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Memory:
        return "Memory";
    case ErrorCategory::Input:
        return "Input";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

std::string ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

std::string ErrorReporter::GetTimestamp()
{
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
