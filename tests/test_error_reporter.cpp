#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

#include <string>

using namespace utils;

TEST_CASE("ErrorReporter - queue", "[errors]")
{
    ErrorReporter::ClearErrors();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

    ErrorReporter::ReportWarning(ErrorCategory::Configuration, "bad value", "growth_factor = 0.5");
    ErrorReporter::ReportError(ErrorCategory::Memory, "trim failed");
    ErrorReporter::ReportFatal(ErrorCategory::Initialization, "no log file", "logs/run.log");

    SECTION("Last error is the most recent one")
    {
        auto last = ErrorReporter::GetLastError();
        REQUIRE(last.category == ErrorCategory::Initialization);
        REQUIRE(last.severity == ErrorSeverity::Fatal);
        REQUIRE_FALSE(last.timestamp.empty());
    }

    SECTION("Summary counts by severity")
    {
        auto summary = ErrorReporter::Summarize();
        REQUIRE(summary.warnings == 1);
        REQUIRE(summary.errors == 1);
        REQUIRE(summary.fatal == 1);
        REQUIRE(summary.Total() == 3);
    }

    SECTION("Draining empties the queue in order")
    {
        auto errors = ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 3);
        REQUIRE(errors.front().user_message == "bad value");
        REQUIRE(errors.back().user_message == "no log file");
        REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
    }

    ErrorReporter::ClearErrors();
}

TEST_CASE("ErrorReporter - bounded queue drops the oldest", "[errors]")
{
    ErrorReporter::ClearErrors();
    for (size_t i = 0; i < ErrorReporter::MAX_QUEUE_SIZE + 5; ++i)
        ErrorReporter::ReportWarning(ErrorCategory::Input, "warning " + std::to_string(i));

    auto summary = ErrorReporter::Summarize();
    REQUIRE(summary.warnings == ErrorReporter::MAX_QUEUE_SIZE);
    REQUIRE(summary.dropped == 5);

    auto errors = ErrorReporter::GetPendingErrors();
    REQUIRE(errors.front().user_message == "warning 5");
    ErrorReporter::ClearErrors();
}

TEST_CASE("ErrorReporter - describe", "[errors]")
{
    ErrorReport report(ErrorCategory::Configuration, ErrorSeverity::Warning, "Configuration file has errors",
                       "line 3");
    REQUIRE(ErrorReporter::Describe(report) == "[Configuration] Warning: Configuration file has errors | line 3");

    ErrorReport bare(ErrorCategory::Unknown, ErrorSeverity::Error, "oops", "");
    REQUIRE(ErrorReporter::Describe(bare) == "[Unknown] Error: oops");
}
