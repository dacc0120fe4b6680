#include <catch2/catch_test_macros.hpp>
#include "app/Application.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace
{

// Builds a mutable argv for Application
class Args
{
public:
    Args(std::initializer_list<std::string> args)
        : storage_(args)
    {
        for (auto& arg : storage_)
            pointers_.push_back(arg.data());
    }

    int argc() const { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

TEST_CASE("Application - caption formatting", "[app]")
{
    Args args{ "caption_utility" };
    Application app(args.argc(), args.argv());

    SECTION("Default display settings")
    {
        REQUIRE(app.textConfig().max_display_bytes == 200);
        REQUIRE(app.textConfig().newline_byte_threshold == 32);
    }

    SECTION("Lines are joined")
    {
        REQUIRE(app.formatCaption("你好\nworld") == "你好——world");
        REQUIRE(app.formatCaption("This line is long enough to count\nnext") ==
                "This line is long enough to count. next");
    }

    SECTION("Windows line endings")
    {
        REQUIRE(app.formatCaption("short\r\nline") == "short—line");
        REQUIRE(app.formatCaption("old\rmac") == "old—mac");
    }

    SECTION("Long captions lose leading clauses")
    {
        std::string first(150, 'a');
        std::string second(100, 'b');
        REQUIRE(app.formatCaption(first + ", " + second) == " " + second);
    }
}

TEST_CASE("Application - command line", "[app]")
{
    SECTION("Help exits cleanly")
    {
        Args args{ "caption_utility", "--help" };
        Application app(args.argc(), args.argv());
        REQUIRE(app.run() == Application::kExitOk);
    }

    SECTION("Unknown option")
    {
        Args args{ "caption_utility", "--bogus" };
        Application app(args.argc(), args.argv());
        REQUIRE(app.run() == Application::kExitUsage);
    }

    SECTION("Option missing its value")
    {
        Args args{ "caption_utility", "--config" };
        Application app(args.argc(), args.argv());
        REQUIRE(app.run() == Application::kExitUsage);
    }

    SECTION("Non-numeric byte budget")
    {
        Args args{ "caption_utility", "--max-bytes", "lots" };
        Application app(args.argc(), args.argv());
        REQUIRE(app.run() == Application::kExitUsage);
    }
}

TEST_CASE("LogManager - reads defaults from config", "[app][logging]")
{
    const auto path = std::filesystem::temp_directory_path() / "caption_utility_logging.toml";
    {
        std::ofstream out(path, std::ios::trunc);
        out << "[global]\nappend_logs = false\n\n[app.debug]\nlogging_level = 5\n";
    }

    utils::LogManager::Shutdown();
    REQUIRE(utils::LogManager::Initialize(path.string()));
    REQUIRE_FALSE(utils::LogManager::IsAppendMode());
    REQUIRE(utils::LogManager::GetDefaultLogLevel() == plog::debug);
    utils::LogManager::Shutdown();

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST_CASE("LogManager - logging_level names", "[app][logging]")
{
    const auto path = std::filesystem::temp_directory_path() / "caption_utility_logging_names.toml";
    auto initializeWith = [&path](const std::string& level) {
        {
            std::ofstream out(path, std::ios::trunc);
            out << "[app.debug]\nlogging_level = " << level << "\n";
        }
        utils::LogManager::Shutdown();
        utils::ErrorReporter::ClearErrors();
        REQUIRE(utils::LogManager::Initialize(path.string()));
    };

    SECTION("Full names in any case")
    {
        initializeWith("\"WARNING\"");
        REQUIRE(utils::LogManager::GetDefaultLogLevel() == plog::warning);
        initializeWith("\"verbose\"");
        REQUIRE(utils::LogManager::GetDefaultLogLevel() == plog::verbose);
        REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
    }

    SECTION("none switches file logging off only when spelled out")
    {
        initializeWith("\"none\"");
        REQUIRE(utils::LogManager::GetDefaultLogLevel() == plog::none);
        REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
    }

    SECTION("Unknown name keeps info and reports a warning")
    {
        for (const std::string level : { "\"dbug\"", "\"trace\"", "\"\"", "9" })
        {
            initializeWith(level);
            REQUIRE(utils::LogManager::GetDefaultLogLevel() == plog::info);

            auto pending = utils::ErrorReporter::GetPendingErrors();
            REQUIRE(pending.size() == 1);
            REQUIRE(pending.front().category == utils::ErrorCategory::Configuration);
            REQUIRE(pending.front().severity == utils::ErrorSeverity::Warning);
        }
    }

    utils::LogManager::Shutdown();
    utils::ErrorReporter::ClearErrors();
    std::error_code ec;
    std::filesystem::remove(path, ec);
}
