#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "config/ConfigManager.hpp"
#include "config/SettingsSerializer.hpp"
#include "state/TextDisplayConfig.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/MemoryTrimmer.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

namespace
{

// Config file in the temp directory, removed when the test ends
class TempConfigFile
{
public:
    explicit TempConfigFile(const std::string& name)
        : path_(fs::temp_directory_path() / ("caption_utility_" + name + ".toml"))
    {
        fs::remove(path_);
    }

    ~TempConfigFile()
    {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void Write(const std::string& content) const
    {
        std::ofstream out(path_, std::ios::trunc);
        out << content;
    }

    // Moves the modification time forward so the change is visible regardless of timestamp resolution
    void Touch(std::chrono::seconds delta) const { fs::last_write_time(path_, fs::last_write_time(path_) + delta); }

    std::string Path() const { return path_.string(); }

private:
    fs::path path_;
};

toml::table Parse(const std::string& text) { return toml::parse(text); }

} // namespace

TEST_CASE("SettingsSerializer - memory table", "[config][settings]")
{
    utils::MemoryTrimmerConfig config;

    SECTION("All keys")
    {
        auto table = Parse(R"(
            enabled = false
            poll_interval_ms = 5000
            min_trim_interval_ms = 10000
            settle_delay_ms = 0
            medium_threshold_mb = 100
            high_threshold_mb = 150
            min_gc_gain_mb = 5
            growth_factor = 2.0
        )");
        SettingsSerializer::deserializeMemory(table, config);

        REQUIRE_FALSE(config.enabled);
        REQUIRE(config.poll_interval == 5000ms);
        REQUIRE(config.min_trim_interval == 10000ms);
        REQUIRE(config.settle_delay == 0ms);
        REQUIRE(config.medium_threshold_mb == 100);
        REQUIRE(config.high_threshold_mb == 150);
        REQUIRE(config.min_gc_gain_mb == 5);
        REQUIRE_THAT(config.growth_factor, WithinAbs(2.0, 1e-9));
    }

    SECTION("Missing keys keep defaults")
    {
        SettingsSerializer::deserializeMemory(toml::table{}, config);

        REQUIRE(config.enabled);
        REQUIRE(config.poll_interval == 30000ms);
        REQUIRE(config.high_threshold_mb == 350);
    }

    SECTION("Invalid values are ignored")
    {
        auto table = Parse(R"(
            poll_interval_ms = 0
            min_trim_interval_ms = -5
            high_threshold_mb = -1
            growth_factor = 0.5
            enabled = "yes"
        )");
        SettingsSerializer::deserializeMemory(table, config);

        REQUIRE(config.enabled);
        REQUIRE(config.poll_interval == 30000ms);
        REQUIRE(config.min_trim_interval == 60000ms);
        REQUIRE(config.high_threshold_mb == 350);
        REQUIRE_THAT(config.growth_factor, WithinAbs(1.5, 1e-9));
    }
}

TEST_CASE("SettingsSerializer - text table", "[config][settings]")
{
    TextDisplayConfig config;
    REQUIRE(config.max_display_bytes == 200);
    REQUIRE(config.newline_byte_threshold == 32);

    SettingsSerializer::deserializeText(Parse("max_display_bytes = 120\nnewline_byte_threshold = 12"), config);
    REQUIRE(config.max_display_bytes == 120);
    REQUIRE(config.newline_byte_threshold == 12);

    SettingsSerializer::deserializeText(Parse("max_display_bytes = -3"), config);
    REQUIRE(config.max_display_bytes == 120);
}

TEST_CASE("ConfigManager - loading", "[config]")
{
    TempConfigFile file("load");
    utils::MemoryTrimmerConfig memory;
    TextDisplayConfig text;
    int debug_calls = 0;

    ConfigManager manager(file.Path());

    TableCallbacks memory_cb;
    memory_cb.load = [&](const toml::table& section) { SettingsSerializer::deserializeMemory(section, memory); };
    REQUIRE(manager.registerTable("memory", std::move(memory_cb), { "enabled", "high_threshold_mb" }));

    TableCallbacks text_cb;
    text_cb.load = [&](const toml::table& section) { SettingsSerializer::deserializeText(section, text); };
    REQUIRE(manager.registerTable("text", std::move(text_cb), { "max_display_bytes" }));

    TableCallbacks debug_cb;
    debug_cb.load = [&](const toml::table& section) {
        ++debug_calls;
        REQUIRE(section["logging_level"].value_or(0) == 5);
    };
    REQUIRE(manager.registerTable("app.debug", std::move(debug_cb), { "logging_level" }));

    SECTION("Missing file uses defaults")
    {
        REQUIRE(manager.load());
        REQUIRE(memory.high_threshold_mb == 350);
        REQUIRE(debug_calls == 0);
        REQUIRE(manager.root().empty());
    }

    SECTION("Tables are routed to their handlers")
    {
        file.Write(R"(
[memory]
enabled = false
high_threshold_mb = 500

[text]
max_display_bytes = 80

[app.debug]
logging_level = 5
)");
        REQUIRE(manager.load());
        REQUIRE_FALSE(memory.enabled);
        REQUIRE(memory.high_threshold_mb == 500);
        REQUIRE(text.max_display_bytes == 80);
        REQUIRE(debug_calls == 1);
        REQUIRE(manager.root().contains("memory"));
    }

    SECTION("Absent table still gets a callback with an empty table")
    {
        file.Write("[app.debug]\nlogging_level = 5\n");
        REQUIRE(manager.load());
        REQUIRE(memory.enabled);
        REQUIRE(text.max_display_bytes == 200);
    }

    SECTION("Unowned keys are collected")
    {
        file.Write("[memory]\nenabled = true\npoll_intervl_ms = 5\n\n[text]\nmax_display_bytes = 90\n");
        REQUIRE(manager.load());
        REQUIRE(manager.unknownKeys() == std::vector<std::string>{ "memory.poll_intervl_ms" });
        REQUIRE(text.max_display_bytes == 90);
    }

    SECTION("Parse errors are reported")
    {
        utils::ErrorReporter::ClearErrors();
        file.Write("[memory\nenabled = ");

        REQUIRE_FALSE(manager.load());
        REQUIRE(std::string(manager.lastError()).find("parse error") != std::string::npos);
        REQUIRE(utils::ErrorReporter::HasPendingErrors());
        REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Configuration);
        REQUIRE(memory.enabled);
        utils::ErrorReporter::ClearErrors();
    }
}

TEST_CASE("ConfigManager - key ownership", "[config]")
{
    ConfigManager manager("unused.toml");

    REQUIRE(manager.registerTable("memory", TableCallbacks{ [](const toml::table&) {} }, { "enabled" }));
    REQUIRE(manager.registerTable("memory", TableCallbacks{ [](const toml::table&) {} }, { "growth_factor" }));
    REQUIRE_FALSE(manager.registerTable("memory", TableCallbacks{ [](const toml::table&) {} }, { "enabled" }));
    REQUIRE(std::string(manager.lastError()).find("enabled") != std::string::npos);

    // Same key under another table is fine
    REQUIRE(manager.registerTable("text", TableCallbacks{ [](const toml::table&) {} }, { "enabled" }));
}

TEST_CASE("ConfigManager - reload on change", "[config]")
{
    TempConfigFile file("reload");
    file.Write("[text]\nmax_display_bytes = 100\n");

    TextDisplayConfig text;
    ConfigManager manager(file.Path());
    TableCallbacks text_cb;
    text_cb.load = [&](const toml::table& section) { SettingsSerializer::deserializeText(section, text); };
    manager.registerTable("text", std::move(text_cb), { "max_display_bytes" });

    REQUIRE(manager.load());
    REQUIRE(text.max_display_bytes == 100);

    SECTION("Unchanged file is not reloaded")
    {
        REQUIRE_FALSE(manager.reloadIfChanged());
    }

    SECTION("Modified file is picked up")
    {
        file.Write("[text]\nmax_display_bytes = 64\n");
        file.Touch(5s);

        REQUIRE(manager.reloadIfChanged());
        REQUIRE(text.max_display_bytes == 64);
        REQUIRE_FALSE(manager.reloadIfChanged());
    }

    SECTION("Broken revision is reported once")
    {
        utils::ErrorReporter::ClearErrors();
        file.Write("[text\n");
        file.Touch(5s);

        REQUIRE_FALSE(manager.reloadIfChanged());
        REQUIRE(utils::ErrorReporter::HasPendingErrors());
        REQUIRE(text.max_display_bytes == 100);

        utils::ErrorReporter::ClearErrors();
        REQUIRE_FALSE(manager.reloadIfChanged());
        REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
    }
}
