#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
    , last_write_(modificationTime())
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& key : ownedKeys)
    {
        if (ownsKey(path, key))
        {
            last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    unknown_keys_.clear();

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        last_write_.reset();
        return true;
    }

    try
    {
        auto parsed = std::make_unique<toml::table>(toml::parse(ifs, config_path_));
        root_ = std::move(parsed);
    }
    catch (const toml::parse_error& pe)
    {
        const auto& where = pe.source().begin;
        last_error_ = "config parse error at line " + std::to_string(where.line) + ", column " +
                      std::to_string(where.column) + ": " + std::string(pe.description());
        PLOG_WARNING << last_error_;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors, previous settings kept",
                                            last_error_ + " (" + config_path_ + ")");
        return false;
    }

    dispatch();
    collectUnknownKeys();
    last_write_ = modificationTime();
    return true;
}

bool ConfigManager::reloadIfChanged()
{
    auto mtime = modificationTime();
    if (!mtime || mtime == last_write_)
        return false;

    if (load())
    {
        PLOG_INFO << "Config reloaded from " << config_path_;
        return true;
    }

    // Remember the broken revision so it is reported once
    last_write_ = mtime;
    return false;
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

void ConfigManager::dispatch()
{
    static const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = handler.path.empty() ? root_.get() : toml::at_path(*root_, handler.path).as_table();
        if (!section && toml::at_path(*root_, handler.path))
            PLOG_WARNING << "Config entry '" << handler.path << "' is not a table, using defaults";

        handler.callbacks.load(section ? *section : empty);
    }
}

void ConfigManager::collectUnknownKeys()
{
    for (const auto& handler : handlers_)
    {
        const toml::table* section = handler.path.empty() ? root_.get() : toml::at_path(*root_, handler.path).as_table();
        if (!section)
            continue;

        for (const auto& [key, node] : *section)
        {
            // Sub-tables belong to their own handlers
            if (node.is_table())
                continue;
            if (ownsKey(handler.path, key.str()))
                continue;

            std::string qualified = handler.path.empty() ? std::string(key.str())
                                                         : handler.path + "." + std::string(key.str());
            if (std::find(unknown_keys_.begin(), unknown_keys_.end(), qualified) == unknown_keys_.end())
            {
                PLOG_WARNING << "Unknown config key '" << qualified << "' ignored";
                unknown_keys_.push_back(std::move(qualified));
            }
        }
    }
}

bool ConfigManager::ownsKey(const std::string& path, std::string_view key) const
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;
        if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key) != handler.ownedKeys.end())
            return true;
    }
    return false;
}

std::optional<fs::file_time_type> ConfigManager::modificationTime() const
{
    std::error_code ec;
    auto tp = fs::last_write_time(config_path_, ec);
    if (ec)
        return std::nullopt;
    return tp;
}
