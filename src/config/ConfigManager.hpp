#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    // Receives the table at the registered path, or an empty table when the file lacks it
    std::function<void(const toml::table& section)> load;
};

/**
 * @brief Owns config.toml and routes its tables to the subsystems that read them.
 *
 * Each handler registers a dotted table path and the keys it reads. A key may be owned by
 * one handler per path; keys found in a registered table that nobody owns are logged as
 * likely typos. A missing file is not an error, defaults stay in effect.
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    bool load();

    // Reloads when the file's modification time moved. Returns true only on a successful reload.
    bool reloadIfChanged();

    const toml::table& root() const;
    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

    // Keys of the last loaded file that sit in a registered table without an owner ("memory.foo")
    const std::vector<std::string>& unknownKeys() const { return unknown_keys_; }

private:
    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };

    void dispatch();
    void collectUnknownKeys();
    bool ownsKey(const std::string& path, std::string_view key) const;

    std::optional<std::filesystem::file_time_type> modificationTime() const;

    std::string config_path_;
    std::string last_error_;
    std::optional<std::filesystem::file_time_type> last_write_;

    std::vector<HandlerEntry> handlers_;
    std::vector<std::string> unknown_keys_;
    std::unique_ptr<toml::table> root_;
};
