#include "SettingsSerializer.hpp"

#include "../state/TextDisplayConfig.hpp"
#include "../utils/MemoryTrimmer.hpp"

#include <plog/Log.h>

#include <string_view>

namespace
{

// Reads a non-negative integer key; negative values are rejected with a warning
bool read_non_negative(const toml::table& section, std::string_view key, int64_t& out)
{
    auto value = section[key].value<int64_t>();
    if (!value)
        return false;
    if (*value < 0)
    {
        PLOG_WARNING << "Ignoring negative value for '" << key << "': " << *value;
        return false;
    }
    out = *value;
    return true;
}

void read_millis(const toml::table& section, std::string_view key, std::chrono::milliseconds& out,
                 bool allow_zero)
{
    int64_t ms = 0;
    if (!read_non_negative(section, key, ms))
        return;
    if (ms == 0 && !allow_zero)
    {
        PLOG_WARNING << "Ignoring zero value for '" << key << "'";
        return;
    }
    out = std::chrono::milliseconds(ms);
}

} // namespace

void SettingsSerializer::deserializeMemory(const toml::table& section, utils::MemoryTrimmerConfig& config)
{
    if (auto enabled = section["enabled"].value<bool>())
        config.enabled = *enabled;

    read_millis(section, "poll_interval_ms", config.poll_interval, false);
    read_millis(section, "min_trim_interval_ms", config.min_trim_interval, true);
    read_millis(section, "settle_delay_ms", config.settle_delay, true);

    read_non_negative(section, "medium_threshold_mb", config.medium_threshold_mb);
    read_non_negative(section, "high_threshold_mb", config.high_threshold_mb);
    read_non_negative(section, "min_gc_gain_mb", config.min_gc_gain_mb);

    if (auto growth = section["growth_factor"].value<double>())
    {
        if (*growth >= 1.0)
            config.growth_factor = *growth;
        else
            PLOG_WARNING << "Ignoring growth_factor below 1.0: " << *growth;
    }

    if (config.medium_threshold_mb > config.high_threshold_mb)
    {
        PLOG_WARNING << "memory.medium_threshold_mb (" << config.medium_threshold_mb
                     << ") is above memory.high_threshold_mb (" << config.high_threshold_mb << ")";
    }
}

void SettingsSerializer::deserializeText(const toml::table& section, TextDisplayConfig& config)
{
    int64_t value = 0;
    if (read_non_negative(section, "max_display_bytes", value))
        config.max_display_bytes = static_cast<std::size_t>(value);
    if (read_non_negative(section, "newline_byte_threshold", value))
        config.newline_byte_threshold = static_cast<std::size_t>(value);
}
