#pragma once

#include <toml++/toml.h>

struct TextDisplayConfig;

namespace utils
{
struct MemoryTrimmerConfig;
}

// TOML -> settings structs. Missing or invalid keys leave the current value untouched.
class SettingsSerializer
{
public:
    // [memory] table
    static void deserializeMemory(const toml::table& section, utils::MemoryTrimmerConfig& config);

    // [text] table
    static void deserializeText(const toml::table& section, TextDisplayConfig& config);
};
