#pragma once

#include "../processing/TextNormalizer.hpp"

#include <cstddef>

struct TextDisplayConfig
{
    // Captions at or above this many UTF-8 bytes lose leading clauses
    std::size_t max_display_bytes = processing::VERYLONG_THRESHOLD;

    // Lines at or above this many bytes end with a full stop when joined, shorter ones with a dash
    std::size_t newline_byte_threshold = processing::MEDIUM_THRESHOLD;
};
