/**
 * @file settings_file.h
 * @brief Settings persistence in a small JSON file
 */

#pragma once

#include <string>
#include "core/settings.h"

namespace paddleball {

/**
 * @brief Loads and saves Settings as JSON
 *
 * Uses a small hand-rolled key extractor rather than a full parser.
 * Integers, strings and "#rrggbb" colors are understood; anything
 * missing or malformed keeps its default.
 */
class SettingsManager {
public:
    SettingsManager() = default;

    /**
     * @brief Load settings from @p path
     *
     * Returns validated defaults if the file is missing or unreadable.
     */
    Settings load(const std::string &path) const;

    /**
     * @brief Parse settings from JSON text already in memory
     */
    Settings parse(const std::string &raw) const;

    /**
     * @brief Write @p s to @p path, replacing any existing file
     * @return false if the file could not be written
     */
    bool save(const std::string &path, const Settings &s) const;
};

/**
 * @brief Parse "#rrggbb" (or "rrggbb") into 0xRRGGBB
 * @return false if @p text is not a six digit hex color
 */
bool parse_hex_color(const std::string &text, unsigned int &out);

std::string format_hex_color(unsigned int color);

} // namespace paddleball
