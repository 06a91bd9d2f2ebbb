/**
 * @file preference_store.h
 * @brief Boolean preference storage backends
 */

#pragma once

#include "core/collaborators.h"
#include <map>
#include <string>

namespace paddleball {

/**
 * @brief Preferences kept only for the lifetime of the process
 */
class MemoryPreferenceStore : public PreferenceStore {
public:
    bool get_bool(const std::string& key, bool fallback) const override;
    bool set_bool(const std::string& key, bool value) override;

private:
    std::map<std::string, bool> values;
};

/**
 * @brief Preferences persisted as a flat JSON object of booleans
 *
 * The whole map is rewritten on every set_bool().
 */
class FilePreferenceStore : public PreferenceStore {
public:
    explicit FilePreferenceStore(std::string path);

    /**
     * @brief Read the file into memory
     * @return false if the file does not exist or cannot be read
     */
    bool load();

    bool get_bool(const std::string& key, bool fallback) const override;
    bool set_bool(const std::string& key, bool value) override;

    const std::string& path() const { return file; }

private:
    bool save() const;

    std::string file;
    std::map<std::string, bool> values;
};

} // namespace paddleball
