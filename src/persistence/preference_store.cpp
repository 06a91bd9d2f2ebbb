#include "persistence/preference_store.h"
#include <fstream>
#include <iterator>
#include <utility>

namespace paddleball {

bool MemoryPreferenceStore::get_bool(const std::string& key, bool fallback) const {
    auto it = values.find(key);
    return it == values.end() ? fallback : it->second;
}

bool MemoryPreferenceStore::set_bool(const std::string& key, bool value) {
    values[key] = value;
    return true;
}

FilePreferenceStore::FilePreferenceStore(std::string path) : file(std::move(path)) {}

bool FilePreferenceStore::load() {
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs) return false;
    std::string raw((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

    // walk "key": true|false pairs; anything else is skipped
    size_t pos = 0;
    while ((pos = raw.find('"', pos)) != std::string::npos) {
        size_t end = raw.find('"', pos + 1);
        if (end == std::string::npos) break;
        std::string key = raw.substr(pos + 1, end - pos - 1);
        size_t colon = raw.find(':', end);
        if (colon == std::string::npos) break;
        size_t v = colon + 1;
        while (v < raw.size() && (raw[v]==' '||raw[v]=='\t')) v++;
        if (raw.compare(v, 4, "true") == 0) values[key] = true;
        else if (raw.compare(v, 5, "false") == 0) values[key] = false;
        pos = v;
    }
    return true;
}

bool FilePreferenceStore::get_bool(const std::string& key, bool fallback) const {
    auto it = values.find(key);
    return it == values.end() ? fallback : it->second;
}

bool FilePreferenceStore::set_bool(const std::string& key, bool value) {
    values[key] = value;
    return save();
}

bool FilePreferenceStore::save() const {
    std::ofstream ofs(file, std::ios::trunc | std::ios::binary);
    if (!ofs) return false;
    ofs << "{\n";
    size_t i = 0;
    for (const auto &kv : values) {
        ofs << "  \"" << kv.first << "\": " << (kv.second ? "true" : "false");
        ofs << (++i < values.size() ? ",\n" : "\n");
    }
    ofs << "}\n";
    return static_cast<bool>(ofs);
}

} // namespace paddleball
