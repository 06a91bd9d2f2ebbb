#include "core/debug_log.h"
#include "persistence/preference_store.h"
#include "persistence/settings_file.h"
#include <exception>
#include <iostream>
#include "x11/game_x11.h"

// Usage: paddleball_x11 [settings.json] [preferences.json]
int main(int argc, char** argv) {
    try {
        paddleball::SettingsManager manager;
        paddleball::Settings settings = manager.load(argc > 1 ? argv[1] : "paddleball.json");
        paddleball::FilePreferenceStore prefs(argc > 2 ? argv[2] : "paddleball_prefs.json");
        if (!prefs.load()) {
            PADDLEBALL_DBG << "no stored preferences at " << prefs.path() << "\n";
        }
        return run_paddleball_x11(settings, prefs);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return -1;
    }
}
