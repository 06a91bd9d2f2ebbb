/**
 * @file console/main.cpp
 * @brief Entry point for the terminal version of PaddleBall
 *
 * Usage: paddleball_console [settings.json] [preferences.json]
 */

#include "platform/platform.h"
#include "console/game.h"
#include "core/debug_log.h"
#include "persistence/preference_store.h"
#include "persistence/settings_file.h"
#include <exception>
#include <iostream>
#include <memory>

int main(int argc, char **argv) {
    using namespace paddleball;
    try {
        auto plat = createPlatform();
        if (!plat) {
            std::cerr << "Failed to create platform abstraction\n";
            return 1;
        }
        SettingsManager manager;
        Settings settings = manager.load(argc > 1 ? argv[1] : "paddleball.json");
        FilePreferenceStore prefs(argc > 2 ? argv[2] : "paddleball_prefs.json");
        if (!prefs.load()) {
            PADDLEBALL_DBG << "no stored preferences at " << prefs.path() << "\n";
        }

        int cols = 80, rows = 30;
        if (!plat->terminal_size(cols, rows)) {
            std::cerr << "warning: terminal size unknown, using 80x30\n";
        }
        // leave room for the status lines under the playfield
        Game g(cols, rows > 12 ? rows - 6 : 6, *plat, settings, prefs);
        return g.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
