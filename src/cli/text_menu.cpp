// FILE: src/cli/text_menu.cpp
#include "cli/text_menu.hpp"

#include "cli/menu_common.hpp"

namespace pm {

namespace {

void render(std::ostream& out, const ModeTable& modes, const std::string& title,
            const std::string& current_id) {
    out << "\033[2J\033[1;1H";
    out << "==============================================\n";
    out << " " << title << " (Text-Only)\n";
    out << "----------------------------------------------\n";
    out << " Current Mode: " << format_current_mode(modes, current_id) << "\n";
    out << "----------------------------------------------\n";
    out << "Press ESC to exit or type a single digit for these modes:\n";
    for (const auto& kv : modes) {
        out << "  " << kv.first << ") " << kv.second << "\n";
    }
    out << "----------------------------------------------\n";
    out << "Your selection: " << std::flush;
}

} // namespace

int run_text_menu(PowerModeService& svc, const ModeTable& modes,
                  const std::string& title, KeySource& keys, std::ostream& out) {
    out << "Warning: rich menu not available. Using text-based menu.\n";
    out << kPressEnter << std::endl;
    if (!wait_for_enter(keys)) {
        out << kFarewell << std::endl;
        return 0;
    }

    while (true) {
        std::string current_id = svc.QueryCurrentMode();
        render(out, modes, title, current_id);

        int key = keys.GetChar();
        if (key == ESC || key == CTRL_C || key == END_OF_INPUT) {
            out << "\n" << kFarewell << std::endl;
            return 0;
        }

        std::string typed = KeyText(key);
        out << typed << "\n";
        auto it = modes.find(typed);
        if (it != modes.end()) {
            out << format_change_report(svc.ChangeMode(it->first, it->second));
        } else {
            out << "Invalid choice: \"" << typed << "\"\n";
        }

        out << "\n" << kPressEnter << std::endl;
        if (!wait_for_enter(keys)) {
            out << kFarewell << std::endl;
            return 0;
        }
    }
}

} // namespace pm
