#include "cli/menu_common.hpp"

namespace pm {

std::string format_current_mode(const ModeTable& modes, const std::string& id) {
    auto it = modes.find(id);
    if (it == modes.end()) return id;
    return id + " (\"" + it->second + "\")";
}

bool wait_for_enter(KeySource& keys) {
    while (true) {
        int key = keys.GetChar();
        if (key == ENTER) return true;
        if (key == END_OF_INPUT || key == CTRL_C) return false;
    }
}

} // namespace pm
