#include "cli/terminal_caps.hpp"

#include <cstdlib>
#include <cstring>

#include <unistd.h>

namespace pm {

bool rich_menu_available() {
    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) return false;
    const char* term = getenv("TERM");
    return term != nullptr && *term != '\0' && std::strcmp(term, "dumb") != 0;
}

UiMode choose_ui_mode(const std::string& setting, bool rich_available) {
    if (setting == "menu") return UiMode::Rich;
    if (setting == "text") return UiMode::Text;
    return rich_available ? UiMode::Rich : UiMode::Text;
}

} // namespace pm
