#pragma once

#include <string>

namespace pm {

enum class UiMode { Rich, Text };

// True when stdin/stdout are terminals able to host the full-screen menu.
bool rich_menu_available();

// Resolve the `ui` setting ("auto", "menu", "text"). Unknown values act as "auto".
UiMode choose_ui_mode(const std::string& setting, bool rich_available);

} // namespace pm
