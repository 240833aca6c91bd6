// Pieces shared by the rich and text menus
#pragma once

#include <string>

#include "cli/terminal_input.hpp"
#include "pm_types.hpp"

namespace pm {

inline const char* const kFarewell = "Exiting. Goodbye!";
inline const char* const kPressEnter = "Press <Enter> to continue...";

// `<id> ("<name>")` for a configured id, the bare id otherwise.
std::string format_current_mode(const ModeTable& modes, const std::string& id);

// Consume keys up to and including Enter. Returns false if input ended or
// Ctrl+C was pressed first.
bool wait_for_enter(KeySource& keys);

} // namespace pm
