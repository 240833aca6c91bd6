// Fallback single-keystroke menu for terminals without full-screen support
#pragma once

#include <ostream>
#include <string>

#include "cli/terminal_input.hpp"
#include "mode_service.hpp"

namespace pm {

// Runs until the operator presses ESC (or input ends). Returns the exit status.
// Only single-character ids can be picked here.
int run_text_menu(PowerModeService& svc, const ModeTable& modes,
                  const std::string& title, KeySource& keys, std::ostream& out);

} // namespace pm
