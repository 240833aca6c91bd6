// Full-screen mode menu (FTXUI)
#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "cli/terminal_input.hpp"
#include "mode_service.hpp"

namespace pm {

struct ModeMenuModel {
    std::string title;
    std::vector<std::string> prompt_lines;
    std::vector<ModeRecord> entries;
    int default_index = 0;
    std::string cancel_label = "ESC";
};

// Returns the chosen id, or std::nullopt when the operator cancels.
using ModePicker = std::function<std::optional<std::string>(const ModeMenuModel&)>;

// Menu contents for one render cycle, with `current_id` pre-selected when known.
ModeMenuModel build_mode_menu(const ModeTable& modes, const std::string& current_id,
                              const std::string& title);

// Interactive FTXUI picker on the full terminal screen.
std::optional<std::string> run_mode_picker(const ModeMenuModel& model);

// Render/select/apply loop. `keys` is used for the acknowledgement after a change.
int run_rich_menu(PowerModeService& svc, const ModeTable& modes, const std::string& title,
                  const ModePicker& picker, KeySource& keys, std::ostream& out);

} // namespace pm
