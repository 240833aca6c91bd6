#pragma once

#include <string>
#include <utility>
#include <vector>

#include "command_runner.hpp"
#include "pm_types.hpp"

namespace pm {

struct ModeCommands {
    std::vector<std::string> query_command = {"nvpmodel", "-q", "--verbose"};
    std::string current_mode_marker = "current mode";
    std::vector<std::string> change_command = {"nvpmodel", "-m"};
    std::vector<std::string> privilege_command = {"sudo"};
};

// Extract the active mode id from status output: the trimmed line right after
// the last line containing `marker` (case-insensitive). kUnknownModeId otherwise.
std::string parse_current_mode(const std::string& output, const std::string& marker);

// Operator-facing text for a change attempt. Failure output is passed through verbatim.
std::string format_change_report(const ChangeReport& report);

class PowerModeService {
public:
    PowerModeService(CommandRunner& runner, ModeCommands commands)
        : runner_(runner), commands_(std::move(commands)) {}

    // Unprivileged; returns kUnknownModeId when the answer is not definitive.
    std::string QueryCurrentMode();

    // Runs the privileged change command for `id`. `name` is only used for messages.
    ChangeReport ChangeMode(const std::string& id, const std::string& name);

    const ModeCommands& commands() const { return commands_; }

private:
    CommandRunner& runner_;
    ModeCommands commands_;
};

} // namespace pm
