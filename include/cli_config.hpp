// power_menu settings definition and YAML I/O declarations
#pragma once

#include <string>
#include <vector>

#include "mode_service.hpp"

struct CliConfig {
    std::string loaded_config_path;
    std::string modes_conf = "/etc/nvpmodel.conf";
    std::vector<std::string> query_command = pm::ModeCommands{}.query_command;
    std::string current_mode_marker = pm::ModeCommands{}.current_mode_marker;
    std::vector<std::string> change_command = pm::ModeCommands{}.change_command;
    // Prefix for the change command; empty when already running as root.
    std::vector<std::string> privilege_command = pm::ModeCommands{}.privilege_command;
    // "auto", "menu" or "text"
    std::string ui = "auto";
    std::string title = "Jetson Power Mode Selector";
    bool verbose = false;
};

// $XDG_CONFIG_HOME/power_menu/config.yaml, else ~/.config/power_menu/config.yaml.
std::string default_config_path();

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const CliConfig& config, const std::string& path);

// Load `config_path` if it exists. A missing file at the default location
// keeps the defaults silently; a missing explicit file warns.
void load_or_create_config(const std::string& config_path, CliConfig& config);

// Command settings for pm::PowerModeService.
pm::ModeCommands to_mode_commands(const CliConfig& config);
