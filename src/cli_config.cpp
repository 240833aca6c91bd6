// power_menu settings YAML read/write implementation
#include "cli_config.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>
#include <iostream>
#include <yaml-cpp/yaml.h>

#include <pwd.h>
#include <unistd.h>

#include "pm_types.hpp" // for pm::fs alias

using namespace pm; // for fs

std::string default_config_path() {
    fs::path base;
    const char* xdg = getenv("XDG_CONFIG_HOME");
    if (xdg != nullptr && *xdg != '\0') {
        base = xdg;
    } else {
        const char* home = getenv("HOME");
        if (home == nullptr) {
            struct passwd* pw = getpwuid(getuid());
            if (pw) {
                home = pw->pw_dir;
            }
        }
        if (home == nullptr) {
            return "power_menu.yaml"; // fallback to current dir
        }
        base = fs::path(home) / ".config";
    }
    return (base / "power_menu" / "config.yaml").string();
}

bool write_config_to_file(const CliConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "power_menu configuration.";
    root["modes_conf"] = config.modes_conf;
    root["query_command"] = config.query_command;
    root["current_mode_marker"] = config.current_mode_marker;
    root["change_command"] = config.change_command;
    root["privilege_command"] = config.privilege_command;
    root["ui"] = config.ui;
    root["title"] = config.title;
    root["verbose"] = config.verbose;

    try {
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
        std::ofstream fout(path);
        if (!fout) return false;
        fout << root << "\n";
        return static_cast<bool>(fout);
    } catch (const std::exception&) {
        return false;
    }
}

void load_or_create_config(const std::string& config_path, CliConfig& config) {
    std::error_code ec;
    bool exists = fs::exists(config_path, ec);
    if (ec) {
        std::cerr << "Warning: Could not access config file '" << config_path
                  << "'. Using default settings. Error: " << ec.message() << std::endl;
        return;
    }
    if (exists) {
        fs::path absolute = fs::absolute(config_path, ec);
        config.loaded_config_path = ec ? config_path : absolute.string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            CliConfig loaded = config;
            if (root["modes_conf"]) loaded.modes_conf = root["modes_conf"].as<std::string>();
            if (root["query_command"] && root["query_command"].IsSequence())
                loaded.query_command = root["query_command"].as<std::vector<std::string>>();
            if (root["current_mode_marker"]) loaded.current_mode_marker = root["current_mode_marker"].as<std::string>();
            if (root["change_command"] && root["change_command"].IsSequence())
                loaded.change_command = root["change_command"].as<std::vector<std::string>>();
            if (root["privilege_command"]) {
                if (root["privilege_command"].IsSequence())
                    loaded.privilege_command = root["privilege_command"].as<std::vector<std::string>>();
                else if (root["privilege_command"].IsNull())
                    loaded.privilege_command.clear();
                else
                    loaded.privilege_command = {root["privilege_command"].as<std::string>()};
            }
            if (root["ui"]) loaded.ui = root["ui"].as<std::string>();
            if (root["title"]) loaded.title = root["title"].as<std::string>();
            if (root["verbose"]) loaded.verbose = root["verbose"].as<bool>();
            config = loaded;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
    } else if (config_path != default_config_path()) {
        std::cerr << "Warning: Config file '" << config_path
                  << "' not found. Using default settings." << std::endl;
    }
}

pm::ModeCommands to_mode_commands(const CliConfig& config) {
    pm::ModeCommands cmds;
    cmds.query_command = config.query_command;
    cmds.current_mode_marker = config.current_mode_marker;
    cmds.change_command = config.change_command;
    cmds.privilege_command = config.privilege_command;
    return cmds;
}
