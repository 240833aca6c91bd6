// FILE: cli/power_menu.cpp
#include <getopt.h>
#include <iostream>
#include <optional>
#include <string>

#include "cli_config.hpp"
#include "command_runner.hpp"
#include "mode_service.hpp"
#include "mode_table.hpp"
#include "cli/menu_common.hpp"
#include "cli/print_cli_help.hpp"
#include "cli/rich_menu.hpp"
#include "cli/terminal_caps.hpp"
#include "cli/terminal_input.hpp"
#include "cli/text_menu.hpp"

using namespace pm;

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_cli_help();
            return 0;
        }
    }

    CliConfig config;
    std::string custom_config_path;

    const char* const short_opts = "hf:mtlqs:v";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"modes-conf", required_argument, nullptr, 'f'},
        {"menu", no_argument, nullptr, 'm'}, {"text", no_argument, nullptr, 't'},
        {"list", no_argument, nullptr, 'l'}, {"query", no_argument, nullptr, 'q'},
        {"set", required_argument, nullptr, 's'}, {"verbose", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 2001},
        {"write-config", required_argument, nullptr, 2002},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    opterr = 0;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        if (opt == 2001) { custom_config_path = optarg; }
    }
    optind = 1;
    opterr = 1;

    load_or_create_config(custom_config_path.empty() ? default_config_path() : custom_config_path, config);

    bool list_only = false;
    bool query_only = false;
    std::optional<std::string> set_id;
    std::optional<std::string> write_path;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'f': config.modes_conf = optarg; break;
        case 'm': config.ui = "menu"; break;
        case 't': config.ui = "text"; break;
        case 'l': list_only = true; break;
        case 'q': query_only = true; break;
        case 's': set_id = std::string(optarg); break;
        case 'v': config.verbose = true; break;
        case 2001: break;
        case 2002: write_path = std::string(optarg); break;
        default: print_cli_help(); return 1;
        }
    }
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        print_cli_help();
        return 1;
    }

    if (write_path) {
        if (!write_config_to_file(config, *write_path)) {
            std::cerr << "Error: Failed to write configuration to " << *write_path << std::endl;
            return 1;
        }
        std::cout << "Configuration saved to " << *write_path << std::endl;
        return 0;
    }

    try {
        ModeTable modes = load_mode_table(config.modes_conf);

        PopenCommandRunner runner(config.verbose ? &std::cerr : nullptr);
        PowerModeService svc(runner, to_mode_commands(config));

        if (!config.query_command.empty() && !find_on_path(config.query_command.front())) {
            std::cerr << "Warning: '" << config.query_command.front()
                      << "' not found on PATH; the current mode will show as "
                      << kUnknownModeId << "." << std::endl;
        }

        if (list_only) {
            for (const auto& kv : modes) std::cout << kv.first << ") " << kv.second << "\n";
            return 0;
        }
        if (query_only) {
            std::cout << "Current mode: " << format_current_mode(modes, svc.QueryCurrentMode()) << std::endl;
            return 0;
        }
        if (set_id) {
            auto it = modes.find(*set_id);
            if (it == modes.end()) {
                std::cerr << "Error: Unknown power mode id '" << *set_id << "'." << std::endl;
                return 1;
            }
            ChangeReport report = svc.ChangeMode(it->first, it->second);
            std::cout << format_change_report(report);
            return report.ok ? 0 : 1;
        }

        TerminalInput keys;
        if (choose_ui_mode(config.ui, rich_menu_available()) == UiMode::Rich) {
            return run_rich_menu(svc, modes, config.title, run_mode_picker, keys, std::cout);
        }
        return run_text_menu(svc, modes, config.title, keys, std::cout);
    } catch (const PowerModeError& e) {
        std::cout << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
