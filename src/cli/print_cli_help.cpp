// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help() {
  std::cout
      << "Usage: power_menu [options]\n\n"
      << "Interactive selector for nvpmodel power modes. Press ESC to exit.\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -f, --modes-conf <file>    Read power modes from <file> "
         "(default /etc/nvpmodel.conf)\n"
      << "  -m, --menu                 Force the full-screen menu\n"
      << "  -t, --text                 Force the single-keystroke text menu\n"
      << "  -l, --list                 Print the configured modes and exit\n"
      << "  -q, --query                Print the current mode and exit\n"
      << "  -s, --set <id>             Switch to mode <id> and exit\n"
      << "  -v, --verbose              Echo external commands before running "
         "them\n"
      << "      --config <file>        Use a specific settings file\n"
      << "      --write-config <file>  Write the effective settings to <file>\n"
      << std::endl;
}
