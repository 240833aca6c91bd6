// Synchronous execution of external commands (nvpmodel, sudo, ...)
#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "pm_types.hpp"

namespace pm {

enum class StderrMode { Merge, Discard };

class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    // Blocks until the command exits. No timeout.
    virtual CommandResult Run(const std::vector<std::string>& argv, StderrMode mode) = 0;
};

// Runs commands through /bin/sh via popen(). When `trace` is set, each
// command line is echoed to it before running.
class PopenCommandRunner : public CommandRunner {
public:
    explicit PopenCommandRunner(std::ostream* trace = nullptr) : trace_(trace) {}
    CommandResult Run(const std::vector<std::string>& argv, StderrMode mode) override;

private:
    std::ostream* trace_;
};

// Quote `arg` for a POSIX shell if it contains anything but safe characters.
std::string shell_quote(const std::string& arg);

// Join argv into a single shell command line.
std::string join_command(const std::vector<std::string>& argv);

// First executable named `program` on $PATH, or std::nullopt.
std::optional<std::string> find_on_path(const std::string& program);

} // namespace pm
