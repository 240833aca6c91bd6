// FILE: src/command_runner.cpp
#include "command_runner.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

namespace pm {

std::string shell_quote(const std::string& arg) {
    if (arg.empty()) return "''";
    bool safe = true;
    for (char c : arg) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) ||
              std::strchr("@%+=:,./-_", c) != nullptr)) {
            safe = false;
            break;
        }
    }
    if (safe) return arg;
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::ostringstream os;
    bool first = true;
    for (const auto& a : argv) {
        if (!first) os << ' ';
        os << shell_quote(a);
        first = false;
    }
    return os.str();
}

CommandResult PopenCommandRunner::Run(const std::vector<std::string>& argv, StderrMode mode) {
    CommandResult result;
    if (argv.empty()) {
        result.output = "empty command\n";
        return result;
    }
    std::string cmdline = join_command(argv);
    if (trace_) *trace_ << "[run] " << cmdline << std::endl;
    cmdline += (mode == StderrMode::Merge) ? " 2>&1" : " 2>/dev/null";

    FILE* pipe = popen(cmdline.c_str(), "r");
    if (!pipe) {
        result.output = "failed to start '" + argv.front() + "': " + std::strerror(errno) + "\n";
        return result;
    }
    char buffer[256];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, n);
    }
    int status = pclose(pipe);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

std::optional<std::string> find_on_path(const std::string& program) {
    if (program.empty()) return std::nullopt;
    if (program.find('/') != std::string::npos) {
        if (access(program.c_str(), X_OK) == 0) return program;
        return std::nullopt;
    }
    const char* path_env = getenv("PATH");
    if (path_env == nullptr) return std::nullopt;

    std::istringstream iss(path_env);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / program;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

} // namespace pm
