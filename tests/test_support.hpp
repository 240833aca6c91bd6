// Shared fakes for the power_menu tests
#pragma once

#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "cli/terminal_input.hpp"
#include "command_runner.hpp"

namespace pm_test {

struct RecordedCall {
    std::vector<std::string> argv;
    pm::StderrMode mode;
};

// Answers every Run() through `handler` and records the argv it was given.
class FakeRunner : public pm::CommandRunner {
public:
    using Handler = std::function<pm::CommandResult(const std::vector<std::string>&)>;
    explicit FakeRunner(Handler handler) : handler_(std::move(handler)) {}

    pm::CommandResult Run(const std::vector<std::string>& argv, pm::StderrMode mode) override {
        calls.push_back({argv, mode});
        return handler_(argv);
    }

    // Calls whose argv contains `flag`.
    int CountWith(const std::string& flag) const {
        int n = 0;
        for (const auto& c : calls)
            for (const auto& a : c.argv)
                if (a == flag) { ++n; break; }
        return n;
    }

    std::vector<RecordedCall> calls;

private:
    Handler handler_;
};

// Replays a fixed key sequence, then reports END_OF_INPUT forever.
class ScriptedKeys : public pm::KeySource {
public:
    ScriptedKeys(std::initializer_list<int> keys) : keys_(keys) {}
    int GetChar() override {
        if (keys_.empty()) return pm::END_OF_INPUT;
        int k = keys_.front();
        keys_.pop_front();
        ++consumed;
        return k;
    }
    bool Exhausted() const { return keys_.empty(); }
    int consumed = 0;

private:
    std::deque<int> keys_;
};

// A file under the temp directory, removed on destruction.
class TempFile {
public:
    TempFile(const std::string& name, const std::string& contents)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::ofstream out(path_);
        out << contents;
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

// A temp directory holding a symlink that points at itself; any path
// below link() fails to stat with ELOOP.
class SymlinkLoop {
public:
    explicit SymlinkLoop(const std::string& name)
        : dir_(std::filesystem::temp_directory_path() / name) {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
        std::filesystem::create_directories(dir_);
        std::filesystem::create_symlink("loop", dir_ / "loop");
    }
    ~SymlinkLoop() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }
    std::string link() const { return (dir_ / "loop").string(); }
    std::string below(const std::string& leaf) const { return (dir_ / "loop" / leaf).string(); }

private:
    std::filesystem::path dir_;
};

inline const char* const kJetsonConf =
    "< PARAM TYPE=FILE NAME=CPU_ONLINE >\n"
    "CORE_0 /sys/devices/system/cpu/cpu0/online\n"
    "< POWER_MODEL ID=0 NAME=15W >\n"
    "CPU_ONLINE CORE_0 1\n"
    "< POWER_MODEL ID=1 NAME=MAXN >\n"
    "< PM_CONFIG DEFAULT=0 >\n";

inline const char* const kStatusWithMarker =
    "NVPM VERB: Config file:/etc/nvpmodel.conf\n"
    "NVPM VERB: parsing done for /etc/nvpmodel.conf\n"
    "NVPM VERB: Current mode: NV Power Mode: MAXN\n"
    "1\n";

} // namespace pm_test
