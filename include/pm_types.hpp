#pragma once
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>

namespace pm {
namespace fs = std::filesystem;

// Shown wherever the active mode could not be determined.
inline const std::string kUnknownModeId = "???";

// Digit ids compare by value: shorter first, then lexically ("2" < "10").
struct ModeIdLess {
    bool operator()(const std::string& a, const std::string& b) const {
        if (a.size() != b.size()) return a.size() < b.size();
        return a < b;
    }
};

struct ModeRecord {
    std::string id;
    std::string name;
};

// id -> display name. Built once at startup, read-only afterwards.
using ModeTable = std::map<std::string, std::string, ModeIdLess>;

struct CommandResult {
    int exit_code = -1;   // -1: could not start, 128+N: killed by signal N
    std::string output;
};

struct ChangeReport {
    std::string id;
    std::string name;
    bool ok = false;
    std::string output;
};

enum class PowerModeErrc {
    Unknown = 1, ConfigMissing, NoModes, Io,
};
struct PowerModeError : public std::runtime_error {
    explicit PowerModeError(const std::string& what)
        : std::runtime_error(what), code_(PowerModeErrc::Unknown) {}
    PowerModeError(PowerModeErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    PowerModeErrc code() const noexcept { return code_; }
private:
    PowerModeErrc code_;
};

} // namespace pm
