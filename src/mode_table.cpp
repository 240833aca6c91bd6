// FILE: src/mode_table.cpp
#include "mode_table.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <system_error>

#include "text_utils.hpp"

namespace pm {

namespace {

const std::regex& power_model_pattern() {
    static const std::regex re(
        R"(^\s*<\s*POWER_MODEL\s+ID\s*=\s*([0-9]+)\s+NAME\s*=\s*(.*)>)");
    return re;
}

} // namespace

std::optional<ModeRecord> parse_power_model_line(const std::string& line) {
    std::smatch m;
    if (!std::regex_search(line, m, power_model_pattern())) return std::nullopt;

    ModeRecord rec;
    rec.id = m[1].str();
    std::string name = m[2].str();
    if (!name.empty() && name.back() == '>') name.pop_back();
    name.erase(std::remove(name.begin(), name.end(), '"'), name.end());
    rec.name = trim(name);
    return rec;
}

ModeTable parse_mode_table(std::istream& in) {
    ModeTable modes;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (auto rec = parse_power_model_line(line)) {
            modes[rec->id] = rec->name;
        }
    }
    return modes;
}

ModeTable load_mode_table(const std::string& path) {
    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (ec) {
        throw PowerModeError(PowerModeErrc::Io, "Could not access " + path + ": " + ec.message());
    }
    if (!exists) {
        throw PowerModeError(PowerModeErrc::ConfigMissing, path + " not found!");
    }
    std::ifstream file(path);
    if (!file) {
        throw PowerModeError(PowerModeErrc::Io, "Could not open " + path);
    }
    ModeTable modes = parse_mode_table(file);
    if (modes.empty()) {
        throw PowerModeError(PowerModeErrc::NoModes,
                             "No <POWER_MODEL> entries found in " + path + ".");
    }
    return modes;
}

} // namespace pm
