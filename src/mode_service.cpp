// FILE: src/mode_service.cpp
#include "mode_service.hpp"

#include <sstream>

#include "text_utils.hpp"

namespace pm {

std::string parse_current_mode(const std::string& output, const std::string& marker) {
    if (output.empty() || marker.empty()) return kUnknownModeId;

    std::vector<std::string> lines;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) lines.push_back(line);

    const std::string needle = to_lower(marker);
    for (size_t i = lines.size(); i-- > 0;) {
        if (to_lower(lines[i]).find(needle) == std::string::npos) continue;
        if (i + 1 >= lines.size()) return kUnknownModeId;
        std::string id = trim(lines[i + 1]);
        return id.empty() ? kUnknownModeId : id;
    }
    return kUnknownModeId;
}

std::string format_change_report(const ChangeReport& report) {
    std::ostringstream os;
    if (report.ok) {
        os << "Successfully changed power mode to: " << report.id << " (\"" << report.name << "\")\n";
    } else {
        os << "Failed to change power mode to: " << report.id << " (\"" << report.name << "\")\n";
        os << "Error output:\n";
        os << report.output;
        if (report.output.empty() || report.output.back() != '\n') os << "\n";
    }
    return os.str();
}

std::string PowerModeService::QueryCurrentMode() {
    if (commands_.query_command.empty()) return kUnknownModeId;
    CommandResult res = runner_.Run(commands_.query_command, StderrMode::Discard);
    if (res.exit_code != 0) return kUnknownModeId;
    return parse_current_mode(res.output, commands_.current_mode_marker);
}

ChangeReport PowerModeService::ChangeMode(const std::string& id, const std::string& name) {
    std::vector<std::string> argv = commands_.privilege_command;
    argv.insert(argv.end(), commands_.change_command.begin(), commands_.change_command.end());
    argv.push_back(id);

    CommandResult res = runner_.Run(argv, StderrMode::Merge);
    ChangeReport report;
    report.id = id;
    report.name = name;
    report.ok = (res.exit_code == 0);
    report.output = std::move(res.output);
    return report;
}

} // namespace pm
