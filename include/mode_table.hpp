// Parsing of <POWER_MODEL ...> records out of nvpmodel.conf
#pragma once

#include <istream>
#include <optional>
#include <string>

#include "pm_types.hpp"

namespace pm {

// Match a single `< POWER_MODEL ID=<digits> NAME=<text> >` line.
// Returns std::nullopt for anything else.
std::optional<ModeRecord> parse_power_model_line(const std::string& line);

// Collect every matching record from a stream; other lines are skipped.
ModeTable parse_mode_table(std::istream& in);

// Load the mode table from `path`.
// Throws PowerModeError(ConfigMissing) if the file does not exist and
// PowerModeError(NoModes) if it holds no records.
ModeTable load_mode_table(const std::string& path);

} // namespace pm
