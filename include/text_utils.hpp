#pragma once

#include <string>

namespace pm {

// Strip leading and trailing whitespace.
std::string trim(const std::string& s);

std::string to_lower(std::string s);

} // namespace pm
