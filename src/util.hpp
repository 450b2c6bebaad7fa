#pragma once
#include <string>

namespace codegate {

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Read a whole file. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

} // namespace codegate
