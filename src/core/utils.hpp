#pragma once

#include <string>
#include <vector>
#include "types.hpp"

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Split on a single delimiter, dropping empty pieces.
std::vector<std::string> split(const std::string& s, char delim);

// Parse "22,23,21" into ports. Rejects anything outside 1..65535 and
// drops duplicates while keeping first-seen order.
Result<std::vector<int>> parse_port_list(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
