#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <sstream>

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t idx = 0;
        int v = std::stoi(s, &idx);
        return idx == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::istringstream in(s);
    std::string piece;
    while (std::getline(in, piece, delim)) {
        trim(piece);
        if (!piece.empty()) parts.push_back(piece);
    }
    return parts;
}

Result<std::vector<int>> parse_port_list(const std::string& s) {
    std::vector<int> ports;
    for (const auto& piece : split(s, ',')) {
        int port = safe_stoi(piece, -1);
        if (port < 1 || port > 65535) {
            return Result<std::vector<int>>::Err(fmt::format("invalid port '{}'", piece));
        }
        if (std::find(ports.begin(), ports.end(), port) == ports.end()) {
            ports.push_back(port);
        }
    }
    if (ports.empty()) {
        return Result<std::vector<int>>::Err("no ports given");
    }
    return Result<std::vector<int>>::Ok(ports);
}
