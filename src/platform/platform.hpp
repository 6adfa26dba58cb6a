#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Expand a leading "~/" against home_dir(). Other paths are returned as-is.
std::filesystem::path expand_home(const std::string& path);

// ~/.rprov, created on demand by callers that write into it.
std::filesystem::path rprov_home();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Route SIGINT/SIGTERM to a flag instead of terminating the process.
void install_interrupt_handler();

// True once an interrupt arrived after install_interrupt_handler().
bool interrupted();

} // namespace platform
