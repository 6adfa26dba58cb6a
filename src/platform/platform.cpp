#include "platform.hpp"
#include <core/constants.hpp>
#include <cstdlib>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <signal.h>
#  include <unistd.h>
#endif
#include <csignal>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path p = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return p;
}

fs::path expand_home(const std::string& path) {
    if (path == "~") return home_dir();
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        return home_dir() / path.substr(2);
    }
    return fs::path(path);
}

fs::path rprov_home() {
    return home_dir() / RPROV_HOME_DIR;
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

static volatile std::sig_atomic_t g_interrupted = 0;

static void on_interrupt(int) {
    g_interrupted = 1;
}

void install_interrupt_handler() {
    g_interrupted = 0;
#ifdef _WIN32
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);
#else
    struct sigaction sa {};
    sa.sa_handler = on_interrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
#endif
}

bool interrupted() {
    return g_interrupted != 0;
}

} // namespace platform
