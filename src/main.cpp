#include <iostream>
#include <vector>
#include <string>
#include "cli/args.hpp"
#include "cli/exit_codes.hpp"
#include "cli/rprov_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>

void print_usage() {
    auto row = [](const std::string& cmd, const std::string& args, const std::string& desc) {
        std::cout << theme::color::BLUE << "    rprov " << cmd << theme::color::RESET
                  << theme::color::BROWN << args << theme::color::RESET
                  << theme::color::DIM << "  " << desc << theme::color::RESET << "\n";
    };

    std::cout << theme::banner(RPROV_VERSION);
    std::cout << theme::section("Usage");
    row("run", " --target HOST [--target HOST ...]", "Provision one or more devices");
    row("probe", " --target HOST [--ports 22,23,21]", "Check which service ports answer");
    row("cache", " list | clear [HOST]", "Show or drop cached tokens");

    std::cout << theme::section("Options");
    std::cout << theme::color::DIM
              << "    --preset aggressive|conservative   Timing preset (default aggressive)\n"
              << "    --ports LIST                       Service ports to wait for\n"
              << "    --timeout S  --connect-timeout S  --read-timeout S\n"
              << "    --retries N  --delay S  --max-wait S  --concurrency N  --auth-retries N\n"
              << "    --user NAME  --password PW  --account NAME  --token TOKEN\n"
              << "    --payload-dir DIR  --config FILE  --cache FILE  --no-post\n"
              << "    -q, --quiet  -v, --verbose\n"
              << "\n"
              << "    rprov --version        Show version\n"
              << "    rprov --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        if (args.empty()) {
            print_usage();
            return EXIT_USAGE;
        }

        auto opts = parse_args(args);
        if (opts.is_err()) {
            std::cout << theme::fail(opts.error);
            std::cout << theme::step("Run 'rprov --help' for usage");
            return EXIT_USAGE;
        }

        if (opts.value.version) {
            std::cout << theme::color::BROWN << theme::color::BOLD << "rprov"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << RPROV_VERSION << theme::color::RESET << "\n";
            return EXIT_OK;
        }
        if (opts.value.help) {
            print_usage();
            return EXIT_OK;
        }

        RprovCLI cli(opts.value);
        return cli.run();
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_USAGE;
    }
}
