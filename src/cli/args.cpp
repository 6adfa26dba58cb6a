#include "args.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <climits>

namespace {

// Walks argv; each flag handler pulls its value through next().
class ArgReader {
public:
    explicit ArgReader(const std::vector<std::string>& args) : args_(args) {}

    bool done() const { return pos_ >= args_.size(); }
    const std::string& peek() const { return args_[pos_]; }
    std::string take() { return args_[pos_++]; }

    Result<std::string> next(const std::string& flag) {
        if (done()) return Result<std::string>::Err(fmt::format("{} needs a value", flag));
        return Result<std::string>::Ok(take());
    }

private:
    const std::vector<std::string>& args_;
    size_t pos_ = 0;
};

Result<int> to_int(const std::string& flag, const std::string& text) {
    int v = safe_stoi(text, INT_MIN);
    if (v == INT_MIN) return Result<int>::Err(fmt::format("{}: '{}' is not a number", flag, text));
    return Result<int>::Ok(v);
}

Result<Millis> to_duration(const std::string& flag, const std::string& text) {
    auto d = parse_duration(text);
    if (d.is_err()) return Result<Millis>::Err(fmt::format("{}: {}", flag, d.error));
    return d;
}

} // namespace

Result<CliOptions> parse_args(const std::vector<std::string>& args) {
    CliOptions opts;
    ArgReader in(args);

    auto fail = [](const std::string& msg) { return Result<CliOptions>::Err(msg); };

    while (!in.done()) {
        std::string arg = in.take();

        // --flag=value form
        std::optional<std::string> inline_value;
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }
        auto value = [&]() -> Result<std::string> {
            if (inline_value) return Result<std::string>::Ok(*inline_value);
            return in.next(arg);
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.verbosity = Verbosity::Quiet;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbosity = Verbosity::Verbose;
        } else if (arg == "--no-post") {
            opts.no_post = true;
        } else if (arg == "--target" || arg == "-t") {
            auto v = value();
            if (v.is_err()) return fail(v.error);
            for (const auto& host : split(v.value, ',')) opts.targets.push_back(host);
        } else if (arg == "--preset") {
            auto v = value();
            if (v.is_err()) return fail(v.error);
            opts.preset = v.value;
        } else if (arg == "--ports") {
            auto v = value();
            if (v.is_err()) return fail(v.error);
            auto ports = parse_port_list(v.value);
            if (ports.is_err()) return fail("--ports: " + ports.error);
            opts.ports = ports.value;
        } else if (arg == "--timeout" || arg == "--connect-timeout" || arg == "--read-timeout" ||
                   arg == "--delay" || arg == "--max-wait") {
            auto v = value();
            if (v.is_err()) return fail(v.error);
            auto d = to_duration(arg, v.value);
            if (d.is_err()) return fail(d.error);
            if (arg == "--timeout") opts.overrides.timeout = d.value;
            else if (arg == "--connect-timeout") opts.overrides.connect_timeout = d.value;
            else if (arg == "--read-timeout") opts.overrides.read_timeout = d.value;
            else if (arg == "--delay") opts.overrides.retry_delay = d.value;
            else opts.overrides.max_service_wait = d.value;
        } else if (arg == "--retries" || arg == "--concurrency" || arg == "--auth-retries") {
            auto v = value();
            if (v.is_err()) return fail(v.error);
            auto n = to_int(arg, v.value);
            if (n.is_err()) return fail(n.error);
            if (arg == "--retries") opts.overrides.retries = n.value;
            else if (arg == "--concurrency") opts.overrides.max_concurrency = n.value;
            else opts.overrides.auth_retries = n.value;
        } else if (arg == "--user" || arg == "--password" || arg == "--account" || arg == "--token") {
            auto v = value();
            if (v.is_err()) return fail(v.error);
            if (arg == "--user") opts.user = v.value;
            else if (arg == "--password") opts.password = v.value;
            else if (arg == "--account") opts.account = v.value;
            else opts.token = v.value;
        } else if (arg == "--payload-dir" || arg == "--config" || arg == "--cache") {
            auto v = value();
            if (v.is_err()) return fail(v.error);
            if (arg == "--payload-dir") opts.payload_dir = v.value;
            else if (arg == "--config") opts.config_path = v.value;
            else opts.cache_path = v.value;
        } else if (!arg.empty() && arg[0] == '-') {
            return fail("Unknown option: " + arg);
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.positional.push_back(arg);
        }
    }

    if (opts.help || opts.version) return Result<CliOptions>::Ok(opts);

    if (opts.command.empty()) return fail("No command given");
    if (opts.command != "run" && opts.command != "probe" && opts.command != "cache") {
        return fail("Unknown command: " + opts.command);
    }
    if ((opts.command == "run" || opts.command == "probe") && opts.targets.empty()) {
        return fail(fmt::format("{} needs at least one --target", opts.command));
    }
    if (opts.command == "probe" && opts.targets.size() > 1) {
        return fail("probe takes a single --target");
    }
    if (opts.command == "cache") {
        if (opts.positional.empty() ||
            (opts.positional[0] != "list" && opts.positional[0] != "clear")) {
            return fail("Usage: rprov cache list | rprov cache clear [HOST]");
        }
        if (opts.positional.size() > 2 || (opts.positional[0] == "list" && opts.positional.size() > 1)) {
            return fail("Too many arguments for cache " + opts.positional[0]);
        }
    } else if (!opts.positional.empty()) {
        return fail("Unexpected argument: " + opts.positional[0]);
    }

    return Result<CliOptions>::Ok(opts);
}
